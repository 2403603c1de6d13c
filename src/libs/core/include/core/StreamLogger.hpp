/*
 * Copyright (C) 2025 The mcol authors
 *
 * This file is part of mcol.
 *
 * mcol is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * mcol is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with mcol.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <mutex>
#include <ostream>

#include "core/ILogger.hpp"

namespace mcol::core::logging
{
    // Writes every log at or above the given severity to a stream, mostly used by tests and tools
    class StreamLogger final : public ILogger
    {
    public:
        StreamLogger(std::ostream& os, Severity minSeverity = defaultMinSeverity);

        bool isSeverityActive(Severity severity) const override { return severity <= _minSeverity; }
        void processLog(const Log& log) override;

    private:
        std::mutex _mutex;
        std::ostream& _os;
        const Severity _minSeverity;
    };
} // namespace mcol::core::logging
