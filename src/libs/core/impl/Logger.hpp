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

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <vector>

#include "core/ILogger.hpp"

namespace mcol::core::logging
{
    // Info and debug messages go to stdout, warnings and errors to stderr
    // Everything goes to the log file when one is set
    class Logger final : public ILogger
    {
    public:
        Logger(Severity minSeverity, const std::filesystem::path& logFilePath);
        ~Logger() override;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        bool isSeverityActive(Severity severity) const override { return severity <= _minSeverity; }
        void processLog(const Log& log) override;

        struct Sink
        {
            Sink(std::ostream& os)
                : stream{ os } {}

            std::mutex mutex;
            std::ostream& stream;
        };

        const Severity _minSeverity;
        std::unique_ptr<std::ofstream> _logFile;
        std::vector<std::unique_ptr<Sink>> _sinks;
        Sink* _infoSink{};
        Sink* _problemSink{};
    };
} // namespace mcol::core::logging
