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

#include <memory>

#include "core/Exception.hpp"

namespace mcol::core
{
    // Process-wide slot holding one instance of Class for the lifetime of the Service object
    // Only the logger is reached this way, so that MCOL_LOG needs no explicit plumbing
    template<typename Class>
    class Service
    {
    public:
        Service(std::unique_ptr<Class> service)
        {
            if (_service)
                throw McolException{ "Service already registered" };
            _service = std::move(service);
        }

        ~Service()
        {
            _service.reset();
        }

        Service(const Service&) = delete;
        Service& operator=(const Service&) = delete;

        Class* operator->() const { return get(); }

        static Class* get() { return _service.get(); }
        static bool exists() { return static_cast<bool>(_service); }

    private:
        static inline std::unique_ptr<Class> _service;
    };
} // namespace mcol::core
