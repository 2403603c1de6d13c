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

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <cassert>
#include <iostream>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace mcol::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CACHE:
            return "CACHE";
        case Module::COLLECTION:
            return "COLLECTION";
        case Module::CONFIG:
            return "CONFIG";
        case Module::MAIN:
            return "MAIN";
        case Module::MIGRATION:
            return "MIGRATION";
        case Module::RECOVERY:
            return "RECOVERY";
        case Module::SCANNER:
            return "SCANNER";
        case Module::STORAGE:
            return "STORAGE";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    std::optional<Severity> parseSeverity(std::string_view str)
    {
        for (Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
        {
            if (stringUtils::stringCaseInsensitiveEqual(str, getSeverityName(severity)))
                return severity;
        }

        return std::nullopt;
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        assert(_logger.isSeverityActive(_severity));
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (!logFilePath.empty())
        {
            _logFile = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
            if (!_logFile->is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw McolException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }

            _infoSink = _sinks.emplace_back(std::make_unique<Sink>(*_logFile)).get();
            _problemSink = _infoSink;
        }
        else
        {
            _infoSink = _sinks.emplace_back(std::make_unique<Sink>(std::cout)).get();
            _problemSink = _sinks.emplace_back(std::make_unique<Sink>(std::cerr)).get();
        }
    }

    Logger::~Logger() = default;

    void Logger::processLog(const Log& log)
    {
        Sink& sink{ log.getSeverity() <= Severity::WARNING ? *_problemSink : *_infoSink };
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        const std::scoped_lock lock{ sink.mutex };
        sink.stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << log.getMessage() << std::endl;
    }
} // namespace mcol::core::logging
