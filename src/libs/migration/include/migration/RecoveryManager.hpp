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

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "migration/ErrorAnalyzer.hpp"

namespace mcol::migration
{
    // Detected -> PlanBuilt -> { Retrying, WaitingOnLock, ManualPending, Skipped, RolledBack } -> Resolved | Abandoned
    enum class RecoveryState
    {
        Detected,
        PlanBuilt,
        Retrying,
        WaitingOnLock,
        ManualPending,
        Skipped,
        RolledBack,
        Resolved,
        Abandoned,
    };
    std::string_view recoveryStateToString(RecoveryState state);

    enum class RecoveryAction
    {
        Retry,
        WaitAndRetry,
        ManualIntervention,
        SkipAlbum,
        Rollback,
    };
    std::string_view recoveryActionToString(RecoveryAction action);

    struct RecoveryPlan
    {
        RecoveryAction primaryAction{ RecoveryAction::ManualIntervention };
        std::vector<RecoveryAction> fallbackActions;
        std::string description;
    };

    struct RecoveryLogEntry
    {
        std::string albumName;
        MigrationErrorKind kind{ MigrationErrorKind::Unknown };
        RecoveryState state{ RecoveryState::Detected };
        RecoveryAction action{ RecoveryAction::ManualIntervention };
        std::string timestamp;
        std::string message;
    };

    struct RecoveryOutcome
    {
        RecoveryState state{ RecoveryState::Abandoned };      // Resolved or Abandoned
        RecoveryState resolution{ RecoveryState::ManualPending }; // how the terminal state was reached
        ErrorDetails lastError;
        std::string message;

        bool isResolved() const { return state == RecoveryState::Resolved; }
        bool isSkipped() const { return resolution == RecoveryState::Skipped; }
    };

    struct RecoverySettings
    {
        std::size_t maxRetries{ 3 };
        std::chrono::seconds lockWaitTimeout{ 30 };
        std::chrono::milliseconds lockPollInterval{ 500 };
        std::chrono::milliseconds retryDelay{ 100 };
    };

    class ILockProbe
    {
    public:
        virtual ~ILockProbe() = default;

        virtual bool isLocked(const std::filesystem::path& path) const = 0;
    };

    // Reports a path as locked while its storage lock sidecar, the path itself or any file below it
    // is held under flock by someone else, or cannot be opened because it is busy
    std::unique_ptr<ILockProbe> createFileLockProbe();

    // Recovery of the failed operations of one migration
    // Not thread safe
    class RecoveryManager
    {
    public:
        using RetryFunction = std::function<void()>;

        RecoveryManager(const RecoverySettings& settings, const ILockProbe& lockProbe);

        RecoveryPlan buildPlan(const ErrorDetails& error, bool force) const;

        // Never throws on retry failures, the last error is reported in the outcome
        RecoveryOutcome recover(const ErrorDetails& error, RetryFunction retryFunc, bool force);

        void recordRollback(std::string_view albumName, MigrationErrorKind kind, std::string_view message);

        const std::vector<RecoveryLogEntry>& getLog() const { return _log; }

    private:
        RecoveryOutcome retry(const ErrorDetails& error, RecoveryAction action, const RetryFunction& retryFunc);
        RecoveryOutcome skip(const ErrorDetails& error);
        RecoveryOutcome requireManualIntervention(const ErrorDetails& error, RecoveryAction action, std::string_view reason);
        bool waitForUnlock(const std::filesystem::path& path) const;

        void log(const ErrorDetails& error, RecoveryState state, RecoveryAction action, std::string_view message);

        const RecoverySettings _settings;
        const ILockProbe& _lockProbe;
        std::vector<RecoveryLogEntry> _log;
    };
} // namespace mcol::migration
