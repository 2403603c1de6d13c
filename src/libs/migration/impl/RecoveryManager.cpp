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

#include "migration/RecoveryManager.hpp"

#include <cerrno>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "storage/FileLock.hpp"

namespace mcol::migration
{
    namespace
    {
        // Another open file description holds a flock on it, or the kernel refuses to open it (busy)
        bool isFileLocked(const std::filesystem::path& path)
        {
            const int fd{ ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK) };
            if (fd < 0)
                return errno == EBUSY || errno == ETXTBSY;

            bool locked{};
            if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
                locked = (errno == EWOULDBLOCK);
            ::close(fd);

            return locked;
        }

        class FileLockProbe : public ILockProbe
        {
        private:
            bool isLocked(const std::filesystem::path& path) const override
            {
                std::error_code ec;

                const std::filesystem::path lockPath{ storage::FileLock::getLockPath(path) };
                if (std::filesystem::exists(lockPath, ec) && isFileLocked(lockPath))
                    return true;

                if (!std::filesystem::exists(path, ec))
                    return false;

                if (isFileLocked(path))
                    return true;

                if (!std::filesystem::is_directory(path, ec))
                    return false;

                for (std::filesystem::recursive_directory_iterator itEntry{ path, std::filesystem::directory_options::skip_permission_denied, ec }; !ec && itEntry != std::filesystem::recursive_directory_iterator{}; itEntry.increment(ec))
                {
                    if (itEntry->is_regular_file(ec) && isFileLocked(itEntry->path()))
                    {
                        MCOL_LOG(RECOVERY, DEBUG, "File '" << itEntry->path().string() << "' is locked");
                        return true;
                    }
                }

                return false;
            }
        };

        std::string formatManualInterventionMessage(const ErrorDetails& error, std::string_view reason)
        {
            std::string message{ "Manual intervention required for album '" + error.context.albumName + "': " + std::string{ reason } };

            std::size_t step{ 1 };
            for (const std::string& solutionStep : error.solutionSteps)
                message += "\n  " + std::to_string(step++) + ". " + solutionStep;

            return message;
        }
    } // namespace

    std::string_view recoveryStateToString(RecoveryState state)
    {
        switch (state)
        {
        case RecoveryState::Detected:
            return "detected";
        case RecoveryState::PlanBuilt:
            return "plan_built";
        case RecoveryState::Retrying:
            return "retrying";
        case RecoveryState::WaitingOnLock:
            return "waiting_on_lock";
        case RecoveryState::ManualPending:
            return "manual_pending";
        case RecoveryState::Skipped:
            return "skipped";
        case RecoveryState::RolledBack:
            return "rolled_back";
        case RecoveryState::Resolved:
            return "resolved";
        case RecoveryState::Abandoned:
            return "abandoned";
        }

        return "";
    }

    std::string_view recoveryActionToString(RecoveryAction action)
    {
        switch (action)
        {
        case RecoveryAction::Retry:
            return "retry";
        case RecoveryAction::WaitAndRetry:
            return "wait_and_retry";
        case RecoveryAction::ManualIntervention:
            return "manual_intervention";
        case RecoveryAction::SkipAlbum:
            return "skip_album";
        case RecoveryAction::Rollback:
            return "rollback";
        }

        return "";
    }

    std::unique_ptr<ILockProbe> createFileLockProbe()
    {
        return std::make_unique<FileLockProbe>();
    }

    RecoveryManager::RecoveryManager(const RecoverySettings& settings, const ILockProbe& lockProbe)
        : _settings{ settings }
        , _lockProbe{ lockProbe }
    {
    }

    RecoveryPlan RecoveryManager::buildPlan(const ErrorDetails& error, bool force) const
    {
        switch (error.kind)
        {
        case MigrationErrorKind::PermissionDenied:
            return RecoveryPlan{ RecoveryAction::ManualIntervention, { RecoveryAction::SkipAlbum, RecoveryAction::Rollback }, "Fix permissions and retry" };
        case MigrationErrorKind::DiskSpaceInsufficient:
            return RecoveryPlan{ RecoveryAction::ManualIntervention, { RecoveryAction::Rollback }, "Free up disk space, else abort" };
        case MigrationErrorKind::FileLocked:
            return RecoveryPlan{ RecoveryAction::WaitAndRetry, { RecoveryAction::ManualIntervention }, "Wait for the lock to be released and retry" };
        case MigrationErrorKind::SourceNotFound:
            return RecoveryPlan{ RecoveryAction::SkipAlbum, { RecoveryAction::ManualIntervention }, "Skip the album" };
        case MigrationErrorKind::TargetExists:
            if (force)
                return RecoveryPlan{ RecoveryAction::Retry, { RecoveryAction::ManualIntervention }, "Retry, merging into the existing target" };
            return RecoveryPlan{ RecoveryAction::ManualIntervention, { RecoveryAction::SkipAlbum }, "Resolve the target conflict" };
        case MigrationErrorKind::Unknown:
            return RecoveryPlan{ RecoveryAction::Retry, { RecoveryAction::ManualIntervention }, "Retry, else manual intervention" };
        }

        return RecoveryPlan{ RecoveryAction::ManualIntervention, {}, "Manual intervention" };
    }

    RecoveryOutcome RecoveryManager::recover(const ErrorDetails& error, RetryFunction retryFunc, bool force)
    {
        MCOL_LOG(RECOVERY, WARNING, "Album '" << error.context.albumName << "': " << migrationErrorKindToString(error.kind) << " error: " << error.message);

        const RecoveryPlan plan{ buildPlan(error, force) };
        log(error, RecoveryState::Detected, plan.primaryAction, error.message);
        log(error, RecoveryState::PlanBuilt, plan.primaryAction, plan.description);

        switch (plan.primaryAction)
        {
        case RecoveryAction::SkipAlbum:
            return skip(error);

        case RecoveryAction::WaitAndRetry:
            log(error, RecoveryState::WaitingOnLock, plan.primaryAction, "Waiting up to " + std::to_string(_settings.lockWaitTimeout.count()) + "s for the lock to be released");
            if (!waitForUnlock(error.context.sourcePath))
                return requireManualIntervention(error, RecoveryAction::ManualIntervention, "still locked after " + std::to_string(_settings.lockWaitTimeout.count()) + "s");
            return retry(error, plan.primaryAction, retryFunc);

        case RecoveryAction::Retry:
            return retry(error, plan.primaryAction, retryFunc);

        case RecoveryAction::ManualIntervention:
        case RecoveryAction::Rollback:
            break;
        }

        return requireManualIntervention(error, RecoveryAction::ManualIntervention, error.message);
    }

    void RecoveryManager::recordRollback(std::string_view albumName, MigrationErrorKind kind, std::string_view message)
    {
        ErrorDetails error;
        error.kind = kind;
        error.context.albumName = albumName;

        log(error, RecoveryState::RolledBack, RecoveryAction::Rollback, message);
    }

    RecoveryOutcome RecoveryManager::retry(const ErrorDetails& error, RecoveryAction action, const RetryFunction& retryFunc)
    {
        ErrorDetails lastError{ error };

        for (std::size_t attempt{ 1 }; attempt <= _settings.maxRetries; ++attempt)
        {
            if (_settings.retryDelay.count() > 0)
                std::this_thread::sleep_for(_settings.retryDelay);

            log(lastError, RecoveryState::Retrying, action, "Attempt " + std::to_string(attempt) + "/" + std::to_string(_settings.maxRetries));
            try
            {
                retryFunc();

                const std::string message{ "Resolved after " + std::to_string(attempt) + " attempt(s)" };
                log(lastError, RecoveryState::Resolved, action, message);
                return RecoveryOutcome{ .state = RecoveryState::Resolved, .resolution = RecoveryState::Retrying, .lastError = lastError, .message = message };
            }
            catch (const std::exception& e)
            {
                lastError = analyzeError(e, error.context);
                MCOL_LOG(RECOVERY, DEBUG, "Album '" << error.context.albumName << "': attempt " << attempt << " failed: " << e.what());
            }

            if (!lastError.retryable)
                break;
        }

        return requireManualIntervention(lastError, RecoveryAction::ManualIntervention, "retries exhausted: " + lastError.message);
    }

    RecoveryOutcome RecoveryManager::skip(const ErrorDetails& error)
    {
        const std::string message{ "Skipped album '" + error.context.albumName + "': " + error.message };
        MCOL_LOG(RECOVERY, WARNING, message);

        log(error, RecoveryState::Skipped, RecoveryAction::SkipAlbum, message);
        log(error, RecoveryState::Resolved, RecoveryAction::SkipAlbum, message);

        return RecoveryOutcome{ .state = RecoveryState::Resolved, .resolution = RecoveryState::Skipped, .lastError = error, .message = message };
    }

    RecoveryOutcome RecoveryManager::requireManualIntervention(const ErrorDetails& error, RecoveryAction action, std::string_view reason)
    {
        const std::string message{ formatManualInterventionMessage(error, reason) };
        MCOL_LOG(RECOVERY, ERROR, message);

        log(error, RecoveryState::ManualPending, action, message);
        log(error, RecoveryState::Abandoned, action, reason);

        return RecoveryOutcome{ .state = RecoveryState::Abandoned, .resolution = RecoveryState::ManualPending, .lastError = error, .message = message };
    }

    bool RecoveryManager::waitForUnlock(const std::filesystem::path& path) const
    {
        const auto deadline{ std::chrono::steady_clock::now() + _settings.lockWaitTimeout };
        while (_lockProbe.isLocked(path))
        {
            if (std::chrono::steady_clock::now() >= deadline)
                return false;

            std::this_thread::sleep_for(_settings.lockPollInterval);
        }

        return true;
    }

    void RecoveryManager::log(const ErrorDetails& error, RecoveryState state, RecoveryAction action, std::string_view message)
    {
        _log.push_back(RecoveryLogEntry{
            .albumName = error.context.albumName,
            .kind = error.kind,
            .state = state,
            .action = action,
            .timestamp = core::stringUtils::toISO8601String(Wt::WDateTime::currentDateTime()),
            .message = std::string{ message },
        });
    }
} // namespace mcol::migration
