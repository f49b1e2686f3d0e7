#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/provisioner.hpp"
#include "daemon/lock_manager.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <sys/types.h>

enum class NoticeKind { Info, Success, Warning, Error };

/// Start/stop/restart/update for the single managed bot process.
/// Each call runs to completion; nothing keeps supervising afterwards.
class ProcessController {
public:
    /// Pause between the stop and start phases of restart
    static constexpr std::chrono::milliseconds kRestartDelay{1000};
    /// Liveness poll interval while waiting for a graceful exit
    static constexpr std::chrono::milliseconds kPollInterval{50};

    explicit ProcessController(const Config& config,
                               Provisioner::CommandRunner runner = nullptr);

    /// Fails with AlreadyRunning if a live instance holds the lock.
    /// A stale lock is cleared with a warning.
    OpResult start();

    /// SIGTERM, wait for the grace period, then SIGKILL; always releases the lock.
    /// Success with NotRunning when there was nothing to stop.
    OpResult stop();

    /// stop(), kRestartDelay, start(). The result is the start phase's.
    OpResult restart();

    /// Read-only
    LockStatus status() const;

    /// Force a dependency reinstall. Never touches the lock or the process.
    OpResult update();

    /// Progress, warnings and errors as they happen
    std::function<void(NoticeKind, const std::string&)> on_notice;

    LockManager& lock() { return lock_; }
    Provisioner& provisioner() { return provisioner_; }

private:
    const Config& config_;
    LockManager lock_;
    Provisioner provisioner_;

    void notify(NoticeKind kind, const std::string& text);
    OpResult provision();
    bool wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) const;
};
