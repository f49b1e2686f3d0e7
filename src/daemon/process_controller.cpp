#include "daemon/process_controller.hpp"
#include "core/logger.hpp"
#include "daemon/launcher.hpp"
#include "i18n/i18n.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <signal.h>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

ProcessController::ProcessController(const Config& config, Provisioner::CommandRunner runner)
    : config_(config),
      lock_(config.lock_path()),
      provisioner_(config, std::move(runner)) {
    provisioner_.on_create_environment = [this]() {
        notify(NoticeKind::Info, T().venv_creating);
    };
    provisioner_.on_install = [this](InstallReason reason) {
        switch (reason) {
            case InstallReason::FirstInstall:
                notify(NoticeKind::Info, T().deps_first_install);
                break;
            case InstallReason::ManifestChanged:
                notify(NoticeKind::Warning, T().deps_manifest_changed);
                break;
            case InstallReason::ProbeFailed:
                notify(NoticeKind::Warning, T().deps_damaged);
                break;
            case InstallReason::Forced:
                notify(NoticeKind::Info, T().deps_forced);
                break;
            case InstallReason::None:
                break;
        }
    };
}

void ProcessController::notify(NoticeKind kind, const std::string& text) {
    if (on_notice) on_notice(kind, text);
}

LockStatus ProcessController::status() const {
    return lock_.status();
}

bool ProcessController::wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (LockManager::is_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(kPollInterval);
    }
    return true;
}

// Environment and dependencies; nothing on disk besides the venv changes here
OpResult ProcessController::provision() {
    try {
        if (provisioner_.ensure_environment()) {
            notify(NoticeKind::Success, T().venv_created);
        }
        InstallReason reason = provisioner_.ensure_dependencies(false);
        notify(NoticeKind::Success,
               reason == InstallReason::None ? T().deps_up_to_date : T().deps_installed);
        return OpResult::ok();
    } catch (const SupervisorException& e) {
        switch (e.error()) {
            case SupervisorError::ManifestNotFound:
                notify(NoticeKind::Error, T().manifest_missing + config_.manifest_path());
                notify(NoticeKind::Info, T().manifest_hint);
                break;
            case SupervisorError::InstallFailed:
                notify(NoticeKind::Error, T().deps_install_failed);
                notify(NoticeKind::Info, T().deps_install_hint);
                break;
            default:
                notify(NoticeKind::Error, e.what());
                break;
        }
        LOG_ERROR("provisioning failed: {} ({})", e.what(), error_name(e.error()));
        return OpResult::fail(e.error(), e.what());
    } catch (const fs::filesystem_error& e) {
        notify(NoticeKind::Error, e.what());
        LOG_ERROR("provisioning failed: {}", e.what());
        return OpResult::fail(SupervisorError::EnvironmentMissing, e.what());
    } catch (const std::exception& e) {
        notify(NoticeKind::Error, T().deps_install_failed);
        LOG_ERROR("provisioning failed: {}", e.what());
        return OpResult::fail(SupervisorError::InstallFailed, e.what());
    }
}

OpResult ProcessController::start() {
    LockStatus st = lock_.status();

    if (st.state == LockState::Running) {
        notify(NoticeKind::Error, std::string(T().start_already_running) +
                                  " (PID: " + std::to_string(st.pid) + ")");
        notify(NoticeKind::Info, T().hint_stop);
        LOG_WARN("start refused: already running as pid {}", st.pid);
        return OpResult::fail(SupervisorError::AlreadyRunning,
                              "already running", st.pid);
    }

    if (st.state == LockState::Stale) {
        notify(NoticeKind::Warning, T().start_stale_removed);
        LOG_WARN("clearing stale lock (pid {})", st.pid);
        lock_.release();
    }

    std::error_code ec;
    if (!config_.data().bot_script.empty() && !fs::exists(config_.script_path(), ec)) {
        notify(NoticeKind::Error, T().start_script_missing + config_.script_path());
        return OpResult::fail(SupervisorError::EnvironmentMissing,
                              "bot script not found: " + config_.script_path());
    }

    // The token lives in the env file; only its presence is checked
    if (!config_.data().env_file.empty() && !fs::exists(config_.env_file_path(), ec)) {
        notify(NoticeKind::Warning, T().start_env_missing + config_.env_file_path());
        notify(NoticeKind::Info, T().start_env_hint);
    }

    OpResult prov = provision();
    if (!prov.success) {
        return prov;
    }

    notify(NoticeKind::Success, T().launching);
    LaunchResult launched = Launcher::spawn_detached(
        config_.launch_argv(), config_.bot_log_path(), config_.base_dir());
    if (!launched.started) {
        std::string reason = std::strerror(launched.sys_error);
        notify(NoticeKind::Error, T().launch_failed + reason);
        LOG_ERROR("launch of {} failed: {}", config_.launch_argv().front(), reason);
        return OpResult::fail(SupervisorError::LaunchFailed, reason);
    }

    try {
        if (!lock_.acquire(launched.pid)) {
            // Another invocation got there between our status check and now
            kill(launched.pid, SIGKILL);
            auto winner = lock_.read_pid();
            pid_t winner_pid = winner ? *winner : -1;
            notify(NoticeKind::Error, T().lock_race_lost);
            LOG_WARN("lost lock race to pid {}, killed pid {}", winner_pid, launched.pid);
            return OpResult::fail(SupervisorError::AlreadyRunning,
                                  "lock taken by another instance", winner_pid);
        }
    } catch (const std::system_error& e) {
        kill(launched.pid, SIGKILL);
        notify(NoticeKind::Error, T().lock_write_failed + std::string(e.what()));
        LOG_ERROR("cannot write lock {}: {}", lock_.path(), e.what());
        return OpResult::fail(SupervisorError::LaunchFailed, e.what());
    }

    notify(NoticeKind::Success, std::string(T().launched) +
                                " (PID: " + std::to_string(launched.pid) + ")");
    notify(NoticeKind::Info, T().hint_logs + config_.bot_log_path());
    LOG_INFO("started pid {}", launched.pid);
    return OpResult::ok(launched.pid);
}

OpResult ProcessController::stop() {
    LockStatus st = lock_.status();

    if (st.state == LockState::Absent) {
        notify(NoticeKind::Warning, T().stop_already);
        return {true, SupervisorError::NotRunning, -1, T().stop_already};
    }

    if (st.state == LockState::Stale) {
        notify(NoticeKind::Warning, T().stop_stale_cleanup);
        lock_.release();
        notify(NoticeKind::Success, T().stop_done);
        LOG_WARN("removed stale lock (pid {})", st.pid);
        return {true, SupervisorError::NotRunning, st.pid, T().stop_stale_cleanup};
    }

    pid_t pid = st.pid;
    notify(NoticeKind::Info, std::string(T().stopping) +
                             " (PID: " + std::to_string(pid) + ")...");
    LOG_INFO("stopping pid {}", pid);

    if (kill(pid, SIGTERM) != 0) {
        int err = errno;
        if (err != ESRCH) {
            std::string reason = std::strerror(err);
            notify(NoticeKind::Error, T().signal_failed + reason);
            LOG_ERROR("SIGTERM to pid {} failed: {}", pid, reason);
            return OpResult::fail(SupervisorError::SignalFailed, reason, pid);
        }
        // Already gone
    } else if (!wait_for_exit(pid, std::chrono::milliseconds(config_.data().grace_period_ms))) {
        notify(NoticeKind::Warning, T().force_stopping);
        LOG_WARN("pid {} ignored SIGTERM for {} ms, sending SIGKILL",
                 pid, config_.data().grace_period_ms);
        if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG_ERROR("SIGKILL to pid {} failed: {}", pid, std::strerror(errno));
        }
    }

    lock_.release();
    notify(NoticeKind::Success, T().stopped);
    LOG_INFO("stopped pid {}", pid);
    return OpResult::ok(pid);
}

OpResult ProcessController::restart() {
    notify(NoticeKind::Info, T().restarting);
    LOG_INFO("restart requested");

    OpResult stopped = stop();
    if (!stopped.success) {
        LOG_WARN("stop phase of restart failed: {}", stopped.message);
    }

    std::this_thread::sleep_for(kRestartDelay);
    return start();
}

OpResult ProcessController::update() {
    if (!provisioner_.environment_exists()) {
        notify(NoticeKind::Error, T().venv_missing);
        notify(NoticeKind::Info, T().update_run_start_first);
        return OpResult::fail(SupervisorError::EnvironmentMissing,
                              "virtual environment not found: " + config_.venv_path());
    }

    try {
        provisioner_.ensure_dependencies(true);
    } catch (const SupervisorException& e) {
        if (e.error() == SupervisorError::ManifestNotFound) {
            notify(NoticeKind::Error, T().manifest_missing + config_.manifest_path());
            notify(NoticeKind::Info, T().manifest_hint);
        } else {
            notify(NoticeKind::Error, T().deps_install_failed);
            notify(NoticeKind::Info, T().deps_install_hint);
        }
        LOG_ERROR("update failed: {}", e.what());
        return OpResult::fail(e.error(), e.what());
    } catch (const std::exception& e) {
        notify(NoticeKind::Error, T().deps_install_failed);
        LOG_ERROR("update failed: {}", e.what());
        return OpResult::fail(SupervisorError::InstallFailed, e.what());
    }

    notify(NoticeKind::Success, T().update_done);
    notify(NoticeKind::Info, T().update_restart_hint);
    LOG_INFO("forced dependency update complete");
    return OpResult::ok();
}
