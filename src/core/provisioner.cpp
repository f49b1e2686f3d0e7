#include "core/provisioner.hpp"
#include "core/errors.hpp"
#include "core/fingerprint.hpp"
#include "core/logger.hpp"
#include "daemon/launcher.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

Provisioner::Provisioner(const Config& config, CommandRunner runner)
    : config_(config), runner_(std::move(runner)) {
    if (!runner_) {
        runner_ = [](const std::vector<std::string>& argv, bool quiet) {
            return Launcher::run_command(argv, quiet);
        };
    }
}

bool Provisioner::environment_exists() const {
    std::error_code ec;
    return fs::is_directory(config_.venv_path(), ec);
}

bool Provisioner::ensure_environment() {
    if (environment_exists()) {
        return false;
    }

    const std::string venv = config_.venv_path();
    const std::string& interpreter = config_.data().interpreter;
    if (on_create_environment) on_create_environment();
    LOG_INFO("creating runtime environment at {}", venv);

    int rc = runner_({interpreter, "-m", "venv", venv}, false);
    if (rc == 127 || rc < 0) {
        LOG_ERROR("interpreter {} could not be executed", interpreter);
        throw SupervisorException(SupervisorError::EnvironmentMissing,
                                  "Python interpreter not found: " + interpreter);
    }
    if (rc != 0 || !environment_exists()) {
        LOG_ERROR("venv creation failed with exit code {}", rc);
        throw SupervisorException(SupervisorError::EnvironmentMissing,
                                  "Failed to create virtual environment at " + venv +
                                  " (exit code " + std::to_string(rc) + ")");
    }
    return true;
}

bool Provisioner::probe_imports() {
    const std::string& module = config_.data().probe_module;
    if (module.empty()) return true;
    return runner_({config_.venv_python(), "-c", "import " + module}, true) == 0;
}

InstallReason Provisioner::install_reason(bool force) {
    if (force) return InstallReason::Forced;

    const std::string record = config_.fingerprint_path();
    if (Fingerprint::read_record(record).empty()) return InstallReason::FirstInstall;
    if (!Fingerprint::is_up_to_date(record, config_.manifest_path())) {
        return InstallReason::ManifestChanged;
    }
    if (!probe_imports()) return InstallReason::ProbeFailed;
    return InstallReason::None;
}

InstallReason Provisioner::ensure_dependencies(bool force) {
    const std::string manifest = config_.manifest_path();

    // ManifestNotFound takes precedence over every other failure
    Fingerprint::require_manifest(manifest);

    if (!environment_exists()) {
        throw SupervisorException(SupervisorError::EnvironmentMissing,
                                  "Virtual environment not found: " + config_.venv_path());
    }

    InstallReason reason = install_reason(force);
    if (reason == InstallReason::None) {
        LOG_DEBUG("dependencies up to date");
        return reason;
    }

    if (on_install) on_install(reason);
    LOG_INFO("installing dependencies from {} (reason {})", manifest, static_cast<int>(reason));

    std::vector<std::string> argv = {config_.venv_pip(), "install", "-q"};
    if (reason == InstallReason::Forced) {
        argv.push_back("--upgrade");
    }
    argv.push_back("-r");
    argv.push_back(manifest);

    int rc = runner_(argv, false);
    if (rc != 0) {
        LOG_ERROR("installer exited with code {}", rc);
        throw SupervisorException(SupervisorError::InstallFailed,
                                  "Dependency installation failed (exit code " +
                                  std::to_string(rc) + ")");
    }

    try {
        Fingerprint::commit(config_.fingerprint_path(), manifest);
    } catch (const SupervisorException&) {
        throw;
    } catch (const std::exception& e) {
        throw SupervisorException(SupervisorError::InstallFailed,
                                  std::string("Cannot record dependency fingerprint: ") + e.what());
    }
    LOG_INFO("dependencies installed, fingerprint committed");
    return reason;
}
