#pragma once

#include "core/config.hpp"

#include <functional>
#include <string>
#include <vector>

enum class InstallReason {
    None,             // up to date, nothing installed
    FirstInstall,     // no fingerprint record
    ManifestChanged,  // record differs from the manifest
    ProbeFailed,      // required module cannot be imported
    Forced,
};

/// Keeps the runtime environment (a Python venv) in sync with the manifest.
/// Failures are thrown as SupervisorException.
class Provisioner {
public:
    /// Runs argv to completion and returns its exit code.
    /// quiet asks the runner to discard the command's output.
    using CommandRunner = std::function<int(const std::vector<std::string>& argv, bool quiet)>;

    explicit Provisioner(const Config& config, CommandRunner runner = nullptr);

    bool environment_exists() const;

    /// Create the venv if absent. Returns true if it was created by this call.
    bool ensure_environment();

    /// Install when forced, when the fingerprint is missing or stale, or when
    /// the import probe fails. Commits the fingerprint on success.
    InstallReason ensure_dependencies(bool force);

    /// Invoked right before the installer runs
    std::function<void(InstallReason)> on_install;

    /// Invoked right before the venv is created
    std::function<void()> on_create_environment;

private:
    const Config& config_;
    CommandRunner runner_;

    InstallReason install_reason(bool force);
    bool probe_imports();
};
