#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <sys/types.h>

enum class SupervisorError {
    None,
    AlreadyRunning,
    NotRunning,          // stop/restart with nothing running; reported as success
    ManifestNotFound,
    InstallFailed,
    LaunchFailed,
    EnvironmentMissing,
    SignalFailed,        // stop could not signal a live process (e.g. EPERM)
};

inline const char* error_name(SupervisorError err) {
    switch (err) {
        case SupervisorError::None:               return "None";
        case SupervisorError::AlreadyRunning:     return "AlreadyRunning";
        case SupervisorError::NotRunning:         return "NotRunning";
        case SupervisorError::ManifestNotFound:   return "ManifestNotFound";
        case SupervisorError::InstallFailed:      return "InstallFailed";
        case SupervisorError::LaunchFailed:       return "LaunchFailed";
        case SupervisorError::EnvironmentMissing: return "EnvironmentMissing";
        case SupervisorError::SignalFailed:       return "SignalFailed";
    }
    return "Unknown";
}

/// Thrown inside the provisioning layer, converted to OpResult by the controller
class SupervisorException : public std::runtime_error {
public:
    SupervisorException(SupervisorError error, const std::string& message)
        : std::runtime_error(message), error_(error) {}

    SupervisorError error() const { return error_; }

private:
    SupervisorError error_;
};

struct OpResult {
    bool success = false;
    SupervisorError error = SupervisorError::None;
    pid_t pid = -1;
    std::string message;

    static OpResult ok(pid_t pid = -1, std::string message = {}) {
        return {true, SupervisorError::None, pid, std::move(message)};
    }
    static OpResult fail(SupervisorError error, std::string message, pid_t pid = -1) {
        return {false, error, pid, std::move(message)};
    }
};
