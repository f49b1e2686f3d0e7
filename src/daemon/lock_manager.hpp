#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

enum class LockState {
    Absent,   // no lock record
    Stale,    // record exists, process is gone
    Running,  // record exists, process is alive
};

struct LockStatus {
    LockState state = LockState::Absent;
    pid_t pid = -1;  // PID from the record, -1 if absent or unreadable
};

/// Owns the lock record: a file holding the PID of the managed process.
class LockManager {
public:
    explicit LockManager(std::string lock_path);

    LockStatus status() const;

    /// Create the record with pid. Returns false if a record already exists.
    /// Throws std::system_error if the file cannot be created or written.
    bool acquire(pid_t pid);

    /// Delete the record. No-op when absent.
    void release();

    std::optional<pid_t> read_pid() const;

    const std::string& path() const { return path_; }

    /// Native liveness query. Zombies count as dead.
    static bool is_alive(pid_t pid);

private:
    std::string path_;
};
