#include "daemon/lock_manager.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <signal.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

LockManager::LockManager(std::string lock_path) : path_(std::move(lock_path)) {}

bool LockManager::is_alive(pid_t pid) {
    if (pid <= 0) return false;

    if (kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }

#ifdef __linux__
    // An exited but unreaped child still answers kill(pid, 0)
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (stat.is_open()) {
        std::string line;
        std::getline(stat, line);
        auto paren = line.rfind(')');
        if (paren != std::string::npos && paren + 2 < line.size()) {
            char state = line[paren + 2];
            if (state == 'Z' || state == 'X') return false;
        }
    }
#endif
    return true;
}

std::optional<pid_t> LockManager::read_pid() const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;

    // A bare positive pid_t, optionally surrounded by whitespace
    long long pid = 0;
    if (!(in >> pid) || pid <= 0 || pid > std::numeric_limits<pid_t>::max()) {
        return std::nullopt;
    }
    in >> std::ws;
    if (!in.eof()) return std::nullopt;
    return static_cast<pid_t>(pid);
}

LockStatus LockManager::status() const {
    LockStatus st;
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return st;
    }

    auto pid = read_pid();
    if (pid) st.pid = *pid;
    st.state = (pid && is_alive(*pid)) ? LockState::Running : LockState::Stale;
    return st;
}

bool LockManager::acquire(pid_t pid) {
    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) return false;
        throw std::system_error(errno, std::generic_category(), "open " + path_);
    }

    std::string content = std::to_string(pid) + "\n";
    ssize_t written = write(fd, content.data(), content.size());
    int write_errno = errno;
    close(fd);

    if (written != static_cast<ssize_t>(content.size())) {
        release();
        throw std::system_error(written < 0 ? write_errno : EIO,
                                std::generic_category(), "write " + path_);
    }
    return true;
}

void LockManager::release() {
    std::error_code ec;
    fs::remove(path_, ec);
}
