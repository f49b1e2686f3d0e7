#include "daemon/launcher.hpp"

#include <cerrno>
#include <cstdlib>
#include <dirent.h>
#include <fcntl.h>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::vector<char*> make_argv(std::vector<std::string>& storage) {
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);
    return argv;
}

// Retry on EINTR, report short reads as failure
bool read_full(int fd, void* buf, size_t len) {
    auto* p = static_cast<char*>(buf);
    size_t done = 0;
    while (done < len) {
        ssize_t n = read(fd, p + done, len - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        done += static_cast<size_t>(n);
    }
    return true;
}

// Descriptors opened without O_CLOEXEC (the supervisor log among them)
// must not leak into the exec'd program. Called in the child after fork.
void cloexec_inherited_fds() {
    DIR* dir = opendir("/proc/self/fd");
    if (!dir) {
        long max_fd = sysconf(_SC_OPEN_MAX);
        if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
        for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
            fcntl(fd, F_SETFD, FD_CLOEXEC);
        }
        return;
    }
    int self = dirfd(dir);
    while (dirent* entry = readdir(dir)) {
        int fd = std::atoi(entry->d_name);  // 0 for "." and ".."
        if (fd > STDERR_FILENO && fd != self) {
            fcntl(fd, F_SETFD, FD_CLOEXEC);
        }
    }
    closedir(dir);
}

void write_errno(int fd, int err) {
    ssize_t n = write(fd, &err, sizeof(err));
    (void)n;
}

} // namespace

int Launcher::run_command(const std::vector<std::string>& args, bool quiet) {
    if (args.empty()) return -1;

    // Built before fork: no allocation in the child
    std::vector<std::string> storage = args;
    std::vector<char*> argv = make_argv(storage);

    pid_t pid = fork();
    if (pid < 0) {
        return -1;
    }

    if (pid == 0) {
        if (quiet) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }
        cloexec_inherited_fds();
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

LaunchResult Launcher::spawn_detached(const std::vector<std::string>& args,
                                      const std::string& log_path,
                                      const std::string& working_dir) {
    LaunchResult result;
    if (args.empty()) {
        result.sys_error = EINVAL;
        return result;
    }

    std::error_code ec;
    auto parent = fs::path(log_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::vector<std::string> storage = args;
    std::vector<char*> argv = make_argv(storage);

    // pid_pipe: intermediate child -> us, grandchild pid
    // err_pipe: grandchild -> us, errno if exec fails; closed by a successful exec
    int pid_pipe[2];
    int err_pipe[2];
    if (pipe2(pid_pipe, O_CLOEXEC) < 0) {
        result.sys_error = errno;
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        result.sys_error = errno;
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        return result;
    }

    pid_t mid = fork();
    if (mid < 0) {
        result.sys_error = errno;
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (mid == 0) {
        close(pid_pipe[0]);
        close(err_pipe[0]);
        setsid();

        pid_t child = fork();
        if (child < 0) {
            write_errno(err_pipe[1], errno);
            _exit(1);
        }
        if (child > 0) {
            ssize_t n = write(pid_pipe[1], &child, sizeof(child));
            (void)n;
            _exit(0);
        }

        // Managed process
        if (!working_dir.empty() && chdir(working_dir.c_str()) < 0) {
            write_errno(err_pipe[1], errno);
            _exit(127);
        }

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (log_fd < 0) {
            write_errno(err_pipe[1], errno);
            _exit(127);
        }
        dup2(log_fd, STDOUT_FILENO);
        dup2(log_fd, STDERR_FILENO);
        close(log_fd);

        cloexec_inherited_fds();
        execvp(argv[0], argv.data());
        write_errno(err_pipe[1], errno);
        _exit(127);
    }

    close(pid_pipe[1]);
    close(err_pipe[1]);

    int status = 0;
    while (waitpid(mid, &status, 0) < 0 && errno == EINTR) {}

    pid_t child = -1;
    bool have_pid = read_full(pid_pipe[0], &child, sizeof(child));
    close(pid_pipe[0]);

    // Blocks until the grandchild execs (EOF) or reports an errno
    int child_errno = 0;
    bool exec_failed = read_full(err_pipe[0], &child_errno, sizeof(child_errno));
    close(err_pipe[0]);

    if (exec_failed) {
        result.sys_error = child_errno;
        return result;
    }
    if (!have_pid || child <= 0) {
        result.sys_error = ECHILD;
        return result;
    }

    result.started = true;
    result.pid = child;
    return result;
}
