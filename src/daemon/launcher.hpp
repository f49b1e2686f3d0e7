#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

struct LaunchResult {
    bool started = false;
    pid_t pid = -1;
    int sys_error = 0;  // errno of the failing step when !started
};

class Launcher {
public:
    /// Run argv to completion. Returns the exit code, 127 if exec failed,
    /// 128 + signo if killed by a signal, -1 if fork failed.
    /// quiet sends the child's stdout/stderr to /dev/null.
    static int run_command(const std::vector<std::string>& argv, bool quiet = false);

    /// Launch argv detached from the caller (new session, re-parented away),
    /// stdin from /dev/null, stdout/stderr appended to log_path.
    /// started is true only once execvp has succeeded.
    static LaunchResult spawn_detached(const std::vector<std::string>& argv,
                                       const std::string& log_path,
                                       const std::string& working_dir = {});
};
