#pragma once

#include "daemon/process_controller.hpp"

#include <iosfwd>
#include <string>

class CLI {
public:
    /// Parse argv and dispatch to a subcommand. Returns the process exit code.
    static int run(int argc, char* argv[]);

    struct Options {
        std::string config_path;      // empty = Config::default_config_path()
        std::string command = "start";
        bool json = false;
    };

    /// Returns false on a malformed option (missing --config value)
    static bool parse_args(int argc, char* argv[], Options& opts);

    /// ANSI colors for output written to fd: a terminal and no NO_COLOR
    static bool use_color(int fd);

private:
    static int cmd_help(std::ostream& out);
    static int cmd_version();
    static int cmd_start(ProcessController& ctl);
    static int cmd_stop(ProcessController& ctl);
    static int cmd_restart(ProcessController& ctl);
    static int cmd_status(ProcessController& ctl, const Config& config, bool json);
    static int cmd_update(ProcessController& ctl);

    static void print_header();
    static void print_notice(NoticeKind kind, const std::string& text);
};
