#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "i18n/i18n.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <unistd.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

using json = nlohmann::json;

namespace {

const char* const RED    = "\033[0;31m";
const char* const GREEN  = "\033[0;32m";
const char* const YELLOW = "\033[1;33m";
const char* const BLUE   = "\033[0;34m";
const char* const PURPLE = "\033[0;35m";
const char* const CYAN   = "\033[0;36m";
const char* const NC     = "\033[0m";

bool is(const char* arg, const char* a, const char* b = nullptr, const char* c = nullptr) {
    return std::strcmp(arg, a) == 0 ||
           (b && std::strcmp(arg, b) == 0) ||
           (c && std::strcmp(arg, c) == 0);
}

} // namespace

// ── Output helpers ──────────────────────────────────────────

bool CLI::use_color(int fd) {
    if (std::getenv("NO_COLOR")) return false;
    return isatty(fd) == 1;
}

void CLI::print_header() {
    bool color = use_color(STDOUT_FILENO);
    const char* line = "━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━";
    if (color) {
        std::cout << PURPLE << line << NC << "\n"
                  << CYAN << "🤖  " << T().app_title << NC << "\n"
                  << PURPLE << line << NC << "\n";
    } else {
        std::cout << line << "\n" << T().app_title << "\n" << line << "\n";
    }
}

void CLI::print_notice(NoticeKind kind, const std::string& text) {
    const char* color = BLUE;
    const char* icon = "ℹ️  ";
    std::ostream* out = &std::cout;
    int fd = STDOUT_FILENO;
    switch (kind) {
        case NoticeKind::Info:    color = BLUE;   icon = "ℹ️  "; break;
        case NoticeKind::Success: color = GREEN;  icon = "✅ "; break;
        case NoticeKind::Warning: color = YELLOW; icon = "⚠️  "; break;
        case NoticeKind::Error:
            color = RED;
            icon = "❌ ";
            out = &std::cerr;
            fd = STDERR_FILENO;
            break;
    }
    if (use_color(fd)) {
        *out << color << icon << text << NC << "\n";
    } else {
        *out << icon << text << "\n";
    }
}

// ── Argument parsing ────────────────────────────────────────

bool CLI::parse_args(int argc, char* argv[], Options& opts) {
    bool have_command = false;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (is(arg, "--config", "-c")) {
            if (i + 1 >= argc) return false;
            opts.config_path = argv[++i];
        } else if (std::strncmp(arg, "--config=", 9) == 0) {
            opts.config_path = arg + 9;
        } else if (is(arg, "--json")) {
            opts.json = true;
        } else if (!have_command) {
            opts.command = arg;
            have_command = true;
        }
    }
    return true;
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        std::cerr << "Option --config requires a file path\n";
        cmd_help(std::cerr);
        return 1;
    }

    const char* cmd = opts.command.c_str();
    if (is(cmd, "help", "--help", "-h")) {
        return cmd_help(std::cout);
    }
    if (is(cmd, "version", "--version", "-v")) {
        return cmd_version();
    }

    bool known = is(cmd, "start", "stop", "restart") || is(cmd, "status", "update");
    if (!known) {
        print_notice(NoticeKind::Error, T().unknown_command + opts.command);
        std::cerr << "\n";
        cmd_help(std::cerr);
        return 1;
    }

    Config config;
    std::string config_path = opts.config_path.empty()
        ? Config::default_config_path() : opts.config_path;
    if (!config.load(config_path) && !config.error().empty()) {
        print_notice(NoticeKind::Warning, T().config_invalid + config.error());
    }
    current_lang = lang_from_code(config.data().language);
    Logger::initialize(config.log_path());
    LOG_INFO("botctl {} {}", APP_VERSION, opts.command);

    ProcessController ctl(config);
    ctl.on_notice = &CLI::print_notice;

    if (is(cmd, "start")) return cmd_start(ctl);
    if (is(cmd, "stop")) return cmd_stop(ctl);
    if (is(cmd, "restart")) return cmd_restart(ctl);
    if (is(cmd, "status")) return cmd_status(ctl, config, opts.json);
    return cmd_update(ctl);
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help(std::ostream& out) {
    out <<
        "botctl — single-instance supervisor for a bot process\n"
        "\n"
        "Usage:\n"
        "  botctl [--config <file>] [command]\n"
        "\n"
        "Commands:\n"
        "  start            Start the bot (default)\n"
        "  stop             Stop the bot\n"
        "  restart          Restart the bot\n"
        "  status [--json]  Show bot status\n"
        "  update           Force-update dependencies (requirements.txt)\n"
        "  version          Show version\n"
        "  help             Show this help\n"
        "\n"
        "Configuration is read from --config, $BOTCTL_CONFIG or ./botctl.yaml.\n"
        "\n"
        "Examples:\n"
        "  botctl               # start\n"
        "  botctl status        # check status\n"
        "  botctl update        # update dependencies\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "botctl " << APP_VERSION << "\n";
    return 0;
}

// ── lifecycle ───────────────────────────────────────────────

int CLI::cmd_start(ProcessController& ctl) {
    print_header();
    OpResult res = ctl.start();
    return res.success ? 0 : 1;
}

int CLI::cmd_stop(ProcessController& ctl) {
    print_header();
    OpResult res = ctl.stop();
    return res.success ? 0 : 1;
}

int CLI::cmd_restart(ProcessController& ctl) {
    print_header();
    OpResult res = ctl.restart();
    return res.success ? 0 : 1;
}

int CLI::cmd_update(ProcessController& ctl) {
    print_header();
    OpResult res = ctl.update();
    return res.success ? 0 : 1;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status(ProcessController& ctl, const Config& config, bool as_json) {
    LockStatus st = ctl.status();

    if (as_json) {
        json j;
        switch (st.state) {
            case LockState::Running: j["state"] = "running"; break;
            case LockState::Stale:   j["state"] = "stale";   break;
            case LockState::Absent:  j["state"] = "absent";  break;
        }
        if (st.pid > 0) j["pid"] = st.pid;
        j["lock_file"] = config.lock_path();
        j["log_file"] = config.bot_log_path();
        std::cout << j.dump() << "\n";
        return 0;
    }

    print_header();
    switch (st.state) {
        case LockState::Running:
            print_notice(NoticeKind::Success, std::string(T().status_running) +
                                              " (PID: " + std::to_string(st.pid) + ")");
            std::cout << "\n";
            print_notice(NoticeKind::Info, T().hint_logs + config.bot_log_path());
            print_notice(NoticeKind::Info, T().hint_stop);
            break;
        case LockState::Stale:
            print_notice(NoticeKind::Warning, T().status_stale);
            print_notice(NoticeKind::Info, T().hint_cleanup + config.lock_path());
            break;
        case LockState::Absent:
            print_notice(NoticeKind::Info, T().status_stopped);
            print_notice(NoticeKind::Info, T().hint_start);
            break;
    }
    return 0;
}
