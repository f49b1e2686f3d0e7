#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() {
    std::error_code ec;
    base_dir_ = fs::current_path(ec).string();
}

Config::Config(const std::string& base_dir) : base_dir_(base_dir) {}

Config::~Config() = default;

std::string Config::default_config_path() {
    const char* env = std::getenv("BOTCTL_CONFIG");
    if (env && *env) {
        return expand_home(env);
    }
    std::error_code ec;
    return (fs::current_path(ec) / "botctl.yaml").string();
}

bool Config::load(const std::string& path) {
    error_.clear();
    std::string full = expand_home(path);
    if (full.empty() || !fs::exists(full)) {
        return false;
    }

    // Relative paths in the file are relative to the file itself
    base_dir_ = fs::absolute(full).parent_path().string();

    try {
        YAML::Node root = YAML::LoadFile(full);

        // Bot section
        if (auto bot = root["bot"]) {
            config_.bot_script = bot["script"].as<std::string>(config_.bot_script);
            config_.bot_executable = bot["executable"].as<std::string>(config_.bot_executable);
            config_.env_file = bot["env_file"].as<std::string>(config_.env_file);
            config_.bot_log_file = bot["log_file"].as<std::string>(config_.bot_log_file);
            if (auto args = bot["args"]) {
                config_.bot_args.clear();
                for (const auto& arg : args) {
                    config_.bot_args.push_back(arg.as<std::string>());
                }
            }
        }

        // Runtime section
        if (auto runtime = root["runtime"]) {
            config_.interpreter = runtime["interpreter"].as<std::string>(config_.interpreter);
            config_.venv_dir = runtime["venv_dir"].as<std::string>(config_.venv_dir);
            config_.manifest = runtime["manifest"].as<std::string>(config_.manifest);
            config_.probe_module = runtime["probe_module"].as<std::string>(config_.probe_module);
        }

        // Supervisor section
        if (auto sup = root["supervisor"]) {
            config_.lock_file = sup["lock_file"].as<std::string>(config_.lock_file);
            config_.log_file = sup["log_file"].as<std::string>(config_.log_file);
            config_.grace_period_ms = sup["grace_period_ms"].as<int>(config_.grace_period_ms);
            config_.language = sup["language"].as<std::string>(config_.language);
        }

        if (config_.grace_period_ms < 0) {
            config_.grace_period_ms = 0;
        }
        return true;
    } catch (const YAML::Exception& e) {
        // Parse failed, keep defaults
        error_ = e.what();
        return false;
    }
}

const std::string& Config::error() const { return error_; }

SupervisorConfig& Config::data() { return config_; }
const SupervisorConfig& Config::data() const { return config_; }

const std::string& Config::base_dir() const { return base_dir_; }

std::string Config::resolve(const std::string& path) const {
    if (path.empty()) return "";
    fs::path p(expand_home(path));
    if (p.is_absolute()) return p.string();
    return (fs::path(base_dir_) / p).string();
}

std::string Config::lock_path() const { return resolve(config_.lock_file); }
std::string Config::venv_path() const { return resolve(config_.venv_dir); }
std::string Config::manifest_path() const { return resolve(config_.manifest); }
std::string Config::script_path() const { return resolve(config_.bot_script); }
std::string Config::env_file_path() const { return resolve(config_.env_file); }
std::string Config::bot_log_path() const { return resolve(config_.bot_log_file); }
std::string Config::log_path() const { return resolve(config_.log_file); }

std::string Config::fingerprint_path() const {
    return (fs::path(venv_path()) / ".requirements_hash").string();
}

std::string Config::venv_python() const {
    return (fs::path(venv_path()) / "bin" / "python").string();
}

std::string Config::venv_pip() const {
    return (fs::path(venv_path()) / "bin" / "pip").string();
}

std::vector<std::string> Config::launch_argv() const {
    std::vector<std::string> argv;
    if (config_.bot_executable.empty()) {
        argv.push_back(venv_python());
    } else {
        // Bare names are looked up in PATH by execvp
        const std::string& exe = config_.bot_executable;
        argv.push_back(exe.find('/') == std::string::npos ? exe : resolve(exe));
    }
    if (!config_.bot_script.empty()) {
        argv.push_back(script_path());
    }
    for (const auto& arg : config_.bot_args) {
        argv.push_back(arg);
    }
    return argv;
}
