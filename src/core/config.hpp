#pragma once

#include <string>
#include <vector>

struct SupervisorConfig {
    // Managed process
    std::string bot_script = "bot.py";
    std::string bot_executable;  // empty = interpreter inside the venv
    std::vector<std::string> bot_args;
    std::string env_file = ".env";
    std::string bot_log_file = "bot.log";

    // Runtime environment
    std::string interpreter = "python3";
    std::string venv_dir = "venv";
    std::string manifest = "requirements.txt";
    std::string probe_module = "aiogram";

    // Supervisor
    std::string lock_file = ".bot.lock";
    std::string log_file = "botctl.log";
    int grace_period_ms = 2000;
    std::string language = "en";
};

class Config {
public:
    Config();
    explicit Config(const std::string& base_dir);
    ~Config();

    /// Load from the given YAML file. The file's directory becomes the base dir.
    /// Returns false if the file is missing or malformed (defaults are kept).
    bool load(const std::string& path);

    /// Last parse error, empty if the last load succeeded or the file was absent
    const std::string& error() const;

    SupervisorConfig& data();
    const SupervisorConfig& data() const;

    const std::string& base_dir() const;

    /// Resolve a path relative to the base dir; absolute paths pass through
    std::string resolve(const std::string& path) const;

    std::string lock_path() const;
    std::string venv_path() const;
    std::string manifest_path() const;
    std::string fingerprint_path() const;
    std::string script_path() const;
    std::string env_file_path() const;
    std::string bot_log_path() const;
    std::string log_path() const;
    std::string venv_python() const;
    std::string venv_pip() const;

    /// argv used to launch the managed process
    std::vector<std::string> launch_argv() const;

    /// --config value if given, else $BOTCTL_CONFIG, else ./botctl.yaml
    static std::string default_config_path();
    static std::string expand_home(const std::string& path);

private:
    SupervisorConfig config_;
    std::string base_dir_;
    std::string error_;
};
