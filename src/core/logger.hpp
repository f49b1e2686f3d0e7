#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

/// Supervisor diagnostics log. Operator-facing output is printed by the CLI.
class Logger {
public:
    /// Route the "botctl" logger to a rotating file at path
    static bool initialize(const std::string& path);

    /// Falls back to a null sink until initialize() succeeds
    static std::shared_ptr<spdlog::logger> get();

    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

#define LOG_INFO(...)  Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) Logger::get()->error(__VA_ARGS__)
#define LOG_DEBUG(...) Logger::get()->debug(__VA_ARGS__)
