#include "core/logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

bool Logger::initialize(const std::string& path) {
    try {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        // 1 MiB per file, 3 backups
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, 1024 * 1024, 3);
        file_sink->set_level(spdlog::level::trace);

        auto logger = std::make_shared<spdlog::logger>("botctl", file_sink);
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%l] %v");
        logger->flush_on(spdlog::level::info);
        logger_ = logger;
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        logger_ = std::make_shared<spdlog::logger>(
            "botctl", std::make_shared<spdlog::sinks::null_sink_mt>());
    }
    return logger_;
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
}
