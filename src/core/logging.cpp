/**
 * @file logging.cpp
 */

#include "core/logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <vector>

namespace quantgate {

bool init_logging(const LoggingConfig& config) {
    if (!config.file_path.empty()) {
        try {
            auto parent = std::filesystem::path(config.file_path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Failed to create log directory: " << ex.what() << std::endl;
            return false;
        }
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::debug);
            sinks.push_back(console_sink);
        }
        if (!config.file_path.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("quantgate", sinks.begin(), sinks.end());
        logger->set_pattern(config.pattern);
        logger->set_level(spdlog::level::from_str(config.level));

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(1));
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

} // namespace quantgate
