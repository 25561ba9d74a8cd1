/**
 * @file logging.h
 * @brief spdlog setup shared by tools and examples
 */

#pragma once

#include <cstddef>
#include <string>

namespace quantgate {

struct LoggingConfig {
    std::string level{"info"};            // trace|debug|info|warn|error|critical|off
    bool console{true};
    std::string file_path;                // Empty disables the rotating file sink
    std::size_t max_file_size{1024 * 1024 * 5};
    std::size_t max_files{3};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%f] [PID:%P] [TID:%t] [%^%l%$] [%s:%#] [%!] %v"};
};

/**
 * @brief Install a console (and optional rotating file) logger as spdlog default
 * @return false if the sinks could not be created
 */
bool init_logging(const LoggingConfig& config);

} // namespace quantgate
