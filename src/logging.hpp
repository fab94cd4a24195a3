#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

// Builds the service logger (colored console + daily file under log_dir,
// keeping max_files rotated files) and installs it as the spdlog default.
std::shared_ptr<spdlog::logger> setup_logging(const std::string& log_level,
                                              const std::string& log_dir,
                                              int max_files);

spdlog::level::level_enum parse_log_level(const std::string& log_level);
