#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <filesystem>
#include <vector>

spdlog::level::level_enum parse_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        return spdlog::level::debug;
    } else if (log_level == "warn") {
        return spdlog::level::warn;
    } else if (log_level == "error") {
        return spdlog::level::err;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> setup_logging(const std::string& log_level,
                                              const std::string& log_dir,
                                              int max_files) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    try {
        std::filesystem::create_directories(log_dir);
        sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            log_dir + "/stockwatch.log", 0, 0, false, static_cast<uint16_t>(max_files)));
    } catch (const std::exception& e) {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("stockwatch", sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        logger->warn("File logging disabled ({}): {}", log_dir, file_error);
    }
    return logger;
}
