#pragma once

#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "config.hpp"

namespace quote_gateway {

/**
 * Install the process-wide default logger: console always, plus a file
 * sink when logging.file is set. Unknown level names fall back to info.
 */
inline void init_logging(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", cfg.file, e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("quote_gateway", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S,%e - %n - %l - %v");
    auto level = spdlog::level::from_str(cfg.level);
    if (level == spdlog::level::off && cfg.level != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

} // namespace quote_gateway
