#pragma once

#include <string>
#include <fstream>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace quote_gateway {

using json = nlohmann::json;

struct ServiceConfig {
    std::string bind_address{"0.0.0.0"};
    uint16_t port{5099};
    size_t io_threads{1};
    size_t worker_threads{4};      // pool that runs blocking upstream calls
};

struct ServiceInfoConfig {
    std::string name{"Yahoo Finance API"};
    std::string version{"1.0.0"};
};

struct UpstreamConfig {
    std::string provider{"yahoo"};  // "yahoo" or "stub"
    std::string chart_host{"https://query2.finance.yahoo.com"};
    std::string summary_host{"https://query1.finance.yahoo.com"};
    std::string cookie_url{"https://fc.yahoo.com"};
    std::string user_agent{
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36"};
    std::string accept_language{"en-US,en;q=0.9"};
    double timeout_seconds{30.0};
    bool auto_adjust{true};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};            // empty = console only
};

struct Config {
    ServiceConfig services;
    ServiceInfoConfig service_info;
    UpstreamConfig upstream;
    LoggingConfig logging;
};

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("services")) {
        auto& svc = j["services"];
        cfg.services.bind_address = svc.value("bind_address", cfg.services.bind_address);
        cfg.services.port = svc.value("port", cfg.services.port);
        cfg.services.io_threads = svc.value("io_threads", cfg.services.io_threads);
        cfg.services.worker_threads = svc.value("worker_threads", cfg.services.worker_threads);
    }
    if (j.contains("service_info")) {
        auto& info = j["service_info"];
        cfg.service_info.name = info.value("name", cfg.service_info.name);
        cfg.service_info.version = info.value("version", cfg.service_info.version);
    }
    if (j.contains("upstream")) {
        auto& up = j["upstream"];
        cfg.upstream.provider = up.value("provider", cfg.upstream.provider);
        cfg.upstream.chart_host = up.value("chart_host", cfg.upstream.chart_host);
        cfg.upstream.summary_host = up.value("summary_host", cfg.upstream.summary_host);
        cfg.upstream.cookie_url = up.value("cookie_url", cfg.upstream.cookie_url);
        cfg.upstream.user_agent = up.value("user_agent", cfg.upstream.user_agent);
        cfg.upstream.accept_language = up.value("accept_language", cfg.upstream.accept_language);
        cfg.upstream.timeout_seconds = up.value("timeout_seconds", cfg.upstream.timeout_seconds);
        cfg.upstream.auto_adjust = up.value("auto_adjust", cfg.upstream.auto_adjust);
    }
    if (j.contains("logging")) {
        auto& lg = j["logging"];
        cfg.logging.level = lg.value("level", cfg.logging.level);
        cfg.logging.file = lg.value("file", cfg.logging.file);
    }
    if (cfg.services.worker_threads == 0) cfg.services.worker_threads = 1;
    if (cfg.services.io_threads == 0) cfg.services.io_threads = 1;
}

} // namespace quote_gateway
