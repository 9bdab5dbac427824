#include <spdlog/spdlog.h>
#include <drogon/drogon.h>
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/data_source_stub.hpp"
#include "core/yahoo_data_source.hpp"
#include "core/quote_gateway.hpp"
#include "control/gateway_controller.hpp"

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    quote_gateway::Config cfg;
    try {
        quote_gateway::load_config(cfg, config_path);
    } catch (const std::exception& e) {
        spdlog::error("Invalid config file {}: {}", config_path, e.what());
        return 1;
    }
    quote_gateway::init_logging(cfg.logging);

    spdlog::info("{} {} starting. port={} bind={} provider={}",
                 cfg.service_info.name, cfg.service_info.version,
                 cfg.services.port, cfg.services.bind_address, cfg.upstream.provider);

    std::shared_ptr<quote_gateway::DataSource> data_source;
    if (cfg.upstream.provider == "yahoo") {
        data_source = std::make_shared<quote_gateway::YahooDataSource>(cfg.upstream);
        spdlog::info("Using Yahoo Finance data source");
    } else {
        if (cfg.upstream.provider != "stub") {
            spdlog::warn("Unknown upstream provider '{}', falling back to stub data source",
                         cfg.upstream.provider);
        }
        data_source = std::make_shared<quote_gateway::StubDataSource>();
    }

    auto gateway = std::make_shared<quote_gateway::QuoteGateway>(
        data_source,
        quote_gateway::ServiceInfo{cfg.service_info.name, cfg.service_info.version});
    auto api_ctrl = std::make_shared<quote_gateway::GatewayController>(gateway, cfg);

    trantor::Logger::setLogLevel(trantor::Logger::kWarn);
    drogon::app().setThreadNum(cfg.services.io_threads);
    drogon::app().addListener(cfg.services.bind_address, cfg.services.port);
    drogon::app().registerController(api_ctrl);
    spdlog::info("Starting Drogon listener on {}:{}", cfg.services.bind_address, cfg.services.port);
    drogon::app().run();
    return 0;
}
