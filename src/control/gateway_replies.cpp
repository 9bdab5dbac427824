#include "gateway_replies.hpp"
#include "gateway_format.hpp"
#include <spdlog/spdlog.h>

namespace quote_gateway {

Reply error_reply(const std::string& ticker, const std::string& message) {
    return {500, gateway_format::format_error({ticker, message})};
}

std::string reply_body(const Reply& reply) {
    return reply.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Reply root_reply(const QuoteGateway& gateway) {
    return {200, gateway_format::format_root(gateway.service_info(), gateway.now())};
}

Reply health_reply(const QuoteGateway& gateway) {
    return {200, gateway_format::format_health(gateway.now())};
}

Reply fundamentals_reply(QuoteGateway& gateway, const std::string& ticker) {
    spdlog::info("Fetching fundamentals for {}", ticker);
    try {
        auto record = gateway.fundamentals(ticker);
        spdlog::info("Successfully fetched fundamentals for {}", ticker);
        return {200, gateway_format::format_fundamentals(record)};
    } catch (const std::exception& e) {
        spdlog::error("Error fetching fundamentals for {}: {}", ticker, e.what());
        return error_reply(ticker, e.what());
    }
}

Reply historical_reply(QuoteGateway& gateway,
                       const std::string& ticker,
                       const std::string& period,
                       const std::string& interval) {
    spdlog::info("Fetching historical data for {} (period={}, interval={})",
                 ticker,
                 period.empty() ? QuoteGateway::kDefaultPeriod : period,
                 interval.empty() ? QuoteGateway::kDefaultInterval : interval);
    try {
        return {200, gateway_format::format_historical(gateway.historical(ticker, period, interval))};
    } catch (const std::exception& e) {
        spdlog::error("Error fetching historical data for {}: {}", ticker, e.what());
        return error_reply(ticker, e.what());
    }
}

Reply quote_reply(QuoteGateway& gateway, const std::string& ticker) {
    spdlog::info("Fetching quote for {}", ticker);
    try {
        auto q = gateway.quote(ticker);
        spdlog::info("Successfully fetched quote for {}", ticker);
        return {200, gateway_format::format_quote(q)};
    } catch (const std::exception& e) {
        spdlog::error("Error fetching quote for {}: {}", ticker, e.what());
        return error_reply(ticker, e.what());
    }
}

} // namespace quote_gateway
