#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "../core/quote_gateway.hpp"

namespace quote_gateway {

/**
 * Status code plus JSON body for one route. Built without a running server
 * so the routing contract can be exercised directly.
 */
struct Reply {
    int status{200};
    nlohmann::json body;
};

Reply root_reply(const QuoteGateway& gateway);
Reply health_reply(const QuoteGateway& gateway);

// Data routes: 200 with the record, or 500 with {ticker, success:false, error}.
Reply fundamentals_reply(QuoteGateway& gateway, const std::string& ticker);
Reply historical_reply(QuoteGateway& gateway,
                       const std::string& ticker,
                       const std::string& period,
                       const std::string& interval);
Reply quote_reply(QuoteGateway& gateway, const std::string& ticker);

// 500 envelope for a failure caught outside the reply builders.
Reply error_reply(const std::string& ticker, const std::string& message);

// Serialized body. Path parameters arrive URL-decoded and may carry bytes
// that are not UTF-8; those are replaced with U+FFFD instead of throwing.
std::string reply_body(const Reply& reply);

} // namespace quote_gateway
