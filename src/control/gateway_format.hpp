#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "../core/records.hpp"
#include "../core/utils.hpp"

namespace quote_gateway {
namespace gateway_format {

template <typename T>
inline nlohmann::json maybe(const std::optional<T>& v) {
    if (!v) return nullptr;
    return *v;
}

inline void put_point(nlohmann::json& out, const OhlcvPoint& p) {
    out["date"] = p.date;
    out["open"] = p.open;
    out["high"] = p.high;
    out["low"] = p.low;
    out["close"] = p.close;
    out["volume"] = p.volume;
    out["adjusted_close"] = p.adjusted_close;
}

inline nlohmann::json format_fundamentals(const FundamentalsRecord& f) {
    nlohmann::json result;
    result["ticker"] = f.ticker;
    result["name"] = f.name;
    result["date"] = f.date;
    result["pe_ratio"] = maybe(f.pe_ratio);
    result["pb_ratio"] = maybe(f.pb_ratio);
    result["ps_ratio"] = maybe(f.ps_ratio);
    result["peg_ratio"] = maybe(f.peg_ratio);
    result["roe"] = maybe(f.roe);
    result["roa"] = maybe(f.roa);
    result["profit_margin"] = maybe(f.profit_margin);
    result["dividend_yield"] = maybe(f.dividend_yield);
    result["dividend_per_share"] = maybe(f.dividend_per_share);
    result["payout_ratio"] = maybe(f.payout_ratio);
    result["revenue_growth"] = maybe(f.revenue_growth);
    result["earnings_growth"] = maybe(f.earnings_growth);
    result["debt_to_equity"] = maybe(f.debt_to_equity);
    result["current_ratio"] = maybe(f.current_ratio);
    result["beta"] = maybe(f.beta);
    result["analyst_rating"] = maybe(f.analyst_rating);
    result["success"] = true;
    return result;
}

inline nlohmann::json format_point(const OhlcvPoint& p) {
    nlohmann::json result;
    put_point(result, p);
    return result;
}

inline nlohmann::json format_historical(const HistoricalRecord& h) {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& p : h.data) {
        data.push_back(format_point(p));
    }
    return {
        {"ticker", h.ticker},
        {"period", h.period},
        {"interval", h.interval},
        {"data", data},
        {"success", true}
    };
}

inline nlohmann::json format_quote(const QuotePoint& q) {
    nlohmann::json result;
    result["ticker"] = q.ticker;
    put_point(result, q.point);
    result["success"] = true;
    return result;
}

inline nlohmann::json format_error(const ErrorEnvelope& e) {
    return {
        {"ticker", e.ticker},
        {"success", false},
        {"error", e.error}
    };
}

inline nlohmann::json format_root(const ServiceInfo& info, Timestamp now) {
    return {
        {"name", info.name},
        {"version", info.version},
        {"status", "running"},
        {"timestamp", utils::ts_to_iso(now)}
    };
}

inline nlohmann::json format_health(Timestamp now) {
    return {
        {"status", "healthy"},
        {"timestamp", utils::ts_to_iso(now)}
    };
}

} // namespace gateway_format
} // namespace quote_gateway
