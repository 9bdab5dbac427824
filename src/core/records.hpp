#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace quote_gateway {

struct FundamentalsRecord {
    std::string ticker;
    std::string name;
    std::string date;              // generation date, service-local
    std::optional<double> pe_ratio;
    std::optional<double> pb_ratio;
    std::optional<double> ps_ratio;
    std::optional<double> peg_ratio;
    std::optional<double> roe;                 // percent
    std::optional<double> roa;                 // percent
    std::optional<double> profit_margin;       // percent
    std::optional<double> dividend_yield;      // percent
    std::optional<double> dividend_per_share;
    std::optional<double> payout_ratio;
    std::optional<double> revenue_growth;      // percent
    std::optional<double> earnings_growth;     // percent
    std::optional<double> debt_to_equity;
    std::optional<double> current_ratio;
    std::optional<double> beta;
    std::optional<std::string> analyst_rating;
};

struct OhlcvPoint {
    std::string date;              // exchange-local trading date
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    int64_t volume{0};
    double adjusted_close{0.0};    // always equal to close
};

struct HistoricalRecord {
    std::string ticker;
    std::string period;
    std::string interval;
    std::vector<OhlcvPoint> data;
};

struct QuotePoint {
    std::string ticker;
    OhlcvPoint point;
};

struct ErrorEnvelope {
    std::string ticker;
    std::string error;
};

struct ServiceInfo {
    std::string name;
    std::string version;
};

} // namespace quote_gateway
