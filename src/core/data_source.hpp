#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace quote_gateway {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * One row of an upstream price series.
 * `date` is already expressed in the exchange's local calendar.
 */
struct BarRecord {
    std::string date;
    double open;
    double high;
    double low;
    double close;
    int64_t volume;
};

/**
 * Flat descriptive/statistical info for a ticker, keyed by upstream field
 * names (longName, trailingPE, returnOnEquity, ...).
 */
struct TickerInfo {
    nlohmann::json fields = nlohmann::json::object();

    // Numeric field, or nullopt when absent, null or non-numeric.
    std::optional<double> number(const std::string& key) const {
        auto it = fields.find(key);
        if (it == fields.end() || !it->is_number()) return std::nullopt;
        return it->get<double>();
    }

    std::optional<std::string> text(const std::string& key) const {
        auto it = fields.find(key);
        if (it == fields.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }

    bool empty() const { return fields.empty(); }
};

/**
 * Raised by a data source when the upstream cannot deliver: transport
 * failure, unknown symbol, malformed or rejected request.
 */
class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Abstract interface for market data sources.
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    virtual TickerInfo get_ticker_info(const std::string& ticker) = 0;

    // Chronological (ascending) series. `period` and `interval` are passed
    // through verbatim; the upstream decides whether they are legal.
    virtual std::vector<BarRecord> get_history(const std::string& ticker,
                                               const std::string& period,
                                               const std::string& interval) = 0;
};

} // namespace quote_gateway
