#pragma once

#include <functional>
#include <memory>
#include <string>
#include "data_source.hpp"
#include "records.hpp"

namespace quote_gateway {

/**
 * Maps upstream ticker info and price series onto the gateway's response
 * records. Stateless per call; every failure propagates as an exception
 * (UpstreamError, or whatever the data source or JSON decoding throws).
 */
class QuoteGateway {
public:
    using Clock = std::function<Timestamp()>;

    static constexpr const char* kDefaultPeriod = "1y";
    static constexpr const char* kDefaultInterval = "1d";

    QuoteGateway(std::shared_ptr<DataSource> data_source,
                 ServiceInfo info,
                 Clock clock = [] { return std::chrono::system_clock::now(); });

    const ServiceInfo& service_info() const { return info_; }
    Timestamp now() const { return clock_(); }

    FundamentalsRecord fundamentals(const std::string& ticker);

    // Empty period/interval fall back to 1y / 1d.
    HistoricalRecord historical(const std::string& ticker,
                                const std::string& period,
                                const std::string& interval);

    // Most recent daily bar; throws UpstreamError when the series is empty.
    QuotePoint quote(const std::string& ticker);

private:
    std::shared_ptr<DataSource> data_source_;
    ServiceInfo info_;
    Clock clock_;
};

OhlcvPoint to_point(const BarRecord& bar);

} // namespace quote_gateway
