#pragma once

#include "data_source.hpp"
#include <spdlog/spdlog.h>

namespace quote_gateway {

class StubDataSource : public DataSource {
public:
    TickerInfo get_ticker_info(const std::string& ticker) override {
        spdlog::warn("StubDataSource: no info for {} (upstream disabled)", ticker);
        return {};
    }

    std::vector<BarRecord> get_history(const std::string& ticker,
                                       const std::string& period,
                                       const std::string& interval) override {
        (void)period;
        (void)interval;
        spdlog::warn("StubDataSource: no history for {} (upstream disabled)", ticker);
        return {};
    }
};

} // namespace quote_gateway
