#include "quote_gateway.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

namespace quote_gateway {

namespace {

// Upstream fractions reported as percentages with two decimals.
std::optional<double> percent(const TickerInfo& info, const char* key) {
    auto v = info.number(key);
    if (!v) return std::nullopt;
    return utils::round_to(*v * 100.0, 2);
}

} // namespace

OhlcvPoint to_point(const BarRecord& bar) {
    OhlcvPoint p;
    p.date = bar.date;
    p.open = utils::round_to(bar.open, 4);
    p.high = utils::round_to(bar.high, 4);
    p.low = utils::round_to(bar.low, 4);
    p.close = utils::round_to(bar.close, 4);
    p.volume = bar.volume;
    p.adjusted_close = p.close;
    return p;
}

QuoteGateway::QuoteGateway(std::shared_ptr<DataSource> data_source, ServiceInfo info, Clock clock)
    : data_source_(std::move(data_source)), info_(std::move(info)), clock_(std::move(clock)) {}

FundamentalsRecord QuoteGateway::fundamentals(const std::string& ticker) {
    TickerInfo info = data_source_->get_ticker_info(ticker);

    FundamentalsRecord f;
    f.ticker = ticker;
    f.name = info.text("longName").value_or("");
    f.date = utils::ts_to_local_date(clock_());
    f.pe_ratio = info.number("trailingPE");
    f.pb_ratio = info.number("priceToBook");
    f.ps_ratio = info.number("priceToSalesTrailing12Months");
    f.peg_ratio = info.number("pegRatio");
    f.roe = percent(info, "returnOnEquity");
    f.roa = percent(info, "returnOnAssets");
    f.profit_margin = percent(info, "profitMargins");
    f.dividend_yield = percent(info, "dividendYield");
    f.dividend_per_share = info.number("dividendRate");
    f.payout_ratio = info.number("payoutRatio");
    f.revenue_growth = percent(info, "revenueGrowth");
    f.earnings_growth = percent(info, "earningsGrowth");
    f.debt_to_equity = info.number("debtToEquity");
    f.current_ratio = info.number("currentRatio");
    f.beta = info.number("beta");
    f.analyst_rating = info.text("recommendationKey");
    return f;
}

HistoricalRecord QuoteGateway::historical(const std::string& ticker,
                                          const std::string& period,
                                          const std::string& interval) {
    HistoricalRecord h;
    h.ticker = ticker;
    h.period = period.empty() ? kDefaultPeriod : period;
    h.interval = interval.empty() ? kDefaultInterval : interval;

    auto bars = data_source_->get_history(ticker, h.period, h.interval);
    h.data.reserve(bars.size());
    for (const auto& bar : bars) {
        h.data.push_back(to_point(bar));
    }
    spdlog::info("Successfully fetched {} historical data points for {}", h.data.size(), ticker);
    return h;
}

QuotePoint QuoteGateway::quote(const std::string& ticker) {
    auto bars = data_source_->get_history(ticker, "1d", "1d");
    if (bars.empty()) {
        throw UpstreamError("No data available for " + ticker);
    }
    QuotePoint q;
    q.ticker = ticker;
    q.point = to_point(bars.back());
    return q;
}

} // namespace quote_gateway
