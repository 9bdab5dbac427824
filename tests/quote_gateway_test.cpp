#include <gtest/gtest.h>
#include <cmath>
#include "../src/core/quote_gateway.hpp"
#include "../src/core/data_source_stub.hpp"
#include "../src/core/utils.hpp"

using namespace quote_gateway;

namespace {

class FakeDataSource : public StubDataSource {
public:
    TickerInfo info;
    std::vector<BarRecord> bars;
    std::string last_period;
    std::string last_interval;
    bool fail{false};

    TickerInfo get_ticker_info(const std::string& ticker) override {
        if (fail) throw UpstreamError("upstream down for " + ticker);
        return info;
    }

    std::vector<BarRecord> get_history(const std::string& ticker,
                                       const std::string& period,
                                       const std::string& interval) override {
        last_period = period;
        last_interval = interval;
        if (fail) throw UpstreamError("upstream down for " + ticker);
        return bars;
    }
};

BarRecord make_bar(const std::string& date, double o, double h, double l, double c, int64_t v) {
    BarRecord b;
    b.date = date;
    b.open = o;
    b.high = h;
    b.low = l;
    b.close = c;
    b.volume = v;
    return b;
}

TickerInfo full_info() {
    TickerInfo info;
    info.fields = {
        {"longName", "Apple Inc."},
        {"trailingPE", 28.456789},
        {"priceToBook", 45.1},
        {"priceToSalesTrailing12Months", 7.25},
        {"pegRatio", 2.1},
        {"returnOnEquity", 1.47251},
        {"returnOnAssets", 0.2238},
        {"profitMargins", 0.153},
        {"dividendYield", 0.0044},
        {"dividendRate", 1.0},
        {"payoutRatio", 0.1513},
        {"revenueGrowth", 0.061},
        {"earningsGrowth", -0.0345},
        {"debtToEquity", 151.862},
        {"currentRatio", 0.867},
        {"beta", 1.24},
        {"recommendationKey", "buy"}
    };
    return info;
}

Timestamp fixed_now() {
    return Timestamp{} + std::chrono::seconds(1718000000);  // 2024-06-10
}

struct Fixture {
    std::shared_ptr<FakeDataSource> source = std::make_shared<FakeDataSource>();
    QuoteGateway gateway{source, ServiceInfo{"Yahoo Finance API", "1.0.0"}, fixed_now};
};

} // namespace

TEST(QuoteGatewayTest, FundamentalsMapsAndScalesFields) {
    Fixture fx;
    fx.source->info = full_info();
    auto f = fx.gateway.fundamentals("AAPL");
    EXPECT_EQ(f.ticker, "AAPL");
    EXPECT_EQ(f.name, "Apple Inc.");
    EXPECT_EQ(f.date, utils::ts_to_local_date(fixed_now()));
    ASSERT_TRUE(f.pe_ratio.has_value());
    EXPECT_DOUBLE_EQ(*f.pe_ratio, 28.456789);  // passed through unrounded
    EXPECT_DOUBLE_EQ(*f.pb_ratio, 45.1);
    EXPECT_DOUBLE_EQ(*f.ps_ratio, 7.25);
    EXPECT_DOUBLE_EQ(*f.peg_ratio, 2.1);
    EXPECT_DOUBLE_EQ(*f.roe, 147.25);
    EXPECT_DOUBLE_EQ(*f.roa, 22.38);
    EXPECT_DOUBLE_EQ(*f.profit_margin, 15.3);
    EXPECT_DOUBLE_EQ(*f.dividend_yield, 0.44);
    EXPECT_DOUBLE_EQ(*f.dividend_per_share, 1.0);
    EXPECT_DOUBLE_EQ(*f.payout_ratio, 0.1513);
    EXPECT_DOUBLE_EQ(*f.revenue_growth, 6.1);
    EXPECT_DOUBLE_EQ(*f.earnings_growth, -3.45);
    EXPECT_DOUBLE_EQ(*f.debt_to_equity, 151.862);
    EXPECT_DOUBLE_EQ(*f.current_ratio, 0.867);
    EXPECT_DOUBLE_EQ(*f.beta, 1.24);
    ASSERT_TRUE(f.analyst_rating.has_value());
    EXPECT_EQ(*f.analyst_rating, "buy");
}

TEST(QuoteGatewayTest, MissingPegRatioLeavesOthersPopulated) {
    Fixture fx;
    fx.source->info = full_info();
    fx.source->info.fields.erase("pegRatio");
    auto f = fx.gateway.fundamentals("AAPL");
    EXPECT_FALSE(f.peg_ratio.has_value());
    EXPECT_TRUE(f.pe_ratio.has_value());
    EXPECT_TRUE(f.roe.has_value());
    EXPECT_TRUE(f.beta.has_value());
}

TEST(QuoteGatewayTest, EmptyInfoGivesEmptyNameAndNoValues) {
    Fixture fx;
    auto f = fx.gateway.fundamentals("ZZZZ");
    EXPECT_EQ(f.name, "");
    EXPECT_FALSE(f.pe_ratio.has_value());
    EXPECT_FALSE(f.roe.has_value());
    EXPECT_FALSE(f.analyst_rating.has_value());
}

TEST(QuoteGatewayTest, NullUpstreamValueIsAbsent) {
    Fixture fx;
    fx.source->info.fields = {{"trailingPE", nullptr}, {"returnOnEquity", "n/a"}};
    auto f = fx.gateway.fundamentals("AAPL");
    EXPECT_FALSE(f.pe_ratio.has_value());
    EXPECT_FALSE(f.roe.has_value());
}

TEST(QuoteGatewayTest, FundamentalsPropagatesUpstreamError) {
    Fixture fx;
    fx.source->fail = true;
    EXPECT_THROW(fx.gateway.fundamentals("AAPL"), UpstreamError);
}

TEST(QuoteGatewayTest, HistoricalRoundsAndKeepsOrder) {
    Fixture fx;
    fx.source->bars = {
        make_bar("2024-06-03", 192.123456, 194.99994, 191.00007, 193.56789, 50000000),
        make_bar("2024-06-04", 193.5, 195.25, 192.75, 194.35, 47000000),
        make_bar("2024-06-05", 195.0, 196.9, 194.1, 196.123449, 54000000),
    };
    auto h = fx.gateway.historical("AAPL", "5d", "1d");
    EXPECT_EQ(h.ticker, "AAPL");
    EXPECT_EQ(h.period, "5d");
    EXPECT_EQ(h.interval, "1d");
    ASSERT_EQ(h.data.size(), 3u);
    EXPECT_DOUBLE_EQ(h.data[0].open, 192.1235);
    EXPECT_DOUBLE_EQ(h.data[0].high, 194.9999);
    EXPECT_DOUBLE_EQ(h.data[0].low, 191.0001);
    EXPECT_DOUBLE_EQ(h.data[0].close, 193.5679);
    EXPECT_EQ(h.data[0].volume, 50000000);
    EXPECT_DOUBLE_EQ(h.data[2].close, 196.1234);
    for (size_t i = 0; i < h.data.size(); ++i) {
        EXPECT_EQ(h.data[i].adjusted_close, h.data[i].close);
        EXPECT_EQ(h.data[i].date, fx.source->bars[i].date);
        if (i > 0) {
            EXPECT_LE(h.data[i - 1].date, h.data[i].date);
        }
    }
}

TEST(QuoteGatewayTest, HistoricalDefaultsPeriodAndInterval) {
    Fixture fx;
    auto h = fx.gateway.historical("MSFT", "", "");
    EXPECT_EQ(fx.source->last_period, "1y");
    EXPECT_EQ(fx.source->last_interval, "1d");
    EXPECT_EQ(h.period, "1y");
    EXPECT_EQ(h.interval, "1d");
}

TEST(QuoteGatewayTest, HistoricalPassesParametersThrough) {
    Fixture fx;
    fx.gateway.historical("MSFT", "max", "1wk");
    EXPECT_EQ(fx.source->last_period, "max");
    EXPECT_EQ(fx.source->last_interval, "1wk");
}

TEST(QuoteGatewayTest, HistoricalEmptySeriesIsNotAnError) {
    Fixture fx;
    auto h = fx.gateway.historical("MSFT", "1mo", "1d");
    EXPECT_TRUE(h.data.empty());
}

TEST(QuoteGatewayTest, QuoteUsesLastBarAndItsDate) {
    Fixture fx;
    fx.source->bars = {
        make_bar("2024-06-06", 1.0, 2.0, 0.5, 1.5, 10),
        make_bar("2024-06-07", 196.9, 197.3, 195.2, 196.894999, 53000000),
    };
    auto q = fx.gateway.quote("AAPL");
    EXPECT_EQ(fx.source->last_period, "1d");
    EXPECT_EQ(fx.source->last_interval, "1d");
    EXPECT_EQ(q.ticker, "AAPL");
    EXPECT_EQ(q.point.date, "2024-06-07");
    EXPECT_DOUBLE_EQ(q.point.close, 196.895);
    EXPECT_EQ(q.point.adjusted_close, q.point.close);
    EXPECT_EQ(q.point.volume, 53000000);
}

TEST(QuoteGatewayTest, QuoteOnEmptySeriesThrows) {
    Fixture fx;
    try {
        fx.gateway.quote("NOPE");
        FAIL() << "expected UpstreamError";
    } catch (const UpstreamError& e) {
        EXPECT_STREQ(e.what(), "No data available for NOPE");
    }
}
