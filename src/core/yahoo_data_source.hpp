#pragma once

#include "data_source.hpp"
#include "config.hpp"
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace quote_gateway {

/**
 * Payload decoding for the Yahoo Finance JSON endpoints. Kept free of any
 * transport so captured responses can be fed straight in.
 */
namespace yahoo {

// Modules requested from quoteSummary; later modules overwrite earlier keys.
extern const std::vector<std::string> kSummaryModules;

// `error.description` (or `error.code`) under `root`, if the payload carries one.
std::optional<std::string> error_description(const nlohmann::json& payload,
                                             const std::string& root);

/**
 * Merge every module of quoteSummary.result[0] into one flat map.
 * {raw, fmt} wrappers collapse to raw; nulls and empty objects are dropped.
 * Throws UpstreamError when the payload carries an error object.
 */
TickerInfo flatten_quote_summary(const nlohmann::json& payload, const std::string& ticker);

/**
 * Decode /v8/finance/chart into chronological bars dated in exchange-local
 * time. Rows with a null price are skipped; a null volume becomes 0.
 * With auto_adjust, O/H/L are scaled by adjclose/close and close is replaced
 * by adjclose. A result without timestamps yields an empty series.
 */
std::vector<BarRecord> parse_chart(const nlohmann::json& payload,
                                   const std::string& ticker,
                                   bool auto_adjust);

} // namespace yahoo

/**
 * DataSource backed by the public Yahoo Finance endpoints.
 *
 * Requests are sent synchronously from the caller's thread through drogon
 * HTTP clients that live on a private event loop, so this must never be
 * called from that loop. The cookie/crumb pair needed by quoteSummary is
 * fetched lazily and shared by all callers until the upstream rejects it.
 */
class YahooDataSource : public DataSource {
public:
    explicit YahooDataSource(const UpstreamConfig& cfg);
    ~YahooDataSource() override;

    TickerInfo get_ticker_info(const std::string& ticker) override;
    std::vector<BarRecord> get_history(const std::string& ticker,
                                       const std::string& period,
                                       const std::string& interval) override;

private:
    struct Session {
        std::vector<std::pair<std::string, std::string>> cookies;
        std::string crumb;
    };

    drogon::HttpRequestPtr make_request(const std::string& path) const;
    drogon::HttpResponsePtr send(const drogon::HttpClientPtr& client,
                                 const drogon::HttpRequestPtr& req,
                                 const std::string& what);
    Session session();
    Session acquire_session();
    void invalidate_session();

    UpstreamConfig cfg_;
    trantor::EventLoopThread loop_thread_;
    drogon::HttpClientPtr chart_client_;
    drogon::HttpClientPtr summary_client_;
    drogon::HttpClientPtr cookie_client_;
    std::mutex session_mutex_;
    std::optional<Session> session_;
};

} // namespace quote_gateway
