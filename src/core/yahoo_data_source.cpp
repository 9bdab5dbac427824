#include "yahoo_data_source.hpp"
#include "utils.hpp"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace quote_gateway {

namespace yahoo {

const std::vector<std::string> kSummaryModules = {
    "financialData",
    "quoteType",
    "defaultKeyStatistics",
    "assetProfile",
    "summaryDetail",
};

std::optional<std::string> error_description(const json& payload, const std::string& root) {
    if (!payload.is_object()) return std::nullopt;
    auto it = payload.find(root);
    if (it == payload.end() || !it->is_object()) return std::nullopt;
    auto err = it->find("error");
    if (err == it->end() || err->is_null()) return std::nullopt;
    if (err->is_string()) {
        return err->get<std::string>();
    }
    if (err->is_object()) {
        if (err->contains("description") && (*err)["description"].is_string()) {
            return (*err)["description"].get<std::string>();
        }
        if (err->contains("code") && (*err)["code"].is_string()) {
            return (*err)["code"].get<std::string>();
        }
    }
    return err->dump();
}

TickerInfo flatten_quote_summary(const json& payload, const std::string& ticker) {
    if (auto err = error_description(payload, "quoteSummary")) {
        throw UpstreamError(*err);
    }
    if (!payload.is_object() || !payload.contains("quoteSummary")) {
        throw UpstreamError("Malformed quoteSummary response for " + ticker);
    }
    TickerInfo info;
    const auto& result = payload["quoteSummary"].value("result", json());
    if (!result.is_array() || result.empty() || !result[0].is_object()) {
        return info;
    }
    const auto& modules = result[0];
    for (const auto& name : kSummaryModules) {
        auto mod = modules.find(name);
        if (mod == modules.end() || !mod->is_object()) continue;
        for (auto it = mod->begin(); it != mod->end(); ++it) {
            if (it.key() == "maxAge") continue;
            const auto& v = it.value();
            if (v.is_null()) continue;
            if (v.is_object()) {
                if (v.contains("raw")) {
                    info.fields[it.key()] = v["raw"];
                } else if (!v.empty()) {
                    info.fields[it.key()] = v;
                }
                continue;
            }
            info.fields[it.key()] = v;
        }
    }
    return info;
}

namespace {

std::optional<double> number_at(const json& arr, size_t i) {
    if (!arr.is_array() || i >= arr.size() || !arr[i].is_number()) return std::nullopt;
    return arr[i].get<double>();
}

const json& first_of(const json& obj, const char* key) {
    static const json kNull;
    if (!obj.is_object()) return kNull;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array() || it->empty()) return kNull;
    return (*it)[0];
}

const json& array_of(const json& obj, const char* key) {
    static const json kEmpty = json::array();
    if (!obj.is_object()) return kEmpty;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return kEmpty;
    return *it;
}

} // namespace

std::vector<BarRecord> parse_chart(const json& payload, const std::string& ticker, bool auto_adjust) {
    if (auto err = error_description(payload, "chart")) {
        throw UpstreamError(*err);
    }
    if (!payload.is_object() || !payload.contains("chart")) {
        throw UpstreamError("Malformed chart response for " + ticker);
    }
    std::vector<BarRecord> bars;
    const auto& result = first_of(payload["chart"], "result");
    if (!result.is_object()) return bars;

    const auto& timestamps = array_of(result, "timestamp");
    if (timestamps.empty()) return bars;

    int64_t gmtoffset = 0;
    if (result.contains("meta") && result["meta"].is_object()) {
        const auto& meta = result["meta"];
        if (meta.contains("gmtoffset") && meta["gmtoffset"].is_number()) {
            gmtoffset = meta["gmtoffset"].get<int64_t>();
        }
    }

    const auto& indicators = result.value("indicators", json::object());
    const auto& quote = first_of(indicators, "quote");
    const auto& opens = array_of(quote, "open");
    const auto& highs = array_of(quote, "high");
    const auto& lows = array_of(quote, "low");
    const auto& closes = array_of(quote, "close");
    const auto& volumes = array_of(quote, "volume");
    const auto& adjcloses = array_of(first_of(indicators, "adjclose"), "adjclose");

    bars.reserve(timestamps.size());
    for (size_t i = 0; i < timestamps.size(); ++i) {
        if (!timestamps[i].is_number()) continue;
        auto o = number_at(opens, i);
        auto h = number_at(highs, i);
        auto l = number_at(lows, i);
        auto c = number_at(closes, i);
        if (!o || !h || !l || !c) continue;

        int64_t epoch = timestamps[i].get<int64_t>();
        BarRecord bar;
        bar.date = utils::epoch_to_date(epoch, gmtoffset);
        bar.open = *o;
        bar.high = *h;
        bar.low = *l;
        bar.close = *c;
        auto v = number_at(volumes, i);
        bar.volume = v ? static_cast<int64_t>(*v) : 0;

        if (auto_adjust) {
            auto adj = number_at(adjcloses, i);
            if (adj && bar.close != 0.0) {
                double ratio = *adj / bar.close;
                bar.open *= ratio;
                bar.high *= ratio;
                bar.low *= ratio;
                bar.close = *adj;
            }
        }
        bars.push_back(bar);
    }
    return bars;
}

} // namespace yahoo

namespace {

const char* req_result_name(drogon::ReqResult r) {
    switch (r) {
        case drogon::ReqResult::Ok: return "ok";
        case drogon::ReqResult::BadResponse: return "bad response";
        case drogon::ReqResult::NetworkFailure: return "network failure";
        case drogon::ReqResult::BadServerAddress: return "bad server address";
        case drogon::ReqResult::Timeout: return "timeout";
        case drogon::ReqResult::HandshakeError: return "TLS handshake error";
        case drogon::ReqResult::InvalidCertificate: return "invalid certificate";
        default: return "request failed";
    }
}

json parse_body(const drogon::HttpResponsePtr& resp) {
    return json::parse(std::string(resp->getBody()), nullptr, false);
}

} // namespace

YahooDataSource::YahooDataSource(const UpstreamConfig& cfg)
    : cfg_(cfg), loop_thread_("yahoo-client") {
    loop_thread_.run();
    auto* loop = loop_thread_.getLoop();
    chart_client_ = drogon::HttpClient::newHttpClient(cfg_.chart_host, loop);
    summary_client_ = drogon::HttpClient::newHttpClient(cfg_.summary_host, loop);
    cookie_client_ = drogon::HttpClient::newHttpClient(cfg_.cookie_url, loop);
    for (const auto& client : {chart_client_, summary_client_, cookie_client_}) {
        client->setUserAgent(cfg_.user_agent);
    }
    spdlog::info("Yahoo data source ready (chart={}, summary={})",
                 cfg_.chart_host, cfg_.summary_host);
}

YahooDataSource::~YahooDataSource() {
    // Clients must go before the loop they run on.
    chart_client_.reset();
    summary_client_.reset();
    cookie_client_.reset();
}

drogon::HttpRequestPtr YahooDataSource::make_request(const std::string& path) const {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPathEncode(false);
    req->setPath(path);
    req->addHeader("Accept", "text/html,application/xhtml+xml,application/json;q=0.9,*/*;q=0.8");
    req->addHeader("Accept-Language", cfg_.accept_language);
    return req;
}

drogon::HttpResponsePtr YahooDataSource::send(const drogon::HttpClientPtr& client,
                                              const drogon::HttpRequestPtr& req,
                                              const std::string& what) {
    auto [result, resp] = client->sendRequest(req, cfg_.timeout_seconds);
    if (result != drogon::ReqResult::Ok || !resp) {
        spdlog::warn("Yahoo {} request failed: {}", what, req_result_name(result));
        throw UpstreamError("Yahoo " + what + " request failed: " + req_result_name(result));
    }
    return resp;
}

YahooDataSource::Session YahooDataSource::session() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_) {
        session_ = acquire_session();
    }
    return *session_;
}

YahooDataSource::Session YahooDataSource::acquire_session() {
    Session s;
    // fc.yahoo.com answers with an error page but still sets the session cookie.
    auto cookie_resp = send(cookie_client_, make_request("/"), "cookie");
    for (const auto& [name, cookie] : cookie_resp->getCookies()) {
        s.cookies.emplace_back(cookie.key(), cookie.value());
    }
    if (s.cookies.empty()) {
        throw UpstreamError("Failed to obtain Yahoo session cookie");
    }

    auto crumb_req = make_request("/v1/test/getcrumb");
    for (const auto& [k, v] : s.cookies) {
        crumb_req->addCookie(k, v);
    }
    auto crumb_resp = send(summary_client_, crumb_req, "crumb");
    std::string crumb(crumb_resp->getBody());
    if (crumb_resp->getStatusCode() != drogon::k200OK || crumb.empty() ||
        crumb.find('<') != std::string::npos || crumb.find('{') != std::string::npos) {
        throw UpstreamError("Failed to obtain Yahoo crumb (HTTP " +
                            std::to_string(static_cast<int>(crumb_resp->getStatusCode())) + ")");
    }
    s.crumb = crumb;
    spdlog::info("Acquired Yahoo session ({} cookies)", s.cookies.size());
    return s;
}

void YahooDataSource::invalidate_session() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.reset();
}

TickerInfo YahooDataSource::get_ticker_info(const std::string& ticker) {
    auto s = session();

    std::string modules;
    for (const auto& m : yahoo::kSummaryModules) {
        if (!modules.empty()) modules += ",";
        modules += m;
    }
    auto req = make_request("/v10/finance/quoteSummary/" + utils::url_encode(ticker));
    req->setParameter("modules", modules);
    req->setParameter("formatted", "false");
    req->setParameter("symbol", ticker);
    req->setParameter("crumb", s.crumb);
    for (const auto& [k, v] : s.cookies) {
        req->addCookie(k, v);
    }

    auto resp = send(summary_client_, req, "quoteSummary");
    int status = static_cast<int>(resp->getStatusCode());
    if (status == 401 || status == 403) {
        invalidate_session();
    }
    auto body = parse_body(resp);
    if (status != 200) {
        auto err = yahoo::error_description(body, "quoteSummary");
        throw UpstreamError(err ? *err
                                : "HTTP " + std::to_string(status) + " from quoteSummary for " + ticker);
    }
    if (body.is_discarded()) {
        throw UpstreamError("Unparseable quoteSummary response for " + ticker);
    }
    return yahoo::flatten_quote_summary(body, ticker);
}

std::vector<BarRecord> YahooDataSource::get_history(const std::string& ticker,
                                                    const std::string& period,
                                                    const std::string& interval) {
    auto req = make_request("/v8/finance/chart/" + utils::url_encode(ticker));
    req->setParameter("range", period);
    req->setParameter("interval", interval);
    req->setParameter("includePrePost", "false");
    req->setParameter("events", "div,splits");

    auto resp = send(chart_client_, req, "chart");
    int status = static_cast<int>(resp->getStatusCode());
    auto body = parse_body(resp);
    if (status != 200) {
        auto err = yahoo::error_description(body, "chart");
        throw UpstreamError(err ? *err
                                : "HTTP " + std::to_string(status) + " from chart for " + ticker);
    }
    if (body.is_discarded()) {
        throw UpstreamError("Unparseable chart response for " + ticker);
    }
    return yahoo::parse_chart(body, ticker, cfg_.auto_adjust);
}

} // namespace quote_gateway
