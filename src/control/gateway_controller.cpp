#include "gateway_controller.hpp"
#include <spdlog/spdlog.h>
#include <drogon/drogon.h>

namespace quote_gateway {

GatewayController::GatewayController(std::shared_ptr<QuoteGateway> gateway, const Config& cfg)
    : gateway_(std::move(gateway)),
      workers_(std::make_unique<trantor::ConcurrentTaskQueue>(cfg.services.worker_threads,
                                                              "upstream-workers")) {
    spdlog::info("Gateway controller using {} upstream workers", cfg.services.worker_threads);
}

drogon::HttpResponsePtr GatewayController::json_resp(const Reply& reply) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(reply.status));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(reply_body(reply));
    return resp;
}

void GatewayController::offload(const std::string& ticker,
                                std::function<Reply()> work,
                                std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    workers_->runTaskInQueue([ticker, work = std::move(work), cb = std::move(cb)]() {
        drogon::HttpResponsePtr resp;
        try {
            resp = json_resp(work());
        } catch (const std::exception& e) {
            // Nothing may escape a pool thread; answer with the envelope instead.
            spdlog::error("Unhandled error serving {}: {}", ticker, e.what());
            resp = json_resp(error_reply(ticker, e.what()));
        }
        cb(resp);
    });
}

void GatewayController::root(const drogon::HttpRequestPtr& req,
                             std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    (void)req;
    cb(json_resp(root_reply(*gateway_)));
}

void GatewayController::health(const drogon::HttpRequestPtr& req,
                               std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    (void)req;
    cb(json_resp(health_reply(*gateway_)));
}

void GatewayController::fundamentals(const drogon::HttpRequestPtr& req,
                                     std::function<void(const drogon::HttpResponsePtr&)>&& cb,
                                     std::string ticker) {
    (void)req;
    auto gateway = gateway_;
    offload(ticker, [gateway, ticker]() { return fundamentals_reply(*gateway, ticker); }, std::move(cb));
}

void GatewayController::historical(const drogon::HttpRequestPtr& req,
                                   std::function<void(const drogon::HttpResponsePtr&)>&& cb,
                                   std::string ticker) {
    std::string period = req->getParameter("period");
    std::string interval = req->getParameter("interval");
    auto gateway = gateway_;
    offload(ticker, [gateway, ticker, period, interval]() {
                return historical_reply(*gateway, ticker, period, interval);
            },
            std::move(cb));
}

void GatewayController::quote(const drogon::HttpRequestPtr& req,
                              std::function<void(const drogon::HttpResponsePtr&)>&& cb,
                              std::string ticker) {
    (void)req;
    auto gateway = gateway_;
    offload(ticker, [gateway, ticker]() { return quote_reply(*gateway, ticker); }, std::move(cb));
}

} // namespace quote_gateway
