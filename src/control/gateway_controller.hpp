#pragma once

#include <drogon/HttpController.h>
#include <trantor/utils/ConcurrentTaskQueue.h>
#include <nlohmann/json.hpp>
#include <memory>
#include "../core/quote_gateway.hpp"
#include "../core/config.hpp"
#include "gateway_replies.hpp"

namespace quote_gateway {

/**
 * REST surface of the gateway.
 *
 * Data routes block on the upstream, so they are run on a worker pool and
 * answered from there; the drogon IO threads only parse and dispatch.
 */
class GatewayController : public drogon::HttpController<GatewayController> {
public:
    static const bool isAutoCreation = false;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(GatewayController::root, "/", drogon::Get);
    ADD_METHOD_TO(GatewayController::health, "/health", drogon::Get);
    ADD_METHOD_TO(GatewayController::fundamentals, "/api/fundamentals/{1}", drogon::Get);
    ADD_METHOD_TO(GatewayController::historical, "/api/historical/{1}", drogon::Get);
    ADD_METHOD_TO(GatewayController::quote, "/api/quote/{1}", drogon::Get);
    METHOD_LIST_END

    GatewayController(std::shared_ptr<QuoteGateway> gateway, const Config& cfg);

    void root(const drogon::HttpRequestPtr& req,
              std::function<void(const drogon::HttpResponsePtr&)>&& cb);
    void health(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& cb);
    void fundamentals(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& cb,
                      std::string ticker);
    void historical(const drogon::HttpRequestPtr& req,
                    std::function<void(const drogon::HttpResponsePtr&)>&& cb,
                    std::string ticker);
    void quote(const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& cb,
               std::string ticker);

private:
    static drogon::HttpResponsePtr json_resp(const Reply& reply);
    void offload(const std::string& ticker,
                 std::function<Reply()> work,
                 std::function<void(const drogon::HttpResponsePtr&)>&& cb);

    std::shared_ptr<QuoteGateway> gateway_;
    std::unique_ptr<trantor::ConcurrentTaskQueue> workers_;
};

} // namespace quote_gateway
