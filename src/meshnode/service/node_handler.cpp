/**
 * @file node_handler.cpp
 * @brief Health check and request lifecycle logging around the executor.
 */
#include "meshnode/service/node_handler.hpp"

#include <chrono>

#include "meshnode/config/constants.hpp"
#include "meshnode/routing/response_envelope.hpp"

namespace meshnode::service {

    namespace http = boost::beast::http;
    using namespace meshnode::config::constants;

    NodeHandler::NodeHandler(std::string service_name,
                             std::shared_ptr<const routing::RequestExecutor> executor,
                             obs::Logger logger)
        : service_name_(std::move(service_name)),
          executor_(std::move(executor)),
          logger_(std::move(logger)) {}

    net::Response NodeHandler::health(const net::Request& req) const {
        logger_.debug("Health check request");
        auto body = routing::encode_health(service_name_);
        if (!body) {
            logger_.error("Failed to encode health response", {{"error", body.error()}});
            return net::make_text_response(500, "Response error: " + body.error(), req.version());
        }
        return net::make_json_response(200, std::move(*body), req.version());
    }

    boost::asio::awaitable<net::Response>
    NodeHandler::handle(const net::Request& req, const net::RequestContext& ctx) const {
        const auto raw_path = net::target_path(req.target());
        const auto path     = net::percent_decode(raw_path);

        if (path == HEALTH_PATH && (req.method() == http::verb::get || req.method() == http::verb::head)) {
            co_return health(req);
        }

        const auto log = logger_.with({
            {"request_id", ctx.request_id},
            {"method", std::string(req.method_string())},
            {"path", path},
            {"remote_addr", ctx.remote_addr},
        });

        const auto ua = req.find(http::field::user_agent);
        log.info("Incoming request", {
            {"user_agent", ua == req.end() ? std::string{} : std::string(ua->value())},
            {"query", std::string(net::target_query(req.target()))},
        });

        auto res = co_await executor_->execute_path(req, path, service_name_, ctx.deadline, log,
                                                    ctx.cancel.get());

        const auto duration = std::chrono::duration<double, std::milli>(net::Clock::now() - ctx.received);
        log.info("Request completed", {
            {"duration_ms", duration.count()},
            {"status_code", res.result_int()},
        });
        co_return res;
    }

} // namespace meshnode::service
