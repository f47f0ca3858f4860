/**
 * @file header_logging.cpp
 * @brief Redacting header dump around an inner handler.
 */
#include "meshnode/obs/header_logging.hpp"

#include <array>
#include <string>

#include <boost/beast/core/string.hpp>

namespace meshnode::obs {

    namespace {
    constexpr std::array<std::string_view, 6> kSensitive{
        "authorization", "cookie", "set-cookie",
        "proxy-authorization", "x-api-key", "x-auth-token"
    };
    } // namespace

    bool is_sensitive_header(std::string_view name) noexcept {
        for (const auto s : kSensitive) {
            if (boost::beast::iequals(name, s)) return true;
        }
        return false;
    }

    Json::Value headers_to_json(const boost::beast::http::fields& headers) {
        Json::Value out(Json::objectValue);
        for (const auto& f : headers) {
            const std::string key(f.name_string());
            const std::string value = is_sensitive_header(key) ? std::string(kRedacted)
                                                               : std::string(f.value());
            if (out.isMember(key)) {
                out[key] = out[key].asString() + ", " + value;
            } else {
                out[key] = value;
            }
        }
        return out;
    }

    HeaderLoggingHandler::HeaderLoggingHandler(std::shared_ptr<const net::RequestHandler> inner,
                                               Logger logger)
        : inner_(std::move(inner)), logger_(std::move(logger)) {}

    boost::asio::awaitable<net::Response>
    HeaderLoggingHandler::handle(const net::Request& req, const net::RequestContext& ctx) const {
        const auto log = logger_.with({{"request_id", ctx.request_id}});
        log.info("Request headers", {
            {"method", std::string(req.method_string())},
            {"path", std::string(req.target())},
            {"request_headers", headers_to_json(req.base())},
        });

        auto res = co_await inner_->handle(req, ctx);

        log.info("Response headers", {
            {"status_code", res.result_int()},
            {"response_headers", headers_to_json(res.base())},
        });
        co_return res;
    }

} // namespace meshnode::obs
