#pragma once
/**
 * @file header_logging.hpp
 * @brief Header logging decorator with sensitive-value redaction.
 * @details Installed around the node handler only when --log-headers is set,
 *          so the routing state machine carries no logging-policy branches.
 */

#include <memory>
#include <string_view>

#include <boost/beast/http/fields.hpp>
#include <json/value.h>

#include "meshnode/net/request_handler.hpp"
#include "meshnode/obs/logger.hpp"

namespace meshnode::obs {

    /// Placeholder written instead of a sensitive header value.
    inline constexpr const char* kRedacted = "[REDACTED]";

    /// True for credentials-bearing headers (case-insensitive).
    [[nodiscard]] bool is_sensitive_header(std::string_view name) noexcept;

    /**
     * @brief Render headers as a JSON object for a log field.
     * @details Repeated headers are joined with ", "; sensitive values are redacted.
     */
    [[nodiscard]] Json::Value headers_to_json(const boost::beast::http::fields& headers);

    /** @class HeaderLoggingHandler
     *  @brief Logs redacted request headers, delegates, then logs response headers.
     */
    class HeaderLoggingHandler final : public net::RequestHandler {
    public:
        HeaderLoggingHandler(std::shared_ptr<const net::RequestHandler> inner, Logger logger);

        boost::asio::awaitable<net::Response>
        handle(const net::Request& req, const net::RequestContext& ctx) const override;

    private:
        std::shared_ptr<const net::RequestHandler> inner_;
        Logger logger_;
    };

} // namespace meshnode::obs
