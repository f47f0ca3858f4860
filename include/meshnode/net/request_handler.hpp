#pragma once
/**
 * @file request_handler.hpp
 * @brief Seam between the HTTP server and whatever answers requests.
 * @details The server owns connections and deadlines; handlers own semantics.
 *          Decorators (header logging) wrap a handler behind the same interface.
 */

#include <memory>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "meshnode/net/cancel_signal.hpp"
#include "meshnode/net/http_types.hpp"

namespace meshnode::net {

    /** @struct RequestContext
     *  @brief Per-request facts established by the server before dispatch.
     */
    struct RequestContext {
        std::string request_id;         ///< Unique per inbound request
        std::string remote_addr;        ///< "ip:port" of the peer
        Clock::time_point received{};   ///< Arrival time (steady clock)
        Deadline deadline{};            ///< received + configured timeout
        std::shared_ptr<CancelSignal> cancel;  ///< Emitted when the client goes away
    };

    /** @class RequestHandler
     *  @brief Answers one request.
     *  @details Runs as a coroutine on the connection's strand. Many requests
     *           are in flight at once across connections, so implementations
     *           must be safe to call concurrently and must never block.
     */
    class RequestHandler {
    public:
        virtual ~RequestHandler() = default;
        virtual boost::asio::awaitable<Response> handle(const Request& req, const RequestContext& ctx) const = 0;
    };

} // namespace meshnode::net
