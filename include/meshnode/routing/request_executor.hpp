#pragma once
/**
 * @file request_executor.hpp
 * @brief Directive state machine: fault gate, terminal answer or one forward.
 * @details The executor owns no per-request state. Collaborators (upstream
 *          client, random source) are injected so tests can script both.
 *          Every entry point is a coroutine; arguments passed by reference
 *          must outlive the co_await.
 */

#include <memory>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "meshnode/net/cancel_signal.hpp"
#include "meshnode/net/http_types.hpp"
#include "meshnode/net/upstream_client.hpp"
#include "meshnode/obs/logger.hpp"
#include "meshnode/routing/directive.hpp"
#include "meshnode/routing/random_source.hpp"

namespace meshnode::routing {

    class RequestExecutor {
    public:
        RequestExecutor(std::shared_ptr<const net::UpstreamClient> client,
                        std::shared_ptr<RandomSource> random);

        /**
         * @brief Run the state machine starting from an already parsed directive.
         *
         * Fault: draw in [0,100); fire when draw < percentage, otherwise re-parse
         * the remaining path and continue. Terminal: 200 envelope. Forward: one
         * outbound call bounded by @p deadline; 502 on transport failure, upstream
         * status/headers/body relayed otherwise.
         *
         * @param req     Inbound request (method and body are relayed).
         * @param d       First directive.
         * @param service Local service name stamped on synthesized envelopes.
         * @param deadline Absolute bound for the outbound call.
         * @param log     Per-request logger.
         * @param cancel  Emitted when the inbound client goes away; aborts a forward.
         */
        [[nodiscard]] boost::asio::awaitable<net::Response>
        execute(const net::Request& req, Directive d, std::string_view service, net::Deadline deadline,
                const obs::Logger& log, net::CancelSignal* cancel = nullptr) const;

        /// parse_directive(@p path) then execute(); a parse error answers 400.
        [[nodiscard]] boost::asio::awaitable<net::Response>
        execute_path(const net::Request& req, std::string_view path, std::string_view service,
                     net::Deadline deadline, const obs::Logger& log,
                     net::CancelSignal* cancel = nullptr) const;

    private:
        net::Response respond_envelope(const net::Request& req, int status, std::string_view service,
                                       std::string message, const obs::Logger& log) const;
        boost::asio::awaitable<net::Response>
        forward(const net::Request& req, const Directive& d, net::Deadline deadline,
                const obs::Logger& log, net::CancelSignal* cancel) const;

        std::shared_ptr<const net::UpstreamClient> client_;
        std::shared_ptr<RandomSource>              random_;
    };

} // namespace meshnode::routing
