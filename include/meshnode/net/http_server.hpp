#pragma once
/**
 * @file http_server.hpp
 * @brief Inbound HTTP/1.1 (optionally TLS) listener on a pool of io_context threads.
 * @details Each accepted connection gets its own strand and session; requests on a
 *          connection are handled in order. The RequestHandler coroutine runs
 *          on that strand, and a client that hangs up mid-request emits the
 *          request's CancelSignal.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "meshnode/compat/expected.hpp"
#include "meshnode/config/constants.hpp"
#include "meshnode/net/request_handler.hpp"
#include "meshnode/obs/logger.hpp"

namespace meshnode::net {

    /// PEM files for inbound TLS.
    struct TlsServerFiles {
        std::string cert_chain;
        std::string private_key;
    };

    struct ServerOptions {
        std::string   address{config::constants::DEFAULT_LISTEN_ADDRESS};
        std::uint16_t port{config::constants::DEFAULT_PORT};     ///< 0 picks an ephemeral port
        unsigned      workers{config::constants::DEFAULT_WORKERS};
        std::chrono::milliseconds request_timeout{config::constants::DEFAULT_REQUEST_TIMEOUT};
        std::optional<TlsServerFiles> tls;                        ///< HTTPS when set
    };

    /** @class HttpServer
     *  @brief Owns the acceptor and the worker threads.
     *  @note Not copyable. stop() is idempotent and called by the destructor.
     */
    class HttpServer {
    public:
        HttpServer(ServerOptions options,
                   std::shared_ptr<const RequestHandler> handler,
                   obs::Logger logger);
        ~HttpServer();

        HttpServer(const HttpServer&)            = delete;
        HttpServer& operator=(const HttpServer&) = delete;

        /**
         * @brief Load TLS material, bind, listen and start the workers.
         * @return Error text for bad certificates or an unusable address.
         */
        meshnode_detail::expected<void, std::string> start();

        /// Stop accepting, abandon open connections and join the workers.
        void stop();

        /// Bound port (the ephemeral one when ServerOptions::port was 0).
        [[nodiscard]] std::uint16_t port() const noexcept;

        [[nodiscard]] bool tls_enabled() const noexcept;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace meshnode::net
