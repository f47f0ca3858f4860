#pragma once
/**
 * @file upstream_client.hpp
 * @brief Outbound HTTP/HTTPS calls to the next hop.
 * @details UpstreamClient is the pluggable seam used by the executor (a fake in
 *          tests, Boost.Beast in production). The client carries no per-request
 *          state and is shared by all request threads.
 */

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include "meshnode/compat/expected.hpp"
#include "meshnode/net/cancel_signal.hpp"
#include "meshnode/net/http_types.hpp"

namespace meshnode::net {

    /** @struct OutboundRequest
     *  @brief Everything needed to reach one hop.
     */
    struct OutboundRequest {
        bool        tls{false};       ///< https when true
        std::string authority;        ///< host[:port] as written in the path
        std::string target{"/"};      ///< Origin-form request target
        std::string method{"GET"};    ///< Inbound method, relayed as-is
        std::string body;             ///< Inbound body, relayed as-is

        /// "scheme://authority/target"
        [[nodiscard]] std::string url() const;

        /// Parse an absolute http(s) URL (used by the probe tool).
        [[nodiscard]] static meshnode_detail::expected<OutboundRequest, std::string>
        from_url(std::string_view url);
    };

    /** @struct Endpoint
     *  @brief Resolver inputs split from an authority.
     */
    struct Endpoint {
        std::string host;   ///< Hostname or IP literal (brackets removed)
        std::string port;   ///< Explicit port or the scheme default
    };

    /// "svc:8080" -> {svc, 8080}; "[::1]" + tls -> {::1, 443}.
    [[nodiscard]] meshnode_detail::expected<Endpoint, std::string>
    split_authority(std::string_view authority, bool tls);

    using UpstreamResult = meshnode_detail::expected<Response, std::string>;

    class UpstreamClient {
    public:
        virtual ~UpstreamClient() = default;

        /**
         * @brief Perform one exchange, bounded by @p deadline end to end.
         * @details Runs on the awaiting coroutine's executor; no thread is held
         *          while the peer is slow. Emitting @p cancel aborts the exchange.
         * @return Upstream response, or transport error text (DNS, connect,
         *         TLS, I/O, deadline, cancellation).
         */
        virtual boost::asio::awaitable<UpstreamResult>
        send(const OutboundRequest& out, Deadline deadline, CancelSignal* cancel = nullptr) const = 0;
    };

    /** @struct TlsClientPolicy
     *  @brief Outbound certificate policy (--upstream-tls-insecure clears verify_peer).
     */
    struct TlsClientPolicy {
        bool verify_peer{true};
    };

    /** @class BeastUpstreamClient
     *  @brief Boost.Beast client; each exchange is a coroutine on the caller's executor.
     */
    class BeastUpstreamClient final : public UpstreamClient {
    public:
        /**
         * @brief Factory: builds the shared TLS context once (setup time only).
         * @return Client or the TLS initialisation error.
         */
        static meshnode_detail::expected<std::shared_ptr<BeastUpstreamClient>, std::string>
        create(TlsClientPolicy policy);

        boost::asio::awaitable<UpstreamResult>
        send(const OutboundRequest& out, Deadline deadline, CancelSignal* cancel = nullptr) const override;

        [[nodiscard]] const TlsClientPolicy& policy() const noexcept { return policy_; }

        BeastUpstreamClient(TlsClientPolicy policy, std::unique_ptr<boost::asio::ssl::context> tls) noexcept;

    private:
        TlsClientPolicy policy_;
        std::unique_ptr<boost::asio::ssl::context> tls_;
    };

} // namespace meshnode::net
