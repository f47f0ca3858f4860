/**
 * @file upstream_client.cpp
 * @brief Boost.Beast next-hop client (plain TCP or TLS), deadline and cancel bound.
 */
#include "meshnode/net/upstream_client.hpp"

#include <exception>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "meshnode/config/constants.hpp"

namespace meshnode::net {

    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace http  = beast::http;
    namespace ssl   = asio::ssl;
    using tcp       = asio::ip::tcp;
    using namespace meshnode::config::constants;

    namespace {

    constexpr const char* kDeadlineExceeded = "context deadline exceeded";
    constexpr const char* kCanceled         = "context canceled";

    Request build_request(const OutboundRequest& out) {
        Request req;
        req.version(kHttp11);
        req.method_string(out.method);
        req.target(out.target.empty() ? std::string{"/"} : out.target);
        req.set(http::field::host, out.authority);
        req.set(http::field::user_agent, USER_AGENT);
        req.body() = out.body;
        req.prepare_payload();
        return req;
    }

    /** @struct Conn
     *  @brief Resolver and stream of one exchange, shared so abort paths can
     *         reach them without outliving them.
     */
    template <class Stream>
    struct Conn {
        template <class... Args>
        explicit Conn(const asio::any_io_executor& ex, Args&&... args)
            : resolver(ex), stream(ex, std::forward<Args>(args)...) {}

        // Pending operations complete with operation_aborted.
        void abort() {
            resolver.cancel();
            beast::get_lowest_layer(stream).cancel();
        }

        tcp::resolver resolver;
        Stream stream;
    };

    /** @class AbortGuard
     *  @brief Aborts a connection at the deadline or when the caller cancels.
     *  @details The stream expiry only covers connect and I/O; this also bounds
     *           name resolution. Both hooks hold a weak reference.
     */
    class AbortGuard {
    public:
        template <class Stream>
        AbortGuard(const std::shared_ptr<Conn<Stream>>& conn, Deadline deadline, CancelSignal* cancel)
            : timer_(conn->stream.get_executor(), deadline), cancel_(cancel) {
            std::weak_ptr<Conn<Stream>> weak = conn;
            auto abort = [weak] {
                if (auto c = weak.lock()) c->abort();
            };
            timer_.async_wait([abort](const beast::error_code& ec) {
                if (!ec) abort();
            });
            if (cancel_) cancel_->install(abort);
        }

        ~AbortGuard() {
            timer_.cancel();
            if (cancel_) cancel_->clear();
        }

        AbortGuard(const AbortGuard&) = delete;
        AbortGuard& operator=(const AbortGuard&) = delete;

    private:
        asio::steady_timer timer_;
        CancelSignal* cancel_;
    };

    template <class Stream>
    asio::awaitable<Response> read_response(Stream& stream, const Request& req) {
        co_await http::async_write(stream, req, asio::use_awaitable);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(UPSTREAM_BODY_LIMIT_BYTES);
        // HEAD responses advertise a length but carry no body.
        if (req.method() == http::verb::head) parser.skip(true);
        co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
        co_return parser.release();
    }

    asio::awaitable<Response> exchange_plain(Endpoint ep, Request req, Deadline deadline,
                                             CancelSignal* cancel) {
        auto ex = co_await asio::this_coro::executor;
        auto conn = std::make_shared<Conn<beast::tcp_stream>>(ex);
        AbortGuard guard(conn, deadline, cancel);

        const auto results = co_await conn->resolver.async_resolve(ep.host, ep.port, asio::use_awaitable);
        conn->stream.expires_at(deadline);
        co_await conn->stream.async_connect(results, asio::use_awaitable);

        auto res = co_await read_response(conn->stream, req);

        beast::error_code ec;
        conn->stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }

    asio::awaitable<Response> exchange_tls(Endpoint ep, Request req, Deadline deadline,
                                           CancelSignal* cancel, ssl::context& tls, bool verify_peer) {
        auto ex = co_await asio::this_coro::executor;
        auto conn = std::make_shared<Conn<beast::ssl_stream<beast::tcp_stream>>>(ex, tls);
        auto& stream = conn->stream;

        if (!::SSL_set_tlsext_host_name(stream.native_handle(), ep.host.c_str())) {
            throw beast::system_error(
                beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
        }
        if (verify_peer) {
            stream.set_verify_mode(ssl::verify_peer);
            stream.set_verify_callback(ssl::host_name_verification(ep.host));
        } else {
            stream.set_verify_mode(ssl::verify_none);
        }

        AbortGuard guard(conn, deadline, cancel);

        const auto results = co_await conn->resolver.async_resolve(ep.host, ep.port, asio::use_awaitable);
        beast::get_lowest_layer(stream).expires_at(deadline);
        co_await beast::get_lowest_layer(stream).async_connect(results, asio::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);

        auto res = co_await read_response(stream, req);

        // No close_notify exchange: peers commonly drop the socket first.
        beast::error_code ec;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }

    // An aborted operation reports why it was aborted, not operation_aborted.
    std::string describe(const beast::error_code& ec, Deadline deadline, const CancelSignal* cancel) {
        if (cancel && cancel->emitted()) return kCanceled;
        if (ec == beast::error::timeout || Clock::now() >= deadline) return kDeadlineExceeded;
        if (ec == http::error::body_limit) return "response body too large";
        return ec.message();
    }

    } // namespace

    std::string OutboundRequest::url() const {
        std::string u = tls ? "https://" : "http://";
        u += authority;
        u += target.empty() ? std::string{"/"} : target;
        return u;
    }

    meshnode_detail::expected<OutboundRequest, std::string>
    OutboundRequest::from_url(std::string_view url) {
        OutboundRequest out;
        constexpr std::string_view kHttp  = "http://";
        constexpr std::string_view kHttps = "https://";
        if (url.starts_with(kHttps)) {
            out.tls = true;
            url.remove_prefix(kHttps.size());
        } else if (url.starts_with(kHttp)) {
            url.remove_prefix(kHttp.size());
        } else {
            return meshnode_detail::unexpected("unsupported URL (want http:// or https://): " + std::string(url));
        }

        const auto slash = url.find('/');
        out.authority = std::string(url.substr(0, slash));
        out.target    = slash == std::string_view::npos ? std::string{"/"} : std::string(url.substr(slash));
        if (out.authority.empty()) {
            return meshnode_detail::unexpected(std::string("URL has no host"));
        }
        return out;
    }

    meshnode_detail::expected<Endpoint, std::string>
    split_authority(std::string_view authority, bool tls) {
        const std::string default_port = std::to_string(tls ? HTTPS_DEFAULT_PORT : HTTP_DEFAULT_PORT);
        Endpoint ep;

        if (authority.starts_with('[')) {
            const auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return meshnode_detail::unexpected("missing ']' in host \"" + std::string(authority) + "\"");
            }
            ep.host = std::string(authority.substr(1, close - 1));
            const auto tail = authority.substr(close + 1);
            if (tail.empty())               ep.port = default_port;
            else if (tail.starts_with(':')) ep.port = std::string(tail.substr(1));
            else return meshnode_detail::unexpected("invalid host \"" + std::string(authority) + "\"");
        } else {
            const auto colon = authority.rfind(':');
            if (colon == std::string_view::npos) {
                ep.host = std::string(authority);
                ep.port = default_port;
            } else {
                ep.host = std::string(authority.substr(0, colon));
                ep.port = std::string(authority.substr(colon + 1));
            }
        }

        if (ep.host.empty()) {
            return meshnode_detail::unexpected("no host in \"" + std::string(authority) + "\"");
        }
        if (ep.port.empty()) ep.port = default_port;
        return ep;
    }

    BeastUpstreamClient::BeastUpstreamClient(TlsClientPolicy policy,
                                             std::unique_ptr<ssl::context> tls) noexcept
        : policy_(policy), tls_(std::move(tls)) {}

    meshnode_detail::expected<std::shared_ptr<BeastUpstreamClient>, std::string>
    BeastUpstreamClient::create(TlsClientPolicy policy) {
        auto tls = std::make_unique<ssl::context>(ssl::context::tls_client);
        beast::error_code ec;
        tls->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                         ssl::context::no_sslv3, ec);
        if (ec) return meshnode_detail::unexpected("tls options: " + ec.message());
        if (policy.verify_peer) {
            tls->set_default_verify_paths(ec);
            if (ec) return meshnode_detail::unexpected("tls trust store: " + ec.message());
        }
        return std::make_shared<BeastUpstreamClient>(policy, std::move(tls));
    }

    asio::awaitable<UpstreamResult>
    BeastUpstreamClient::send(const OutboundRequest& out, Deadline deadline, CancelSignal* cancel) const {
        const auto prefix = out.method + " \"" + out.url() + "\": ";

        auto ep = split_authority(out.authority, out.tls);
        if (!ep) co_return meshnode_detail::unexpected(prefix + ep.error());
        if (cancel && cancel->emitted()) co_return meshnode_detail::unexpected(prefix + kCanceled);
        if (Clock::now() >= deadline) co_return meshnode_detail::unexpected(prefix + kDeadlineExceeded);

        auto req = build_request(out);
        std::string error;
        try {
            if (out.tls) {
                co_return co_await exchange_tls(std::move(*ep), std::move(req), deadline, cancel, *tls_,
                                                policy_.verify_peer);
            }
            co_return co_await exchange_plain(std::move(*ep), std::move(req), deadline, cancel);
        } catch (const beast::system_error& e) {
            error = describe(e.code(), deadline, cancel);
        } catch (const std::exception& e) {
            error = e.what();
        }
        co_return meshnode_detail::unexpected(prefix + error);
    }

} // namespace meshnode::net
