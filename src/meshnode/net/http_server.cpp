/**
 * @file http_server.cpp
 * @brief Async Beast listener and per-connection sessions (plain and TLS).
 */
#include "meshnode/net/http_server.hpp"

#include <atomic>
#include <exception>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <fmt/format.h>

namespace meshnode::net {

    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace http  = beast::http;
    namespace ssl   = asio::ssl;
    using tcp       = asio::ip::tcp;
    using namespace meshnode::config::constants;

    namespace {

    using PlainStream = beast::tcp_stream;
    using TlsStream   = beast::ssl_stream<beast::tcp_stream>;

    /// State every session reads; outlives the sessions through shared ownership.
    struct Shared {
        std::shared_ptr<const RequestHandler> handler;
        obs::Logger                           logger;
        std::chrono::milliseconds             request_timeout;
        std::atomic<std::uint64_t>            seq{0};

        std::string next_request_id() {
            const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            return fmt::format("{}-{}", nanos, seq.fetch_add(1, std::memory_order_relaxed) + 1);
        }
    };

    bool is_quiet_close(const beast::error_code& ec) {
        return ec == http::error::end_of_stream || ec == beast::error::timeout ||
               ec == asio::error::operation_aborted || ec == asio::error::eof ||
               ec == asio::error::connection_reset;
    }

    template <class Stream>
    class Session : public std::enable_shared_from_this<Session<Stream>> {
        static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;

    public:
        Session(Stream&& stream, std::shared_ptr<Shared> shared)
            : stream_(std::move(stream)), shared_(std::move(shared)) {
            beast::error_code ec;
            const auto peer = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
            if (!ec) remote_ = fmt::format("{}:{}", peer.address().to_string(), peer.port());
        }

        void run() {
            // Start on the connection's strand.
            asio::dispatch(stream_.get_executor(),
                           beast::bind_front_handler(&Session::on_run, this->shared_from_this()));
        }

    private:
        void on_run() {
            if constexpr (kTls) {
                beast::get_lowest_layer(stream_).expires_after(TLS_HANDSHAKE_TIMEOUT);
                stream_.async_handshake(ssl::stream_base::server,
                    beast::bind_front_handler(&Session::on_handshake, this->shared_from_this()));
            } else {
                do_read();
            }
        }

        void on_handshake(beast::error_code ec) {
            if (ec) {
                shared_->logger.debug("TLS handshake failed",
                                      {{"remote_addr", remote_}, {"error", ec.message()}});
                return;
            }
            do_read();
        }

        void do_read() {
            parser_.emplace();
            parser_->body_limit(INBOUND_BODY_LIMIT_BYTES);
            beast::get_lowest_layer(stream_).expires_after(SESSION_IDLE_TIMEOUT);
            http::async_read(stream_, buffer_, *parser_,
                beast::bind_front_handler(&Session::on_read, this->shared_from_this()));
        }

        void on_read(beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                do_close();
                return;
            }
            if (ec == http::error::body_limit) {
                res_ = make_text_response(413, "request body too large");
                res_.keep_alive(false);
                write(true);
                return;
            }
            if (ec) {
                if (!is_quiet_close(ec)) {
                    shared_->logger.debug("Connection read failed",
                                          {{"remote_addr", remote_}, {"error", ec.message()}});
                }
                return;
            }
            handle(parser_->release());
        }

        void handle(Request req) {
            RequestContext ctx;
            ctx.request_id  = shared_->next_request_id();
            ctx.remote_addr = remote_;
            ctx.received    = Clock::now();
            ctx.deadline    = ctx.received + shared_->request_timeout;
            ctx.cancel      = std::make_shared<CancelSignal>();

            request_id_ = ctx.request_id;
            version_    = req.version();
            keep_alive_ = req.keep_alive();
            cancel_     = ctx.cancel;
            watch_peer();

            // The strand is free while the handler waits on a next hop.
            asio::co_spawn(stream_.get_executor(),
                           respond(shared_, std::move(req), std::move(ctx)),
                           beast::bind_front_handler(&Session::on_handled, this->shared_from_this()));
        }

        static asio::awaitable<Response> respond(std::shared_ptr<Shared> shared, Request req,
                                                 RequestContext ctx) {
            co_return co_await shared->handler->handle(req, ctx);
        }

        void on_handled(std::exception_ptr eptr, Response res) {
            cancel_.reset();
            beast::error_code ec;
            beast::get_lowest_layer(stream_).socket().cancel(ec);

            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    shared_->logger.error("Request handler failed",
                                          {{"request_id", request_id_}, {"error", e.what()}});
                    res = make_text_response(500, std::string("Response error: ") + e.what());
                }
            }
            res_ = std::move(res);
            res_.version(version_);
            res_.keep_alive(keep_alive_);
            write(res_.need_eof());
        }

        // Readability with nothing buffered means FIN or RST while the
        // handler runs. Buffered bytes are a pipelined request; stop watching.
        void watch_peer() {
            beast::get_lowest_layer(stream_).socket().async_wait(tcp::socket::wait_read,
                beast::bind_front_handler(&Session::on_peer_readable, this->shared_from_this()));
        }

        void on_peer_readable(beast::error_code ec) {
            if (ec || !cancel_) return;
            auto& socket = beast::get_lowest_layer(stream_).socket();
            const auto pending = socket.available(ec);
            if (!ec && pending > 0) return;

            shared_->logger.debug("Client disconnected",
                                  {{"request_id", request_id_}, {"remote_addr", remote_}});
            cancel_->emit();
        }

        void write(bool close) {
            beast::get_lowest_layer(stream_).expires_after(SESSION_IDLE_TIMEOUT);
            http::async_write(stream_, res_,
                beast::bind_front_handler(&Session::on_write, this->shared_from_this(), close));
        }

        void on_write(bool close, beast::error_code ec, std::size_t) {
            if (ec) {
                if (!is_quiet_close(ec)) {
                    shared_->logger.debug("Connection write failed",
                                          {{"remote_addr", remote_}, {"error", ec.message()}});
                }
                return;
            }
            if (close) {
                do_close();
                return;
            }
            res_ = {};
            do_read();
        }

        void do_close() {
            if constexpr (kTls) {
                beast::get_lowest_layer(stream_).expires_after(TLS_HANDSHAKE_TIMEOUT);
                stream_.async_shutdown(
                    beast::bind_front_handler(&Session::on_shutdown, this->shared_from_this()));
            } else {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }
        }

        void on_shutdown(beast::error_code) {
            // Peer may already be gone; the socket closes with the session.
        }

        Stream stream_;
        std::shared_ptr<Shared> shared_;
        std::string remote_{"unknown"};
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        Response res_;
        std::string request_id_;
        unsigned version_{kHttp11};
        bool keep_alive_{false};
        std::shared_ptr<CancelSignal> cancel_;
    };

    } // namespace

    struct HttpServer::Impl {
        ServerOptions options;
        std::shared_ptr<Shared> shared;
        std::optional<ssl::context> tls;    // outlives the io_context and its sessions
        asio::io_context ioc;
        tcp::acceptor acceptor;
        std::vector<std::thread> threads;
        std::atomic<bool> running{false};
        std::uint16_t bound_port{0};

        Impl(ServerOptions opts, std::shared_ptr<const RequestHandler> handler, obs::Logger logger)
            : options(std::move(opts)),
              shared(std::make_shared<Shared>()),
              ioc(static_cast<int>(options.workers)),
              acceptor(asio::make_strand(ioc)) {
            shared->handler         = std::move(handler);
            shared->logger          = std::move(logger);
            shared->request_timeout = options.request_timeout;
        }

        meshnode_detail::expected<void, std::string> load_tls() {
            const auto& files = *options.tls;
            beast::error_code ec;
            tls.emplace(ssl::context::tls_server);
            tls->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                             ssl::context::no_sslv3, ec);
            if (ec) return meshnode_detail::unexpected("tls options: " + ec.message());
            tls->use_certificate_chain_file(files.cert_chain, ec);
            if (ec) {
                return meshnode_detail::unexpected(
                    fmt::format("failed to load TLS certificate \"{}\": {}", files.cert_chain, ec.message()));
            }
            tls->use_private_key_file(files.private_key, ssl::context::pem, ec);
            if (ec) {
                return meshnode_detail::unexpected(
                    fmt::format("failed to load TLS key \"{}\": {}", files.private_key, ec.message()));
            }
            return {};
        }

        meshnode_detail::expected<void, std::string> listen() {
            beast::error_code ec;
            const auto addr = asio::ip::make_address(options.address, ec);
            if (ec) {
                return meshnode_detail::unexpected(
                    fmt::format("invalid listen address \"{}\": {}", options.address, ec.message()));
            }
            const tcp::endpoint ep{addr, options.port};
            const auto where = fmt::format("listen tcp {}:{}: ", options.address, options.port);

            acceptor.open(ep.protocol(), ec);
            if (ec) return meshnode_detail::unexpected(where + ec.message());
            acceptor.set_option(asio::socket_base::reuse_address(true), ec);
            if (ec) return meshnode_detail::unexpected(where + ec.message());
            acceptor.bind(ep, ec);
            if (ec) return meshnode_detail::unexpected(where + ec.message());
            acceptor.listen(asio::socket_base::max_listen_connections, ec);
            if (ec) return meshnode_detail::unexpected(where + ec.message());

            bound_port = acceptor.local_endpoint(ec).port();
            if (ec) return meshnode_detail::unexpected(where + ec.message());
            return {};
        }

        void do_accept() {
            acceptor.async_accept(asio::make_strand(ioc),
                                  beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    shared->logger.warn("Accept failed", {{"error", ec.message()}});
                }
            } else if (tls) {
                std::make_shared<Session<TlsStream>>(TlsStream(std::move(socket), *tls), shared)->run();
            } else {
                std::make_shared<Session<PlainStream>>(PlainStream(std::move(socket)), shared)->run();
            }
            if (running.load()) do_accept();
        }
    };

    HttpServer::HttpServer(ServerOptions options,
                           std::shared_ptr<const RequestHandler> handler,
                           obs::Logger logger)
        : impl_(std::make_unique<Impl>(std::move(options), std::move(handler), std::move(logger))) {}

    HttpServer::~HttpServer() { stop(); }

    meshnode_detail::expected<void, std::string> HttpServer::start() {
        if (impl_->running.load()) return meshnode_detail::unexpected(std::string("server already started"));
        if (impl_->options.workers == 0) return meshnode_detail::unexpected(std::string("workers must be >= 1"));

        if (impl_->options.tls) {
            if (auto ok = impl_->load_tls(); !ok) return ok;
        }
        if (auto ok = impl_->listen(); !ok) return ok;

        impl_->running.store(true);
        impl_->do_accept();

        impl_->threads.reserve(impl_->options.workers);
        for (unsigned i = 0; i < impl_->options.workers; ++i) {
            impl_->threads.emplace_back([this] { impl_->ioc.run(); });
        }
        return {};
    }

    void HttpServer::stop() {
        if (!impl_->running.exchange(false)) return;

        impl_->ioc.stop();
        for (auto& t : impl_->threads) {
            if (t.joinable()) t.join();
        }
        impl_->threads.clear();

        beast::error_code ec;
        impl_->acceptor.close(ec);
    }

    std::uint16_t HttpServer::port() const noexcept { return impl_->bound_port; }

    bool HttpServer::tls_enabled() const noexcept { return impl_->options.tls.has_value(); }

} // namespace meshnode::net
