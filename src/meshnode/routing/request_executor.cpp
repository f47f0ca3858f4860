/**
 * @file request_executor.cpp
 * @brief Fault / terminal / forward transitions for one inbound request.
 */
#include "meshnode/routing/request_executor.hpp"

#include <chrono>
#include <exception>
#include <string>

#include "meshnode/config/constants.hpp"
#include "meshnode/routing/path_interpreter.hpp"
#include "meshnode/routing/response_envelope.hpp"

namespace meshnode::routing {

    namespace http = boost::beast::http;
    using namespace meshnode::config::constants;

    namespace {

    double elapsed_ms(net::Clock::time_point since) {
        return std::chrono::duration<double, std::milli>(net::Clock::now() - since).count();
    }

    // Framing is recomputed for the downstream connection.
    bool is_hop_header(http::field f) noexcept {
        return f == http::field::content_length || f == http::field::transfer_encoding ||
               f == http::field::connection     || f == http::field::keep_alive;
    }

    } // namespace

    RequestExecutor::RequestExecutor(std::shared_ptr<const net::UpstreamClient> client,
                                     std::shared_ptr<RandomSource> random)
        : client_(std::move(client)), random_(std::move(random)) {}

    boost::asio::awaitable<net::Response>
    RequestExecutor::execute_path(const net::Request& req, std::string_view path, std::string_view service,
                                  net::Deadline deadline, const obs::Logger& log,
                                  net::CancelSignal* cancel) const {
        auto parsed = parse_directive(path);
        if (!parsed) {
            const std::string err = to_string(parsed.error());
            log.error("Path parsing failed", {{"error", err}, {"path", std::string(path)}});
            co_return net::make_text_response(400, err, req.version());
        }
        log.debug("Path parsed successfully", {
            {"directive", to_string(parsed->kind)},
            {"next_hop", parsed->next_hop},
            {"remaining", parsed->remaining_path},
        });
        co_return co_await execute(req, std::move(*parsed), service, deadline, log, cancel);
    }

    boost::asio::awaitable<net::Response>
    RequestExecutor::execute(const net::Request& req, Directive d, std::string_view service,
                             net::Deadline deadline, const obs::Logger& log,
                             net::CancelSignal* cancel) const {
        // Each non-firing fault hands the rest of the path back to the interpreter.
        while (d.is_fault()) {
            log.info("Fault injection detected", {
                {"fault_code", d.fault_status_code},
                {"percentage", d.fault_percentage},
            });

            if (random_->uniform_int(0, FAULT_DRAW_UPPER) < d.fault_percentage) {
                log.info("Fault triggered", {{"fault_code", d.fault_status_code}});
                co_return respond_envelope(req, d.fault_status_code, service,
                                           fault_message(d.fault_status_code), log);
            }

            log.info("Fault not triggered, continuing to next segment", {{"remaining", d.remaining_path}});
            auto next = parse_directive(d.remaining_path);
            if (!next) {
                const std::string err = to_string(next.error());
                log.error("Failed to parse remaining path", {{"error", err}, {"remaining", d.remaining_path}});
                co_return net::make_text_response(400, err, req.version());
            }
            d = std::move(*next);
            log.debug("Continuing with remaining path", {
                {"next_hop", d.next_hop},
                {"remaining", d.remaining_path},
            });
        }

        if (d.is_terminal()) {
            log.info("Processing as final hop");
            co_return respond_envelope(req, 200, service, MSG_TERMINAL_SUCCESS, log);
        }
        co_return co_await forward(req, d, deadline, log, cancel);
    }

    net::Response RequestExecutor::respond_envelope(const net::Request& req, int status,
                                                    std::string_view service, std::string message,
                                                    const obs::Logger& log) const {
        log.debug("Sending envelope response", {{"status_code", status}, {"service", std::string(service)}});

        const ResponseEnvelope env{status, std::string(service), std::move(message)};
        auto body = encode_envelope(env);
        if (!body) {
            log.error("Failed to encode JSON response", {{"error", body.error()}});
            return net::make_text_response(500, "Response error: " + body.error(), req.version());
        }
        return net::make_json_response(static_cast<unsigned>(status), std::move(*body), req.version());
    }

    boost::asio::awaitable<net::Response>
    RequestExecutor::forward(const net::Request& req, const Directive& d, net::Deadline deadline,
                             const obs::Logger& log, net::CancelSignal* cancel) const {
        net::OutboundRequest out;
        out.tls       = d.scheme == Scheme::Https;
        out.authority = d.next_hop;
        out.target    = d.remaining_path;
        out.method    = std::string(req.method_string());
        out.body      = req.body();

        const auto url = out.url();
        log.info("Forwarding to next hop", {{"next_hop_url", url}, {"next_service", d.next_hop}});

        const auto started = net::Clock::now();
        auto upstream = co_await client_->send(out, deadline, cancel);
        const double forward_ms = elapsed_ms(started);

        if (!upstream) {
            log.error("Next hop request failed", {
                {"error", upstream.error()},
                {"next_hop_url", url},
                {"forward_duration_ms", forward_ms},
            });
            co_return net::make_text_response(502, "Next hop error: " + upstream.error(), req.version());
        }

        auto& up = *upstream;
        log.info("Next hop response received", {
            {"status_code", up.result_int()},
            {"forward_duration_ms", forward_ms},
            {"next_hop_url", url},
        });

        try {
            net::Response res;
            res.version(req.version());
            res.result(up.result_int());
            for (const auto& f : up.base()) {
                if (is_hop_header(f.name())) continue;
                res.insert(f.name_string(), f.value());
            }
            if (req.method() == http::verb::head) {
                // No body was read; keep the advertised length.
                if (const auto len = up.find(http::field::content_length); len != up.end()) {
                    res.set(http::field::content_length, len->value());
                }
            } else {
                res.body() = std::move(up.body());
                res.prepare_payload();
            }
            co_return res;
        } catch (const std::exception& e) {
            log.error("Failed to forward response", {
                {"error", e.what()},
                {"upstream_status", up.result_int()},
            });
            co_return net::make_text_response(500, std::string("Response error: ") + e.what(), req.version());
        }
    }

} // namespace meshnode::routing
