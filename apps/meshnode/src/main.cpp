/**
 * @file main.cpp
 * @brief meshnode entry point: subcommand dispatch and node wiring.
 *
 * **serve**
 * - Parse flags (config::Loader), build the logger, the upstream client, the
 *   random source, the executor and the node handler (optionally wrapped in the
 *   header logging decorator), then start the HTTP server.
 * - Block until SIGINT/SIGTERM, then stop the server and join its workers.
 *
 * **version** / **help**
 * - Print build identity or flag reference.
 *
 * Exit codes: 0 on clean shutdown, 1 on flag, TLS or listen errors.
 */

#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "meshnode/config/config_loader.hpp"
#include "meshnode/net/http_server.hpp"
#include "meshnode/net/upstream_client.hpp"
#include "meshnode/obs/header_logging.hpp"
#include "meshnode/obs/logger.hpp"
#include "meshnode/routing/random_source.hpp"
#include "meshnode/routing/request_executor.hpp"
#include "meshnode/service/node_handler.hpp"
#include "meshnode/version.hpp"

namespace {

void print_version() {
    std::cout << "meshnode version " << meshnode::version_string << "\n"
              << "  commit: " << meshnode::git_commit << "\n"
              << "  built:  " << meshnode::build_date << std::endl;
}

void print_help() {
    std::cout << "meshnode: composable mock HTTP node for microservice topologies\n"
              << "\n"
              << "Requests are routed by their path:\n"
              << "  /                               answer as the final hop\n"
              << "  /proxy/[http(s)://]host[:port]  forward the rest of the path\n"
              << "  /fault/<code>[/<percentage>]    inject an error response\n"
              << "\n"
              << meshnode::config::Loader::usage();
}

int fail(std::string_view msg) {
    std::cerr << "Error: " << msg << std::endl;
    return 1;
}

int serve(const std::vector<std::string>& args) {
    using namespace meshnode;

    auto cfg = config::Loader::from_args(args);
    if (!cfg) return fail(cfg.error());

    auto log = obs::make_logger(cfg->log_level, cfg->log_format, cfg->service_name);
    log.info("Starting microservice", {
        {"port", cfg->port},
        {"timeout", config::format_duration(cfg->timeout)},
        {"log_level", obs::to_string(cfg->log_level)},
        {"log_format", obs::to_string(cfg->log_format)},
        {"log_headers", cfg->log_headers},
        {"tls", cfg->tls_enabled()},
        {"upstream_tls_insecure", cfg->upstream_tls_insecure},
        {"workers", cfg->workers},
    });

    auto client = net::BeastUpstreamClient::create(net::TlsClientPolicy{!cfg->upstream_tls_insecure});
    if (!client) {
        log.error("Upstream client setup failed", {{"error", client.error()}});
        return fail(client.error());
    }

    auto executor = std::make_shared<const routing::RequestExecutor>(
        *client, routing::make_random_source(cfg->fault_seed));

    std::shared_ptr<const net::RequestHandler> handler =
        std::make_shared<const service::NodeHandler>(cfg->service_name, executor, log);
    if (cfg->log_headers) {
        handler = std::make_shared<const obs::HeaderLoggingHandler>(handler, log);
    }

    net::ServerOptions opts;
    opts.port            = static_cast<std::uint16_t>(cfg->port);
    opts.workers         = static_cast<unsigned>(cfg->workers);
    opts.request_timeout = cfg->timeout;
    if (cfg->tls_enabled()) opts.tls = net::TlsServerFiles{cfg->tls_cert, cfg->tls_key};

    net::HttpServer server(opts, handler, log);
    if (auto ok = server.start(); !ok) {
        log.error("Server error", {{"error", ok.error()}});
        return fail(ok.error());
    }
    log.info("Server listening", {
        {"addr", opts.address + ":" + std::to_string(server.port())},
        {"tls", server.tls_enabled()},
    });

    boost::asio::io_context signals_ioc{1};
    boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) log.info("Shutdown signal received", {{"signal", signo}});
    });
    signals_ioc.run();

    server.stop();
    log.info("Server stopped");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_help();
        return 0;
    }

    const std::string_view cmd = args.front();
    if (cmd == "serve") {
        return serve(std::vector<std::string>(args.begin() + 1, args.end()));
    }
    if (cmd == "version" || cmd == "--version") {
        print_version();
        return 0;
    }
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_help();
        return 0;
    }
    return fail("unknown command \"" + std::string(cmd) + "\" for \"meshnode\"");
}
