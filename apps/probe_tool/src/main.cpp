// apps/probe_tool/src/main.cpp
// meshnode: probe_tool
// Purpose: Standalone helper for probing a running topology (status mix, service identity).
// This is NOT the node itself; it is a testing utility.
//
// Usage:
//   ./probe_tool <url> [count]
//   ./probe_tool http://localhost:8080/fault/503/30/proxy/backend:8080 200
//
// Notes:
// - Each probe is a plain GET through the same Beast client the node uses to forward.
// - The summary (status histogram, non-2xx rate) is the quick way to check that a
//   fault percentage behaves as configured.

#include <charconv>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

#include "meshnode/net/run_blocking.hpp"
#include "meshnode/net/upstream_client.hpp"
#include "meshnode/routing/response_envelope.hpp"

namespace {
constexpr int  kDefaultCount = 20;
constexpr auto kProbeTimeout = std::chrono::seconds(10);
} // namespace

int main(int argc, char** argv) {
    using namespace meshnode;

    if (argc < 2) {
        std::cerr << "usage: probe_tool <url> [count]" << std::endl;
        return 1;
    }
    const std::string url = argv[1];

    int count = kDefaultCount;
    if (argc > 2) {
        const std::string_view s = argv[2];
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), count);
        if (ec != std::errc{} || ptr != s.data() + s.size() || count < 1) {
            std::cerr << "Error: count must be a positive integer, got \"" << s << "\"" << std::endl;
            return 1;
        }
    }

    auto target = net::OutboundRequest::from_url(url);
    if (!target) {
        std::cerr << "Error: " << target.error() << std::endl;
        return 1;
    }
    auto client = net::BeastUpstreamClient::create(net::TlsClientPolicy{});
    if (!client) {
        std::cerr << "Error: " << client.error() << std::endl;
        return 1;
    }

    std::cout << "meshnode probe_tool starting" << std::endl;
    std::cout << "Target: " << url << ", count: " << count << std::endl;

    std::map<std::string, int> histogram;
    int non_2xx = 0;

    for (int i = 0; i < count; ++i) {
        const auto started = net::Clock::now();
        auto res = net::run_blocking((*client)->send(*target, started + kProbeTimeout));
        const auto ms = std::chrono::duration<double, std::milli>(net::Clock::now() - started).count();

        std::cout << "PROBE seq=" << i << std::fixed << std::setprecision(1) << " time=" << ms << " ms";
        if (!res) {
            std::cout << " error=\"" << res.error() << "\"" << std::endl;
            ++histogram["error"];
            ++non_2xx;
            continue;
        }

        const unsigned status = res->result_int();
        std::cout << " status=" << status;
        if (auto env = routing::decode_envelope(res->body())) {
            std::cout << " service=" << env->service;
        }
        std::cout << std::endl;

        ++histogram[std::to_string(status)];
        if (status < 200 || status > 299) ++non_2xx;
    }

    std::cout << "--------------------------------------------------\n";
    for (const auto& [key, n] : histogram) {
        std::cout << std::left << std::setw(6) << key << " " << n << "\n";
    }
    std::cout << "non-2xx rate: " << std::setprecision(1)
              << (100.0 * non_2xx / count) << "%" << std::endl;

    std::cout << "probe_tool finished" << std::endl;
    return 0;
}
