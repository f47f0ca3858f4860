/**
 * @file http_types.cpp
 * @brief Small helpers around Beast messages and request targets.
 */
#include "meshnode/net/http_types.hpp"

namespace meshnode::net {

    namespace http = boost::beast::http;

    Response make_text_response(unsigned status, std::string_view text, unsigned version) {
        Response res{http::int_to_status(status), version};
        res.result(status); // keep non-standard codes intact
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.set("X-Content-Type-Options", "nosniff");
        res.body().assign(text.begin(), text.end());
        res.body().push_back('\n');
        res.prepare_payload();
        return res;
    }

    Response make_json_response(unsigned status, std::string body, unsigned version) {
        Response res{http::int_to_status(status), version};
        res.result(status);
        res.set(http::field::content_type, "application/json");
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    std::string_view target_path(std::string_view target) noexcept {
        const auto q = target.find('?');
        return q == std::string_view::npos ? target : target.substr(0, q);
    }

    std::string_view target_query(std::string_view target) noexcept {
        const auto q = target.find('?');
        return q == std::string_view::npos ? std::string_view{} : target.substr(q + 1);
    }

    namespace {
    int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
    } // namespace

    std::string percent_decode(std::string_view path) {
        std::string out;
        out.reserve(path.size());
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (path[i] == '%' && i + 2 < path.size()) {
                const int hi = hex_value(path[i + 1]);
                const int lo = hex_value(path[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    out.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            out.push_back(path[i]);
        }
        return out;
    }

    std::chrono::milliseconds remaining(Deadline deadline) noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    }

} // namespace meshnode::net
