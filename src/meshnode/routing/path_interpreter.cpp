/**
 * @file path_interpreter.cpp
 * @brief Single-step path parsing for /fault/ and /proxy/ segments.
 */
#include "meshnode/routing/path_interpreter.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <vector>

namespace meshnode::routing {
    using namespace meshnode::config::constants;

    namespace {

    constexpr std::string_view kFaultPrefix = "/fault/";
    constexpr std::string_view kProxyPrefix = "/proxy/";

    // Split on '/', keeping empty segments: "/a//b" -> {"", "a", "", "b"}.
    std::vector<std::string_view> split_segments(std::string_view path) {
        std::vector<std::string_view> parts;
        std::size_t start = 0;
        while (true) {
            const auto slash = path.find('/', start);
            if (slash == std::string_view::npos) {
                parts.push_back(path.substr(start));
                return parts;
            }
            parts.push_back(path.substr(start, slash - start));
            start = slash + 1;
        }
    }

    // Whole-segment integer; rejects empty input and trailing garbage.
    std::optional<int> to_int(std::string_view s) noexcept {
        if (s.empty()) return std::nullopt;
        int v = 0;
        const auto* first = s.data();
        const auto* last  = s.data() + s.size();
        const auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec != std::errc{} || ptr != last) return std::nullopt;
        return v;
    }

    // "/" + parts[from..] joined by '/', or "/" when nothing is left.
    std::string rejoin_from(const std::vector<std::string_view>& parts, std::size_t from) {
        std::string out{"/"};
        for (std::size_t i = from; i < parts.size(); ++i) {
            if (i != from) out.push_back('/');
            out.append(parts[i]);
        }
        return out;
    }

    // "https:" -> "https"; anything that is not <alpha>[alnum+-.]*":" -> nullopt.
    std::optional<std::string> scheme_token(std::string_view seg) {
        if (seg.size() < 2 || seg.back() != ':') return std::nullopt;
        const auto name = seg.substr(0, seg.size() - 1);
        if (!std::isalpha(static_cast<unsigned char>(name.front()))) return std::nullopt;
        const bool ok = std::all_of(name.begin(), name.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        });
        if (!ok) return std::nullopt;
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    ParseResult parse_fault(const std::vector<std::string_view>& parts) {
        // parts: {"", "fault", <code>, [<percentage>], rest...}
        const auto code = to_int(parts.size() > 2 ? parts[2] : std::string_view{});
        if (!code || *code < FAULT_CODE_MIN || *code > FAULT_CODE_MAX) {
            return meshnode_detail::unexpected(ParseError::InvalidFaultCode);
        }

        int percentage = FAULT_PERCENT_DEFAULT;
        std::size_t rest = 3;
        if (parts.size() > 3) {
            // Non-numeric: keep the default and treat the segment as the next head.
            if (const auto p = to_int(parts[3])) {
                percentage = *p;
                rest = 4;
            }
        }
        if (percentage < FAULT_PERCENT_MIN || percentage > FAULT_PERCENT_MAX) {
            return meshnode_detail::unexpected(ParseError::InvalidPercentage);
        }

        Directive d;
        d.kind              = DirectiveKind::Fault;
        d.fault_status_code = *code;
        d.fault_percentage  = percentage;
        d.remaining_path    = rejoin_from(parts, rest);
        return d;
    }

    ParseResult parse_forward(const std::vector<std::string_view>& parts) {
        // parts: {"", "proxy", <hop or scheme:>, ...}
        Directive d;
        d.kind = DirectiveKind::Forward;

        std::string_view hop = parts.size() > 2 ? parts[2] : std::string_view{};
        std::size_t rest = 3;

        if (const auto scheme = scheme_token(hop)) {
            if (*scheme == "http")       d.scheme = Scheme::Http;
            else if (*scheme == "https") d.scheme = Scheme::Https;
            else return meshnode_detail::unexpected(ParseError::UnsupportedScheme);

            // "https://host" splits as {"https:", "", "host"}; a collapsed
            // "https:/host" as {"https:", "host"}.
            std::size_t host_idx = 3;
            if (parts.size() > 3 && parts[3].empty()) host_idx = 4;
            hop  = parts.size() > host_idx ? parts[host_idx] : std::string_view{};
            rest = host_idx + 1;
        }

        if (hop.empty()) {
            return meshnode_detail::unexpected(ParseError::EmptyServiceName);
        }

        d.next_hop       = std::string(hop);
        d.remaining_path = rejoin_from(parts, rest);
        return d;
    }

    } // namespace

    ParseResult parse_directive(std::string_view path) {
        if (path.empty() || path == "/") {
            return Directive{};
        }

        if (path.starts_with(kFaultPrefix)) {
            return parse_fault(split_segments(path));
        }
        if (path.starts_with(kProxyPrefix)) {
            return parse_forward(split_segments(path));
        }
        return meshnode_detail::unexpected(ParseError::UnrecognizedPrefix);
    }

    const char* to_string(DirectiveKind k) noexcept {
        switch (k) {
            case DirectiveKind::Terminal: return "terminal";
            case DirectiveKind::Fault:    return "fault";
            case DirectiveKind::Forward:  return "forward";
        }
        return "unknown";
    }

    const char* to_string(Scheme s) noexcept {
        return s == Scheme::Https ? "https" : "http";
    }

    const char* to_string(ParseError e) noexcept {
        switch (e) {
            case ParseError::InvalidFaultCode:   return "invalid fault code: must be a number in 400-599";
            case ParseError::InvalidPercentage:  return "invalid fault percentage: must be 0-100";
            case ParseError::EmptyServiceName:   return "invalid path: empty service name";
            case ParseError::UnsupportedScheme:  return "invalid path: scheme must be http or https";
            case ParseError::UnrecognizedPrefix: return "invalid path: must start with /proxy/ or /fault/";
        }
        return "invalid path";
    }

} // namespace meshnode::routing
