/**
 * @file config_loader.cpp
 * @brief getopt_long based flag parsing with named defaults.
 */
#include "meshnode/config/config_loader.hpp"

#include <getopt.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>

#include <fmt/format.h>

namespace meshnode::config {
    using namespace meshnode::config::constants;

    namespace {

    enum LongOnly : int {
        OPT_LOG_HEADERS = 1000,
        OPT_TLS_CERT,
        OPT_TLS_KEY,
        OPT_UPSTREAM_TLS_INSECURE,
        OPT_FAULT_SEED,
    };

    // Leading ':' makes getopt report a missing argument as ':' instead of '?'.
    constexpr const char* kShortOpts = ":p:t:s:l:f:w:";

    const option kLongOpts[] = {
        {"port",                  required_argument, nullptr, 'p'},
        {"timeout",               required_argument, nullptr, 't'},
        {"service-name",          required_argument, nullptr, 's'},
        {"log-level",             required_argument, nullptr, 'l'},
        {"log-format",            required_argument, nullptr, 'f'},
        {"log-headers",           no_argument,       nullptr, OPT_LOG_HEADERS},
        {"tls-cert",              required_argument, nullptr, OPT_TLS_CERT},
        {"tls-key",               required_argument, nullptr, OPT_TLS_KEY},
        {"upstream-tls-insecure", no_argument,       nullptr, OPT_UPSTREAM_TLS_INSECURE},
        {"workers",               required_argument, nullptr, 'w'},
        {"fault-seed",            required_argument, nullptr, OPT_FAULT_SEED},
        {nullptr, 0, nullptr, 0},
    };

    template <class T>
    meshnode_detail::expected<T, std::string> parse_number(std::string_view text, std::string_view flag) {
        T v{};
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), last, v);
        if (text.empty() || ec != std::errc{} || ptr != last) {
            return meshnode_detail::unexpected(
                fmt::format("invalid argument \"{}\" for \"--{}\" flag", text, flag));
        }
        return v;
    }

    struct Unit {
        std::string_view name;
        double nanos;
    };

    constexpr Unit kUnits[] = {
        {"ns", 1.0},
        {"us", 1e3},
        {"\xC2\xB5s", 1e3},   // U+00B5 micro sign
        {"\xCE\xBCs", 1e3},   // U+03BC greek mu
        {"ms", 1e6},
        {"s",  1e9},
        {"m",  60e9},
        {"h",  3600e9},
    };

    // Shortest decimal rendering: 1.5 -> "1.5", 250.0 -> "250".
    std::string trim_number(double v) {
        return fmt::format("{}", v);
    }

    } // namespace

    meshnode_detail::expected<std::chrono::nanoseconds, std::string>
    parse_duration(std::string_view s) {
        const auto invalid = [&] {
            return meshnode_detail::unexpected(fmt::format("time: invalid duration \"{}\"", s));
        };

        std::string_view rest = s;
        bool negative = false;
        if (!rest.empty() && (rest.front() == '-' || rest.front() == '+')) {
            negative = rest.front() == '-';
            rest.remove_prefix(1);
        }
        if (rest == "0") return std::chrono::nanoseconds{0};
        if (rest.empty()) return invalid();

        double total = 0.0;
        while (!rest.empty()) {
            std::size_t n = 0;
            while (n < rest.size() && (std::isdigit(static_cast<unsigned char>(rest[n])) || rest[n] == '.')) ++n;
            if (n == 0) return invalid();

            double value = 0.0;
            const auto num = rest.substr(0, n);
            const auto [ptr, ec] = std::from_chars(num.data(), num.data() + num.size(), value,
                                                   std::chars_format::fixed);
            if (ec != std::errc{} || ptr != num.data() + num.size()) return invalid();
            rest.remove_prefix(n);

            std::size_t u = 0;
            while (u < rest.size() && !std::isdigit(static_cast<unsigned char>(rest[u])) && rest[u] != '.') ++u;
            const auto unit = rest.substr(0, u);
            if (unit.empty()) {
                return meshnode_detail::unexpected(fmt::format("time: missing unit in duration \"{}\"", s));
            }
            const Unit* found = nullptr;
            for (const auto& k : kUnits) {
                if (k.name == unit) { found = &k; break; }
            }
            if (!found) {
                return meshnode_detail::unexpected(
                    fmt::format("time: unknown unit \"{}\" in duration \"{}\"", unit, s));
            }
            total += value * found->nanos;
            rest.remove_prefix(u);
        }

        if (total > static_cast<double>(std::numeric_limits<std::int64_t>::max())) return invalid();
        const auto ns = static_cast<std::int64_t>(std::llround(total));
        return std::chrono::nanoseconds{negative ? -ns : ns};
    }

    std::string format_duration(std::chrono::nanoseconds d) {
        if (d.count() == 0) return "0s";
        std::string out = d.count() < 0 ? "-" : "";
        const auto abs_ns = static_cast<double>(d.count() < 0 ? -d.count() : d.count());

        if (abs_ns < 1e3) return out + trim_number(abs_ns) + "ns";
        if (abs_ns < 1e6) return out + trim_number(abs_ns / 1e3) + "\xC2\xB5s";
        if (abs_ns < 1e9) return out + trim_number(abs_ns / 1e6) + "ms";

        const auto total_ns = static_cast<std::int64_t>(abs_ns);
        const auto hours    = total_ns / 3'600'000'000'000LL;
        const auto minutes  = (total_ns / 60'000'000'000LL) % 60;
        const double secs   = static_cast<double>(total_ns % 60'000'000'000LL) / 1e9;

        if (hours > 0)        out += fmt::format("{}h{}m", hours, minutes);
        else if (minutes > 0) out += fmt::format("{}m", minutes);
        return out + trim_number(secs) + "s";
    }

    meshnode_detail::expected<ServeConfig, std::string>
    Loader::from_args(const std::vector<std::string>& args) {
        ServeConfig cfg;

        // getopt wants a mutable, null-terminated argv with a program name first.
        std::vector<std::string> storage;
        storage.reserve(args.size() + 1);
        storage.emplace_back("meshnode serve");
        storage.insert(storage.end(), args.begin(), args.end());
        std::vector<char*> argv;
        argv.reserve(storage.size() + 1);
        for (auto& a : storage) argv.push_back(a.data());
        argv.push_back(nullptr);
        const int argc = static_cast<int>(storage.size());

        optind = 0; // full reinitialisation (GNU)
        opterr = 0;

        int c = 0;
        while ((c = ::getopt_long(argc, argv.data(), kShortOpts, kLongOpts, nullptr)) != -1) {
            const std::string_view arg = optarg ? std::string_view{optarg} : std::string_view{};
            switch (c) {
                case 'p': {
                    auto v = parse_number<int>(arg, "port");
                    if (!v) return meshnode_detail::unexpected(v.error());
                    cfg.port = *v;
                    break;
                }
                case 't': {
                    auto v = parse_duration(arg);
                    if (!v) {
                        return meshnode_detail::unexpected(
                            fmt::format("invalid argument \"{}\" for \"--timeout\" flag: {}", arg, v.error()));
                    }
                    cfg.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*v);
                    break;
                }
                case 's':
                    cfg.service_name = std::string(arg);
                    break;
                case 'l': {
                    auto v = obs::parse_log_level(arg);
                    if (!v) return meshnode_detail::unexpected(v.error());
                    cfg.log_level = *v;
                    break;
                }
                case 'f': {
                    auto v = obs::parse_log_format(arg);
                    if (!v) return meshnode_detail::unexpected(v.error());
                    cfg.log_format = *v;
                    break;
                }
                case 'w': {
                    auto v = parse_number<int>(arg, "workers");
                    if (!v) return meshnode_detail::unexpected(v.error());
                    cfg.workers = *v;
                    break;
                }
                case OPT_LOG_HEADERS:
                    cfg.log_headers = true;
                    break;
                case OPT_TLS_CERT:
                    cfg.tls_cert = std::string(arg);
                    break;
                case OPT_TLS_KEY:
                    cfg.tls_key = std::string(arg);
                    break;
                case OPT_UPSTREAM_TLS_INSECURE:
                    cfg.upstream_tls_insecure = true;
                    break;
                case OPT_FAULT_SEED: {
                    auto v = parse_number<std::uint64_t>(arg, "fault-seed");
                    if (!v) return meshnode_detail::unexpected(v.error());
                    cfg.fault_seed = *v;
                    break;
                }
                case ':':
                    return meshnode_detail::unexpected(
                        fmt::format("flag needs an argument: {}", argv[optind - 1]));
                default:
                    return meshnode_detail::unexpected(
                        fmt::format("unknown flag: {}", argv[optind - 1]));
            }
        }

        if (optind < argc) {
            return meshnode_detail::unexpected(
                fmt::format("unexpected argument \"{}\" for \"meshnode serve\"", argv[optind]));
        }

        if (auto ok = validate(cfg); !ok) return meshnode_detail::unexpected(ok.error());
        return cfg;
    }

    meshnode_detail::expected<void, std::string> Loader::validate(const ServeConfig& cfg) {
        if (cfg.port < 1 || cfg.port > 65535) {
            return meshnode_detail::unexpected(fmt::format("port must be between 1 and 65535, got {}", cfg.port));
        }
        if (cfg.timeout.count() <= 0) {
            return meshnode_detail::unexpected(
                fmt::format("timeout must be positive, got {}", format_duration(cfg.timeout)));
        }
        if (cfg.service_name.empty()) {
            return meshnode_detail::unexpected(std::string("service-name must not be empty"));
        }
        if (cfg.workers < 1 || cfg.workers > static_cast<int>(MAX_WORKERS)) {
            return meshnode_detail::unexpected(
                fmt::format("workers must be between 1 and {}, got {}", MAX_WORKERS, cfg.workers));
        }
        if (cfg.tls_cert.empty() != cfg.tls_key.empty()) {
            return meshnode_detail::unexpected(std::string("both --tls-cert and --tls-key must be provided together"));
        }
        if (cfg.tls_enabled()) {
            std::error_code ec;
            if (!std::filesystem::exists(cfg.tls_cert, ec)) {
                return meshnode_detail::unexpected(fmt::format("certificate file not found: {}", cfg.tls_cert));
            }
            if (!std::filesystem::exists(cfg.tls_key, ec)) {
                return meshnode_detail::unexpected(fmt::format("key file not found: {}", cfg.tls_key));
            }
        }
        return {};
    }

    std::string Loader::usage() {
        return fmt::format(
            "Usage:\n"
            "  meshnode serve [flags]\n"
            "  meshnode version\n"
            "  meshnode help\n"
            "\n"
            "Serve flags:\n"
            "  -p, --port int                  HTTP server port (default {})\n"
            "  -t, --timeout duration          Request timeout (default {})\n"
            "  -s, --service-name string       Service identifier in responses (default \"{}\")\n"
            "  -l, --log-level string          Log level: debug, info, warn, error (default \"{}\")\n"
            "  -f, --log-format string         Log output format: json, text (default \"{}\")\n"
            "      --log-headers               Log request and response headers with redaction\n"
            "      --tls-cert string           PEM certificate chain (enables HTTPS with --tls-key)\n"
            "      --tls-key string            PEM private key\n"
            "      --upstream-tls-insecure     Skip certificate verification for outbound HTTPS\n"
            "  -w, --workers int               Server worker threads, 1-{} (default {})\n"
            "      --fault-seed uint           Seed for fault sampling (default: random)\n",
            DEFAULT_PORT, format_duration(DEFAULT_REQUEST_TIMEOUT), DEFAULT_SERVICE_NAME,
            DEFAULT_LOG_LEVEL, DEFAULT_LOG_FORMAT, MAX_WORKERS, DEFAULT_WORKERS);
    }

} // namespace meshnode::config
