#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: command-line flags -> validated ServeConfig.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "meshnode/compat/expected.hpp"
#include "meshnode/config/constants.hpp"
#include "meshnode/obs/logger.hpp"

namespace meshnode::config {

    /** @struct ServeConfig
     *  @brief Everything `meshnode serve` needs to wire a node.
     */
    struct ServeConfig {
        int port{constants::DEFAULT_PORT};                                 ///< 1-65535
        std::chrono::milliseconds timeout{constants::DEFAULT_REQUEST_TIMEOUT}; ///< Per request, > 0
        std::string service_name{constants::DEFAULT_SERVICE_NAME};        ///< Non-empty
        obs::LogLevel  log_level{obs::LogLevel::Info};
        obs::LogFormat log_format{obs::LogFormat::Json};
        bool log_headers{false};            ///< Install the header logging decorator
        std::string tls_cert;               ///< PEM chain; with tls_key enables HTTPS
        std::string tls_key;
        bool upstream_tls_insecure{false};  ///< Skip outbound certificate checks
        int workers{constants::DEFAULT_WORKERS};                           ///< 1-256
        std::optional<std::uint64_t> fault_seed;                          ///< Reproducible draws

        [[nodiscard]] bool tls_enabled() const noexcept { return !tls_cert.empty() && !tls_key.empty(); }
    };

    /** @class Loader
     *  @brief Source of node configuration (command-line flags).
     */
    class Loader {
    public:
        /**
         * @brief Parse `serve` flags (argv without program and subcommand names).
         * @param args e.g. {"--port", "9090", "-s", "frontend"}
         * @return Validated config, or the message printed after "Error: ".
         */
        static meshnode_detail::expected<ServeConfig, std::string>
        from_args(const std::vector<std::string>& args);

        /// Cross-field and range checks; from_args() runs it last.
        static meshnode_detail::expected<void, std::string> validate(const ServeConfig& cfg);

        /// Flag reference printed by `meshnode help`.
        static std::string usage();
    };

    /**
     * @brief Parse a duration such as "300ms", "1.5h" or "2h45m".
     * @details Units: ns, us (or µs), ms, s, m, h. A bare "0" is accepted.
     */
    [[nodiscard]] meshnode_detail::expected<std::chrono::nanoseconds, std::string>
    parse_duration(std::string_view s);

    /// Inverse of parse_duration for logs ("1m30s", "250ms").
    [[nodiscard]] std::string format_duration(std::chrono::nanoseconds d);

} // namespace meshnode::config
