#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the routing engine and the node plumbing.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          command-line Loader where a flag exists.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace meshnode::config::constants {

// =====================
// Serve defaults (command-line)
// =====================
inline constexpr uint16_t DEFAULT_PORT           = 8080;     ///< Listen port
inline constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{30000}; ///< 30 s per request
inline constexpr const char* DEFAULT_SERVICE_NAME = "proxy"; ///< Identity in responses
inline constexpr const char* DEFAULT_LOG_LEVEL    = "info";
inline constexpr const char* DEFAULT_LOG_FORMAT   = "json";
inline constexpr unsigned DEFAULT_WORKERS        = 8;        ///< io_context worker threads
inline constexpr unsigned MAX_WORKERS            = 256;
inline constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";

// =====================
// Path grammar
// =====================
inline constexpr int FAULT_CODE_MIN           = 400;  ///< Lowest injectable status
inline constexpr int FAULT_CODE_MAX           = 599;  ///< Highest injectable status
inline constexpr int FAULT_PERCENT_MIN        = 0;
inline constexpr int FAULT_PERCENT_MAX        = 100;
inline constexpr int FAULT_PERCENT_DEFAULT    = 100;  ///< Always fire when omitted
inline constexpr int FAULT_DRAW_UPPER         = 100;  ///< Draw range is [0, 100)

// =====================
// Transport
// =====================
inline constexpr uint16_t HTTP_DEFAULT_PORT   = 80;
inline constexpr uint16_t HTTPS_DEFAULT_PORT  = 443;
inline constexpr std::size_t UPSTREAM_BODY_LIMIT_BYTES = 64u * 1024u * 1024u; ///< 64 MiB relay cap
inline constexpr std::size_t INBOUND_BODY_LIMIT_BYTES  = 16u * 1024u * 1024u; ///< 16 MiB request cap
inline constexpr std::chrono::seconds SESSION_IDLE_TIMEOUT{60};   ///< Keep-alive idle close
inline constexpr std::chrono::seconds TLS_HANDSHAKE_TIMEOUT{10};  ///< Inbound TLS handshake
inline constexpr const char* USER_AGENT       = "meshnode";

// =====================
// Envelope messages
// =====================
inline constexpr const char* MSG_TERMINAL_SUCCESS = "Request processed successfully";
inline constexpr const char* MSG_FAULT_PREFIX     = "Fault injected: ";
inline constexpr const char* HEALTH_STATUS        = "healthy";
inline constexpr const char* HEALTH_PATH          = "/health";

} // namespace meshnode::config::constants
