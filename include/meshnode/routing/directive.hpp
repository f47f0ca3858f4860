/**
 * @file directive.hpp
 * @brief Directive model produced by the path interpreter, one per parse call.
 *
 * A directive describes what the current node must do with the head of the
 * request path: answer locally (terminal), gate on a fault draw (fault) or
 * hand the rest of the path to another hop (forward). The unconsumed suffix
 * travels along in `remaining_path` and is itself a valid interpreter input.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "meshnode/config/constants.hpp"

namespace meshnode::routing {

/**
 * @brief What the node does with the current segment.
 *
 * @note Exactly one kind holds per directive; the accessors on Directive
 *       derive from it so the three predicates can never disagree.
 */
enum class DirectiveKind : std::uint8_t {
    Terminal = 0, ///< No segments left: answer with a success envelope
    Fault,        ///< /fault/<code>[/<percentage>]
    Forward       ///< /proxy/[scheme://]host[:port]
};

/// Transport used to reach the next hop.
enum class Scheme : std::uint8_t { Http = 0, Https };

/// Malformed-path taxonomy. Every value surfaces as HTTP 400.
enum class ParseError : std::uint8_t {
    InvalidFaultCode = 1, ///< Code missing, non-numeric or outside [400,599]
    InvalidPercentage,    ///< Numeric percentage outside [0,100]
    EmptyServiceName,     ///< /proxy/ with an empty hop segment
    UnsupportedScheme,    ///< scheme:// other than http or https
    UnrecognizedPrefix    ///< Neither /, /fault/ nor /proxy/
};

/**
 * @struct Directive
 * @brief Parsed instruction for the head of a path.
 */
struct Directive final {
    DirectiveKind kind{DirectiveKind::Terminal};

    /// host[:port] of the next hop (Forward only).
    std::string next_hop;

    /// Scheme for the next hop (Forward only).
    Scheme scheme{Scheme::Http};

    /// Unconsumed suffix, always starts with '/'.
    std::string remaining_path{"/"};

    /// Injected status (Fault only).
    int fault_status_code{0};

    /// Probability in percent that the fault fires (Fault only).
    int fault_percentage{config::constants::FAULT_PERCENT_DEFAULT};

    [[nodiscard]] bool is_terminal() const noexcept { return kind == DirectiveKind::Terminal; }
    [[nodiscard]] bool is_fault()    const noexcept { return kind == DirectiveKind::Fault; }
    [[nodiscard]] bool is_forward()  const noexcept { return kind == DirectiveKind::Forward; }

    bool operator==(const Directive&) const = default;
};

/// Stable label for logs ("terminal", "fault", "forward").
const char* to_string(DirectiveKind k) noexcept;

/// "http" or "https".
const char* to_string(Scheme s) noexcept;

/// Human readable description returned to callers in 400 bodies.
const char* to_string(ParseError e) noexcept;

} // namespace meshnode::routing
