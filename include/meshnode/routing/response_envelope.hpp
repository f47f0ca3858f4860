#pragma once
/**
 * @file response_envelope.hpp
 * @brief JSON payload synthesized by a node for terminal and fault responses.
 * @details Wire shape: {"status": <int>, "service": "<name>", "message": "<text>"}
 *          followed by a newline. Relayed upstream bodies never pass through here.
 */

#include <string>
#include <string_view>

#include "meshnode/compat/expected.hpp"

namespace meshnode::routing {

    /** @struct ResponseEnvelope
     *  @brief Locally generated response body. Built fresh per request.
     */
    struct ResponseEnvelope {
        int         status{200};  ///< Mirrors the HTTP status line
        std::string service;      ///< Identity of the node that produced it
        std::string message;      ///< Human readable outcome

        bool operator==(const ResponseEnvelope&) const = default;
    };

    /// Serialize an envelope; fails only if the JSON writer rejects the content.
    [[nodiscard]] meshnode_detail::expected<std::string, std::string>
    encode_envelope(const ResponseEnvelope& env);

    /// Parse an envelope body (used by tests and the probe tool).
    [[nodiscard]] meshnode_detail::expected<ResponseEnvelope, std::string>
    decode_envelope(std::string_view body);

    /// {"status":"healthy","service":"<name>"}
    [[nodiscard]] meshnode_detail::expected<std::string, std::string>
    encode_health(std::string_view service);

    /// Standard reason phrase, "Unknown Error" for unregistered codes.
    std::string reason_phrase(int status);

    /// "Fault injected: 503 Service Unavailable"
    std::string fault_message(int status);

} // namespace meshnode::routing
