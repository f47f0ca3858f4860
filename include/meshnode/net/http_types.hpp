#pragma once
/**
 * @file http_types.hpp
 * @brief Message and clock vocabulary shared by the server, the client and the engine.
 * @details The engine speaks Boost.Beast messages directly so that relayed upstream
 *          responses keep their status, headers and body without re-modelling.
 */

#include <chrono>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

namespace meshnode::net {

    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    using Clock    = std::chrono::steady_clock;
    /// Absolute point after which no outbound work may continue.
    using Deadline = Clock::time_point;

    /// HTTP/1.1 as encoded by Beast.
    inline constexpr unsigned kHttp11 = 11;

    /**
     * @brief Plain-text response in the shape net/http's Error() produces.
     * @details Sets text/plain, nosniff and a newline-terminated body.
     */
    Response make_text_response(unsigned status, std::string_view text,
                                unsigned version = kHttp11);

    /// JSON response with @p body as-is.
    Response make_json_response(unsigned status, std::string body,
                                unsigned version = kHttp11);

    /// Path component of a request target ("/a/b?x=1" -> "/a/b").
    std::string_view target_path(std::string_view target) noexcept;

    /// Query component of a request target without '?', empty if none.
    std::string_view target_query(std::string_view target) noexcept;

    /**
     * @brief Percent-decode a URL path.
     * @return Decoded path; malformed escapes are kept verbatim.
     */
    std::string percent_decode(std::string_view path);

    /// Milliseconds left until @p deadline (negative when already past).
    std::chrono::milliseconds remaining(Deadline deadline) noexcept;

} // namespace meshnode::net
