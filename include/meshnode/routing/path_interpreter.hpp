#pragma once
/**
 * @file path_interpreter.hpp
 * @brief Path interpreter: URL path -> one Directive + remaining path.
 * @details Segments are consumed left to right, one directive per call. The
 *          executor re-invokes the interpreter on Directive::remaining_path, so
 *          a chain is a lazy, restartable sequence rather than a pre-built list.
 *          No state is kept between calls.
 */

#include <string_view>

#include "meshnode/compat/expected.hpp"
#include "meshnode/routing/directive.hpp"

namespace meshnode::routing {

/// Result type of a single parse step.
using ParseResult = meshnode_detail::expected<Directive, ParseError>;

/**
 * @brief Parse the head of @p path into a directive.
 *
 * Grammar (priority order):
 *  - "" or "/"                                  -> Terminal, remaining "/"
 *  - /fault/<code>[/<percentage>][/rest...]     -> Fault
 *  - /proxy/[http(s)://]host[:port][/rest...]   -> Forward
 *  - anything else                              -> ParseError::UnrecognizedPrefix
 *
 * A percentage segment that is not an integer is not an error: the percentage
 * defaults to 100 and the segment becomes the head of the remaining path. An
 * integer outside [0,100] is rejected.
 *
 * @param path Decoded URL path (query string already stripped).
 * @return Directive on success, ParseError otherwise.
 */
[[nodiscard]] ParseResult parse_directive(std::string_view path);

} // namespace meshnode::routing
