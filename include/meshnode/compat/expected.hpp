/**
 * @file expected.hpp
 * @brief Single spelling of expected/unexpected for the whole node.
 *
 * Parser results, config loading and outbound calls all return
 * meshnode_detail::expected<T, E> so call-sites never name an implementation.
 *
 * - libstdc++ 12 / C++23: std::expected from <expected>.
 * - Older toolchains: tl::expected (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace meshnode_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace meshnode_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
