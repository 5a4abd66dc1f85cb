/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * The rest of the codebase spells `vpnlist_detail::expected` so resolver,
 * archive and reconciler results do not depend on a specific implementation.
 *
 * - In C++23 and later: uses <expected> from the standard library.
 * - Otherwise: falls back to <tl/expected.hpp>, the header-only backport by
 *   TartanLlama (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace vpnlist_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace vpnlist_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
