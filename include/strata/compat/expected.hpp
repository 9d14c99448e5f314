/**
 * @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected.
 *
 * The rest of strata spells results as strata_detail::expected so it does
 * not depend on which implementation the toolchain ships.
 *
 * - Standard library with <expected>: uses std::expected.
 * - Otherwise: falls back to <tl/expected.hpp>, the header-only backport by
 *   TartanLlama (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace strata_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace strata_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
