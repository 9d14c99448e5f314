#pragma once
/**
 * @file decode_options.hpp
 * @brief Per-packet decode strategy and buffer ownership.
 */

#include "strata/config/constants.hpp"

namespace strata::core {

/** @struct DecodeOptions
 *  @brief Chosen at packet construction, fixed afterwards.
 *
 *  - lazy: decode only what each accessor needs. Accessors then mutate the
 *    packet, so one lazy packet must not be used from several threads at once.
 *  - no_copy: borrow the caller's buffer instead of copying it. The caller
 *    must keep those bytes alive and unchanged while the packet is in use.
 *
 *  The default (eager, copying) is the safest and slowest combination.
 */
struct DecodeOptions {
  bool lazy{strata::config::constants::DECODE_LAZY_DEFAULT};
  bool no_copy{strata::config::constants::DECODE_NO_COPY_DEFAULT};

  static constexpr DecodeOptions defaults() noexcept { return {}; }
  static constexpr DecodeOptions lazy_decoding() noexcept { return {.lazy = true, .no_copy = false}; }
  static constexpr DecodeOptions zero_copy() noexcept { return {.lazy = false, .no_copy = true}; }

  friend constexpr bool operator==(const DecodeOptions&, const DecodeOptions&) = default;
};

} // namespace strata::core
