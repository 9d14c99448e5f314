#pragma once

#include <chrono>

namespace strata::core {

/** @struct CaptureInfo
 *  @brief How a packet was captured. Filled in by the packet source, never by
 *         the decode engine.
 */
struct CaptureInfo {
  bool populated{false};                            ///< Other fields are meaningless unless true
  std::chrono::system_clock::time_point timestamp{}; ///< Capture time
  int capture_length{0};                            ///< Bytes actually captured
  int original_length{0};                           ///< Length on the wire before truncation

  friend bool operator==(const CaptureInfo&, const CaptureInfo&) = default;
};

} // namespace strata::core
