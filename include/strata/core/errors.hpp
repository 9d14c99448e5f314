#pragma once
/**
 * @file errors.hpp
 * @brief Error codes and result type shared by decoders and the packet engine.
 *
 * Decoders report failure through DecodeResult rather than exceptions. The
 * engine still contains exceptions a decoder lets escape and converts them
 * into DecodeErrc::DecoderFault (see packet.hpp).
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "strata/compat/expected.hpp"  // strata_detail::expected / unexpected

namespace strata::core {

/**
 * @brief Reason a decode step failed.
 */
enum class DecodeErrc : std::uint8_t {
  InvalidDecoder = 1,  ///< request_next() was handed a null decoder
  NoLayerYet,          ///< request_next() called before any layer was appended
  Truncated,           ///< Input shorter than the protocol requires
  Malformed,           ///< Field values are inconsistent or out of range
  Unsupported,         ///< Valid but not understood by this decoder
  DecoderFault,        ///< Decoder raised an exception instead of returning
  Other                ///< Anything a decoder cannot classify further
};

/// @brief Stable name for logs ("Truncated", "DecoderFault", ...).
std::string_view to_string(DecodeErrc code) noexcept;

/**
 * @brief Error value carried by a failed DecodeResult.
 */
struct DecodeError {
  DecodeErrc  code{DecodeErrc::Other};  ///< Classification
  std::string message;                  ///< Human-readable cause

  DecodeError() = default;
  DecodeError(DecodeErrc c, std::string msg) : code(c), message(std::move(msg)) {}

  /// @brief Message text, or the code name when no message was given.
  [[nodiscard]] std::string what() const;

  friend bool operator==(const DecodeError&, const DecodeError&) = default;
};

/// @brief Outcome of Decoder::decode() and PacketBuilder::request_next().
using DecodeResult = strata_detail::expected<void, DecodeError>;

/// @brief Shorthand for returning a failure from a decoder.
inline strata_detail::unexpected<DecodeError> decode_error(DecodeErrc code, std::string message) {
  return strata_detail::unexpected<DecodeError>(DecodeError{code, std::move(message)});
}

} // namespace strata::core
