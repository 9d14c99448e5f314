#include "strata/core/errors.hpp"

namespace strata::core {

std::string_view to_string(DecodeErrc code) noexcept {
  switch (code) {
    case DecodeErrc::InvalidDecoder: return "InvalidDecoder";
    case DecodeErrc::NoLayerYet:     return "NoLayerYet";
    case DecodeErrc::Truncated:      return "Truncated";
    case DecodeErrc::Malformed:      return "Malformed";
    case DecodeErrc::Unsupported:    return "Unsupported";
    case DecodeErrc::DecoderFault:   return "DecoderFault";
    case DecodeErrc::Other:          return "Other";
  }
  return "Unknown";
}

std::string DecodeError::what() const {
  if (message.empty()) return std::string(to_string(code));
  return message;
}

} // namespace strata::core
