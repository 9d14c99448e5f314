#include "strata/core/decoder.hpp"

namespace strata::core {

DecodeResult DecodeFunc::decode(Bytes data, PacketBuilder& builder) const {
  if (!fn_) {
    return decode_error(DecodeErrc::InvalidDecoder, "DecodeFunc has no target");
  }
  return fn_(data, builder);
}

} // namespace strata::core
