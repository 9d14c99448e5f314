#pragma once
/**
 * @file decoder.hpp
 * @brief Decoder capability and the PacketBuilder surface it writes into.
 *
 * Contract for Decoder::decode(data, builder):
 *  - On success, append zero or more layers (usually exactly one), optionally
 *    claim roles for them and optionally request the next decoder, which runs
 *    against the payload of the last appended layer.
 *  - On failure, return decode_error(...). Throwing is tolerated: the engine
 *    converts any escaping exception into DecodeErrc::DecoderFault.
 *  - Never keep the builder reference after returning.
 *
 * Decoders are shared between packets and threads, so they must be stateless
 * or synchronize internally.
 */

#include <functional>
#include <memory>
#include <utility>

#include "strata/core/errors.hpp"
#include "strata/core/layer.hpp"

namespace strata::core {

class Decoder;

/**
 * @brief Mutation surface handed to a Decoder for the duration of one call.
 */
class PacketBuilder {
public:
  virtual ~PacketBuilder() = default;

  /**
   * @brief Append a decoded layer; it becomes the packet's last layer.
   * @return Reference to the stored layer (owned by the packet), suitable for
   *         claim_role().
   * @throws std::invalid_argument if @p layer is null.
   */
  virtual const Layer& append_layer(std::unique_ptr<Layer> layer) = 0;

  /**
   * @brief Register @p layer as the occupant of @p role.
   * First claim per role wins; later claims are ignored. For Role::Error the
   * layer must be an ErrorLayer, other layers are ignored for that role.
   */
  virtual void claim_role(Role role, const Layer& layer) = 0;

  /**
   * @brief Queue @p next to run against the last appended layer's payload.
   * @return DecodeErrc::InvalidDecoder if @p next is null,
   *         DecodeErrc::NoLayerYet if no layer was appended yet. In eager
   *         mode the next decoder runs before this returns and its failure,
   *         if any, is returned here as well.
   */
  virtual DecodeResult request_next(const Decoder* next) = 0;
};

/**
 * @brief Parses one protocol out of a byte buffer.
 */
class Decoder {
public:
  virtual ~Decoder() = default;
  virtual DecodeResult decode(Bytes data, PacketBuilder& builder) const = 0;
};

/**
 * @brief Adapts a callable into a Decoder.
 *
 * @code
 * static const strata::core::DecodeFunc kPayload{
 *   [](strata::core::Bytes d, strata::core::PacketBuilder& b) -> strata::core::DecodeResult {
 *     auto& l = b.append_layer(std::make_unique<strata::core::BaseLayer>(kPayloadType, d, strata::core::Bytes{}));
 *     b.claim_role(strata::core::Role::Application, l);
 *     return {};
 *   }};
 * @endcode
 */
class DecodeFunc final : public Decoder {
public:
  using Fn = std::function<DecodeResult(Bytes, PacketBuilder&)>;

  explicit DecodeFunc(Fn fn) : fn_(std::move(fn)) {}

  DecodeResult decode(Bytes data, PacketBuilder& builder) const override;

private:
  Fn fn_;
};

} // namespace strata::core
