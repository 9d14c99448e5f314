#pragma once
/**
 * @file layer.hpp
 * @brief Layer data model: layer types, layer classes, roles and the layer
 *        interfaces decoders produce.
 *
 * A Layer never owns bytes. contents() and payload() are views into the
 * buffer of the Packet that holds the layer, so they share its lifetime.
 */

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "strata/core/errors.hpp"

namespace strata::core {

/// @brief Read-only byte view used throughout the engine.
using Bytes = std::span<const std::uint8_t>;

/**
 * @brief Identifies the protocol a Layer represents.
 *
 * Compared by id only; the name is for printing. Decoder authors define
 * their own constants, e.g. `inline constexpr LayerType kEthernet{1, "Ethernet"};`.
 * Id 0 (kReservedLayerTypeId) belongs to the engine: a default-constructed
 * LayerType compares equal to LayerTypes::DecodeFailure, so user types must
 * start at 1.
 */
struct LayerType {
  std::uint32_t    id{0};
  std::string_view name{};

  constexpr bool operator==(const LayerType& o) const noexcept { return id == o.id; }
};

/// Id reserved for layer types the engine itself appends.
inline constexpr std::uint32_t kReservedLayerTypeId = 0;

/// @brief Layer types reserved by the engine itself.
struct LayerTypes {
  static constexpr LayerType DecodeFailure{kReservedLayerTypeId, "DecodeFailure"};
};

/**
 * @brief Role a layer may occupy inside a packet.
 * At most one layer per role, first claim wins.
 */
enum class Role : std::uint8_t {
  Link = 0,
  Network,
  Transport,
  Application,
  Error
};

/// Number of Role enumerators.
inline constexpr std::size_t kRoleCount = 5;

/// @brief Stable name for logs ("Link", "Network", ...).
std::string_view to_string(Role role) noexcept;

/**
 * @brief A set of layer types that can be queried as one, e.g. "any IP version".
 */
class LayerClass {
public:
  virtual ~LayerClass() = default;
  /// @brief True if @p t belongs to this class.
  virtual bool contains(LayerType t) const noexcept = 0;
};

/**
 * @brief LayerClass backed by a small list of types (linear scan).
 */
class LayerClassSet final : public LayerClass {
public:
  LayerClassSet(std::initializer_list<LayerType> types) : types_(types) {}
  explicit LayerClassSet(std::vector<LayerType> types) : types_(std::move(types)) {}

  bool contains(LayerType t) const noexcept override;

  /// @brief Member types in construction order.
  const std::vector<LayerType>& types() const noexcept { return types_; }

private:
  std::vector<LayerType> types_;
};

/**
 * @brief One decoded unit of a protocol stack.
 */
class Layer {
public:
  virtual ~Layer() = default;

  /// @brief Kind of this layer.
  virtual LayerType layer_type() const noexcept = 0;
  /// @brief Bytes that make up this layer (header and trailer).
  virtual Bytes contents() const noexcept = 0;
  /// @brief Bytes left for the next decode step.
  virtual Bytes payload() const noexcept = 0;
  /// @brief Human-readable summary; default prints type and sizes.
  virtual std::string to_string() const;
};

/**
 * @brief Convenience Layer storing its contents/payload split.
 *
 * Most decoders derive from this and add their parsed header fields.
 */
class BaseLayer : public Layer {
public:
  BaseLayer(LayerType type, Bytes contents, Bytes payload) noexcept
    : type_(type), contents_(contents), payload_(payload) {}

  /// @brief Split @p data at @p header_len: header becomes contents, rest payload.
  /// @throws std::out_of_range if header_len > data.size(). Inside a decoder
  ///         the engine turns this into a DecoderFault failure layer.
  static BaseLayer split(LayerType type, Bytes data, std::size_t header_len) {
    if (header_len > data.size()) {
      throw std::out_of_range("header length " + std::to_string(header_len) +
                              " exceeds " + std::to_string(data.size()) + " available byte(s)");
    }
    return BaseLayer(type, data.first(header_len), data.subspan(header_len));
  }

  LayerType layer_type() const noexcept override { return type_; }
  Bytes contents() const noexcept override { return contents_; }
  Bytes payload() const noexcept override { return payload_; }

private:
  LayerType type_;
  Bytes     contents_;
  Bytes     payload_;
};

/**
 * @brief A layer describing why decoding stopped.
 */
class ErrorLayer : public Layer {
public:
  /// @brief The cause that stopped decoding.
  virtual const DecodeError& error() const noexcept = 0;
};

/**
 * @brief Terminal layer appended by the engine when a decode step fails.
 *
 * contents() holds the bytes that were handed to the failing decoder;
 * payload() is always empty.
 */
class DecodeFailure final : public ErrorLayer {
public:
  DecodeFailure(DecodeError err, Bytes remainder)
    : err_(std::move(err)), data_(remainder) {}

  LayerType layer_type() const noexcept override { return LayerTypes::DecodeFailure; }
  Bytes contents() const noexcept override { return data_; }
  Bytes payload() const noexcept override { return {}; }
  const DecodeError& error() const noexcept override { return err_; }
  std::string to_string() const override;

private:
  DecodeError err_;
  Bytes       data_;
};

} // namespace strata::core
