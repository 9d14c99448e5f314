#pragma once
/**
 * @file packet.hpp
 * @brief Packet: raw bytes plus the ordered layers decoded from them.
 *
 * Two strategies share one type:
 *  - Eager: the whole decoder chain runs inside new_packet(). Afterwards the
 *    packet never changes and may be read from many threads through
 *    `const Packet&`.
 *  - Lazy: the first decoder is only queued. Each non-const accessor decodes
 *    just far enough to answer, so a lazy packet is mutable for its whole life
 *    and must not be used from several threads at once.
 *
 * Accessor pairs:
 *  - non-const overloads may run pending decode steps (lazy only);
 *  - const overloads never decode and report what is decoded so far, which
 *    for an eager packet is everything.
 *
 * Decode failures never escape: a failing step (error result or exception)
 * appends a DecodeFailure as the final layer and error_layer() returns it.
 *
 * Ownership:
 *  - Copying mode (default) owns a private copy of the input.
 *  - No-copy mode borrows the input; the caller keeps it alive and unchanged.
 *  - Layer views (contents/payload) point into that buffer.
 *  - Decoders are not owned. A decoder must outlive any lazy packet that may
 *    still run it.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "strata/core/capture_info.hpp"
#include "strata/core/decode_options.hpp"
#include "strata/core/decoder.hpp"
#include "strata/core/errors.hpp"
#include "strata/core/layer.hpp"

namespace strata::core {

class Packet;

/**
 * @brief Build a packet from @p data, starting the chain with @p first.
 *
 * Copies @p data unless options.no_copy. Decodes fully before returning unless
 * options.lazy. Never fails: malformed input yields a packet whose
 * error_layer() is set.
 */
Packet new_packet(Bytes data, const Decoder& first, DecodeOptions options = {});

class Packet final {
public:
  /// @brief When decode steps run.
  enum class Strategy : std::uint8_t {
    Eager,  ///< All steps during construction
    Lazy    ///< Steps on demand from accessors
  };

  /// @brief View over the decoded layers, in decode order.
  /// Lazy packets may invalidate a previously returned view when they grow.
  using LayerView = std::span<const Layer* const>;

  Packet(const Packet&)            = delete;
  Packet& operator=(const Packet&) = delete;
  Packet(Packet&&) noexcept            = default;
  Packet& operator=(Packet&&) noexcept = default;
  ~Packet() = default;

  // --------------------------- Pure queries --------------------------------
  /// @brief Raw packet bytes (owned copy or borrowed view).
  Bytes data() const noexcept { return data_; }

  /// @brief Capture metadata, writable by sources and callers.
  CaptureInfo&       capture_info() noexcept { return capture_; }
  const CaptureInfo& capture_info() const noexcept { return capture_; }

  Strategy strategy() const noexcept { return strategy_; }
  bool is_lazy() const noexcept { return strategy_ == Strategy::Lazy; }

  /// @brief True once no decode step is pending.
  bool fully_decoded() const noexcept { return pending_ == nullptr; }

  // --------------------------- Decoding accessors --------------------------
  /// @brief All layers; drains a lazy packet first.
  LayerView layers();
  LayerView layers() const noexcept { return {layers_.data(), layers_.size()}; }

  /// @brief First layer of type @p t, or nullptr.
  const Layer* layer(LayerType t);
  const Layer* layer(LayerType t) const noexcept;

  /// @brief First layer whose type belongs to @p cls, or nullptr.
  const Layer* layer_class(const LayerClass& cls);
  const Layer* layer_class(const LayerClass& cls) const noexcept;

  const Layer* link_layer()        { return advance_for(Role::Link); }
  const Layer* network_layer()     { return advance_for(Role::Network); }
  const Layer* transport_layer()   { return advance_for(Role::Transport); }
  const Layer* application_layer() { return advance_for(Role::Application); }

  const Layer* link_layer() const noexcept        { return roles_[index(Role::Link)]; }
  const Layer* network_layer() const noexcept     { return roles_[index(Role::Network)]; }
  const Layer* transport_layer() const noexcept   { return roles_[index(Role::Transport)]; }
  const Layer* application_layer() const noexcept { return roles_[index(Role::Application)]; }

  /// @brief Non-null iff decoding stopped on a failure (or a decoder claimed the role).
  const ErrorLayer* error_layer();
  const ErrorLayer* error_layer() const noexcept;

  /// @brief Run every pending decode step. No-op for eager packets.
  void decode_all();

  /// @brief One block per layer: "--- Layer N: <type> ---" then the layer text.
  /// The non-const overload drains a lazy packet first.
  std::string to_string();
  std::string to_string() const;

private:
  friend Packet new_packet(Bytes data, const Decoder& first, DecodeOptions options);
  class Builder;

  Packet(Bytes data, std::vector<std::uint8_t> owned, Strategy strategy);

  static constexpr std::size_t index(Role r) noexcept { return static_cast<std::size_t>(r); }

  // Builder surface (see PacketBuilder for the contract).
  const Layer& append(std::unique_ptr<Layer> layer);
  void         claim(Role role, const Layer& layer);
  DecodeResult request_next(const Decoder* next);

  /// Bytes the next decoder would receive: last payload, or all data.
  Bytes next_input() const noexcept;
  /// Run one decoder under failure containment.
  DecodeResult invoke(const Decoder& dec, Bytes input);
  void record_failure(DecodeError err);
  /// Lazy: run the single pending step, if any.
  void step();
  const Layer* advance_for(Role r);

  template <class Pred>
  const Layer* find_from(std::size_t first, Pred pred) const;
  template <class Pred>
  const Layer* find_advancing(Pred pred);

  std::vector<std::uint8_t>            owned_{};     ///< Backing store when copying
  Bytes                                data_{};      ///< Packet bytes (owned_ or borrowed)
  std::vector<std::unique_ptr<Layer>>  storage_{};   ///< Owns every appended layer
  std::vector<const Layer*>            layers_{};    ///< Decode-order sequence
  std::array<const Layer*, kRoleCount> roles_{};     ///< First claimant per role
  CaptureInfo                          capture_{};
  Strategy                             strategy_{Strategy::Eager};
  const Decoder*                       pending_{nullptr}; ///< Lazy: next step to run
  bool                                 failed_{false};    ///< DecodeFailure appended
};

} // namespace strata::core
