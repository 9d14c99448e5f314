#pragma once
/**
 * @file packet_source.hpp
 * @brief Turns a PacketDataSource plus a first-layer Decoder into decoded packets.
 *
 * Two ways to read:
 *
 *  - Pull, next_packet(): one source read per call, every source error
 *    returned as-is (including end-of-stream). Fastest and the only API that
 *    exposes errors.
 *    @code
 *    for (;;) {
 *      auto pkt = src.next_packet();
 *      if (!pkt) {
 *        if (pkt.error().end_of_stream()) break;
 *        continue;  // or log pkt.error()
 *      }
 *      handle(*pkt);
 *    }
 *    @endcode
 *
 *  - Push, packets(): a background thread reads and hands packets over a
 *    rendezvous channel. End-of-stream closes the stream; other source errors
 *    are logged and skipped.
 *    @code
 *    auto stream = src.packets();
 *    while (auto pkt = stream.receive()) handle(*pkt);
 *    @endcode
 *
 * The PacketSource, its data source and its decoder must outlive every
 * PacketStream it returns.
 */

#include <optional>
#include <memory>
#include <thread>

#include "strata/compat/expected.hpp"
#include "strata/core/decode_options.hpp"
#include "strata/core/decoder.hpp"
#include "strata/core/packet.hpp"
#include "strata/obs/observability.hpp"
#include "strata/source/packet_data_source.hpp"
#include "strata/source/rendezvous_channel.hpp"

namespace strata::source {

using PacketResult = strata_detail::expected<core::Packet, SourceError>;

/**
 * @brief Consuming end of PacketSource::packets().
 *
 * Owns the producer thread. Destroying the stream (or calling cancel())
 * stops the producer even if it is blocked handing over a packet; a producer
 * blocked inside the data source's own read exits once that read returns.
 */
class PacketStream final {
public:
  using Channel = RendezvousChannel<core::Packet>;

  PacketStream(std::shared_ptr<Channel> chan, std::jthread worker) noexcept
    : chan_(std::move(chan)), worker_(std::move(worker)) {}

  PacketStream(const PacketStream&)            = delete;
  PacketStream& operator=(const PacketStream&) = delete;
  PacketStream(PacketStream&&) noexcept            = default;
  PacketStream& operator=(PacketStream&&) noexcept = default;

  ~PacketStream() { cancel(); }

  /// @brief Next packet; nullopt once the source reached end-of-stream or the
  ///        stream was cancelled.
  std::optional<core::Packet> receive();

  /// @brief Stop the producer and stop receiving. Idempotent.
  void cancel() noexcept;

private:
  std::shared_ptr<Channel> chan_;
  std::jthread             worker_;  ///< Joined on destruction
};

/**
 * @brief Decoding adapter over a PacketDataSource.
 */
class PacketSource final {
public:
  /**
   * @param source   Raw packet supplier.
   * @param decoder  Decoder for the first layer of every packet.
   * @param options  Decode options for each packet.
   * @param observer Optional event sink (not owned).
   */
  PacketSource(PacketDataSource& source,
               const core::Decoder& decoder,
               core::DecodeOptions options = {},
               obs::Observer* observer = nullptr) noexcept;

  PacketSource(const PacketSource&)            = delete;
  PacketSource& operator=(const PacketSource&) = delete;

  /// @brief Options used for packets built from now on. A running stream keeps
  ///        the options it was started with.
  const core::DecodeOptions& options() const noexcept { return options_; }
  void set_options(core::DecodeOptions options) noexcept { options_ = options; }

  /**
   * @brief Read and decode one packet.
   * @return The packet, with CaptureInfo taken from the source, or the
   *         source's error unchanged.
   */
  PacketResult next_packet();

  /**
   * @brief Start a background producer and return its stream immediately.
   */
  PacketStream packets();

private:
  PacketResult read_one(const core::DecodeOptions& options);
  void produce(std::stop_token st, PacketStream::Channel& chan, core::DecodeOptions options);

  PacketDataSource&    source_;
  const core::Decoder& decoder_;
  core::DecodeOptions  options_;
  obs::Observer*       observer_;
};

} // namespace strata::source
