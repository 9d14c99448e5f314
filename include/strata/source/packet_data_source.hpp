#pragma once
/**
 * @file packet_data_source.hpp
 * @brief Capability of anything that supplies raw packet bytes (pcap file,
 *        live capture, replay buffer, ...).
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "strata/compat/expected.hpp"
#include "strata/core/capture_info.hpp"
#include "strata/core/layer.hpp"

namespace strata::source {

/// @brief Error classes a source may report. Only EndOfStream has meaning to
///        the core; the rest are passed through or discarded.
enum class SourceErrc : std::uint8_t {
  EndOfStream = 1,  ///< Clean end of input
  Io,               ///< Read failure
  Timeout,          ///< No packet within the source's read timeout
  Other
};

/// @brief Stable name for logs.
std::string_view to_string(SourceErrc code) noexcept;

struct SourceError {
  SourceErrc  code{SourceErrc::Other};
  std::string message;

  SourceError() = default;
  SourceError(SourceErrc c, std::string msg) : code(c), message(std::move(msg)) {}

  [[nodiscard]] bool end_of_stream() const noexcept { return code == SourceErrc::EndOfStream; }

  friend bool operator==(const SourceError&, const SourceError&) = default;
};

/** @struct PacketData
 *  @brief One raw packet as read from a source.
 *
 *  @var data Valid at least until the next read_packet_data() call on the same
 *            source. Sources whose buffers live longer may say so; only those
 *            are safe to combine with no-copy decoding across reads.
 */
struct PacketData {
  core::Bytes       data{};
  core::CaptureInfo info{};
};

using ReadResult = strata_detail::expected<PacketData, SourceError>;

/**
 * @brief Pull-based supplier of raw packets.
 */
class PacketDataSource {
public:
  virtual ~PacketDataSource() = default;

  /// @brief Next packet, SourceErrc::EndOfStream when exhausted, or another error.
  virtual ReadResult read_packet_data() = 0;
};

} // namespace strata::source
