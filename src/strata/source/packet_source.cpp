/**
 * @file packet_source.cpp
 * @brief Pull and push reading over a PacketDataSource.
 */
#include "strata/source/packet_source.hpp"

#include <cstdint>
#include <utility>

#include "strata/obs/log.hpp"

namespace strata::source {

std::string_view to_string(SourceErrc code) noexcept {
  switch (code) {
    case SourceErrc::EndOfStream: return "EndOfStream";
    case SourceErrc::Io:          return "Io";
    case SourceErrc::Timeout:     return "Timeout";
    case SourceErrc::Other:       return "Other";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// PacketStream
// -----------------------------------------------------------------------------

std::optional<core::Packet> PacketStream::receive() {
  if (!chan_) return std::nullopt;
  return chan_->receive();
}

void PacketStream::cancel() noexcept {
  if (chan_) chan_->cancel();
  if (worker_.joinable()) worker_.request_stop();
}

// -----------------------------------------------------------------------------
// PacketSource
// -----------------------------------------------------------------------------

PacketSource::PacketSource(PacketDataSource& source,
                           const core::Decoder& decoder,
                           core::DecodeOptions options,
                           obs::Observer* observer) noexcept
  : source_(source), decoder_(decoder), options_(options), observer_(observer) {}

PacketResult PacketSource::next_packet() {
  return read_one(options_);
}

PacketResult PacketSource::read_one(const core::DecodeOptions& options) {
  auto raw = source_.read_packet_data();
  if (!raw) {
    if (observer_) {
      if (raw.error().end_of_stream()) observer_->on_end_of_stream();
      else                              observer_->on_source_error(raw.error());
    }
    return strata_detail::unexpected<SourceError>(std::move(raw.error()));
  }

  core::Packet pkt = core::new_packet(raw->data, decoder_, options);
  pkt.capture_info() = raw->info;
  if (observer_) observer_->on_packet(pkt);
  return pkt;
}

PacketStream PacketSource::packets() {
  auto chan = std::make_shared<PacketStream::Channel>();
  const core::DecodeOptions options = options_;
  std::jthread worker([this, chan, options](std::stop_token st) {
    produce(st, *chan, options);
  });
  return PacketStream(std::move(chan), std::move(worker));
}

void PacketSource::produce(std::stop_token st, PacketStream::Channel& chan, core::DecodeOptions options) {
  auto log = obs::logger();
  std::uint64_t delivered = 0;

  while (!st.stop_requested()) {
    auto pkt = read_one(options);
    if (!pkt) {
      if (pkt.error().end_of_stream()) {
        log->debug("packet stream: end of stream after {} packet(s)", delivered);
        chan.close();
        return;
      }
      // No error channel in the push API: note it and keep reading.
      log->debug("packet stream: skipping source error {}: {}",
                 to_string(pkt.error().code), pkt.error().message);
      continue;
    }

    if (chan.send(std::move(*pkt), st) != PacketStream::Channel::SendStatus::Delivered) {
      log->debug("packet stream: consumer went away after {} packet(s)", delivered);
      return;
    }
    ++delivered;
  }
  log->debug("packet stream: stop requested after {} packet(s)", delivered);
}

} // namespace strata::source
