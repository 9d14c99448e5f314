/**
 * @file packet.cpp
 * @brief Eager/lazy decode state machine and failure containment.
 *
 * State per packet:
 *  - layers_ only grows; roles_ entries are written at most once.
 *  - pending_ is only ever set for lazy packets.
 *  - failed_ flips once, when the terminal DecodeFailure is appended. After
 *    that, appends/claims/requests from decoders still on the stack are
 *    dropped so the failure stays last.
 */
#include "strata/core/packet.hpp"

#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "strata/obs/log.hpp"

namespace strata::core {

// -----------------------------------------------------------------------------
// Builder: the PacketBuilder handed to a decoder for one decode() call.
// -----------------------------------------------------------------------------
class Packet::Builder final : public PacketBuilder {
public:
  explicit Builder(Packet& p) noexcept : p_(p) {}

  const Layer& append_layer(std::unique_ptr<Layer> layer) override { return p_.append(std::move(layer)); }
  void claim_role(Role role, const Layer& layer) override { p_.claim(role, layer); }
  DecodeResult request_next(const Decoder* next) override { return p_.request_next(next); }

private:
  Packet& p_;
};

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------

Packet new_packet(Bytes data, const Decoder& first, DecodeOptions options) {
  std::vector<std::uint8_t> owned;
  if (!options.no_copy) {
    owned.assign(data.begin(), data.end());
    data = Bytes{owned.data(), owned.size()};
  }

  if (options.lazy) {
    Packet p(data, std::move(owned), Packet::Strategy::Lazy);
    p.pending_ = &first;
    return p;
  }

  Packet p(data, std::move(owned), Packet::Strategy::Eager);
  // Empty input is already terminal; lazy packets skip it the same way.
  if (!p.data_.empty()) {
    (void)p.invoke(first, p.data_);
  }
  return p;
}

Packet::Packet(Bytes data, std::vector<std::uint8_t> owned, Strategy strategy)
  : owned_(std::move(owned)),
    data_(data),
    strategy_(strategy)
{
  // Moving the vector keeps its heap block, so a view into it stays valid.
  // Typical chains are link/network/transport/application plus one spare.
  layers_.reserve(6);
  storage_.reserve(6);
}

// -----------------------------------------------------------------------------
// Builder surface
// -----------------------------------------------------------------------------

const Layer& Packet::append(std::unique_ptr<Layer> layer) {
  if (!layer) throw std::invalid_argument("append_layer called with a null layer");
  storage_.push_back(std::move(layer));
  const Layer& stored = *storage_.back();
  if (!failed_) layers_.push_back(&stored);
  return stored;
}

void Packet::claim(Role role, const Layer& layer) {
  if (failed_) return;
  auto& slot = roles_[index(role)];
  if (slot != nullptr) return;  // first claim wins
  if (role == Role::Error && dynamic_cast<const ErrorLayer*>(&layer) == nullptr) return;
  slot = &layer;
}

DecodeResult Packet::request_next(const Decoder* next) {
  if (next == nullptr) {
    return decode_error(DecodeErrc::InvalidDecoder,
                        "request_next passed a null decoder, probably an unsupported decode type");
  }
  if (layers_.empty()) {
    return decode_error(DecodeErrc::NoLayerYet, "request_next called, but no layers added yet");
  }
  if (failed_) {
    return strata_detail::unexpected<DecodeError>(error_layer()->error());
  }

  if (strategy_ == Strategy::Lazy) {
    pending_ = next;
    return {};
  }

  // Eager: run it right now, on this stack.
  const Bytes input = next_input();
  if (input.empty()) return {};
  return invoke(*next, input);
}

// -----------------------------------------------------------------------------
// Decode steps
// -----------------------------------------------------------------------------

Bytes Packet::next_input() const noexcept {
  if (layers_.empty()) return data_;
  return layers_.back()->payload();
}

DecodeResult Packet::invoke(const Decoder& dec, Bytes input) {
  DecodeResult res;
  try {
    Builder b{*this};
    res = dec.decode(input, b);
  } catch (const std::exception& e) {
    res = decode_error(DecodeErrc::DecoderFault, e.what());
  } catch (...) {
    res = decode_error(DecodeErrc::DecoderFault, "decoder threw a non-standard exception");
  }

  // A nested eager failure is recorded by the innermost invoke; enclosing
  // decoders usually hand the same error back up, which is not recorded twice.
  if (!res && !failed_) {
    record_failure(res.error());
  }
  return res;
}

void Packet::record_failure(DecodeError err) {
  const Bytes remainder = next_input();
  obs::logger()->debug("decode stopped after {} layer(s): {} ({}), {} byte(s) undecoded",
                       layers_.size(), core::to_string(err.code), err.what(), remainder.size());

  storage_.push_back(std::make_unique<DecodeFailure>(std::move(err), remainder));
  const Layer& failure = *storage_.back();
  layers_.push_back(&failure);

  auto& slot = roles_[index(Role::Error)];
  if (slot == nullptr) slot = &failure;

  pending_ = nullptr;
  failed_  = true;
}

void Packet::step() {
  if (pending_ == nullptr) return;
  const Decoder* next = pending_;
  pending_ = nullptr;

  const Bytes input = next_input();
  // Nothing left to hand over: this was the final step.
  if (input.empty()) return;
  (void)invoke(*next, input);
}

const Layer* Packet::advance_for(Role r) {
  while (roles_[index(r)] == nullptr && pending_ != nullptr) step();
  return roles_[index(r)];
}

void Packet::decode_all() {
  while (pending_ != nullptr) step();
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------

template <class Pred>
const Layer* Packet::find_from(std::size_t first, Pred pred) const {
  for (std::size_t i = first; i < layers_.size(); ++i) {
    if (pred(*layers_[i])) return layers_[i];
  }
  return nullptr;
}

template <class Pred>
const Layer* Packet::find_advancing(Pred pred) {
  if (const Layer* hit = find_from(0, pred)) return hit;
  // Only scan what each step appended.
  std::size_t scanned = layers_.size();
  while (pending_ != nullptr) {
    step();
    if (const Layer* hit = find_from(scanned, pred)) return hit;
    scanned = layers_.size();
  }
  return nullptr;
}

Packet::LayerView Packet::layers() {
  decode_all();
  return {layers_.data(), layers_.size()};
}

const Layer* Packet::layer(LayerType t) {
  return find_advancing([t](const Layer& l) { return l.layer_type() == t; });
}

const Layer* Packet::layer(LayerType t) const noexcept {
  return find_from(0, [t](const Layer& l) { return l.layer_type() == t; });
}

const Layer* Packet::layer_class(const LayerClass& cls) {
  return find_advancing([&cls](const Layer& l) { return cls.contains(l.layer_type()); });
}

const Layer* Packet::layer_class(const LayerClass& cls) const noexcept {
  return find_from(0, [&cls](const Layer& l) { return cls.contains(l.layer_type()); });
}

const ErrorLayer* Packet::error_layer() {
  return static_cast<const ErrorLayer*>(advance_for(Role::Error));
}

const ErrorLayer* Packet::error_layer() const noexcept {
  return static_cast<const ErrorLayer*>(roles_[index(Role::Error)]);
}

std::string Packet::to_string() {
  decode_all();
  return std::as_const(*this).to_string();
}

std::string Packet::to_string() const {
  std::ostringstream os;
  for (std::size_t i = 0; i < layers_.size(); ++i) {
    os << "--- Layer " << (i + 1) << ": " << layers_[i]->layer_type().name << " ---\n"
       << layers_[i]->to_string() << "\n";
  }
  return os.str();
}

} // namespace strata::core
