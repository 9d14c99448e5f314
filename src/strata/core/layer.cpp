#include "strata/core/layer.hpp"

#include <algorithm>
#include <sstream>

namespace strata::core {

std::string_view to_string(Role role) noexcept {
  switch (role) {
    case Role::Link:        return "Link";
    case Role::Network:     return "Network";
    case Role::Transport:   return "Transport";
    case Role::Application: return "Application";
    case Role::Error:       return "Error";
  }
  return "Unknown";
}

bool LayerClassSet::contains(LayerType t) const noexcept {
  return std::find(types_.begin(), types_.end(), t) != types_.end();
}

std::string Layer::to_string() const {
  std::ostringstream os;
  os << layer_type().name << " {contents=" << contents().size()
     << " bytes, payload=" << payload().size() << " bytes}";
  return os.str();
}

std::string DecodeFailure::to_string() const {
  std::ostringstream os;
  os << "DecodeFailure {" << core::to_string(err_.code) << ": " << err_.what()
     << ", undecoded=" << data_.size() << " bytes}";
  return os.str();
}

} // namespace strata::core
