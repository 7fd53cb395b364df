#include "bridgeway/sync-request.hpp"

#include <algorithm>
#include <istream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace bridgeway {

SyncRequest& SyncRequest::set(std::string_view name, std::string_view value) {
  const auto it = std::ranges::find_if(_variables, [name](const Variable& var) { return var.name == name; });
  if (it == _variables.end()) {
    _variables.push_back(Variable{std::string(name), std::string(value)});
  } else {
    it->value.assign(value);
  }
  return *this;
}

std::optional<std::string_view> SyncRequest::get(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_variables, [name](const Variable& var) { return var.name == name; });
  if (it == _variables.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

SyncRequest& SyncRequest::withUrlScheme(std::string_view scheme) {
  _urlScheme.assign(scheme);
  return *this;
}

SyncRequest& SyncRequest::withBodyStream(std::istream& input) {
  _ownedInput.reset();
  _input = &input;
  return *this;
}

SyncRequest& SyncRequest::withBody(std::string_view body) {
  _ownedInput = std::make_unique<std::istringstream>(std::string(body));
  _input = _ownedInput.get();
  return *this;
}

}  // namespace bridgeway
