#include "bridgeway/scope.hpp"

#include <algorithm>
#include <string_view>

#include "bridgeway/http-header.hpp"

namespace bridgeway {

const http::Header* Scope::findHeader(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(headers, [name](const http::Header& header) { return header.name == name; });
  return it == headers.end() ? nullptr : &*it;
}

}  // namespace bridgeway
