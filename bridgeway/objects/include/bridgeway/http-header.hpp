#pragma once

#include <string>
#include <string_view>

#include "bridgeway/vector.hpp"

namespace bridgeway::http {

// One header field, name and value kept as raw bytes.
// In a Scope, names are lower case. In a response, names are kept as sent by the handler.
struct Header {
  Header() noexcept = default;

  Header(std::string_view name, std::string_view value) : name(name), value(value) {}

  bool operator==(const Header&) const noexcept = default;

  std::string name;
  std::string value;
};

// Ordered list of header fields. Duplicates are preserved in order.
using HeaderList = vector<Header>;

}  // namespace bridgeway::http
