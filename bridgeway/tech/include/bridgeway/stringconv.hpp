#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>
#include <system_error>

namespace bridgeway {

// Conversion of untrusted input: the whole string must be a decimal integer representable in Integral.
// A single leading '+' is accepted. Returns std::nullopt on any failure (empty, trailing garbage, overflow).
template <std::integral Integral>
std::optional<Integral> TryStringToIntegral(std::string_view str) noexcept {
  if (str.size() > 1 && str.front() == '+' && str[1] != '-') {
    str.remove_prefix(1);
  }
  Integral ret;
  const char *endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret);
  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

}  // namespace bridgeway
