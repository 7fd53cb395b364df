#include "bridgeway/status-format.hpp"

#include <charconv>
#include <string>
#include <string_view>

#include "bridgeway/http-status-code.hpp"

namespace bridgeway {

std::string FormatStatus(http::StatusCode status, StatusFormat format) {
  char buf[8];
  const auto ptr = std::to_chars(buf, buf + sizeof(buf), status).ptr;

  std::string ret(buf, ptr);
  if (format == StatusFormat::WithPhrase) {
    const std::string_view reason = http::ReasonPhraseFor(status);
    if (!reason.empty()) {
      ret.reserve(ret.size() + 1UL + reason.size());
      ret.push_back(' ');
      ret.append(reason);
    }
  }
  return ret;
}

}  // namespace bridgeway
