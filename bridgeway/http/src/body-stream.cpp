#include "bridgeway/body-stream.hpp"

#include <optional>
#include <string>
#include <utility>

namespace bridgeway {

void BodyStream::iterator::advance() {
  auto chunk = _stream->next();
  if (chunk) {
    _stream->_current = std::move(*chunk);
  } else {
    _stream->_current.clear();
    _stream = nullptr;
  }
}

BodyStream::BodyStream(BodyStream&& other) noexcept
    : _channels(std::move(other._channels)), _current(std::move(other._current)) {}

BodyStream& BodyStream::operator=(BodyStream&& other) noexcept {
  if (this != &other) {
    cancelIfPending();
    _channels = std::move(other._channels);
    _current = std::move(other._current);
  }
  return *this;
}

BodyStream::~BodyStream() { cancelIfPending(); }

std::optional<std::string> BodyStream::next() {
  if (!_channels) {
    return std::nullopt;
  }
  auto chunk = _channels->body().pop();
  if (!chunk) {
    // end of stream: the channels are not needed anymore
    _channels.reset();
  }
  return chunk;
}

std::string BodyStream::readAll() {
  std::string ret;
  for (auto chunk = next(); chunk; chunk = next()) {
    ret.append(*chunk);
  }
  return ret;
}

void BodyStream::cancelIfPending() noexcept {
  if (_channels) {
    _channels->requestCancel();
    _channels.reset();
  }
}

}  // namespace bridgeway
