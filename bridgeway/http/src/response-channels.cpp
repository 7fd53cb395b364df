#include "bridgeway/response-channels.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "bridgeway/message.hpp"

namespace bridgeway {

bool StatusChannel::offer(ResponseStart start) {
  if (_filled.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  _promise.set_value(std::move(start));
  return true;
}

ResponseStart StatusChannel::wait() { return _future.get(); }

bool BodyChannel::push(std::string chunk) {
  if (chunk.empty()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_closed) {
      return false;
    }
    _chunks.push_back(std::move(chunk));
  }
  _cv.notify_one();
  return true;
}

bool BodyChannel::close() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_closed) {
      return false;
    }
    _closed = true;
  }
  _cv.notify_all();
  return true;
}

std::optional<std::string> BodyChannel::pop() {
  std::unique_lock<std::mutex> lock(_mutex);
  _cv.wait(lock, [this] { return !_chunks.empty() || _closed; });
  if (_chunks.empty()) {
    return std::nullopt;
  }
  std::optional<std::string> ret(std::move(_chunks.front()));
  _chunks.pop_front();
  return ret;
}

bool BodyChannel::closed() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _closed;
}

}  // namespace bridgeway
