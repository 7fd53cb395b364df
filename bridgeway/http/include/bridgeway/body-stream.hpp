#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "bridgeway/response-channels.hpp"

namespace bridgeway {

// Lazy, single-pass sequence of the response body chunks of one request.
// Each step blocks until the worker produces the next chunk or ends the stream.
// Once the end of stream is reached the channels are released, and any further iteration yields nothing.
//
// Destroying a BodyStream before its end asks the handler to stop (see ResponseChannels::requestCancel()).
//
// Usage:
//   for (const std::string& chunk : bodyStream) {
//     write(chunk);
//   }
class BodyStream {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string*;
    using reference = const std::string&;

    iterator() noexcept = default;

    reference operator*() const noexcept { return _stream->_current; }
    pointer operator->() const noexcept { return &_stream->_current; }

    iterator& operator++() {
      advance();
      return *this;
    }

    void operator++(int) { advance(); }

    bool operator==(std::default_sentinel_t) const noexcept { return _stream == nullptr; }

   private:
    friend class BodyStream;

    explicit iterator(BodyStream* stream) : _stream(stream) { advance(); }

    void advance();

    BodyStream* _stream{nullptr};
  };

  BodyStream() noexcept = default;

  explicit BodyStream(std::shared_ptr<ResponseChannels> channels) noexcept : _channels(std::move(channels)) {}

  BodyStream(const BodyStream&) = delete;
  BodyStream(BodyStream&& other) noexcept;
  BodyStream& operator=(const BodyStream&) = delete;
  BodyStream& operator=(BodyStream&& other) noexcept;

  ~BodyStream();

  [[nodiscard]] iterator begin() { return iterator(this); }
  [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

  // Blocks until the next chunk is available. Returns std::nullopt at the end of the stream.
  [[nodiscard]] std::optional<std::string> next();

  // Consumes the rest of the stream and returns it as a single buffer.
  [[nodiscard]] std::string readAll();

  // Tells whether the end of the stream has been reached (always true for a default constructed BodyStream).
  [[nodiscard]] bool exhausted() const noexcept { return _channels == nullptr; }

 private:
  void cancelIfPending() noexcept;

  std::shared_ptr<ResponseChannels> _channels;
  std::string _current;
};

}  // namespace bridgeway
