#pragma once

#include <mockstream/bytes.hpp>
#include <mockstream/mock_stream.hpp>
#include <mockstream/result.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>

namespace mockstream {

/// Reference-counted mock stream for single-threaded aliasing.
///
/// Copies are handles to one `mock_stream`: bytes pushed through any handle are read through
/// every other, and bytes written through any handle are popped from every other. A typical test
/// keeps one handle and gives another to the object under test.
///
/// No internal locking. Use `sync_mock_stream` when handles live on different threads.
class shared_mock_stream {
 public:
  shared_mock_stream() : impl_(std::make_shared<mock_stream>()) {}

  auto read_some(std::span<std::byte> buf) -> io_result<std::size_t> {
    return impl_->read_some(buf);
  }

  auto write_some(std::span<std::byte const> buf) -> io_result<std::size_t> {
    return impl_->write_some(buf);
  }

  auto flush() -> void_result { return impl_->flush(); }

  void push_bytes_to_read(std::span<std::byte const> bytes) { impl_->push_bytes_to_read(bytes); }
  void push_bytes_to_read(std::string_view s) { impl_->push_bytes_to_read(s); }

  auto peek_bytes_written() const noexcept -> std::span<std::byte const> {
    return impl_->peek_bytes_written();
  }

  auto pop_bytes_written() -> byte_vector { return impl_->pop_bytes_written(); }

  auto bytes_available() const noexcept -> std::size_t { return impl_->bytes_available(); }

  /// Number of handles sharing this stream.
  auto use_count() const noexcept -> long { return impl_.use_count(); }

 private:
  std::shared_ptr<mock_stream> impl_;
};

}  // namespace mockstream
