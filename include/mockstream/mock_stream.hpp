#pragma once

#include <mockstream/byte_buffer.hpp>
#include <mockstream/bytes.hpp>
#include <mockstream/result.hpp>

#include <cstddef>
#include <span>
#include <string_view>

namespace mockstream {

/// A read/write stream that stores the data written and serves the data pushed for reading.
///
/// Value semantics: a copy owns an independent duplicate of the buffered state.
class mock_stream {
 public:
  mock_stream() = default;

  auto read_some(std::span<std::byte> buf) -> io_result<std::size_t> {
    return buffer_.read_some(buf);
  }

  auto write_some(std::span<std::byte const> buf) -> io_result<std::size_t> {
    return buffer_.write_some(buf);
  }

  auto flush() -> void_result { return buffer_.flush(); }

  void push_bytes_to_read(std::span<std::byte const> bytes) { buffer_.push_bytes_to_read(bytes); }
  void push_bytes_to_read(std::string_view s) { buffer_.push_bytes_to_read(as_bytes(s)); }

  auto peek_bytes_written() const noexcept -> std::span<std::byte const> {
    return buffer_.peek_bytes_written();
  }

  auto pop_bytes_written() -> byte_vector { return buffer_.pop_bytes_written(); }

  auto bytes_available() const noexcept -> std::size_t { return buffer_.bytes_available(); }

 private:
  byte_buffer buffer_{};
};

}  // namespace mockstream
