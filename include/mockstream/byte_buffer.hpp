#pragma once

#include <mockstream/bytes.hpp>
#include <mockstream/result.hpp>

#include <cstddef>
#include <span>

namespace mockstream {

/// The buffering core shared by every mock stream.
///
/// Two independent sides:
/// - a read cursor: bytes injected by the test harness plus the current read position;
/// - a write buffer: bytes written by the code under test, drained by the harness.
///
/// Invariant: `position() <= read_data_.size()`.
///
/// Reads never block: an exhausted read side returns 0 (end-of-data). Writes always consume
/// the whole buffer. Not thread-safe.
class byte_buffer {
 public:
  byte_buffer() = default;

  /// Copy up to `buf.size()` bytes from the read cursor into `buf`.
  auto read_some(std::span<std::byte> buf) -> io_result<std::size_t>;

  /// Append all of `buf` to the write buffer.
  auto write_some(std::span<std::byte const> buf) -> io_result<std::size_t>;

  auto flush() -> void_result { return ok(); }

  /// Make `bytes` available to future reads.
  ///
  /// Fully consumed read data is discarded first, so a cursor that is drained between pushes
  /// does not grow without bound.
  void push_bytes_to_read(std::span<std::byte const> bytes);

  /// Everything written so far. The view is invalidated by the next write or pop.
  auto peek_bytes_written() const noexcept -> std::span<std::byte const> { return written_; }

  /// Remove and return everything written so far.
  auto pop_bytes_written() -> byte_vector;

  auto bytes_available() const noexcept -> std::size_t { return read_data_.size() - position_; }
  auto position() const noexcept -> std::size_t { return position_; }

 private:
  byte_vector read_data_{};
  std::size_t position_ = 0;
  byte_vector written_{};
};

}  // namespace mockstream
