#pragma once

#include <mockstream/bytes.hpp>
#include <mockstream/config.hpp>
#include <mockstream/error.hpp>
#include <mockstream/result.hpp>
#include <mockstream/stream_concepts.hpp>

#include <array>
#include <cstddef>
#include <span>

namespace mockstream::io {

/// Composed operation: read exactly `buf.size()` bytes.
///
/// Notes:
/// - Layered on the stream's `read_some` primitive.
/// - Interrupted reads (`error::interrupted`, `EINTR`) are retried.
/// - If `read_some` yields 0 before the buffer is full, this returns `error::eof`. Bytes read
///   so far stay in `buf`.
template <read_stream Stream>
auto read(Stream& s, std::span<std::byte> buf) -> io_result<std::size_t> {
  auto const wanted = buf.size();

  while (!buf.empty()) {
    auto r = s.read_some(buf);
    if (!r) {
      if (is_interrupted(r.error().code())) {
        continue;
      }
      return r;
    }

    auto const n = *r;
    if (n == 0) {
      return unexpected(error::eof);
    }
    buf = buf.subspan(n);
  }

  return wanted;
}

/// Composed operation: append everything up to end-of-data to `out`.
///
/// Returns the number of bytes appended. Interrupted reads are retried; any other error is
/// returned with the bytes read so far left in `out`.
template <read_stream Stream>
auto read_to_end(Stream& s, byte_vector& out) -> io_result<std::size_t> {
  std::array<std::byte, MOCKSTREAM_READ_TO_END_CHUNK> chunk{};
  std::size_t total = 0;

  for (;;) {
    auto r = s.read_some(chunk);
    if (!r) {
      if (is_interrupted(r.error().code())) {
        continue;
      }
      return r;
    }

    auto const n = *r;
    if (n == 0) {
      return total;
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
    total += n;
  }
}

}  // namespace mockstream::io
