#pragma once

#include <mockstream/error.hpp>
#include <mockstream/result.hpp>
#include <mockstream/stream_concepts.hpp>

#include <cstddef>
#include <span>

namespace mockstream::io {

/// Composed operation: write exactly `buf.size()` bytes.
///
/// Notes:
/// - Layered on the stream's `write_some` primitive.
/// - Interrupted writes (`error::interrupted`, `EINTR`) are retried.
/// - If `write_some` yields 0 before the buffer is fully written, this returns
///   `error::write_zero`.
template <write_stream Stream>
auto write(Stream& s, std::span<std::byte const> buf) -> io_result<std::size_t> {
  auto const wanted = buf.size();

  while (!buf.empty()) {
    auto r = s.write_some(buf);
    if (!r) {
      if (is_interrupted(r.error().code())) {
        continue;
      }
      return r;
    }

    auto const n = *r;
    if (n == 0) {
      return unexpected(error::write_zero);
    }
    buf = buf.subspan(n);
  }

  return wanted;
}

}  // namespace mockstream::io
