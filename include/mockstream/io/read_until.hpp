#pragma once

#include <mockstream/bytes.hpp>
#include <mockstream/detail/find_subsequence.hpp>
#include <mockstream/error.hpp>
#include <mockstream/result.hpp>
#include <mockstream/stream_concepts.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>

namespace mockstream::io {

/// Upper bound on the bytes requested from `read_some` per `read_until` iteration.
inline constexpr std::size_t read_until_chunk = 512;

/// Composed operation: read into `out` until it contains `delim`.
///
/// Semantics:
/// - Appends to `out`; bytes already in `out` take part in the search.
/// - Returns the length of `out` up to and including the first occurrence of `delim`.
/// - If `out` already contains `delim`, completes immediately without reading.
/// - End-of-data before `delim` is found returns `error::eof`.
/// - Growing `out` beyond `max_size` bytes without finding `delim` returns
///   `error::message_size`.
/// - An empty `delim` is rejected with `error::invalid_argument`.
///
/// Note: `read_some` may read past the delimiter; those bytes stay at the tail of `out`.
template <read_stream Stream>
auto read_until(Stream& s, byte_vector& out, std::span<std::byte const> delim,
                std::size_t max_size) -> io_result<std::size_t> {
  if (delim.empty()) {
    return unexpected(error::invalid_argument);
  }

  // Only the tail that could still hold a match straddling old and new data is rescanned.
  std::size_t search_from = 0;
  for (;;) {
    auto const pos = detail::find_subsequence(std::span<std::byte const>(out).subspan(search_from),
                                              delim);
    if (pos != detail::npos) {
      return search_from + pos + delim.size();
    }
    if (out.size() >= max_size) {
      return unexpected(error::message_size);
    }
    if (out.size() >= delim.size()) {
      search_from = out.size() - delim.size() + 1;
    }

    auto const old_size = out.size();
    out.resize(old_size + (std::min)(max_size - old_size, read_until_chunk));
    auto r = s.read_some(std::span<std::byte>(out).subspan(old_size));
    if (!r) {
      out.resize(old_size);
      if (is_interrupted(r.error().code())) {
        continue;
      }
      return r;
    }
    out.resize(old_size + *r);
    if (*r == 0) {
      return unexpected(error::eof);
    }
  }
}

template <read_stream Stream>
auto read_until(Stream& s, byte_vector& out, std::string_view delim, std::size_t max_size)
  -> io_result<std::size_t> {
  return read_until(s, out, as_bytes(delim), max_size);
}

}  // namespace mockstream::io
