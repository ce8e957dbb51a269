#pragma once

#include <mockstream/result.hpp>

#include <concepts>
#include <cstddef>
#include <span>

namespace mockstream {

/// Minimal synchronous stream concepts used by composed I/O algorithms.
///
/// IMPORTANT: concepts cannot enforce semantics. The following contracts are normative.
///
/// read_some contract:
/// - On success, returns the number of bytes copied into the buffer, at most `buf.size()`.
/// - Returning `0` for a non-empty buffer indicates end-of-data. It is not an error, and
///   a later call may return data again (a mock may be refilled).
/// - Mock streams never block in `read_some`, with the single exception of
///   `sync_mock_stream` while a `wait_for` pattern is pending.
///
/// write_some contract:
/// - On success, returns the number of bytes consumed. Mock streams consume everything.
/// - Returning `0` for a non-empty buffer is treated by composed algorithms as
///   `error::write_zero`.
///
/// flush contract:
/// - Pushes out anything buffered. For in-memory streams it always succeeds.
///
/// Errors are reported via `io_result<...>`; nothing is retried inside a primitive.
template <class Stream>
concept read_stream = requires(Stream& s, std::span<std::byte> rbuf) {
  { s.read_some(rbuf) } -> std::same_as<io_result<std::size_t>>;
};

template <class Stream>
concept write_stream = requires(Stream& s, std::span<std::byte const> wbuf) {
  { s.write_some(wbuf) } -> std::same_as<io_result<std::size_t>>;
  { s.flush() } -> std::same_as<void_result>;
};

template <class Stream>
concept stream = read_stream<Stream> && write_stream<Stream>;

}  // namespace mockstream
