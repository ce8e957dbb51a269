#pragma once

#include <mockstream/result.hpp>

#include <cstddef>
#include <span>
#include <utility>

namespace mockstream {

/// Blocking byte stream over an owned POSIX descriptor.
///
/// The real-transport counterpart of the mock streams: it satisfies the same `stream` concept, so
/// code written against that concept runs unchanged over a socket, a pipe or a mock.
///
/// - `read_some` returns 0 when the peer has closed its sending side.
/// - `write_some` uses `send(MSG_NOSIGNAL)` on sockets, so a vanished peer yields
///   `error::broken_pipe` instead of `SIGPIPE`, and `write` on other descriptors.
/// - `EINTR` is retried inside both primitives.
/// - Every operation on a closed stream returns `error::not_open`.
class fd_stream {
 public:
  fd_stream() noexcept = default;
  explicit fd_stream(int fd) noexcept : fd_(fd) {}

  fd_stream(fd_stream const&) = delete;
  auto operator=(fd_stream const&) -> fd_stream& = delete;

  fd_stream(fd_stream&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  auto operator=(fd_stream&& other) noexcept -> fd_stream& {
    if (this != &other) {
      close();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  ~fd_stream() { close(); }

  /// Two connected streams (`socketpair(AF_UNIX, SOCK_STREAM)`).
  static auto pair() -> io_result<std::pair<fd_stream, fd_stream>>;

  auto read_some(std::span<std::byte> buf) -> io_result<std::size_t>;
  auto write_some(std::span<std::byte const> buf) -> io_result<std::size_t>;
  auto flush() -> void_result;

  /// Half-close: the peer reads end-of-data once buffered bytes are consumed.
  auto shutdown_write() -> void_result;

  void close() noexcept;

  auto is_open() const noexcept -> bool { return fd_ >= 0; }
  auto native_handle() const noexcept -> int { return fd_; }

  /// Give up ownership without closing.
  auto release() noexcept -> int { return std::exchange(fd_, -1); }

 private:
  int fd_ = -1;
};

}  // namespace mockstream
