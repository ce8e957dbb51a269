#include <mockstream/detail/fd_utils.hpp>
#include <mockstream/error.hpp>
#include <mockstream/fd_stream.hpp>

#include <cerrno>

#include <sys/socket.h>
#include <unistd.h>

namespace mockstream {

inline auto fd_stream::pair() -> io_result<std::pair<fd_stream, fd_stream>> {
  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    return unexpected(detail::map_errno(errno));
  }
  return std::pair<fd_stream, fd_stream>{fd_stream{fds[0]}, fd_stream{fds[1]}};
}

inline auto fd_stream::read_some(std::span<std::byte> buf) -> io_result<std::size_t> {
  if (fd_ < 0) {
    return unexpected(error::not_open);
  }
  if (buf.empty()) {
    return std::size_t{0};
  }

  for (;;) {
    auto n = ::read(fd_, buf.data(), buf.size());
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return unexpected(error::would_block);
    }
    return unexpected(detail::map_errno(errno));
  }
}

inline auto fd_stream::write_some(std::span<std::byte const> buf) -> io_result<std::size_t> {
  if (fd_ < 0) {
    return unexpected(error::not_open);
  }
  if (buf.empty()) {
    return std::size_t{0};
  }

  bool use_send = true;
  for (;;) {
    auto n = use_send ? ::send(fd_, buf.data(), buf.size(), MSG_NOSIGNAL)
                      : ::write(fd_, buf.data(), buf.size());
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    if (use_send && errno == ENOTSOCK) {
      use_send = false;
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return unexpected(error::would_block);
    }
    return unexpected(detail::map_errno(errno));
  }
}

inline auto fd_stream::flush() -> void_result {
  if (fd_ < 0) {
    return fail(error::not_open);
  }
  return ok();
}

inline auto fd_stream::shutdown_write() -> void_result {
  if (fd_ < 0) {
    return fail(error::not_open);
  }
  if (::shutdown(fd_, SHUT_WR) != 0) {
    return fail(detail::map_errno(errno));
  }
  return ok();
}

inline void fd_stream::close() noexcept {
  auto fd = release();
  if (fd >= 0) {
    (void)::close(fd);
  }
}

}  // namespace mockstream
