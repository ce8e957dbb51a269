#pragma once

#include <mockstream/error.hpp>

#include <cerrno>
#include <system_error>

namespace mockstream::detail {

inline auto map_errno(int err) noexcept -> std::error_code {
  switch (err) {
    case EPIPE: {
      return error::broken_pipe;
    }
    case ECONNRESET: {
      return error::connection_reset;
    }
    case ECONNABORTED: {
      return error::connection_aborted;
    }
    case ETIMEDOUT: {
      return error::timed_out;
    }
    case EACCES:
    case EPERM: {
      return error::permission_denied;
    }
    case EBADF: {
      return error::not_open;
    }
    default: {
      return std::error_code(err, std::generic_category());
    }
  }
}

}  // namespace mockstream::detail
