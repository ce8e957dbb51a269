#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace mockstream {

enum class error {
  /// End of stream reached before the requested amount of data was transferred.
  eof = 1,

  /// A write transferred zero bytes before the buffer was fully written.
  write_zero,

  /// The peer is gone; writing is no longer possible.
  broken_pipe,

  /// Connection reset by peer.
  connection_reset,

  /// Connection aborted locally.
  connection_aborted,

  /// The operation was interrupted and may be retried.
  interrupted,

  /// The operation would block.
  would_block,

  /// The operation did not complete in time.
  timed_out,

  /// Access to the resource was refused.
  permission_denied,

  /// The stream (or underlying resource) is not open.
  not_open,

  /// Invalid argument / malformed input (library-level)
  invalid_argument,

  /// A delimited read exceeded its size limit.
  message_size,

  /// Any failure that does not fit one of the kinds above.
  other,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace mockstream

namespace std {

template <>
struct is_error_code_enum<mockstream::error> : std::true_type {};

}  // namespace std

namespace mockstream {

/// Error value carried by every stream operation.
///
/// An `io_error` is a `std::error_code` optionally paired with a free-form description. The code
/// classifies the failure; the description, when present, replaces the category's message text.
/// Injected failures use the description to carry a caller-chosen message.
class io_error {
 public:
  io_error() = default;

  io_error(std::error_code ec) noexcept : code_(ec) {}

  template <class ErrorCodeEnum>
    requires std::is_error_code_enum_v<ErrorCodeEnum>
  io_error(ErrorCodeEnum e) : code_(e) {}

  io_error(std::error_code ec, std::string description)
      : code_(ec), description_(std::move(description)) {}

  auto code() const noexcept -> std::error_code { return code_; }

  /// The description if one was given, otherwise the category's message.
  auto message() const -> std::string {
    return description_.empty() ? code_.message() : description_;
  }

  auto has_description() const noexcept -> bool { return !description_.empty(); }

  explicit operator bool() const noexcept { return static_cast<bool>(code_); }

  friend auto operator==(io_error const& lhs, std::error_code const& rhs) noexcept -> bool {
    return lhs.code_ == rhs;
  }

  friend auto operator==(io_error const& lhs, std::error_condition const& rhs) noexcept -> bool {
    return lhs.code_ == rhs;
  }

 private:
  std::error_code code_{};
  std::string description_{};
};

/// True for the "try again" outcomes composed operations retry on.
inline auto is_interrupted(std::error_code const& ec) noexcept -> bool {
  return ec == error::interrupted || ec == std::errc::interrupted;
}

}  // namespace mockstream
