#pragma once

#include <mockstream/error.hpp>
#include <mockstream/result.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <system_error>
#include <utility>

namespace mockstream {

/// A stream whose reads and writes fail a fixed number of times.
///
/// Each `read_some` / `write_some` call, regardless of direction or buffer:
/// - fails with `io_error{kind, message}` while the repeat count is positive, decrementing it;
/// - fails the same way forever if the repeat count is negative;
/// - succeeds with 0 bytes (end-of-data) once the count reaches zero.
///
/// `flush` always succeeds. Chain it between mocks (see `chain`) to exercise retry loops:
///
/// ```
/// auto s = mockstream::chain(mockstream::chain(first, mockstream::failing_mock_stream{
///                                                       mockstream::error::interrupted,
///                                                       "interrupted", 3}),
///                            second);
/// ```
class failing_mock_stream {
 public:
  failing_mock_stream(std::error_code kind, std::string message, int repeat_count)
      : kind_(kind), message_(std::move(message)), repeat_count_(repeat_count) {}

  auto read_some(std::span<std::byte>) -> io_result<std::size_t> { return fail_once(); }
  auto write_some(std::span<std::byte const>) -> io_result<std::size_t> { return fail_once(); }
  auto flush() -> void_result { return ok(); }

  /// Failures left before end-of-data; negative means unlimited.
  auto remaining_failures() const noexcept -> int { return repeat_count_; }

  auto kind() const noexcept -> std::error_code { return kind_; }
  auto message() const noexcept -> std::string const& { return message_; }

 private:
  auto fail_once() -> io_result<std::size_t>;

  std::error_code kind_;
  std::string message_;
  int repeat_count_;
};

}  // namespace mockstream
