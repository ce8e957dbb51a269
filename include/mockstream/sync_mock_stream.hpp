#pragma once

#include <mockstream/assert.hpp>
#include <mockstream/bytes.hpp>
#include <mockstream/config.hpp>
#include <mockstream/mock_stream.hpp>
#include <mockstream/result.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <string_view>

namespace mockstream {

/// Thread-safe, reference-counted mock stream.
///
/// Copies are handles to one mutex-guarded `mock_stream`. Every operation holds the lock only
/// for its own buffer access.
///
/// Write-triggered unblock:
/// - `wait_for(pattern)` arms the stream. While armed, `read_some` polls (sleeping
///   `poll_interval()` between checks, without holding the lock) until disarmed.
/// - Each `write_some` appends, then, if armed, searches the whole write buffer accumulated
///   since the last pop for `pattern` as a contiguous run. A match disarms the stream (one shot).
/// - Bytes already written before `wait_for` only count once another write happens.
/// - There is no timeout: a pattern that is never written blocks readers forever.
class sync_mock_stream {
 public:
  static constexpr std::chrono::milliseconds default_poll_interval{
    MOCKSTREAM_SYNC_POLL_INTERVAL_MS};

  sync_mock_stream() : sync_mock_stream(default_poll_interval) {}

  /// `poll_interval` must be positive.
  explicit sync_mock_stream(std::chrono::milliseconds poll_interval)
      : state_(std::make_shared<state>(poll_interval)) {
    MOCKSTREAM_ENSURE(poll_interval.count() > 0,
                      "sync_mock_stream: poll interval must be positive");
  }

  /// Blocks while a `wait_for` pattern is pending, then reads like `mock_stream`.
  auto read_some(std::span<std::byte> buf) -> io_result<std::size_t>;

  /// Appends `buf`; clears a pending wait when the accumulated output contains its pattern.
  auto write_some(std::span<std::byte const> buf) -> io_result<std::size_t>;

  auto flush() -> void_result;

  /// Block reads (through every handle) until `expected_bytes` has been written.
  void wait_for(std::span<std::byte const> expected_bytes);
  void wait_for(std::string_view expected) { wait_for(as_bytes(expected)); }

  auto is_waiting() const noexcept -> bool {
    return state_->waiting.load(std::memory_order_acquire);
  }

  void push_bytes_to_read(std::span<std::byte const> bytes);
  void push_bytes_to_read(std::string_view s) { push_bytes_to_read(as_bytes(s)); }

  /// Copy of everything written so far, taken under the lock.
  auto peek_bytes_written() const -> byte_vector;

  auto pop_bytes_written() -> byte_vector;

  auto bytes_available() const -> std::size_t;

  auto poll_interval() const noexcept -> std::chrono::milliseconds {
    return state_->poll_interval;
  }

 private:
  struct state {
    explicit state(std::chrono::milliseconds interval) noexcept : poll_interval(interval) {}

    mutable std::mutex mtx{};
    mock_stream stream{};
    // Guarded by `mtx`; published to readers through `waiting`.
    byte_vector expected{};
    std::atomic<bool> waiting{false};
    std::chrono::milliseconds const poll_interval;
  };

  std::shared_ptr<state> state_;
};

}  // namespace mockstream
