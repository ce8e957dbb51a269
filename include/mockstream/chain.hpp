#pragma once

#include <mockstream/result.hpp>
#include <mockstream/stream_concepts.hpp>

#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>

namespace mockstream {

/// Reads from `First` until it reports end-of-data, then from `Second`.
///
/// Errors from the first stream are returned unchanged and do not advance the chain, so a
/// `failing_mock_stream` in first position is consulted again on the next call. Once the first
/// stream returns 0 for a non-empty buffer it is never read again.
///
/// Both streams are owned. Chain handle types (`shared_mock_stream`, `sync_mock_stream`) to keep
/// access to a stream from outside the chain.
template <read_stream First, read_stream Second>
class chained_stream {
 public:
  chained_stream(First first, Second second)
      : first_(std::move(first)), second_(std::move(second)) {}

  auto read_some(std::span<std::byte> buf) -> io_result<std::size_t> {
    if (!first_done_) {
      auto r = first_.read_some(buf);
      if (!r || *r != 0 || buf.empty()) {
        return r;
      }
      first_done_ = true;
    }
    return second_.read_some(buf);
  }

  auto first() noexcept -> First& { return first_; }
  auto first() const noexcept -> First const& { return first_; }
  auto second() noexcept -> Second& { return second_; }
  auto second() const noexcept -> Second const& { return second_; }

  /// True once the first stream has reported end-of-data.
  auto first_done() const noexcept -> bool { return first_done_; }

 private:
  First first_;
  Second second_;
  bool first_done_ = false;
};

template <class First, class Second>
  requires read_stream<std::decay_t<First>> && read_stream<std::decay_t<Second>>
auto chain(First&& first, Second&& second)
  -> chained_stream<std::decay_t<First>, std::decay_t<Second>> {
  return {std::forward<First>(first), std::forward<Second>(second)};
}

}  // namespace mockstream
