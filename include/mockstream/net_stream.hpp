#pragma once

#include <mockstream/failing_mock_stream.hpp>
#include <mockstream/fd_stream.hpp>
#include <mockstream/mock_stream.hpp>
#include <mockstream/result.hpp>
#include <mockstream/shared_mock_stream.hpp>
#include <mockstream/sync_mock_stream.hpp>

#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>

namespace mockstream {

/// A network-facing stream that is either a mock or a real transport.
///
/// Production code holds a `net_stream`; tests construct it from a mock handle and keep a second
/// handle to drive the other side. Every alternative satisfies `stream`, and `net_stream`
/// forwards to the active one.
class net_stream {
 public:
  using variant_type = std::variant<mock_stream, shared_mock_stream, sync_mock_stream,
                                    failing_mock_stream, fd_stream>;

  template <class Stream>
    requires(!std::is_same_v<std::remove_cvref_t<Stream>, net_stream> &&
             std::is_constructible_v<variant_type, Stream &&>)
  net_stream(Stream&& s) : impl_(std::forward<Stream>(s)) {}

  auto read_some(std::span<std::byte> buf) -> io_result<std::size_t> {
    return std::visit([&](auto& s) { return s.read_some(buf); }, impl_);
  }

  auto write_some(std::span<std::byte const> buf) -> io_result<std::size_t> {
    return std::visit([&](auto& s) { return s.write_some(buf); }, impl_);
  }

  auto flush() -> void_result {
    return std::visit([](auto& s) { return s.flush(); }, impl_);
  }

  /// False only for the real (`fd_stream`) alternative.
  auto is_mock() const noexcept -> bool { return !std::holds_alternative<fd_stream>(impl_); }

  auto index() const noexcept -> std::size_t { return impl_.index(); }

  template <class Stream>
  auto get_if() noexcept -> Stream* {
    return std::get_if<Stream>(&impl_);
  }

  template <class Stream>
  auto get_if() const noexcept -> Stream const* {
    return std::get_if<Stream>(&impl_);
  }

 private:
  variant_type impl_;
};

}  // namespace mockstream
