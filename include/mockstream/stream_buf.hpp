#pragma once

#include <mockstream/error.hpp>
#include <mockstream/io/write.hpp>
#include <mockstream/result.hpp>
#include <mockstream/stream_concepts.hpp>

#include <cstddef>
#include <ios>
#include <span>
#include <streambuf>
#include <utility>
#include <vector>

namespace mockstream {

/// `std::streambuf` over a stream, for code written against `std::istream` / `std::ostream`.
///
/// - Input is buffered: `underflow` pulls up to `buffer_size` bytes per `read_some`, so the
///   stream may be consumed past what the istream has extracted.
/// - Output is unbuffered: every put forwards to `io::write`, so bytes are visible to
///   `pop_bytes_written` as soon as the ostream operation returns.
/// - A failed primitive maps to iostream failure; the error is kept in `last_error()`.
///   Interrupted reads are retried.
///
/// Read-only streams (e.g. `chained_stream`) can be wrapped; puts then fail.
template <read_stream Stream>
class stream_buf : public std::streambuf {
 public:
  explicit stream_buf(Stream& s, std::size_t buffer_size = 512)
      : stream_(s), get_area_(buffer_size == 0 ? 1 : buffer_size) {
    setg(get_area_.data(), get_area_.data(), get_area_.data());
  }

  stream_buf(stream_buf const&) = delete;
  auto operator=(stream_buf const&) -> stream_buf& = delete;

  auto last_error() const noexcept -> io_error const& { return last_error_; }

 protected:
  auto underflow() -> int_type override {
    if (gptr() < egptr()) {
      return traits_type::to_int_type(*gptr());
    }

    auto area = std::as_writable_bytes(std::span<char>(get_area_));
    for (;;) {
      auto r = stream_.read_some(area);
      if (!r) {
        if (is_interrupted(r.error().code())) {
          continue;
        }
        last_error_ = std::move(r).error();
        return traits_type::eof();
      }
      if (*r == 0) {
        return traits_type::eof();
      }
      setg(get_area_.data(), get_area_.data(), get_area_.data() + *r);
      return traits_type::to_int_type(*gptr());
    }
  }

  auto overflow(int_type ch) -> int_type override {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
      return traits_type::not_eof(ch);
    }
    char const c = traits_type::to_char_type(ch);
    return put(&c, 1) ? ch : traits_type::eof();
  }

  auto xsputn(char const* s, std::streamsize n) -> std::streamsize override {
    if (n <= 0) {
      return 0;
    }
    return put(s, static_cast<std::size_t>(n)) ? n : 0;
  }

  auto sync() -> int override {
    if constexpr (write_stream<Stream>) {
      auto r = stream_.flush();
      if (!r) {
        last_error_ = std::move(r).error();
        return -1;
      }
      return 0;
    } else {
      return 0;
    }
  }

 private:
  auto put(char const* s, std::size_t n) -> bool {
    if constexpr (write_stream<Stream>) {
      auto r = io::write(stream_, std::as_bytes(std::span<char const>(s, n)));
      if (!r) {
        last_error_ = std::move(r).error();
        return false;
      }
      return true;
    } else {
      last_error_ = error::invalid_argument;
      return false;
    }
  }

  Stream& stream_;
  std::vector<char> get_area_;
  io_error last_error_{};
};

}  // namespace mockstream
