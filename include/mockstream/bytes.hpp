#pragma once

#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mockstream {

/// Owning byte sequence used for injected and captured stream data.
using byte_vector = std::vector<std::byte>;

/// View the characters of `s` as bytes (no copy).
inline auto as_bytes(std::string_view s) noexcept -> std::span<std::byte const> {
  return std::as_bytes(std::span<char const>(s.data(), s.size()));
}

/// View a byte range as characters (no copy).
inline auto as_string_view(std::span<std::byte const> b) noexcept -> std::string_view {
  return {reinterpret_cast<char const*>(b.data()), b.size()};
}

inline auto to_bytes(std::string_view s) -> byte_vector {
  auto b = as_bytes(s);
  return byte_vector(b.begin(), b.end());
}

/// Build a byte vector from small integer literals: `make_bytes({1, 2, 3})`.
inline auto make_bytes(std::initializer_list<unsigned char> values) -> byte_vector {
  byte_vector out;
  out.reserve(values.size());
  for (auto v : values) {
    out.push_back(static_cast<std::byte>(v));
  }
  return out;
}

inline auto to_string(std::span<std::byte const> b) -> std::string {
  return std::string(as_string_view(b));
}

}  // namespace mockstream
