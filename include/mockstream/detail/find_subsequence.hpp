#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <iterator>
#include <span>

namespace mockstream::detail {

inline constexpr auto npos = static_cast<std::size_t>(-1);

/// Position of the first contiguous occurrence of `needle` in `haystack`, or `npos`.
///
/// An empty needle matches at position 0.
[[nodiscard]] inline auto find_subsequence(std::span<std::byte const> haystack,
                                           std::span<std::byte const> needle) -> std::size_t {
  if (needle.empty()) {
    return 0;
  }
  if (haystack.size() < needle.size()) {
    return npos;
  }

  if (needle.size() == 1) {
    auto const* found = std::memchr(haystack.data(), static_cast<unsigned char>(needle[0]),
                                    haystack.size());
    if (!found) {
      return npos;
    }
    return static_cast<std::size_t>(static_cast<std::byte const*>(found) - haystack.data());
  }

  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end());
  if (it == haystack.end()) {
    return npos;
  }
  return static_cast<std::size_t>(std::distance(haystack.begin(), it));
}

}  // namespace mockstream::detail
