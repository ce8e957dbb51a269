#pragma once

#include <mockstream/error.hpp>
#include <mockstream/expected.hpp>

#include <system_error>
#include <utility>
#include <variant>

namespace mockstream {

/// Common result type for stream operations.
template <class T>
using io_result = expected<T, io_error>;

/// Result type for operations with nothing to return (`flush`).
using void_result = expected<std::monostate, io_error>;

[[nodiscard]] inline auto ok() noexcept -> void_result { return std::monostate{}; }
[[nodiscard]] inline auto fail(io_error e) noexcept -> void_result { return unexpected(std::move(e)); }

}  // namespace mockstream
