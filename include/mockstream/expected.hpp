#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

#include <version>
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
#endif

namespace mockstream {

// `std::expected` (C++23) when available, otherwise a subset sufficient for this library.
//
// The subset covers construction from values and `unexpected`, observers, `value_or` and
// equality. Monadic operations are intentionally absent.
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L

template <class E>
using unexpected = std::unexpected<E>;

template <class T, class E>
using expected = std::expected<T, E>;

#else

template <class E>
class bad_expected_access : public std::exception {
 public:
  explicit bad_expected_access(E e) : err_(std::move(e)) {}

  auto error() const& -> E const& { return err_; }
  auto error() && -> E&& { return std::move(err_); }

  const char* what() const noexcept override { return "bad expected access"; }

 private:
  E err_;
};

template <class E>
class unexpected {
 public:
  constexpr explicit unexpected(E const& e) : error_(e) {}
  constexpr explicit unexpected(E&& e) : error_(std::move(e)) {}

  constexpr auto error() const& noexcept -> E const& { return error_; }
  constexpr auto error() & noexcept -> E& { return error_; }
  constexpr auto error() && noexcept -> E&& { return std::move(error_); }

 private:
  E error_;
};

template <class E>
unexpected(E) -> unexpected<E>;

template <class T, class E>
class expected {
  static_assert(!std::is_void_v<T>, "use expected<std::monostate, E> for void results");

 public:
  using value_type = T;
  using error_type = E;

  constexpr expected() : storage_(std::in_place_index<0>) {}

  constexpr expected(T const& value) : storage_(std::in_place_index<0>, value) {}
  constexpr expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

  template <class G>
    requires std::is_convertible_v<G const&, E>
  constexpr expected(unexpected<G> const& u) : storage_(std::in_place_index<1>, E(u.error())) {}

  template <class G>
    requires std::is_convertible_v<G&&, E>
  constexpr expected(unexpected<G>&& u)
      : storage_(std::in_place_index<1>, E(std::move(u).error())) {}

  constexpr auto has_value() const noexcept -> bool { return storage_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr auto value() & -> T& {
    check();
    return std::get<0>(storage_);
  }
  constexpr auto value() const& -> T const& {
    check();
    return std::get<0>(storage_);
  }
  constexpr auto value() && -> T&& {
    check();
    return std::move(std::get<0>(storage_));
  }

  constexpr auto error() & noexcept -> E& { return std::get<1>(storage_); }
  constexpr auto error() const& noexcept -> E const& { return std::get<1>(storage_); }
  constexpr auto error() && noexcept -> E&& { return std::move(std::get<1>(storage_)); }

  constexpr auto operator*() & noexcept -> T& { return std::get<0>(storage_); }
  constexpr auto operator*() const& noexcept -> T const& { return std::get<0>(storage_); }
  constexpr auto operator*() && noexcept -> T&& { return std::move(std::get<0>(storage_)); }

  constexpr auto operator->() noexcept -> T* { return &std::get<0>(storage_); }
  constexpr auto operator->() const noexcept -> T const* { return &std::get<0>(storage_); }

  template <class U>
  constexpr auto value_or(U&& fallback) const& -> T {
    return has_value() ? **this : static_cast<T>(std::forward<U>(fallback));
  }

  template <class U>
  constexpr auto value_or(U&& fallback) && -> T {
    return has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(fallback));
  }

  template <class U>
    requires(!std::is_same_v<std::remove_cvref_t<U>, expected>)
  friend constexpr auto operator==(expected const& x, U const& v) -> bool {
    return x.has_value() && *x == v;
  }

 private:
  constexpr void check() const {
    if (!has_value()) {
      throw bad_expected_access<E>(std::get<1>(storage_));
    }
  }

  std::variant<T, E> storage_;
};

#endif

}  // namespace mockstream
