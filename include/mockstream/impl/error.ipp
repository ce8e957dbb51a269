#include <mockstream/error.hpp>

namespace mockstream {

namespace detail {

class error_category_impl : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "mockstream"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<error>(ev)) {
      // Stream outcomes
      case error::eof:
        return "end of file";
      case error::write_zero:
        return "write zero";
      case error::broken_pipe:
        return "broken pipe";
      case error::connection_reset:
        return "connection reset";
      case error::connection_aborted:
        return "connection aborted";

      // Transient
      case error::interrupted:
        return "interrupted";
      case error::would_block:
        return "operation would block";
      case error::timed_out:
        return "timed out";

      // Object state / input
      case error::permission_denied:
        return "permission denied";
      case error::not_open:
        return "resource not open";
      case error::invalid_argument:
        return "invalid argument";
      case error::message_size:
        return "message size";

      case error::other:
        return "other error";
      default:
        return "unknown error";
    }
  }
};

inline auto error_category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

inline auto make_error_code(error e) -> std::error_code {
  return {static_cast<int>(e), detail::error_category()};
}

}  // namespace mockstream
