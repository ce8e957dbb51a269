#include <mockstream/failing_mock_stream.hpp>

namespace mockstream {

inline auto failing_mock_stream::fail_once() -> io_result<std::size_t> {
  if (repeat_count_ == 0) {
    return std::size_t{0};
  }
  if (repeat_count_ > 0) {
    --repeat_count_;
  }
  return unexpected(io_error{kind_, message_});
}

}  // namespace mockstream
