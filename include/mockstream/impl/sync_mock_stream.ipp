#include <mockstream/detail/find_subsequence.hpp>
#include <mockstream/sync_mock_stream.hpp>

#include <thread>

namespace mockstream {

inline auto sync_mock_stream::read_some(std::span<std::byte> buf) -> io_result<std::size_t> {
  auto& st = *state_;
  while (st.waiting.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(st.poll_interval);
  }

  std::scoped_lock lk{st.mtx};
  return st.stream.read_some(buf);
}

inline auto sync_mock_stream::write_some(std::span<std::byte const> buf)
  -> io_result<std::size_t> {
  auto& st = *state_;
  std::scoped_lock lk{st.mtx};

  auto r = st.stream.write_some(buf);
  if (!r) {
    return r;
  }

  if (st.waiting.load(std::memory_order_acquire) &&
      detail::find_subsequence(st.stream.peek_bytes_written(), st.expected) != detail::npos) {
    st.waiting.store(false, std::memory_order_release);
  }
  return r;
}

inline auto sync_mock_stream::flush() -> void_result {
  std::scoped_lock lk{state_->mtx};
  return state_->stream.flush();
}

inline void sync_mock_stream::wait_for(std::span<std::byte const> expected_bytes) {
  auto& st = *state_;
  std::scoped_lock lk{st.mtx};
  st.expected.assign(expected_bytes.begin(), expected_bytes.end());
  st.waiting.store(true, std::memory_order_release);
}

inline void sync_mock_stream::push_bytes_to_read(std::span<std::byte const> bytes) {
  std::scoped_lock lk{state_->mtx};
  state_->stream.push_bytes_to_read(bytes);
}

inline auto sync_mock_stream::peek_bytes_written() const -> byte_vector {
  std::scoped_lock lk{state_->mtx};
  auto view = state_->stream.peek_bytes_written();
  return byte_vector(view.begin(), view.end());
}

inline auto sync_mock_stream::pop_bytes_written() -> byte_vector {
  std::scoped_lock lk{state_->mtx};
  return state_->stream.pop_bytes_written();
}

inline auto sync_mock_stream::bytes_available() const -> std::size_t {
  std::scoped_lock lk{state_->mtx};
  return state_->stream.bytes_available();
}

}  // namespace mockstream
