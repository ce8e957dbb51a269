#include <mockstream/assert.hpp>
#include <mockstream/byte_buffer.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

namespace mockstream {

inline auto byte_buffer::read_some(std::span<std::byte> buf) -> io_result<std::size_t> {
  MOCKSTREAM_ASSERT(position_ <= read_data_.size());

  auto const n = std::min(buf.size(), read_data_.size() - position_);
  if (n != 0) {
    std::memcpy(buf.data(), read_data_.data() + position_, n);
    position_ += n;
  }
  return n;
}

inline auto byte_buffer::write_some(std::span<std::byte const> buf) -> io_result<std::size_t> {
  written_.insert(written_.end(), buf.begin(), buf.end());
  return buf.size();
}

inline void byte_buffer::push_bytes_to_read(std::span<std::byte const> bytes) {
  if (position_ == read_data_.size()) {
    read_data_.clear();
    position_ = 0;
  }
  read_data_.insert(read_data_.end(), bytes.begin(), bytes.end());
}

inline auto byte_buffer::pop_bytes_written() -> byte_vector {
  return std::exchange(written_, byte_vector{});
}

}  // namespace mockstream
