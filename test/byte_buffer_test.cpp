#include <gtest/gtest.h>

#include <mockstream/byte_buffer.hpp>
#include <mockstream/impl.hpp>

#include "test_util.hpp"

#include <array>
#include <cstddef>
#include <span>

namespace mockstream::test {

TEST(byte_buffer_test, empty_buffer_reads_zero) {
  byte_buffer b;
  std::array<std::byte, 8> out{};
  auto r = b.read_some(out);
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, 0u);
  EXPECT_EQ(b.bytes_available(), 0u);
}

TEST(byte_buffer_test, read_returns_pushed_bytes_then_zero) {
  byte_buffer b;
  auto const data = bytes({1, 2, 3, 4, 5});
  b.push_bytes_to_read(data);

  std::array<std::byte, 16> out{};
  auto r = b.read_some(out);
  ASSERT_TRUE(r);
  ASSERT_EQ(*r, data.size());
  EXPECT_EQ(byte_vector(out.begin(), out.begin() + 5), data);

  auto again = b.read_some(out);
  ASSERT_TRUE(again);
  EXPECT_EQ(*again, 0u);
}

TEST(byte_buffer_test, partial_reads_advance_position) {
  byte_buffer b;
  b.push_bytes_to_read(as_bytes("abcdefg"));

  std::array<std::byte, 3> out{};
  byte_vector collected;
  for (;;) {
    auto r = b.read_some(out);
    ASSERT_TRUE(r);
    if (*r == 0) {
      break;
    }
    EXPECT_LE(*r, out.size());
    collected.insert(collected.end(), out.begin(), out.begin() + static_cast<std::ptrdiff_t>(*r));
  }
  EXPECT_EQ(str(collected), "abcdefg");
  EXPECT_EQ(b.position(), 7u);
}

TEST(byte_buffer_test, empty_destination_reads_nothing) {
  byte_buffer b;
  b.push_bytes_to_read(as_bytes("xy"));
  auto r = b.read_some(std::span<std::byte>{});
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, 0u);
  EXPECT_EQ(b.bytes_available(), 2u);
}

TEST(byte_buffer_test, push_after_full_consumption_resets_cursor) {
  byte_buffer b;
  b.push_bytes_to_read(as_bytes("abcd"));
  std::array<std::byte, 4> out{};
  ASSERT_TRUE(b.read_some(out));
  EXPECT_EQ(b.position(), 4u);

  b.push_bytes_to_read(as_bytes("ef"));
  EXPECT_EQ(b.position(), 0u);
  EXPECT_EQ(b.bytes_available(), 2u);

  auto r = b.read_some(out);
  ASSERT_TRUE(r);
  ASSERT_EQ(*r, 2u);
  EXPECT_EQ(str(std::span<std::byte const>(out.data(), 2)), "ef");
}

TEST(byte_buffer_test, push_with_unread_data_appends) {
  byte_buffer b;
  b.push_bytes_to_read(as_bytes("abcd"));
  std::array<std::byte, 2> out{};
  ASSERT_TRUE(b.read_some(out));

  b.push_bytes_to_read(as_bytes("ef"));
  EXPECT_EQ(b.position(), 2u);
  EXPECT_EQ(b.bytes_available(), 4u);

  std::array<std::byte, 8> rest{};
  auto r = b.read_some(rest);
  ASSERT_TRUE(r);
  EXPECT_EQ(str(std::span<std::byte const>(rest.data(), *r)), "cdef");
}

TEST(byte_buffer_test, write_accumulates_and_pop_drains) {
  byte_buffer b;
  auto w1 = b.write_some(as_bytes("ab"));
  auto w2 = b.write_some(as_bytes("cd"));
  ASSERT_TRUE(w1);
  ASSERT_TRUE(w2);
  EXPECT_EQ(*w1, 2u);
  EXPECT_EQ(*w2, 2u);

  EXPECT_EQ(str(b.peek_bytes_written()), "abcd");
  EXPECT_EQ(str(b.pop_bytes_written()), "abcd");
  EXPECT_TRUE(b.pop_bytes_written().empty());
  EXPECT_TRUE(b.peek_bytes_written().empty());
}

TEST(byte_buffer_test, read_and_write_sides_are_independent) {
  byte_buffer b;
  b.push_bytes_to_read(as_bytes("in"));
  ASSERT_TRUE(b.write_some(as_bytes("out")));

  std::array<std::byte, 8> out{};
  auto r = b.read_some(out);
  ASSERT_TRUE(r);
  EXPECT_EQ(str(std::span<std::byte const>(out.data(), *r)), "in");
  EXPECT_EQ(str(b.pop_bytes_written()), "out");
}

TEST(byte_buffer_test, flush_always_succeeds) {
  byte_buffer b;
  EXPECT_TRUE(b.flush());
  ASSERT_TRUE(b.write_some(as_bytes("x")));
  EXPECT_TRUE(b.flush());
  EXPECT_EQ(str(b.peek_bytes_written()), "x");
}

}  // namespace mockstream::test
