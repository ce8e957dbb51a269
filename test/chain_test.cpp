#include <gtest/gtest.h>

#include <mockstream/chain.hpp>
#include <mockstream/failing_mock_stream.hpp>
#include <mockstream/impl.hpp>
#include <mockstream/io/read.hpp>
#include <mockstream/mock_stream.hpp>
#include <mockstream/shared_mock_stream.hpp>

#include "test_util.hpp"

#include <array>
#include <cstddef>
#include <span>

namespace mockstream::test {

namespace {

/// Counts bytes until end-of-data, tolerating up to `retries` failed reads.
class count_io {
 public:
  template <read_stream Stream>
  auto read_data(Stream& r, int retries) -> std::size_t {
    std::size_t count = 0;
    for (;;) {
      std::array<std::byte, 5> buffer{};
      auto n = r.read_some(buffer);
      if (!n) {
        if (retries == 0) {
          break;
        }
        --retries;
        continue;
      }
      if (*n == 0) {
        break;
      }
      count += *n;
    }
    return count;
  }
};

auto mock_with(std::string_view data) -> mock_stream {
  mock_stream s;
  s.push_bytes_to_read(data);
  return s;
}

}  // namespace

static_assert(read_stream<chained_stream<mock_stream, failing_mock_stream>>);

TEST(chain_test, retry_loop_tolerates_injected_failures) {
  auto c = chain(chain(mock_with("1234"), failing_mock_stream{error::other, "Failing", 3}),
                 mock_with("5678"));

  count_io sut;
  EXPECT_EQ(sut.read_data(c, 3), 8u);
}

TEST(chain_test, too_few_retries_stops_early) {
  auto c = chain(chain(mock_with("1234"), failing_mock_stream{error::other, "Failing", 3}),
                 mock_with("5678"));

  count_io sut;
  EXPECT_EQ(sut.read_data(c, 2), 4u);
}

TEST(chain_test, infinite_failure_after_data) {
  auto c = chain(mock_with("abcd"), failing_mock_stream{error::other, "Failing", -1});

  std::array<std::byte, 8> v{};
  auto r = c.read_some(v);
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, 4u);
  EXPECT_FALSE(c.first_done());

  auto e1 = c.read_some(v);
  ASSERT_FALSE(e1);
  EXPECT_EQ(e1.error(), error::other);
  EXPECT_TRUE(c.first_done());

  auto e2 = c.read_some(v);
  ASSERT_FALSE(e2);
  EXPECT_EQ(e2.error(), error::other);
}

TEST(chain_test, read_exact_retries_interruptions_across_links) {
  auto c = chain(chain(mock_with("abcd"), failing_mock_stream{error::interrupted, "Interrupted", 5}),
                 mock_with("ABCD"));

  std::array<std::byte, 8> v{};
  auto r = io::read(c, v);
  ASSERT_TRUE(r);
  EXPECT_EQ(str(v), "abcdABCD");

  auto tail = c.read_some(v);
  ASSERT_TRUE(tail);
  EXPECT_EQ(*tail, 0u);
}

TEST(chain_test, error_in_first_stream_does_not_advance) {
  auto c = chain(failing_mock_stream{error::broken_pipe, "down", 2}, mock_with("later"));

  std::array<std::byte, 8> v{};
  EXPECT_FALSE(c.read_some(v));
  EXPECT_FALSE(c.read_some(v));
  EXPECT_EQ(c.first().remaining_failures(), 0);

  auto r = c.read_some(v);
  ASSERT_TRUE(r);
  EXPECT_EQ(str(std::span<std::byte const>(v.data(), *r)), "later");
}

TEST(chain_test, empty_buffer_does_not_exhaust_first_stream) {
  auto c = chain(mock_with("xy"), mock_with("z"));

  auto r0 = c.read_some(std::span<std::byte>{});
  ASSERT_TRUE(r0);
  EXPECT_EQ(*r0, 0u);
  EXPECT_FALSE(c.first_done());

  byte_vector all;
  ASSERT_TRUE(io::read_to_end(c, all));
  EXPECT_EQ(str(all), "xyz");
}

TEST(chain_test, shared_handles_keep_outside_access) {
  shared_mock_stream head;
  shared_mock_stream tail;
  auto c = chain(head, tail);

  head.push_bytes_to_read("one ");
  tail.push_bytes_to_read("two");

  byte_vector all;
  ASSERT_TRUE(io::read_to_end(c, all));
  EXPECT_EQ(str(all), "one two");

  // The head is exhausted for good; new data in it is not seen by the chain.
  head.push_bytes_to_read("ignored");
  tail.push_bytes_to_read(" three");
  all.clear();
  ASSERT_TRUE(io::read_to_end(c, all));
  EXPECT_EQ(str(all), " three");
}

}  // namespace mockstream::test
