#include <gtest/gtest.h>

#include <mockstream/chain.hpp>
#include <mockstream/failing_mock_stream.hpp>
#include <mockstream/impl.hpp>
#include <mockstream/mock_stream.hpp>
#include <mockstream/stream_buf.hpp>

#include "test_util.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace mockstream::test {

TEST(stream_buf_test, istream_reads_lines) {
  mock_stream s;
  s.push_bytes_to_read("abcd\r\ndcba\r\n");

  stream_buf<mock_stream> sb{s};
  std::istream in{&sb};

  std::string line;
  ASSERT_TRUE(std::getline(in, line));
  EXPECT_EQ(line, "abcd\r");
  ASSERT_TRUE(std::getline(in, line));
  EXPECT_EQ(line, "dcba\r");
  EXPECT_FALSE(std::getline(in, line));
  EXPECT_TRUE(in.eof());
  EXPECT_FALSE(sb.last_error());
}

TEST(stream_buf_test, small_buffer_refills) {
  mock_stream s;
  s.push_bytes_to_read("hello stream_buf");

  stream_buf<mock_stream> sb{s, 3};
  std::istream in{&sb};

  std::string a;
  std::string b;
  in >> a >> b;
  EXPECT_EQ(a, "hello");
  EXPECT_EQ(b, "stream_buf");
}

TEST(stream_buf_test, ostream_writes_are_visible_immediately) {
  mock_stream s;
  stream_buf<mock_stream> sb{s};
  std::ostream out{&sb};

  out << "x=" << 42 << '\n';
  EXPECT_TRUE(out.good());
  EXPECT_EQ(str(s.pop_bytes_written()), "x=42\n");

  out << "tail" << std::flush;
  EXPECT_TRUE(out.good());
  EXPECT_EQ(str(s.pop_bytes_written()), "tail");
}

TEST(stream_buf_test, read_error_sets_failbit_and_last_error) {
  failing_mock_stream s{error::connection_aborted, "aborted by test", 1};
  stream_buf<failing_mock_stream> sb{s};
  std::istream in{&sb};

  std::string line;
  EXPECT_FALSE(std::getline(in, line));
  EXPECT_EQ(sb.last_error(), error::connection_aborted);
  EXPECT_EQ(sb.last_error().message(), "aborted by test");
}

TEST(stream_buf_test, write_error_sets_badbit_and_last_error) {
  failing_mock_stream s{error::broken_pipe, "peer went away", -1};
  stream_buf<failing_mock_stream> sb{s};
  std::ostream out{&sb};

  out << "data";
  EXPECT_TRUE(out.bad());
  EXPECT_EQ(sb.last_error(), error::broken_pipe);
}

TEST(stream_buf_test, interrupted_reads_are_retried) {
  mock_stream tail;
  tail.push_bytes_to_read("42\n");
  auto c = chain(failing_mock_stream{error::interrupted, "EINTR", 3}, tail);

  stream_buf<decltype(c)> sb{c};
  std::istream in{&sb};

  int v = 0;
  in >> v;
  EXPECT_EQ(v, 42);
  EXPECT_FALSE(sb.last_error());
}

TEST(stream_buf_test, puts_on_read_only_stream_fail) {
  auto c = chain(mock_stream{}, mock_stream{});
  stream_buf<decltype(c)> sb{c};
  std::ostream out{&sb};

  out << "nope";
  EXPECT_TRUE(out.bad());
  EXPECT_EQ(sb.last_error(), error::invalid_argument);
}

}  // namespace mockstream::test
