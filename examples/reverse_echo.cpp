// reverse_echo.cpp
//
// Purpose:
//   Drive one piece of protocol code through three transports:
//   - a shared_mock_stream in the same thread
//   - a sync_mock_stream with a client on a worker thread, using wait_for so
//     the reply only becomes readable once the request has been written
//   - a connected fd_stream pair
//
// The service under test reads newline-terminated lines and writes each one
// back reversed, until end-of-data.

#include <mockstream/impl.hpp>
#include <mockstream/mockstream.hpp>

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace {

template <mockstream::stream Stream>
auto reverse_lines(Stream& s) -> mockstream::void_result {
  mockstream::byte_vector pending;
  for (;;) {
    auto n = mockstream::io::read_until(s, pending, "\n", 4096);
    if (!n) {
      if (n.error() == mockstream::error::eof && pending.empty()) {
        return mockstream::ok();
      }
      return mockstream::fail(std::move(n).error());
    }

    auto const line_len = *n - 1;
    std::reverse(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(line_len));
    if (auto w = mockstream::io::write(s, std::span<std::byte const>(pending).first(*n)); !w) {
      return mockstream::fail(std::move(w).error());
    }
    pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(*n));

    if (auto f = s.flush(); !f) {
      return f;
    }
  }
}

template <mockstream::stream Stream>
auto transact(Stream& s, std::string_view request) -> mockstream::io_result<std::string> {
  if (auto w = mockstream::io::write(s, mockstream::as_bytes(request)); !w) {
    return mockstream::unexpected(std::move(w).error());
  }
  mockstream::byte_vector reply;
  auto n = mockstream::io::read_until(s, reply, "\n", 4096);
  if (!n) {
    return mockstream::unexpected(std::move(n).error());
  }
  return mockstream::to_string(std::span<std::byte const>(reply).first(*n));
}

void report(char const* name, mockstream::void_result const& r, std::string const& output) {
  if (!r) {
    std::cerr << name << ": " << r.error().message() << "\n";
    return;
  }
  std::cout << name << ": " << output;
}

}  // namespace

auto main() -> int {
  {
    mockstream::shared_mock_stream probe;
    auto service = probe;
    probe.push_bytes_to_read("hello\nworld\n");
    auto r = reverse_lines(service);
    report("shared", r, mockstream::to_string(probe.pop_bytes_written()));
  }

  {
    mockstream::sync_mock_stream probe;
    auto client = probe;

    // The reply is queued up front; the client's reads stay blocked until "ping\n" is written.
    probe.push_bytes_to_read("pong\n");
    probe.wait_for("ping\n");

    mockstream::io_result<std::string> reply = std::string{};
    std::thread worker([&] { reply = transact(client, "ping\n"); });
    worker.join();

    if (!reply) {
      std::cerr << "sync: " << reply.error().message() << "\n";
    } else {
      std::cout << "sync: sent " << mockstream::to_string(probe.pop_bytes_written())
                << "sync: got " << *reply;
    }
  }

  {
    auto p = mockstream::fd_stream::pair();
    if (!p) {
      std::cerr << "socketpair: " << p.error().message() << "\n";
      return 1;
    }
    auto& client = p->first;
    auto& server = p->second;

    mockstream::void_result r;
    std::thread worker([&] { r = reverse_lines(server); });

    std::string output;
    if (mockstream::io::write(client, mockstream::as_bytes("socket\n")) &&
        client.shutdown_write()) {
      mockstream::byte_vector echoed;
      if (mockstream::io::read_to_end(client, echoed)) {
        output = mockstream::to_string(echoed);
      }
    }
    worker.join();
    report("fd", r, output);
  }

  return 0;
}
