#pragma once

// Primary public header for the mockstream test-double library.
// Most users should include this header only (plus <mockstream/impl.hpp> once).

// Error & result model
#include <mockstream/error.hpp>
#include <mockstream/expected.hpp>
#include <mockstream/result.hpp>

// Stream contract & helpers
#include <mockstream/bytes.hpp>
#include <mockstream/stream_concepts.hpp>

// Mock streams
#include <mockstream/byte_buffer.hpp>
#include <mockstream/failing_mock_stream.hpp>
#include <mockstream/mock_stream.hpp>
#include <mockstream/shared_mock_stream.hpp>
#include <mockstream/sync_mock_stream.hpp>

// Composition
#include <mockstream/chain.hpp>
#include <mockstream/io/read.hpp>
#include <mockstream/io/read_until.hpp>
#include <mockstream/io/write.hpp>
#include <mockstream/stream_buf.hpp>

// Real transport
#include <mockstream/fd_stream.hpp>
#include <mockstream/net_stream.hpp>
