#pragma once

// Compile-time configuration.
//
// Every macro below may be defined by the build (e.g. `-DMOCKSTREAM_SYNC_POLL_INTERVAL_MS=1`)
// before any mockstream header is included.

/// Default polling interval, in milliseconds, used by `sync_mock_stream::read_some` while a
/// `wait_for` pattern is pending.
#ifndef MOCKSTREAM_SYNC_POLL_INTERVAL_MS
#define MOCKSTREAM_SYNC_POLL_INTERVAL_MS 10
#endif

/// Scratch chunk size used by `io::read_to_end`.
#ifndef MOCKSTREAM_READ_TO_END_CHUNK
#define MOCKSTREAM_READ_TO_END_CHUNK 4096
#endif

static_assert(MOCKSTREAM_SYNC_POLL_INTERVAL_MS > 0, "poll interval must be positive");
static_assert(MOCKSTREAM_READ_TO_END_CHUNK > 0, "read_to_end chunk must be positive");
