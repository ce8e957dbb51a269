#pragma once

// Out-of-line definitions. Include from the translation units that use the library (every
// definition is `inline`, so any number of units may include it).

#include <mockstream/impl/assert.ipp>
#include <mockstream/impl/error.ipp>

#include <mockstream/impl/byte_buffer.ipp>
#include <mockstream/impl/failing_mock_stream.ipp>
#include <mockstream/impl/sync_mock_stream.ipp>

#include <mockstream/impl/fd_stream.ipp>
