/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <seastar/core/circular_buffer.hh>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>

#include "seastarx.hh"

namespace upload {

// Never empty, at most max_chunk_bytes long.
using byte_chunk = temporary_buffer<char>;

// Carves a byte stream into chunks of exactly max_chunk_bytes, except for
// the last one which may be shorter.
//
// Chunks are pulled one at a time with next_chunk(). The stream is read only
// from inside next_chunk(), and never past the end of the chunk being
// built, so nothing is buffered here between chunks.
//
// The splitter owns the stream. It is closed as soon as the end of data is
// seen; close() must be called (and waited for) before destroying a
// splitter that was not read to the end.
class chunk_splitter {
    input_stream<char> _in;
    size_t _max_chunk_bytes;
    // Bytes read for the chunk being built.
    circular_buffer<temporary_buffer<char>> _pending;
    size_t _pending_bytes = 0;
    // End of data was seen and everything was emitted.
    bool _closed = false;
    bool _stream_closed = false;
    uint64_t _emitted_bytes = 0;
private:
    byte_chunk take(size_t n);
public:
    chunk_splitter(input_stream<char> in, size_t max_chunk_bytes);

    // Resolves to the next chunk, or to std::nullopt once the stream is
    // exhausted. Stream errors are propagated and leave the splitter open.
    future<std::optional<byte_chunk>> next_chunk();

    future<> close();

    size_t max_chunk_bytes() const noexcept {
        return _max_chunk_bytes;
    }

    bool exhausted() const noexcept {
        return _closed;
    }

    uint64_t emitted_bytes() const noexcept {
        return _emitted_bytes;
    }

    // Bytes read from the stream that are not part of an emitted chunk yet.
    size_t buffered_bytes() const noexcept {
        return _pending_bytes;
    }
};

} // namespace upload
