/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

#include "upload/chunk_splitter.hh"

namespace upload {

static seastar::logger splog("chunk_splitter");

chunk_splitter::chunk_splitter(input_stream<char> in, size_t max_chunk_bytes)
    : _in(std::move(in))
    , _max_chunk_bytes(max_chunk_bytes)
{
    if (_max_chunk_bytes == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

// Moves the first n pending bytes into a chunk.
// Precondition: 0 < n <= _pending_bytes
byte_chunk chunk_splitter::take(size_t n) {
    _pending_bytes -= n;
    _emitted_bytes += n;

    auto& front = _pending.front();
    if (front.size() >= n) {
        auto chunk = front.share(0, n);
        front.trim_front(n);
        if (front.empty()) {
            _pending.pop_front();
        }
        return chunk;
    }

    byte_chunk chunk(n);
    size_t pos = 0;
    while (pos < n) {
        auto& buf = _pending.front();
        auto len = std::min(buf.size(), n - pos);
        std::copy_n(buf.get(), len, chunk.get_write() + pos);
        pos += len;
        if (len == buf.size()) {
            _pending.pop_front();
        } else {
            // Split inside this buffer: the tail stays for the next chunk.
            buf.trim_front(len);
        }
    }
    return chunk;
}

future<std::optional<byte_chunk>> chunk_splitter::next_chunk() {
    if (_closed) {
        co_return std::nullopt;
    }
    while (_pending_bytes < _max_chunk_bytes) {
        // Never read past the current chunk: whatever the stream holds
        // beyond it stays there.
        auto buf = co_await _in.read_up_to(_max_chunk_bytes - _pending_bytes);
        if (buf.empty()) {
            co_await close();
            _closed = true;
            if (_pending_bytes == 0) {
                splog.trace("end of data after {} bytes", _emitted_bytes);
                co_return std::nullopt;
            }
            splog.trace("final chunk of {} bytes", _pending_bytes);
            co_return take(_pending_bytes);
        }
        _pending_bytes += buf.size();
        _pending.push_back(std::move(buf));
    }
    co_return take(_max_chunk_bytes);
}

future<> chunk_splitter::close() {
    if (!_stream_closed) {
        _stream_closed = true;
        co_await _in.close();
    }
}

} // namespace upload
