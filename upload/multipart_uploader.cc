/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <exception>
#include <functional>
#include <utility>
#include <seastar/core/coroutine.hh>
#include <seastar/core/print.hh>
#include <seastar/core/when_all.hh>
#include <seastar/util/log.hh>

#include "upload/multipart_uploader.hh"

namespace upload {

static seastar::logger ulog("upload");

uint64_t expected_chunks(uint64_t size_bytes, size_t max_chunk_bytes) noexcept {
    return (size_bytes + max_chunk_bytes - 1) / max_chunk_bytes;
}

uint64_t expected_batches(uint64_t chunks, unsigned max_concurrent) noexcept {
    return (chunks + max_concurrent - 1) / max_concurrent;
}

multipart_uploader::multipart_uploader(s3::client_ptr client, upload_config cfg)
    : _client(std::move(client))
    , _cfg(std::move(cfg))
{
    _cfg.validate();
}

future<> multipart_uploader::upload_stream(input_stream<char> in, sstring bucket, sstring key, std::optional<uint64_t> size_hint) {
    chunk_splitter splitter(std::move(in), _cfg.max_chunk_bytes);
    std::exception_ptr ex;
    try {
        co_await upload(splitter, std::move(bucket), std::move(key), size_hint);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await splitter.close();
    if (ex) {
        std::rethrow_exception(ex);
    }
}

future<> multipart_uploader::upload(chunk_splitter& splitter, sstring bucket, sstring key, std::optional<uint64_t> size_hint) {
    auto first = co_await splitter.next_chunk();
    if (!first) {
        // Empty file: still create the object.
        ulog.info("Uploading file: {} (empty)", key);
        co_await _client->put_object(bucket, key, temporary_buffer<char>());
        ulog.info("Finished uploading file: {}", key);
        co_return;
    }

    std::vector<byte_chunk> chunks;
    chunks.push_back(std::move(*first));
    // A full first chunk may still be the whole object. Look one chunk
    // ahead so that such objects are put in one request, too.
    if (chunks.front().size() == splitter.max_chunk_bytes()) {
        if (auto second = co_await splitter.next_chunk()) {
            chunks.push_back(std::move(*second));
        }
    }

    if (chunks.size() == 1) {
        ulog.info("Uploading file: {}", key);
        co_await _client->put_object(bucket, key, std::move(chunks.front()));
        ulog.info("Finished uploading file: {}", key);
        co_return;
    }

    upload_session session{std::move(bucket), std::move(key), {}, {}};
    co_await multipart_upload(splitter, session, std::move(chunks), size_hint);
}

future<> multipart_uploader::multipart_upload(chunk_splitter& splitter, upload_session& session, std::vector<byte_chunk> first_chunks,
        std::optional<uint64_t> size_hint) {
    unsigned predicted_batches = 0;
    if (size_hint) {
        auto chunks = expected_chunks(*size_hint, splitter.max_chunk_bytes());
        predicted_batches = expected_batches(chunks, _cfg.max_concurrent);
        ulog.info("Uploading file: {} in {} chunks over {} batches", session.key, chunks, predicted_batches);
    } else {
        ulog.info("Uploading file: {} in parts of {} bytes", session.key, splitter.max_chunk_bytes());
    }

    // Nothing exists on the server side yet if this fails.
    session.upload_id = co_await _client->create_multipart_upload(session.bucket, session.key);

    std::exception_ptr ex;
    try {
        co_await upload_parts(splitter, session, std::move(first_chunks), predicted_batches);
        // Batches are drained in dispatch order, so the parts are sorted already.
        std::ranges::sort(session.parts, std::less<>(), &s3::part_result::part_number);
        co_await _client->complete_multipart_upload(session.bucket, session.key, session.upload_id, session.parts);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await abort_upload(session);
        std::rethrow_exception(ex);
    }
    ulog.info("Finished uploading file: {} ({} parts)", session.key, session.parts.size());
}

future<> multipart_uploader::upload_parts(chunk_splitter& splitter, upload_session& session, std::vector<byte_chunk> first_chunks,
        unsigned predicted_batches) {
    auto batch_name = [predicted_batches] (unsigned n) {
        return predicted_batches ? seastar::format("{}/{}", n, predicted_batches) : seastar::format("{}", n);
    };

    std::vector<future<s3::part_result>> batch;
    unsigned part_number = 1;
    unsigned batch_number = 1;
    size_t preread = 0;
    std::exception_ptr ex;
    try {
        for (;;) {
            std::optional<byte_chunk> chunk;
            if (preread < first_chunks.size()) {
                chunk = std::move(first_chunks[preread++]);
            } else {
                chunk = co_await splitter.next_chunk();
            }
            if (!chunk) {
                break;
            }
            // The part number is fixed here, completion order does not matter.
            batch.push_back(upload_part(session, part_number++, std::move(*chunk)));
            if (batch.size() >= _cfg.max_concurrent) {
                ulog.info("{}: Uploading batch {}", session.key, batch_name(batch_number++));
                co_await drain_batch(std::exchange(batch, {}), session);
            }
        }
        if (!batch.empty()) {
            ulog.info("{}: Uploading batch {} (final)", session.key, batch_name(batch_number));
            co_await drain_batch(std::exchange(batch, {}), session);
        }
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        // Reading the stream failed with parts still in flight. They are
        // let to finish, their results are of no use anymore.
        if (!batch.empty()) {
            auto done = co_await when_all(batch.begin(), batch.end());
            for (auto& f : done) {
                f.ignore_ready_future();
            }
        }
        std::rethrow_exception(ex);
    }
}

future<s3::part_result> multipart_uploader::upload_part(const upload_session& session, unsigned part_number, byte_chunk chunk) {
    ulog.trace("{}: part {} ({} bytes)", session.key, part_number, chunk.size());
    auto etag = co_await _client->upload_part(session.bucket, session.key, session.upload_id, part_number, std::move(chunk));
    co_return s3::part_result{part_number, std::move(etag)};
}

// Waits for every part of the batch, not just the first failure, and
// reports the failure of the lowest numbered part.
future<> multipart_uploader::drain_batch(std::vector<future<s3::part_result>> batch, upload_session& session) {
    auto done = co_await when_all(batch.begin(), batch.end());
    std::exception_ptr ex;
    for (auto& f : done) {
        if (f.failed()) {
            auto ep = f.get_exception();
            if (!ex) {
                ex = std::move(ep);
            }
        } else if (ex) {
            f.ignore_ready_future();
        } else {
            session.parts.push_back(co_await std::move(f));
        }
    }
    if (ex) {
        std::rethrow_exception(ex);
    }
}

// Best effort: a failure here must not hide the error that led to the abort.
future<> multipart_uploader::abort_upload(const upload_session& session) noexcept {
    ulog.warn("Aborting upload {} of {}", session.upload_id, session.key);
    try {
        co_await _client->abort_multipart_upload(session.bucket, session.key, session.upload_id);
    } catch (...) {
        ulog.error("Failed to abort upload {} of {}: {}", session.upload_id, session.key, std::current_exception());
    }
}

} // namespace upload
