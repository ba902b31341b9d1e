/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>

#include "seastarx.hh"
#include "s3/client.hh"
#include "upload/chunk_splitter.hh"
#include "upload/upload_config.hh"

namespace upload {

// One in-progress multipart upload.
struct upload_session {
    sstring bucket;
    sstring key;
    sstring upload_id;
    // Completed parts, in part number order.
    std::vector<s3::part_result> parts;
};

// Uploads objects whose data comes from a chunk_splitter.
//
// An object that fits into one chunk is put with a single request. Larger
// objects are uploaded in parts of max_chunk_bytes, max_concurrent parts at
// a time: a batch of parts is dispatched, then waited for as a whole before
// the next chunks are read. At most max(max_concurrent, 2) chunks are held in
// memory: telling a one-chunk object from a larger one takes reading the
// second chunk, which then waits while the first batch is uploaded.
//
// If anything fails after the multipart upload was created, the upload is
// aborted and the original error is propagated.
//
// Can be used for many objects concurrently.
class multipart_uploader {
    s3::client_ptr _client;
    upload_config _cfg;
private:
    future<> multipart_upload(chunk_splitter& splitter, upload_session& session, std::vector<byte_chunk> first_chunks,
            std::optional<uint64_t> size_hint);
    future<> upload_parts(chunk_splitter& splitter, upload_session& session, std::vector<byte_chunk> first_chunks,
            unsigned predicted_batches);
    future<s3::part_result> upload_part(const upload_session& session, unsigned part_number, byte_chunk chunk);
    future<> drain_batch(std::vector<future<s3::part_result>> batch, upload_session& session);
    future<> abort_upload(const upload_session& session) noexcept;
public:
    multipart_uploader(s3::client_ptr client, upload_config cfg);

    const upload_config& config() const noexcept {
        return _cfg;
    }

    // Uploads everything the splitter produces as bucket/key.
    // size_hint, when known, is only used for progress reporting.
    future<> upload(chunk_splitter& splitter, sstring bucket, sstring key, std::optional<uint64_t> size_hint = std::nullopt);

    // Splits the stream into chunks of max_chunk_bytes and uploads it.
    // The stream is closed in all cases.
    future<> upload_stream(input_stream<char> in, sstring bucket, sstring key, std::optional<uint64_t> size_hint = std::nullopt);
};

// Number of chunks a size_bytes object is split into, 0 for an empty one.
uint64_t expected_chunks(uint64_t size_bytes, size_t max_chunk_bytes) noexcept;

// Number of batches needed to upload the chunks, max_concurrent at a time.
uint64_t expected_batches(uint64_t chunks, unsigned max_concurrent) noexcept;

} // namespace upload
