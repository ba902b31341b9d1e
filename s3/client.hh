/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string_view>
#include <vector>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include "s3/connection.hh"
#include "s3/creds.hh"

namespace s3 {

using namespace seastar;

// One uploaded part of a multipart upload, as CompleteMultipartUpload wants it.
struct part_result {
    unsigned part_number;
    sstring etag;

    bool operator==(const part_result&) const = default;
};

// S3 API client.
// Methods can be invoked concurrently.
// Bucket and key arguments do not have to outlive the calls.
// Failures are reported as exceptional futures, aws_error for non-2xx answers.
class client {
public:
    virtual ~client() = default;

    // Checks that the bucket exists and is accessible with our credentials.
    virtual future<> head_bucket(const sstring& bucket) = 0;

    // Uploads the whole object in one request. The body may be empty.
    virtual future<> put_object(const sstring& bucket, const sstring& key, temporary_buffer<char> body) = 0;

    // CreateMultipartUpload. Resolves to the upload id.
    virtual future<sstring> create_multipart_upload(const sstring& bucket, const sstring& key) = 0;

    // UploadPart. Resolves to the part's ETag, verbatim.
    virtual future<sstring> upload_part(const sstring& bucket, const sstring& key, const sstring& upload_id,
            unsigned part_number, temporary_buffer<char> body) = 0;

    // CompleteMultipartUpload. The parts must be sorted by part number.
    virtual future<> complete_multipart_upload(const sstring& bucket, const sstring& key, const sstring& upload_id,
            const std::vector<part_result>& parts) = 0;

    // AbortMultipartUpload.
    virtual future<> abort_multipart_upload(const sstring& bucket, const sstring& key, const sstring& upload_id) = 0;

    // Reads the whole object.
    virtual future<temporary_buffer<char>> get_object(const sstring& bucket, const sstring& key) = 0;

    // Removes the object.
    virtual future<> delete_object(const sstring& bucket, const sstring& key) = 0;

    // Releases pooled connections. No calls may be in progress.
    virtual future<> close() = 0;
};

using client_ptr = seastar::shared_ptr<client>;

client_ptr make_client(connection_factory_ptr, endpoint_config);

// Path-style request target: /bucket/key, with the key uri-encoded.
sstring object_path(std::string_view bucket, std::string_view key);

// Content type to announce for the key, empty if none.
std::string_view content_type_for(std::string_view key);

// The CompleteMultipartUpload request document.
sstring complete_multipart_upload_body(const std::vector<part_result>& parts);

} // namespace s3
