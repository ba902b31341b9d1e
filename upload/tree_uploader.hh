/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "seastarx.hh"
#include "s3/client.hh"
#include "upload/multipart_uploader.hh"

namespace upload {

class bucket_inaccessible : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class tree_upload_error : public std::runtime_error {
    size_t _failed;
    size_t _total;
public:
    tree_upload_error(size_t failed, size_t total);

    size_t failed() const noexcept { return _failed; }
    size_t total() const noexcept { return _total; }
};

// "bucket/some/prefix" split at the first slash.
struct bucket_path {
    sstring bucket;
    sstring prefix;
};

// Throws configuration_error if there is no bucket name.
bucket_path parse_bucket_path(std::string_view path);

// The object key of a file at relative path rel below the uploaded
// directory: prefix/rel, normalized, with '/' separators and no leading
// "./" or "/".
sstring make_object_key(std::string_view prefix, const std::filesystem::path& rel);

struct file_entry {
    std::filesystem::path path;
    // Relative to the uploaded directory.
    std::filesystem::path relative;
    uint64_t size;
};

// All regular files below root, hidden ones included, sorted by relative path.
future<std::vector<file_entry>> list_files(std::filesystem::path root);

// Uploads a local directory tree to a bucket, file_concurrency files at a time.
class tree_uploader {
    s3::client_ptr _client;
    multipart_uploader _uploader;
public:
    tree_uploader(s3::client_ptr client, upload_config cfg);

    // Fails with bucket_inaccessible before doing anything else if the
    // bucket cannot be reached. Every file is attempted; if some of them
    // failed the result is a tree_upload_error.
    future<> upload_directory(std::filesystem::path source, bucket_path dest);

    future<> upload_file(const file_entry& file, sstring bucket, sstring key);
};

} // namespace upload
