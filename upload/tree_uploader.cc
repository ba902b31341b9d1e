/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <exception>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <functional>
#include <seastar/core/loop.hh>
#include <seastar/util/log.hh>

#include "log.hh"
#include "lister.hh"
#include "s3/aws_error.hh"
#include "upload/tree_uploader.hh"

namespace upload {

static logging::logger tlog("tree_upload");

tree_upload_error::tree_upload_error(size_t failed, size_t total)
    : std::runtime_error(fmt::format("{} of {} files failed to upload", failed, total))
    , _failed(failed)
    , _total(total)
{}

bucket_path parse_bucket_path(std::string_view path) {
    while (path.starts_with('/')) {
        path.remove_prefix(1);
    }
    auto slash = path.find('/');
    bucket_path ret;
    ret.bucket = sstring(path.substr(0, slash));
    if (slash != std::string_view::npos) {
        ret.prefix = sstring(path.substr(slash + 1));
    }
    if (ret.bucket.empty()) {
        throw configuration_error("Missing bucket name");
    }
    return ret;
}

sstring make_object_key(std::string_view prefix, const std::filesystem::path& rel) {
    auto key = (std::filesystem::path(std::string(prefix)) / rel).lexically_normal().generic_string();
    std::string_view k = key;
    for (;;) {
        if (k.starts_with("./")) {
            k.remove_prefix(2);
        } else if (k.starts_with('/')) {
            k.remove_prefix(1);
        } else {
            break;
        }
    }
    return sstring(k);
}

future<std::vector<file_entry>> list_files(std::filesystem::path root) {
    std::vector<file_entry> files;
    co_await lister::scan_tree(root, lister::show_hidden::yes, [&files, &root] (fs::path parent_dir, directory_entry de) -> future<> {
        auto path = parent_dir / de.name.c_str();
        auto size = co_await file_size(path.native());
        files.push_back(file_entry{path, path.lexically_relative(root), size});
    });
    std::ranges::sort(files, std::less<>(), &file_entry::relative);
    co_return files;
}

tree_uploader::tree_uploader(s3::client_ptr client, upload_config cfg)
    : _client(client)
    , _uploader(std::move(client), std::move(cfg))
{}

future<> tree_uploader::upload_file(const file_entry& entry, sstring bucket, sstring key) {
    auto f = co_await open_file_dma(entry.path.native(), open_flags::ro);
    file_input_stream_options opts;
    opts.buffer_size = _uploader.config().read_buffer_size;
    opts.read_ahead = 1;

    std::exception_ptr ex;
    try {
        co_await _uploader.upload_stream(make_file_input_stream(f, opts), std::move(bucket), std::move(key), entry.size);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await f.close();
    if (ex) {
        std::rethrow_exception(ex);
    }
}

future<> tree_uploader::upload_directory(std::filesystem::path source, bucket_path dest) {
    try {
        co_await _client->head_bucket(dest.bucket);
    } catch (const s3::aws_error& e) {
        tlog.debug("head_bucket {}: {}", dest.bucket, e.what());
        log_error_and_throw<bucket_inaccessible>(tlog, "Requested S3 bucket {} cannot be found or accessed", dest.bucket);
    }

    auto files = co_await list_files(source);
    const auto& cfg = _uploader.config();
    tlog.info("Uploading {} files from {} to {}/{}", files.size(), source.native(), dest.bucket, dest.prefix);
    for (const auto& f : files) {
        auto chunks = expected_chunks(f.size, cfg.max_chunk_bytes);
        tlog.info("{}: {} bytes, {} chunks, {} batches", f.relative.native(), f.size, chunks, expected_batches(chunks, cfg.max_concurrent));
    }

    size_t failed = 0;
    co_await max_concurrent_for_each(files, cfg.file_concurrency, [this, &dest, &failed] (const file_entry& f) -> future<> {
        auto key = make_object_key(dest.prefix, f.relative);
        try {
            co_await upload_file(f, dest.bucket, key);
        } catch (...) {
            ++failed;
            tlog.error("Failed to upload {} as {}: {}", f.path.native(), key, std::current_exception());
        }
    });

    if (failed) {
        throw tree_upload_error(failed, files.size());
    }
    tlog.info("Uploaded {} files to {}", files.size(), dest.bucket);
}

} // namespace upload
