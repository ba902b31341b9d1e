/*
 * Copyright (C) 2014-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <filesystem>
#include <iostream>
#include <optional>
#include <boost/program_options.hpp>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/util/file.hh>
#include <seastar/util/log.hh>

#include "log.hh"
#include "seastarx.hh"
#include "s3/client.hh"
#include "upload/tree_uploader.hh"
#include "upload/upload_config.hh"

namespace bpo = boost::program_options;

static logging::logger startlog("s3push");

static future<upload::s3push_config>
read_config(const bpo::variables_map& opts) {
    if (!opts.contains("config-file")) {
        co_return upload::s3push_config{};
    }
    auto file = opts["config-file"].as<sstring>();
    sstring contents;
    try {
        contents = co_await util::read_entire_file_contiguous(std::filesystem::path(file));
    } catch (...) {
        startlog.error("Could not read configuration file {}: {}", file, std::current_exception());
        throw;
    }
    co_return upload::parse_config(contents);
}

template <typename T>
static std::optional<T> get_option(const bpo::variables_map& opts, const char* name) {
    if (opts.contains(name)) {
        return opts[name].as<T>();
    }
    return std::nullopt;
}

static upload::config_overrides command_line_overrides(const bpo::variables_map& opts) {
    upload::config_overrides o;
    o.region = get_option<std::string>(opts, "region");
    o.host = get_option<std::string>(opts, "endpoint");
    o.port = get_option<unsigned>(opts, "port");
    o.max_chunk_bytes = get_option<size_t>(opts, "max-chunk-bytes");
    o.max_concurrent = get_option<unsigned>(opts, "max-concurrent");
    o.file_concurrency = get_option<unsigned>(opts, "file-concurrency");
    return o;
}

static future<int> run(const bpo::variables_map& opts) {
    auto cfg = co_await read_config(opts);
    upload::resolve_config(cfg, command_line_overrides(opts));
    if (cfg.upload.max_chunk_bytes < upload::aws_minimum_part_size) {
        startlog.warn("max_chunk_bytes {} is below the S3 minimum part size of {}, multipart uploads will be rejected",
                cfg.upload.max_chunk_bytes, upload::aws_minimum_part_size);
    }

    auto dest = upload::parse_bucket_path(opts["bucket-path"].as<sstring>());
    auto source = std::filesystem::path(opts["source"].as<sstring>());
    startlog.info("endpoint: {}, {}", cfg.endpoint, cfg.upload);

    auto factory = s3::make_basic_connection_factory(cfg.endpoint.host, cfg.endpoint.port);
    auto client = s3::make_client(std::move(factory), cfg.endpoint);
    std::exception_ptr ex;
    try {
        upload::tree_uploader uploader(client, cfg.upload);
        co_await uploader.upload_directory(std::move(source), std::move(dest));
    } catch (...) {
        ex = std::current_exception();
    }
    co_await client->close();
    if (ex) {
        std::rethrow_exception(ex);
    }
    co_return 0;
}

int main(int ac, char** av) {
    app_template::config app_cfg;
    app_cfg.name = "s3push";
    app_cfg.description =
R"(s3push - upload a local directory tree to an S3 bucket

Usage: s3push [options] <bucket[/prefix]>

Credentials and region are taken from the configuration file and the
AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN and
AWS_DEFAULT_REGION environment variables.
)";
    app_cfg.auto_handle_sigint_sigterm = true;
    app_template app(std::move(app_cfg));

    auto init = app.get_options_description().add_options();
    init("source", bpo::value<sstring>()->default_value("."), "directory to upload");
    init("region", bpo::value<std::string>(), "AWS region, overrides AWS_DEFAULT_REGION");
    init("endpoint", bpo::value<std::string>(), "S3 host name (default: s3.<region>.amazonaws.com)");
    init("port", bpo::value<unsigned>(), "S3 port (default: 80)");
    init("max-chunk-bytes", bpo::value<size_t>(), "files larger than this are uploaded in parts of this size");
    init("max-concurrent", bpo::value<unsigned>(), "parts of a file uploaded at once");
    init("file-concurrency", bpo::value<unsigned>(), "files uploaded at once");
    init("config-file", bpo::value<sstring>(), "YAML configuration file");
    app.add_positional_options({
        { "bucket-path", bpo::value<sstring>()->required(), "destination bucket, optionally followed by /prefix", 1 },
    });

    return app.run(ac, av, [&app] () -> future<int> {
        const auto& opts = app.configuration();
        try {
            co_return co_await run(opts);
        } catch (...) {
            startlog.error("Upload failed: {}", std::current_exception());
        }
        co_return 1;
    });
}
