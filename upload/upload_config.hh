/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>

#include "s3/creds.hh"

namespace upload {

class configuration_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// "Each part must be at least 5 MB in size, except the last part."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
constexpr size_t aws_minimum_part_size = 5 * 1024 * 1024;

struct upload_config {
    // Files larger than this are uploaded in parts of this size.
    size_t max_chunk_bytes = 18'000'000;
    // Parts of one object uploaded at once.
    unsigned max_concurrent = 10;
    // Files of a tree uploaded at once.
    unsigned file_concurrency = 32;
    size_t read_buffer_size = 256 * 1024;

    // Throws configuration_error.
    void validate() const;
};

struct s3push_config {
    s3::endpoint_config endpoint;
    upload_config upload;
};

// Parses the YAML configuration file contents: an `endpoints:` list
// (the first entry is used) and an `upload:` map.
s3push_config parse_config(std::string_view yaml);

// Settings given on the command line.
struct config_overrides {
    std::optional<std::string> region;
    std::optional<std::string> host;
    std::optional<unsigned> port;
    std::optional<size_t> max_chunk_bytes;
    std::optional<unsigned> max_concurrent;
    std::optional<unsigned> file_concurrency;
};

// Fills the default host and checks that everything needed to talk to S3
// is present.
void finalize_endpoint(s3::endpoint_config& ep);

// Layers the environment and then the overrides on top of cfg (as read
// from the configuration file), finalizes the endpoint and validates the
// upload settings.
void resolve_config(s3push_config& cfg, const config_overrides& overrides);

} // namespace upload

template <>
struct fmt::formatter<upload::upload_config> : fmt::formatter<std::string_view> {
    auto format(const upload::upload_config&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
