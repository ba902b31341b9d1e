/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string>
#include <fmt/core.h>

namespace YAML {
    class Node;
}

namespace s3 {

struct aws_credentials {
    std::string access_key_id;
    std::string secret_access_key;
    // Only set for temporary (STS) credentials.
    std::string session_token;

    bool empty() const noexcept {
        return access_key_id.empty() || secret_access_key.empty();
    }
};

struct endpoint_config {
    std::string host;
    unsigned port = 80;
    std::string region;
    aws_credentials creds;

    // The public AWS endpoint for the configured region.
    std::string default_host() const;

    // Decodes one entry of the `endpoints:` list. Missing keys keep their defaults.
    static endpoint_config decode(const YAML::Node&);
};

// Overrides the credentials and region with the AWS_ACCESS_KEY_ID,
// AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN and AWS_DEFAULT_REGION
// environment variables, where those are set and not empty.
void apply_environment(endpoint_config& cfg);

} // namespace s3

template <>
struct fmt::formatter<s3::endpoint_config> : fmt::formatter<std::string_view> {
    auto format(const s3::endpoint_config&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
