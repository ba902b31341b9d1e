/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <string>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

#include "upload/upload_config.hh"

namespace upload {

void upload_config::validate() const {
    if (max_chunk_bytes == 0) {
        throw configuration_error("max_chunk_bytes must be positive");
    }
    if (max_concurrent == 0) {
        throw configuration_error("max_concurrent must be positive");
    }
    if (file_concurrency == 0) {
        throw configuration_error("file_concurrency must be positive");
    }
    if (read_buffer_size == 0) {
        throw configuration_error("read_buffer_size must be positive");
    }
}

s3push_config parse_config(std::string_view yaml) {
    s3push_config cfg;
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        throw configuration_error(fmt::format("Invalid configuration file: {}", e.what()));
    }
    if (!root.IsDefined() || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw configuration_error("Invalid configuration file: expected a map at the top level");
    }

    try {
        if (auto endpoints = root["endpoints"]) {
            if (!endpoints.IsSequence()) {
                throw configuration_error("Invalid configuration file: `endpoints` must be a list");
            }
            if (endpoints.size() > 0) {
                cfg.endpoint = s3::endpoint_config::decode(endpoints[0]);
            }
        }
        if (auto up = root["upload"]) {
            auto& u = cfg.upload;
            u.max_chunk_bytes = up["max_chunk_bytes"].as<size_t>(u.max_chunk_bytes);
            u.max_concurrent = up["max_concurrent"].as<unsigned>(u.max_concurrent);
            u.file_concurrency = up["file_concurrency"].as<unsigned>(u.file_concurrency);
            u.read_buffer_size = up["read_buffer_size"].as<size_t>(u.read_buffer_size);
        }
    } catch (const YAML::Exception& e) {
        throw configuration_error(fmt::format("Invalid configuration file: {}", e.what()));
    }
    return cfg;
}

void finalize_endpoint(s3::endpoint_config& ep) {
    if (ep.creds.access_key_id.empty()) {
        throw configuration_error("Missing \"AWS_ACCESS_KEY_ID\"");
    }
    if (ep.creds.secret_access_key.empty()) {
        throw configuration_error("Missing \"AWS_SECRET_ACCESS_KEY\"");
    }
    if (ep.region.empty()) {
        throw configuration_error("Missing \"AWS_DEFAULT_REGION\"");
    }
    if (ep.host.empty()) {
        ep.host = ep.default_host();
    }
}

void resolve_config(s3push_config& cfg, const config_overrides& o) {
    s3::apply_environment(cfg.endpoint);

    auto& ep = cfg.endpoint;
    ep.region = o.region.value_or(ep.region);
    ep.host = o.host.value_or(ep.host);
    ep.port = o.port.value_or(ep.port);
    auto& u = cfg.upload;
    u.max_chunk_bytes = o.max_chunk_bytes.value_or(u.max_chunk_bytes);
    u.max_concurrent = o.max_concurrent.value_or(u.max_concurrent);
    u.file_concurrency = o.file_concurrency.value_or(u.file_concurrency);

    finalize_endpoint(ep);
    u.validate();
}

} // namespace upload

auto fmt::formatter<upload::upload_config>::format(const upload::upload_config& c, fmt::format_context& ctx) const
    -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "upload_config{{max_chunk_bytes={}, max_concurrent={}, file_concurrency={}, read_buffer_size={}}}",
            c.max_chunk_bytes, c.max_concurrent, c.file_concurrency, c.read_buffer_size);
}
