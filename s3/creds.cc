/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

#include "s3/creds.hh"

using namespace std::string_literals;

namespace s3 {

std::string endpoint_config::default_host() const {
    return fmt::format("s3.{}.amazonaws.com", region);
}

endpoint_config endpoint_config::decode(const YAML::Node& node) {
    auto get_opt = [](const YAML::Node& node, const std::string& key, auto def) {
        auto tmp = node[key];
        return tmp ? tmp.template as<std::decay_t<decltype(def)>>() : def;
    };

    endpoint_config ep;
    ep.host = get_opt(node, "name", ""s);
    ep.port = get_opt(node, "port", ep.port);
    ep.region = get_opt(node, "aws_region", ""s);
    ep.creds.access_key_id = get_opt(node, "aws_access_key_id", ""s);
    ep.creds.secret_access_key = get_opt(node, "aws_secret_access_key", ""s);
    ep.creds.session_token = get_opt(node, "aws_session_token", ""s);
    return ep;
}

static void override_from_env(std::string& value, const char* name) {
    const char* env = std::getenv(name);
    if (env && *env) {
        value = env;
    }
}

void apply_environment(endpoint_config& cfg) {
    override_from_env(cfg.creds.access_key_id, "AWS_ACCESS_KEY_ID");
    override_from_env(cfg.creds.secret_access_key, "AWS_SECRET_ACCESS_KEY");
    override_from_env(cfg.creds.session_token, "AWS_SESSION_TOKEN");
    override_from_env(cfg.region, "AWS_DEFAULT_REGION");
}

} // namespace s3

auto fmt::formatter<s3::endpoint_config>::format(const s3::endpoint_config& ep, fmt::format_context& ctx) const
    -> decltype(ctx.out()) {
    // Never print the secret.
    return fmt::format_to(ctx.out(), "endpoint_config{{host={}, port={}, region={}, access_key_id={}}}",
            ep.host, ep.port, ep.region, ep.creds.access_key_id);
}
