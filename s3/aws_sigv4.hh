/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <array>
#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// AWS Signature Version 4.
// https://docs.aws.amazon.com/IAM/latest/UserGuide/create-signed-request.html
namespace s3::aws {

using digest = std::array<unsigned char, 32>;

std::string to_hex(const unsigned char* data, size_t size);
std::string sha256_hex(std::string_view data);
digest hmac_sha256(std::string_view key, std::string_view data);

// Hex SHA-256 of the empty string, the payload hash of body-less requests.
extern const std::string empty_payload_hash;

// RFC 3986 encoding as required for canonical URIs and query strings.
std::string uri_encode(std::string_view s, bool encode_slash);

// Sorts and encodes the parameters; the result is usable both on the wire
// and in the canonical request.
std::string canonical_query_string(std::vector<std::pair<std::string, std::string>> params);

// "20150830T123600Z"
std::string format_amz_date(std::chrono::system_clock::time_point tp);

digest derive_signing_key(std::string_view secret_key, std::string_view date, std::string_view region, std::string_view service);

struct signing_request {
    std::string method;
    // Already uri-encoded.
    std::string canonical_uri;
    std::string canonical_query;
    // Lower-case names; values are trimmed on use.
    std::map<std::string, std::string> headers;
    std::string payload_hash;

    std::string signed_headers() const;
    std::string canonical_request() const;
};

// amz_date is the value of the x-amz-date header, which must also be part of
// the signed headers.
std::string get_signature(std::string_view secret_key, std::string_view amz_date,
        std::string_view region, std::string_view service, const signing_request& req);

std::string authorization_header(std::string_view access_key_id, std::string_view secret_key, std::string_view amz_date,
        std::string_view region, std::string_view service, const signing_request& req);

} // namespace s3::aws
