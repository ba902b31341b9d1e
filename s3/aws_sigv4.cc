/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <fmt/format.h>
#include <boost/algorithm/string/trim.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "s3/aws_sigv4.hh"

namespace s3::aws {

std::string to_hex(const unsigned char* data, size_t size) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string res;
    res.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        res.push_back(digits[data[i] >> 4]);
        res.push_back(digits[data[i] & 0xf]);
    }
    return res;
}

std::string sha256_hex(std::string_view data) {
    digest md;
    unsigned int len = 0;
    if (!EVP_Digest(data.data(), data.size(), md.data(), &len, EVP_sha256(), nullptr)) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return to_hex(md.data(), len);
}

digest hmac_sha256(std::string_view key, std::string_view data) {
    digest md;
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), md.data(), &len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return md;
}

static std::string_view as_string_view(const digest& d) {
    return std::string_view(reinterpret_cast<const char*>(d.data()), d.size());
}

const std::string empty_payload_hash = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::string uri_encode(std::string_view s, bool encode_slash) {
    std::string res;
    res.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
            res.push_back(c);
        } else {
            res += fmt::format("%{:02X}", c);
        }
    }
    return res;
}

std::string canonical_query_string(std::vector<std::pair<std::string, std::string>> params) {
    for (auto& [k, v] : params) {
        k = uri_encode(k, true);
        v = uri_encode(v, true);
    }
    std::sort(params.begin(), params.end());
    std::string res;
    for (auto& [k, v] : params) {
        if (!res.empty()) {
            res.push_back('&');
        }
        res += k;
        res.push_back('=');
        res += v;
    }
    return res;
}

std::string format_amz_date(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    ::gmtime_r(&t, &tm);
    char buf[sizeof("20150830T123600Z")];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

digest derive_signing_key(std::string_view secret_key, std::string_view date, std::string_view region, std::string_view service) {
    auto k_date = hmac_sha256(fmt::format("AWS4{}", secret_key), date);
    auto k_region = hmac_sha256(as_string_view(k_date), region);
    auto k_service = hmac_sha256(as_string_view(k_region), service);
    return hmac_sha256(as_string_view(k_service), "aws4_request");
}

std::string signing_request::signed_headers() const {
    std::string res;
    for (auto& [name, value] : headers) {
        if (!res.empty()) {
            res.push_back(';');
        }
        res += name;
    }
    return res;
}

std::string signing_request::canonical_request() const {
    std::string res = fmt::format("{}\n{}\n{}\n", method, canonical_uri, canonical_query);
    for (auto& [name, value] : headers) {
        res += fmt::format("{}:{}\n", name, boost::algorithm::trim_copy(value));
    }
    res += fmt::format("\n{}\n{}", signed_headers(), payload_hash);
    return res;
}

static std::string credential_scope(std::string_view date, std::string_view region, std::string_view service) {
    return fmt::format("{}/{}/{}/aws4_request", date, region, service);
}

std::string get_signature(std::string_view secret_key, std::string_view amz_date,
        std::string_view region, std::string_view service, const signing_request& req) {
    auto date = amz_date.substr(0, 8);
    auto string_to_sign = fmt::format("AWS4-HMAC-SHA256\n{}\n{}\n{}",
            amz_date, credential_scope(date, region, service), sha256_hex(req.canonical_request()));
    auto key = derive_signing_key(secret_key, date, region, service);
    auto sig = hmac_sha256(as_string_view(key), string_to_sign);
    return to_hex(sig.data(), sig.size());
}

std::string authorization_header(std::string_view access_key_id, std::string_view secret_key, std::string_view amz_date,
        std::string_view region, std::string_view service, const signing_request& req) {
    return fmt::format("AWS4-HMAC-SHA256 Credential={}/{}, SignedHeaders={}, Signature={}",
            access_key_id, credential_scope(amz_date.substr(0, 8), region, service),
            req.signed_headers(), get_signature(secret_key, amz_date, region, service, req));
}

} // namespace s3::aws
