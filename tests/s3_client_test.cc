/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE core

#include <chrono>
#include <cstdlib>
#include <boost/test/unit_test.hpp>
#include <fmt/format.h>

#include "s3/aws_error.hh"
#include "s3/aws_sigv4.hh"
#include "s3/client.hh"
#include "s3/creds.hh"
#include "upload/upload_config.hh"

using namespace s3;

// Examples from the AWS Signature Version 4 test suite.
static const std::string example_secret = "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY";

static aws::signing_request vanilla_get(std::string query) {
    aws::signing_request req;
    req.method = "GET";
    req.canonical_uri = "/";
    req.canonical_query = std::move(query);
    req.headers["host"] = "example.amazonaws.com";
    req.headers["x-amz-date"] = "20150830T123600Z";
    req.payload_hash = aws::empty_payload_hash;
    return req;
}

BOOST_AUTO_TEST_CASE(test_signing_key) {
    auto key = aws::derive_signing_key(example_secret, "20120215", "us-east-1", "iam");
    BOOST_REQUIRE_EQUAL(aws::to_hex(key.data(), key.size()), "f4780e2d9f65fa895f9c67b32ce1baf0b0d8a43505a000a1a9e090d414db404d");
}

BOOST_AUTO_TEST_CASE(test_empty_payload_hash) {
    BOOST_REQUIRE_EQUAL(aws::sha256_hex(""), aws::empty_payload_hash);
}

BOOST_AUTO_TEST_CASE(test_get_vanilla_signature) {
    auto req = vanilla_get("");
    BOOST_REQUIRE_EQUAL(req.signed_headers(), "host;x-amz-date");
    BOOST_REQUIRE_EQUAL(aws::get_signature(example_secret, "20150830T123600Z", "us-east-1", "service", req),
            "5fa00fa31553b73ebf1942676e86291e8372ff2a2260956d9b8aae1d763fbf31");
    BOOST_REQUIRE_EQUAL(aws::authorization_header("AKIDEXAMPLE", example_secret, "20150830T123600Z", "us-east-1", "service", req),
            "AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20150830/us-east-1/service/aws4_request, "
            "SignedHeaders=host;x-amz-date, "
            "Signature=5fa00fa31553b73ebf1942676e86291e8372ff2a2260956d9b8aae1d763fbf31");
}

BOOST_AUTO_TEST_CASE(test_query_parameters_are_sorted) {
    auto query = aws::canonical_query_string({{"Param2", "value2"}, {"Param1", "value1"}});
    BOOST_REQUIRE_EQUAL(query, "Param1=value1&Param2=value2");
    auto req = vanilla_get(query);
    BOOST_REQUIRE_EQUAL(aws::get_signature(example_secret, "20150830T123600Z", "us-east-1", "service", req),
            "b97d918cfa904a5beff61c982a1b6f458b799221646efd99d3219ec94cdf2500");

    BOOST_REQUIRE_EQUAL(aws::canonical_query_string({{"uploadId", "a b+c"}, {"partNumber", "7"}}), "partNumber=7&uploadId=a%20b%2Bc");
    BOOST_REQUIRE_EQUAL(aws::canonical_query_string({{"uploads", ""}}), "uploads=");
}

BOOST_AUTO_TEST_CASE(test_uri_encode) {
    BOOST_REQUIRE_EQUAL(aws::uri_encode("a b/c~d-e_f.g", false), "a%20b/c~d-e_f.g");
    BOOST_REQUIRE_EQUAL(aws::uri_encode("a b/c", true), "a%20b%2Fc");
    BOOST_REQUIRE_EQUAL(aws::uri_encode("\xc3\xbc", true), "%C3%BC");
}

BOOST_AUTO_TEST_CASE(test_amz_date) {
    auto tp = std::chrono::system_clock::from_time_t(1440938160);
    BOOST_REQUIRE_EQUAL(aws::format_amz_date(tp), "20150830T123600Z");
}

BOOST_AUTO_TEST_CASE(test_xml_tags) {
    std::string_view doc = "<InitiateMultipartUploadResult><Bucket>b</Bucket><UploadId>VXBsb2FkIElE</UploadId></InitiateMultipartUploadResult>";
    BOOST_REQUIRE_EQUAL(parse_xml_tag(doc, "UploadId"), "VXBsb2FkIElE");
    BOOST_REQUIRE(!find_xml_tag(doc, "Key"));
    BOOST_REQUIRE_THROW(parse_xml_tag(doc, "Key"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_aws_error_from_response) {
    auto e = aws_error::from_response(404,
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
            "<Error><Code>NoSuchBucket</Code><Message>The specified bucket does not exist</Message></Error>");
    BOOST_REQUIRE_EQUAL(e.status(), 404);
    BOOST_REQUIRE_EQUAL(e.code(), "NoSuchBucket");
    BOOST_REQUIRE(e.is_not_found());
    BOOST_REQUIRE(!e.is_access_denied());
    BOOST_REQUIRE_EQUAL(std::string(e.what()), "request failed with status 404: NoSuchBucket: The specified bucket does not exist");

    auto bare = aws_error::from_response(403, "");
    BOOST_REQUIRE(bare.is_access_denied());
    BOOST_REQUIRE(bare.code().empty());
    BOOST_REQUIRE_EQUAL(std::string(bare.what()), "request failed with status 403");
}

BOOST_AUTO_TEST_CASE(test_complete_multipart_upload_body) {
    std::vector<part_result> parts = {{1, "\"etag-1\""}, {2, "\"etag-2\""}};
    BOOST_REQUIRE_EQUAL(complete_multipart_upload_body(parts),
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
            "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
            "<Part><ETag>\"etag-1\"</ETag><PartNumber>1</PartNumber></Part>"
            "<Part><ETag>\"etag-2\"</ETag><PartNumber>2</PartNumber></Part>"
            "</CompleteMultipartUpload>");
}

BOOST_AUTO_TEST_CASE(test_object_path) {
    BOOST_REQUIRE_EQUAL(object_path("bucket", ""), "/bucket");
    BOOST_REQUIRE_EQUAL(object_path("bucket", "dir/a b.txt"), "/bucket/dir/a%20b.txt");
}

BOOST_AUTO_TEST_CASE(test_content_type) {
    BOOST_REQUIRE_EQUAL(content_type_for("site/index.html"), "text/html");
    BOOST_REQUIRE(content_type_for("site/style.css").empty());
    BOOST_REQUIRE(content_type_for("html").empty());
}

BOOST_AUTO_TEST_CASE(test_parse_config) {
    auto cfg = upload::parse_config(R"(
endpoints:
  - name: minio.local
    port: 9000
    aws_region: eu-west-1
    aws_access_key_id: AKID
    aws_secret_access_key: SECRET
upload:
  max_chunk_bytes: 6000000
  max_concurrent: 4
)");
    BOOST_REQUIRE_EQUAL(cfg.endpoint.host, "minio.local");
    BOOST_REQUIRE_EQUAL(cfg.endpoint.port, 9000u);
    BOOST_REQUIRE_EQUAL(cfg.endpoint.region, "eu-west-1");
    BOOST_REQUIRE_EQUAL(cfg.endpoint.creds.access_key_id, "AKID");
    BOOST_REQUIRE_EQUAL(cfg.endpoint.creds.secret_access_key, "SECRET");
    BOOST_REQUIRE(cfg.endpoint.creds.session_token.empty());
    BOOST_REQUIRE_EQUAL(cfg.upload.max_chunk_bytes, 6000000u);
    BOOST_REQUIRE_EQUAL(cfg.upload.max_concurrent, 4u);
    BOOST_REQUIRE_EQUAL(cfg.upload.file_concurrency, 32u);
    BOOST_REQUIRE_EQUAL(cfg.upload.read_buffer_size, 256u * 1024);

    auto defaults = upload::parse_config("");
    BOOST_REQUIRE_EQUAL(defaults.upload.max_chunk_bytes, 18000000u);
    BOOST_REQUIRE_EQUAL(defaults.upload.max_concurrent, 10u);
    BOOST_REQUIRE_EQUAL(defaults.endpoint.port, 80u);

    BOOST_REQUIRE_THROW(upload::parse_config("endpoints: {name: x}"), upload::configuration_error);
    BOOST_REQUIRE_THROW(upload::parse_config("upload: {max_concurrent: many}"), upload::configuration_error);
    BOOST_REQUIRE_THROW(upload::parse_config("[unbalanced"), upload::configuration_error);
}

static void clear_aws_environment() {
    ::unsetenv("AWS_ACCESS_KEY_ID");
    ::unsetenv("AWS_SECRET_ACCESS_KEY");
    ::unsetenv("AWS_SESSION_TOKEN");
    ::unsetenv("AWS_DEFAULT_REGION");
}

BOOST_AUTO_TEST_CASE(test_finalize_endpoint) {
    clear_aws_environment();

    endpoint_config ep;
    BOOST_REQUIRE_THROW(upload::finalize_endpoint(ep), upload::configuration_error);

    ep.creds.access_key_id = "AKID";
    ep.creds.secret_access_key = "SECRET";
    try {
        upload::finalize_endpoint(ep);
        BOOST_FAIL("region is missing");
    } catch (const upload::configuration_error& e) {
        BOOST_REQUIRE_EQUAL(std::string(e.what()), "Missing \"AWS_DEFAULT_REGION\"");
    }

    ep.region = "us-west-2";
    upload::finalize_endpoint(ep);
    BOOST_REQUIRE_EQUAL(ep.host, "s3.us-west-2.amazonaws.com");

    auto printed = fmt::format("{}", ep);
    BOOST_REQUIRE(printed.find("SECRET") == std::string::npos);
}

static const char* layered_config = R"(
endpoints:
  - aws_region: us-east-1
    aws_access_key_id: FILE_AKID
    aws_secret_access_key: FILE_SECRET
upload:
  max_concurrent: 4
)";

BOOST_AUTO_TEST_CASE(test_environment_overrides_file) {
    clear_aws_environment();
    ::setenv("AWS_ACCESS_KEY_ID", "ENV_AKID", 1);
    ::setenv("AWS_DEFAULT_REGION", "eu-west-1", 1);

    auto cfg = upload::parse_config(layered_config);
    upload::resolve_config(cfg, {});
    BOOST_REQUIRE_EQUAL(cfg.endpoint.creds.access_key_id, "ENV_AKID");
    // Not in the environment, so the file's value stays.
    BOOST_REQUIRE_EQUAL(cfg.endpoint.creds.secret_access_key, "FILE_SECRET");
    BOOST_REQUIRE_EQUAL(cfg.endpoint.region, "eu-west-1");
    BOOST_REQUIRE_EQUAL(cfg.endpoint.host, "s3.eu-west-1.amazonaws.com");
    BOOST_REQUIRE_EQUAL(cfg.upload.max_concurrent, 4u);

    clear_aws_environment();
}

BOOST_AUTO_TEST_CASE(test_command_line_overrides_environment) {
    clear_aws_environment();
    ::setenv("AWS_DEFAULT_REGION", "eu-west-1", 1);

    auto cfg = upload::parse_config(layered_config);
    upload::config_overrides o;
    o.region = "ap-south-1";
    o.host = "minio.local";
    o.port = 9000;
    o.max_concurrent = 2;
    upload::resolve_config(cfg, o);
    BOOST_REQUIRE_EQUAL(cfg.endpoint.region, "ap-south-1");
    BOOST_REQUIRE_EQUAL(cfg.endpoint.host, "minio.local");
    BOOST_REQUIRE_EQUAL(cfg.endpoint.port, 9000u);
    BOOST_REQUIRE_EQUAL(cfg.endpoint.creds.access_key_id, "FILE_AKID");
    BOOST_REQUIRE_EQUAL(cfg.upload.max_concurrent, 2u);

    o = {};
    o.max_concurrent = 0;
    cfg = upload::parse_config(layered_config);
    BOOST_REQUIRE_THROW(upload::resolve_config(cfg, o), upload::configuration_error);

    clear_aws_environment();
}
