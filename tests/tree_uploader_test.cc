/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <boost/test/unit_test.hpp>
#include <seastar/core/coroutine.hh>
#include <seastar/testing/test_case.hh>

#include "lister.hh"
#include "tests/upload_test_utils.hh"
#include "upload/tree_uploader.hh"

using namespace tests;

static fs::path make_test_dir(std::string_view name) {
    auto dir = fs::temp_directory_path() / seastar::format("s3push-{}-{}", name, ::getpid()).c_str();
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& p, std::string_view contents) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << contents;
}

// site/
//   index.html
//   .hidden
//   empty
//   css/style.css   (larger than one part)
//   link -> index.html
static fs::path make_site(std::string_view name) {
    auto root = make_test_dir(name);
    write_file(root / "index.html", "<html></html>");
    write_file(root / ".hidden", "secret");
    write_file(root / "empty", "");
    write_file(root / "css" / "style.css", "body { color: red; }");
    fs::create_symlink(root / "index.html", root / "link");
    return root;
}

static upload::upload_config small_parts() {
    upload::upload_config cfg;
    cfg.max_chunk_bytes = 4;
    cfg.max_concurrent = 2;
    cfg.file_concurrency = 2;
    return cfg;
}

BOOST_AUTO_TEST_CASE(test_parse_bucket_path) {
    auto p = upload::parse_bucket_path("bucket");
    BOOST_REQUIRE_EQUAL(p.bucket, "bucket");
    BOOST_REQUIRE_EQUAL(p.prefix, "");

    p = upload::parse_bucket_path("bucket/some/prefix");
    BOOST_REQUIRE_EQUAL(p.bucket, "bucket");
    BOOST_REQUIRE_EQUAL(p.prefix, "some/prefix");

    p = upload::parse_bucket_path("/bucket/");
    BOOST_REQUIRE_EQUAL(p.bucket, "bucket");
    BOOST_REQUIRE_EQUAL(p.prefix, "");

    BOOST_REQUIRE_THROW(upload::parse_bucket_path(""), upload::configuration_error);
    BOOST_REQUIRE_THROW(upload::parse_bucket_path("/"), upload::configuration_error);
}

BOOST_AUTO_TEST_CASE(test_make_object_key) {
    BOOST_REQUIRE_EQUAL(upload::make_object_key("", "a/b.txt"), "a/b.txt");
    BOOST_REQUIRE_EQUAL(upload::make_object_key("sub/dir", "a.txt"), "sub/dir/a.txt");
    BOOST_REQUIRE_EQUAL(upload::make_object_key("sub/", "a.txt"), "sub/a.txt");
    BOOST_REQUIRE_EQUAL(upload::make_object_key("/sub/", "./x/../y.txt"), "sub/y.txt");
    BOOST_REQUIRE_EQUAL(upload::make_object_key(".", "a"), "a");
}

SEASTAR_TEST_CASE(test_list_files) {
    auto root = make_site("list");
    auto files = co_await upload::list_files(root);

    std::vector<std::string> names;
    for (auto& f : files) {
        names.push_back(f.relative.generic_string());
    }
    // Hidden files are included, symbolic links are not.
    BOOST_REQUIRE((names == std::vector<std::string>{".hidden", "css/style.css", "empty", "index.html"}));
    BOOST_REQUIRE_EQUAL(files[0].size, 6u);
    BOOST_REQUIRE_EQUAL(files[2].size, 0u);

    co_await lister::rmdir(root);
}

SEASTAR_TEST_CASE(test_upload_directory) {
    auto root = make_site("upload");
    auto client = seastar::make_shared<fake_s3_client>();
    upload::tree_uploader up(client, small_parts());
    co_await up.upload_directory(root, upload::parse_bucket_path("bucket/www"));

    BOOST_REQUIRE_EQUAL(client->objects.size(), 4u);
    BOOST_REQUIRE_EQUAL(client->objects["bucket/www/index.html"], "<html></html>");
    BOOST_REQUIRE_EQUAL(client->objects["bucket/www/.hidden"], "secret");
    BOOST_REQUIRE_EQUAL(client->objects["bucket/www/empty"], "");
    BOOST_REQUIRE_EQUAL(client->objects["bucket/www/css/style.css"], "body { color: red; }");
    BOOST_REQUIRE(!client->objects.contains("bucket/www/link"));
    // All of the files are larger than a part but the empty one.
    BOOST_REQUIRE_EQUAL(client->creates, 3u);
    BOOST_REQUIRE_EQUAL(client->puts, 1u);
    BOOST_REQUIRE_EQUAL(client->pending_uploads(), 0u);

    co_await lister::rmdir(root);
}

SEASTAR_TEST_CASE(test_missing_bucket_fails_early) {
    auto root = make_site("missing");
    auto client = seastar::make_shared<fake_s3_client>();
    upload::tree_uploader up(client, small_parts());
    bool failed = false;
    try {
        co_await up.upload_directory(root, upload::parse_bucket_path("nope"));
    } catch (const upload::bucket_inaccessible& e) {
        failed = true;
        BOOST_REQUIRE_EQUAL(std::string(e.what()), "Requested S3 bucket nope cannot be found or accessed");
    }
    BOOST_REQUIRE(failed);
    BOOST_REQUIRE(client->objects.empty());
    BOOST_REQUIRE_EQUAL(client->creates + client->puts, 0u);

    co_await lister::rmdir(root);
}

SEASTAR_TEST_CASE(test_failed_files_do_not_stop_the_others) {
    auto root = make_site("partial");
    auto client = seastar::make_shared<fake_s3_client>();
    client->fail_keys.insert("index.html");
    upload::tree_uploader up(client, small_parts());
    bool failed = false;
    try {
        co_await up.upload_directory(root, upload::parse_bucket_path("bucket"));
    } catch (const upload::tree_upload_error& e) {
        failed = true;
        BOOST_REQUIRE_EQUAL(e.failed(), 1u);
        BOOST_REQUIRE_EQUAL(e.total(), 4u);
        BOOST_REQUIRE_EQUAL(std::string(e.what()), "1 of 4 files failed to upload");
    }
    BOOST_REQUIRE(failed);
    BOOST_REQUIRE_EQUAL(client->objects.size(), 3u);
    BOOST_REQUIRE(!client->objects.contains("bucket/index.html"));
    BOOST_REQUIRE_EQUAL(client->objects["bucket/css/style.css"], "body { color: red; }");

    co_await lister::rmdir(root);
}
