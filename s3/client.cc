/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <unordered_map>
#include <seastar/core/coroutine.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/print.hh>
#include <seastar/core/sstring.hh>
#include <seastar/http/response_parser.hh>
#include <seastar/util/backtrace.hh>
#include <seastar/util/log.hh>
#include <seastar/util/noncopyable_function.hh>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include "s3/client.hh"
#include "s3/aws_error.hh"
#include "s3/aws_sigv4.hh"

using namespace seastar;

namespace s3 {

static seastar::logger s3log("s3");

struct s3_http_response : public http_response {
    temporary_buffer<char> content;

    std::optional<sstring> find_header(std::string_view name) const {
        for (auto&& [key, value] : _headers) {
            if (boost::iequals(key, name)) {
                return boost::trim_copy(value);
            }
        }
        return std::nullopt;
    }

    sstring get_header(std::string_view name) const {
        auto value = find_header(name);
        if (!value) {
            throw_with_backtrace<std::runtime_error>(seastar::format("Expected header not found: {}", name));
        }
        return *value;
    }

    std::string_view content_as_string() const {
        return std::string_view(content.get(), content.size());
    }
};

struct http_content_writer {
    size_t size;
    noncopyable_function<future<>(output_stream<char>&)> writer;
};

static future<sstring> read_line(input_stream<char>& in) {
    sstring line;
    for (;;) {
        auto c = co_await in.read_exactly(1);
        if (c.empty()) {
            co_await coroutine::return_exception(std::runtime_error("Unexpected end of HTTP response"));
        }
        if (c[0] == '\n') {
            if (!line.empty() && line[line.size() - 1] == '\r') {
                line.resize(line.size() - 1);
            }
            co_return line;
        }
        line.append(c.get(), 1);
    }
}

// Transfer-Encoding: chunked, https://datatracker.ietf.org/doc/html/rfc9112#section-7.1
static future<temporary_buffer<char>> read_chunked_content(input_stream<char>& in) {
    std::vector<temporary_buffer<char>> chunks;
    size_t total = 0;
    for (;;) {
        auto line = co_await read_line(in);
        auto size = std::stoul(std::string(line.substr(0, line.find(';'))), nullptr, 16);
        if (size == 0) {
            // Skip the trailer section.
            while (!(co_await read_line(in)).empty()) {
            }
            break;
        }
        auto chunk = co_await in.read_exactly(size);
        if (chunk.size() != size) {
            co_await coroutine::return_exception(std::runtime_error("Unexpected end of chunked HTTP response"));
        }
        total += chunk.size();
        chunks.push_back(std::move(chunk));
        co_await read_line(in);
    }
    temporary_buffer<char> content(total);
    size_t pos = 0;
    for (auto& chunk : chunks) {
        std::copy_n(chunk.get(), chunk.size(), content.get_write() + pos);
        pos += chunk.size();
    }
    co_return content;
}

// The peer closed or reset the connection before sending a single byte of
// the response. Idle keep-alive connections end up like this once the
// server times them out.
class connection_lost : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Counts the bytes the parser is fed.
struct counting_response_parser {
    http_response_parser& parser;
    size_t& bytes_seen;

    future<consumption_result<char>> operator()(temporary_buffer<char> buf) {
        bytes_seen += buf.size();
        return parser(std::move(buf));
    }
};

static future<> write_request(output_stream<char>& out,
                              const sstring& method,
                              const sstring& target,
                              const std::unordered_map<sstring, sstring>& headers,
                              std::optional<http_content_writer> content) {
    co_await out.write(method);
    co_await out.write(" ");
    co_await out.write(target);
    co_await out.write(" HTTP/1.1\r\n");

    for (auto&& [key, value] : headers) {
        co_await out.write(key);
        co_await out.write(": ");
        co_await out.write(value);
        co_await out.write("\r\n");
    }

    if (content) {
        co_await out.write("Content-Length: ");
        co_await out.write(to_sstring(content->size));
        co_await out.write("\r\n");
        co_await out.write("\r\n");
        co_await content->writer(out);
    } else {
        co_await out.write("\r\n");
    }

    co_await out.flush();
}

// Keep headers alive around async operation.
static
future<s3_http_response> make_http_request(connection_ptr con,
                                        const sstring& method,
                                        const sstring& target,
                                        const std::unordered_map<sstring, sstring>& headers,
                                        std::optional<http_content_writer> content) {
    s3log.debug("conn {}: {} {}", fmt::ptr(&*con), method, target);

    std::exception_ptr ex;
    try {
        co_await write_request(con->out(), method, target, headers, std::move(content));
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await coroutine::return_exception(connection_lost(seastar::format("Sending request failed: {}", ex)));
    }

    auto& in = con->in();
    http_response_parser parser;
    parser.init();
    size_t bytes_seen = 0;
    try {
        co_await in.consume(counting_response_parser{parser, bytes_seen});
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (bytes_seen == 0) {
            co_await coroutine::return_exception(connection_lost(seastar::format("Reading response failed: {}", ex)));
        }
        std::rethrow_exception(ex);
    }

    auto parsed_response = parser.get_parsed_response();
    if (!parsed_response) {
        if (bytes_seen == 0) {
            co_await coroutine::return_exception(connection_lost("Connection closed before the response"));
        }
        co_await coroutine::return_exception(std::runtime_error("Parsing HTTP response failed"));
    }
    s3_http_response response{std::move(*parsed_response)};

    // HEAD answers carry the object's Content-Length but no body.
    if (response._status_code != 204 && method != "HEAD") {
        auto te = response.find_header("Transfer-Encoding");
        if (te && boost::iequals(*te, "chunked")) {
            response.content = co_await read_chunked_content(in);
        } else {
            auto length = response.find_header("Content-Length");
            auto content_length = length ? std::stoul(std::string(*length)) : 0;
            response.content = co_await in.read_exactly(content_length);
        }
    }

    if (response._status_code < 200 || response._status_code >= 300) {
        co_await coroutine::return_exception(aws_error::from_response(response._status_code, response.content_as_string()));
    }
    co_return response;
}

// The server will not take another request on this connection.
static bool closes_connection(const s3_http_response& resp) {
    auto value = resp.find_header("Connection");
    return value && boost::iequals(*value, "close");
}

sstring object_path(std::string_view bucket, std::string_view key) {
    if (key.empty()) {
        return seastar::format("/{}", aws::uri_encode(bucket, true));
    }
    return seastar::format("/{}/{}", aws::uri_encode(bucket, true), aws::uri_encode(key, false));
}

std::string_view content_type_for(std::string_view key) {
    if (key.ends_with(".html")) {
        return "text/html";
    }
    return {};
}

sstring complete_multipart_upload_body(const std::vector<part_result>& parts) {
    sstring body = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
            "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";
    for (auto& p : parts) {
        body += seastar::format("<Part><ETag>{}</ETag><PartNumber>{}</PartNumber></Part>", p.etag, p.part_number);
    }
    body += "</CompleteMultipartUpload>";
    return body;
}

class client_impl : public client, public enable_shared_from_this<client_impl> {
    connection_factory_ptr _connection_factory;
    endpoint_config _cfg;
    sstring _host;

    using query_params = std::vector<std::pair<std::string, std::string>>;
    using header_map = std::unordered_map<sstring, sstring>;
protected:
    future<> close_connection(connection_ptr con) {
        try {
            co_await con->close();
        } catch (...) {
            s3log.error("conn {}: failed to close: {}", fmt::ptr(&*con), std::current_exception());
        }
    }

    // Runs func on a connection and returns the connection to the pool
    // afterwards, unless func failed or the server asked to close it.
    // A pooled connection the server has dropped in the meantime is
    // replaced by a new one, once.
    future<s3_http_response> do_with_connection(noncopyable_function<future<s3_http_response>(connection_ptr)> func) {
        auto con = co_await _connection_factory->connect(connection_factory::allow_pooled::yes);
        for (;;) {
            bool retry = false;
            std::exception_ptr ex;
            try {
                auto resp = co_await func(con);
                if (closes_connection(resp)) {
                    s3log.debug("conn {}: closed by server", fmt::ptr(&*con));
                    co_await close_connection(std::move(con));
                } else {
                    _connection_factory->take_back(std::move(con));
                }
                co_return resp;
            } catch (const connection_lost&) {
                retry = con->reused();
                ex = std::current_exception();
            } catch (...) {
                ex = std::current_exception();
            }
            co_await close_connection(con);
            if (!retry) {
                std::rethrow_exception(ex);
            }
            s3log.debug("conn {}: idle connection lost ({}), retrying on a new one", fmt::ptr(&*con), ex);
            con = co_await _connection_factory->connect(connection_factory::allow_pooled::no);
        }
    }

    header_map sign(const sstring& method, const sstring& path, const std::string& query,
            const header_map& extra, const std::string& payload_hash) const {
        aws::signing_request req;
        req.method = method;
        req.canonical_uri = path;
        req.canonical_query = query;
        req.payload_hash = payload_hash;

        auto amz_date = aws::format_amz_date(std::chrono::system_clock::now());
        header_map headers = extra;
        headers["Host"] = _host;
        headers["x-amz-date"] = amz_date;
        headers["x-amz-content-sha256"] = payload_hash;
        if (!_cfg.creds.session_token.empty()) {
            headers["x-amz-security-token"] = _cfg.creds.session_token;
        }
        for (auto&& [key, value] : headers) {
            std::string name(key);
            std::transform(name.begin(), name.end(), name.begin(), [] (unsigned char c) { return std::tolower(c); });
            req.headers.emplace(std::move(name), std::string(value));
        }
        headers["Authorization"] = aws::authorization_header(_cfg.creds.access_key_id, _cfg.creds.secret_access_key,
                amz_date, _cfg.region, "s3", req);
        headers["Connection"] = "Keep-Alive";
        return headers;
    }

    future<s3_http_response> request(sstring method, sstring path, query_params params, header_map extra,
            std::optional<temporary_buffer<char>> body = std::nullopt) {
        auto query = aws::canonical_query_string(std::move(params));
        auto payload_hash = body ? aws::sha256_hex(std::string_view(body->get(), body->size())) : aws::empty_payload_hash;
        auto headers = sign(method, path, query, extra, payload_hash);
        auto target = query.empty() ? path : seastar::format("{}?{}", path, query);

        co_return co_await do_with_connection([&] (connection_ptr con) {
            std::optional<http_content_writer> wr;
            if (body) {
                // Shared, so that the body can be sent again on a new connection.
                wr = http_content_writer{body->size(), [buf = body->share()] (output_stream<char>& out) {
                    return out.write(buf.get(), buf.size());
                }};
            }
            return make_http_request(con, method, target, headers, std::move(wr));
        });
    }

    static header_map content_type_header(std::string_view key) {
        header_map headers;
        auto ct = content_type_for(key);
        if (!ct.empty()) {
            headers["Content-Type"] = sstring(ct);
        }
        return headers;
    }
public:
    client_impl(connection_factory_ptr cf, endpoint_config cfg)
        : _connection_factory(std::move(cf))
        , _cfg(std::move(cfg))
    {
        _host = _connection_factory->host_name();
        if (_cfg.port != 80) {
            _host = seastar::format("{}:{}", _host, _cfg.port);
        }
    }

    future<> head_bucket(const sstring& bucket) override {
        // HeadBucket: https://docs.aws.amazon.com/AmazonS3/latest/API/API_HeadBucket.html
        co_await request("HEAD", object_path(bucket, ""), {}, {});
    }

    future<> put_object(const sstring& bucket, const sstring& key, temporary_buffer<char> body) override {
        // PutObject: https://docs.aws.amazon.com/AmazonS3/latest/API/API_PutObject.html
        auto path = object_path(bucket, key);
        auto size = body.size();
        co_await request("PUT", path, {}, content_type_header(key), std::move(body));
        s3log.debug("Put {} ({} bytes)", path, size);
    }

    future<sstring> create_multipart_upload(const sstring& bucket, const sstring& key) override {
        // CreateMultipartUpload: https://docs.aws.amazon.com/AmazonS3/latest/API/API_CreateMultipartUpload.html
        auto path = object_path(bucket, key);
        auto resp = co_await request("POST", path, {{"uploads", ""}}, content_type_header(key));
        auto upload_id = parse_xml_tag(resp.content_as_string(), "UploadId");
        s3log.debug("Upload {} of {} started", upload_id, path);
        co_return upload_id;
    }

    future<sstring> upload_part(const sstring& bucket, const sstring& key, const sstring& upload_id,
            unsigned part_number, temporary_buffer<char> body) override {
        // UploadPart: https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
        auto path = object_path(bucket, key);
        query_params params{{"partNumber", to_sstring(part_number)}, {"uploadId", upload_id}};
        auto resp = co_await request("PUT", path, std::move(params), {}, std::move(body));
        co_return resp.get_header("ETag");
    }

    future<> complete_multipart_upload(const sstring& bucket, const sstring& key, const sstring& upload_id,
            const std::vector<part_result>& parts) override {
        // CompleteMultipartUpload: https://docs.aws.amazon.com/AmazonS3/latest/API/API_CompleteMultipartUpload.html
        auto path = object_path(bucket, key);
        auto id = upload_id;
        auto xml = complete_multipart_upload_body(parts);
        auto nr_parts = parts.size();
        temporary_buffer<char> body(xml.data(), xml.size());

        s3log.debug("Upload {} of {} finalizing, size={}, parts={}", id, path, body.size(), nr_parts);
        auto resp = co_await request("POST", path, {{"uploadId", id}}, {}, std::move(body));
        // The request can fail after the 200 OK was sent.
        if (find_xml_tag(resp.content_as_string(), "Error")) {
            co_await coroutine::return_exception(aws_error::from_response(resp._status_code, resp.content_as_string()));
        }
        s3log.debug("Upload {} of {} completed", id, path);
    }

    future<> abort_multipart_upload(const sstring& bucket, const sstring& key, const sstring& upload_id) override {
        // AbortMultipartUpload: https://docs.aws.amazon.com/AmazonS3/latest/API/API_AbortMultipartUpload.html
        auto path = object_path(bucket, key);
        auto id = upload_id;
        co_await request("DELETE", path, {{"uploadId", id}}, {});
        s3log.debug("Upload ({}) of {} aborted.", id, path);
    }

    future<temporary_buffer<char>> get_object(const sstring& bucket, const sstring& key) override {
        auto resp = co_await request("GET", object_path(bucket, key), {}, {});
        co_return std::move(resp.content);
    }

    future<> delete_object(const sstring& bucket, const sstring& key) override {
        co_await request("DELETE", object_path(bucket, key), {}, {});
    }

    future<> close() override {
        return _connection_factory->close();
    }
};

client_ptr make_client(connection_factory_ptr cf, endpoint_config cfg) {
    return seastar::make_shared<client_impl>(std::move(cf), std::move(cfg));
}

} // namespace s3
