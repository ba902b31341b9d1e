/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <fmt/format.h>
#include <seastar/util/backtrace.hh>

#include "s3/aws_error.hh"

namespace s3 {

std::optional<std::string_view> find_xml_tag(std::string_view xml, std::string_view name) {
    auto open = fmt::format("<{}>", name);
    auto close = fmt::format("</{}>", name);
    auto b = xml.find(open);
    if (b == std::string_view::npos) {
        return std::nullopt;
    }
    b += open.size();
    auto e = xml.find(close, b);
    if (e == std::string_view::npos) {
        return std::nullopt;
    }
    return xml.substr(b, e - b);
}

seastar::sstring parse_xml_tag(std::string_view xml, std::string_view name) {
    auto value = find_xml_tag(xml, name);
    if (!value) {
        seastar::throw_with_backtrace<std::runtime_error>(fmt::format("Response does not contain <{}>: {}", name, xml));
    }
    return seastar::sstring(value->data(), value->size());
}

aws_error::aws_error(int status, std::string code, const std::string& message)
    : std::runtime_error(message)
    , _status(status)
    , _code(std::move(code))
{ }

aws_error aws_error::from_response(int status, std::string_view body) {
    auto code = find_xml_tag(body, "Code");
    auto message = find_xml_tag(body, "Message");
    std::string code_str = code ? std::string(*code) : std::string();
    if (code) {
        return aws_error(status, code_str, fmt::format("request failed with status {}: {}: {}",
                status, *code, message ? *message : std::string_view("no message")));
    }
    return aws_error(status, code_str, fmt::format("request failed with status {}", status));
}

} // namespace s3
