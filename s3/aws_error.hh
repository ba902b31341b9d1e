/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <seastar/core/sstring.hh>

namespace s3 {

// Returns the text between <name> and </name>, if both are present.
std::optional<std::string_view> find_xml_tag(std::string_view xml, std::string_view name);

// Same as find_xml_tag() but a missing tag is an error.
seastar::sstring parse_xml_tag(std::string_view xml, std::string_view name);

// A non-2xx answer from the object store.
class aws_error : public std::runtime_error {
    int _status;
    std::string _code;
public:
    aws_error(int status, std::string code, const std::string& message);

    int status() const noexcept { return _status; }
    // The S3 error code, e.g. "NoSuchUpload". Empty when the response had no body.
    const std::string& code() const noexcept { return _code; }

    bool is_not_found() const noexcept { return _status == 404; }
    bool is_access_denied() const noexcept { return _status == 403; }

    // Builds the error out of the <Error> document S3 sends with failures.
    static aws_error from_response(int status, std::string_view body);
};

} // namespace s3
