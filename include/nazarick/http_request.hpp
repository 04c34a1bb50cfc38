/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nazarick/error.hpp>

namespace nazarick {

class dynamic_buffer;

#define NAZARICK_HTTP_METHOD_MAP(XX) \
    XX(GET) \
    XX(POST) \
    XX(PUT) \
    XX(DELETE) \
    XX(HEAD) \
    XX(OPTIONS) \
    XX(TRACE) \
    XX(CONNECT)

enum class http_method {
#define XX(x) x,
    NAZARICK_HTTP_METHOD_MAP(XX)
#undef XX
};

const char * method_name(http_method m) noexcept;
/// Returns false if name isn't a supported method.
bool method_from_name(std::string_view name, http_method &m) noexcept;

struct http_request {
    http_method method = http_method::GET;
    std::string uri;
    /// "1.0" or "1.1".
    std::string version;
    /// Raw header lines ("Key: Value") in order of appearance.
    std::vector<std::string> headers;

    /// Value of the first header with name equal to key ignoring case.
    /// Leading and trailing spaces and tabs are stripped from value.
    bool get_field(std::string_view key, std::string_view &value) const
        noexcept;
};

/// ASCII case-insensitive comparison.
bool iequals(std::string_view a, std::string_view b) noexcept;

/// Maximum size of request line with headers (including terminator).
constexpr size_t MAX_HEADER_SIZE = 8 * 1024;

/// Parse header block "request-line CRLF *(header CRLF) CRLF".
/// On failure err holds protocol error. Throws std::bad_alloc.
bool parse_request(std::string_view head, http_request &req, error &err);

/// Validate header line "Key: Value".
bool validate_header(std::string_view line) noexcept;

/// Validate request target for method.
bool validate_uri(std::string_view uri, http_method method) noexcept;

enum class cut_result {
    NEED_MORE,
    COMPLETE,
    FAILED
};

/// Look for complete header block at the start of not consumed bytes in buf.
/// On COMPLETE the block is parsed into req and popped from buf, bytes after
/// it (body or next request) stay in buf. On FAILED err is set, allocation
/// failure is reported as transport error UV_ENOMEM.
cut_result cut_message(dynamic_buffer &buf, http_request &req, error &err)
    noexcept;

} // namespace nazarick
