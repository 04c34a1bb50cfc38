/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/http_request.hpp>

#include <cctype>
#include <iterator>
#include <new>

#include <uv.h>

#include <nazarick/dynamic_buffer.hpp>
#include <nazarick/log.hpp>

namespace nazarick {

namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr std::string_view TERMINATOR = "\r\n\r\n";
constexpr std::string_view VERSION_PREFIX = "HTTP/";

constexpr const char * method_names[] = {
#define XX(x) #x,
    NAZARICK_HTTP_METHOD_MAP(XX)
#undef XX
};

std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

/// Adjacent separators give empty elements.
std::vector<std::string_view> split(std::string_view s, std::string_view sep)
{
    std::vector<std::string_view> res;
    for (;;) {
        size_t pos = s.find(sep);
        if (pos == std::string_view::npos) {
            res.push_back(s);
            return res;
        }
        res.push_back(s.substr(0, pos));
        s.remove_prefix(pos + sep.size());
    }
}

bool parse_request_line(std::string_view line, http_request &req, error &err)
{
    std::vector<std::string_view> parts = split(line, " ");
    if (parts.size() != 3) {
        err = error::protocol(400, "Bad request line");
        return false;
    }

    if (!method_from_name(parts[0], req.method)) {
        nazarick_log(LOG_WARNING, "Method %.*s not allowed",
                (int)parts[0].size(), parts[0].data());
        err = error::protocol(405, "Method not allowed");
        return false;
    }

    if (!validate_uri(parts[1], req.method)) {
        err = error::protocol(400, "Bad URI");
        return false;
    }
    req.uri.assign(parts[1]);

    std::string_view version = parts[2];
    if (version.substr(0, VERSION_PREFIX.size()) != VERSION_PREFIX) {
        err = error::protocol(505, "HTTP version not supported");
        return false;
    }
    version.remove_prefix(VERSION_PREFIX.size());
    if (version != "1.0" && version != "1.1") {
        err = error::protocol(505, "HTTP version not supported");
        return false;
    }
    req.version.assign(version);
    return true;
}

} // namespace

bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i]))
            return false;
    return true;
}

const char * method_name(http_method m) noexcept
{
    return method_names[static_cast<size_t>(m)];
}

bool method_from_name(std::string_view name, http_method &m) noexcept
{
    for (size_t i = 0; i < std::size(method_names); ++i)
        if (name == method_names[i]) {
            m = static_cast<http_method>(i);
            return true;
        }
    return false;
}

bool http_request::get_field(std::string_view key, std::string_view &value)
    const noexcept
{
    for (const std::string &h : headers) {
        std::string_view line(h);
        size_t colon = line.find(':');
        if (colon == std::string_view::npos)
            continue;
        if (iequals(line.substr(0, colon), key)) {
            value = trim(line.substr(colon + 1));
            return true;
        }
    }
    return false;
}

bool validate_header(std::string_view line) noexcept
{
    size_t colon = line.find(':');
    if (colon == std::string_view::npos)
        return false;
    std::string_view key = line.substr(0, colon);
    std::string_view value = line.substr(colon + 1);
    return !key.empty() && !value.empty() && key.back() != ' ';
}

bool validate_uri(std::string_view uri, http_method method) noexcept
{
    if (uri.empty() || uri.find(' ') != std::string_view::npos)
        return false;
    // authority-form
    if (method == http_method::CONNECT &&
            uri.find(':') == std::string_view::npos)
        return false;
    // asterisk-form
    if (method == http_method::OPTIONS && uri != "*")
        return false;
    return true;
}

bool parse_request(std::string_view head, http_request &req, error &err)
{
    if (head.size() < TERMINATOR.size() ||
        head.substr(head.size() - TERMINATOR.size()) != TERMINATOR) {
        err = error::protocol(400, "Bad request");
        return false;
    }

    // Strip the final CRLF, so the blank line is the last element.
    head.remove_suffix(CRLF.size());
    std::vector<std::string_view> lines = split(head, CRLF);
    if (lines.size() < 2 || !lines.back().empty()) {
        err = error::protocol(400, "Bad request");
        return false;
    }

    if (!parse_request_line(lines.front(), req, err))
        return false;

    req.headers.clear();
    for (size_t i = 1; i + 1 < lines.size(); ++i) {
        if (!validate_header(lines[i])) {
            err = error::protocol(400, "Bad header");
            return false;
        }
        req.headers.emplace_back(lines[i]);
    }
    return true;
}

cut_result cut_message(dynamic_buffer &buf, http_request &req, error &err)
    noexcept
{
    size_t idx = buf.find(TERMINATOR);
    if (idx == dynamic_buffer::npos) {
        if (buf.length() > MAX_HEADER_SIZE) {
            err = error::protocol(413, "Header too long");
            return cut_result::FAILED;
        }
        return cut_result::NEED_MORE;
    }

    size_t head_len = idx + TERMINATOR.size();
    try {
        if (!parse_request(std::string_view(buf.data(), head_len), req, err))
            return cut_result::FAILED;
    }
    catch (const std::bad_alloc &) {
        nazarick_log(LOG_EMERG, "Can't allocate memory for request");
        err = error::transport(UV_ENOMEM);
        return cut_result::FAILED;
    }
    buf.pop(head_len);
    return cut_result::COMPLETE;
}

} // namespace nazarick
