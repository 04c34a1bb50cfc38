/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/body_reader.hpp>

#include <algorithm>
#include <limits>
#include <new>

#include <uv.h>

#include <nazarick/dynamic_buffer.hpp>
#include <nazarick/http_request.hpp>
#include <nazarick/log.hpp>
#include <nazarick/stream.hpp>

namespace nazarick {

namespace {

constexpr std::string_view CRLF = "\r\n";

int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

constexpr size_t chunked_body_reader::MAX_SIZE_LINE;
constexpr uint64_t chunked_body_reader::MAX_CHUNK_SIZE;

///
/// memory_body_reader
///

void memory_body_reader::read(chunk_cb cb) noexcept
{
    if (done)
        return cb(error(), std::string_view());
    done = true;
    cb(error(), data);
}

///
/// length_body_reader
///

void length_body_reader::read(chunk_cb cb) noexcept
{
    if (!remaining)
        return cb(error(), std::string_view());
    if (!buf.empty())
        return deliver(cb);

    // Buffer is empty, ask exactly one more piece from the connection.
    auto on_read = [this, cb](int status, std::string_view data) {
        if (status < 0)
            return cb(error::transport(status), std::string_view());
        if (data.empty())
            return cb(error::protocol(400, "Unexpected EOF"),
                    std::string_view());
        if (!buf.push(data))
            return cb(error::transport(UV_ENOMEM), std::string_view());
        deliver(cb);
    };
    int r = s.read(on_read);
    if (r < 0)
        cb(error::transport(r), std::string_view());
}

void length_body_reader::deliver(const chunk_cb &cb) noexcept
{
    size_t n = (size_t)std::min<int64_t>(remaining, buf.length());
    chunk.assign(buf.data(), n);
    buf.pop(n);
    remaining -= n;
    cb(error(), chunk);
}

///
/// chunked_body_reader
///

void chunked_body_reader::read(chunk_cb cb) noexcept
{
    if (failure)
        return cb(failure, std::string_view());

    error err;
    switch (step(err)) {
    case STEP_CHUNK:
        return cb(error(), chunk);
    case STEP_END:
        return cb(error(), std::string_view());
    case STEP_FAILED:
        failure = err;
        return cb(err, std::string_view());
    case STEP_MORE:
        break;
    }

    auto on_read = [this, cb](int status, std::string_view data) {
        if (status < 0) {
            failure = error::transport(status);
            return cb(failure, std::string_view());
        }
        if (data.empty()) {
            failure = error::protocol(400, "Unexpected end of chunked body");
            return cb(failure, std::string_view());
        }
        if (!buf.push(data)) {
            failure = error::transport(UV_ENOMEM);
            return cb(failure, std::string_view());
        }
        read(cb);
    };
    int r = s.read(on_read);
    if (r < 0)
        cb(error::transport(r), std::string_view());
}

chunked_body_reader::step_result chunked_body_reader::step(error &err)
    noexcept
{
    for (;;) {
        switch (state) {
        case STATE_SIZE: {
            size_t eol = buf.find(CRLF);
            if (eol == dynamic_buffer::npos) {
                if (buf.length() > MAX_SIZE_LINE) {
                    err = error::protocol(400, "Invalid chunk size");
                    return STEP_FAILED;
                }
                return STEP_MORE;
            }
            uint64_t size;
            if (eol > MAX_SIZE_LINE ||
                !parse_chunk_size(std::string_view(buf.data(), eol), size)) {
                err = error::protocol(400, "Invalid chunk size");
                return STEP_FAILED;
            }
            if (size > MAX_CHUNK_SIZE) {
                err = error::protocol(413, "Chunk too large");
                return STEP_FAILED;
            }
            buf.pop(eol + CRLF.size());
            if (size) {
                chunk_size = size;
                state = STATE_DATA;
            }
            else
                state = STATE_TRAILER;
            break;
        }

        case STATE_DATA:
            if (buf.length() < chunk_size + CRLF.size())
                return STEP_MORE;
            if (buf.view().substr(chunk_size, CRLF.size()) != CRLF) {
                err = error::protocol(400, "Bad chunk terminator");
                return STEP_FAILED;
            }
            chunk.assign(buf.data(), chunk_size);
            buf.pop(chunk_size + CRLF.size());
            state = STATE_SIZE;
            return STEP_CHUNK;

        case STATE_TRAILER: {
            size_t eol = buf.find(CRLF);
            if (eol == dynamic_buffer::npos) {
                if (trailer_size + buf.length() > MAX_HEADER_SIZE) {
                    err = error::protocol(413, "Header too long");
                    return STEP_FAILED;
                }
                return STEP_MORE;
            }
            buf.pop(eol + CRLF.size());
            if (!eol) {
                state = STATE_DONE;
                return STEP_END;
            }
            trailer_size += eol + CRLF.size();
            if (trailer_size > MAX_HEADER_SIZE) {
                err = error::protocol(413, "Header too long");
                return STEP_FAILED;
            }
            break;
        }

        case STATE_DONE:
            return STEP_END;
        }
    }
}

bool parse_chunk_size(std::string_view line, uint64_t &size) noexcept
{
    size_t ext = line.find(';');
    if (ext != std::string_view::npos)
        line = line.substr(0, ext);
    // BWS before chunk-ext
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t'))
        line.remove_suffix(1);
    if (line.empty() || line.size() > 16)
        return false;

    size = 0;
    for (char c : line) {
        int v = hex_value(c);
        if (v < 0)
            return false;
        size = (size << 4) | v;
    }
    return true;
}

///
/// Body selection
///

bool parse_content_length(std::string_view value, int64_t &length) noexcept
{
    if (value.empty())
        return false;
    int64_t res = 0;
    for (char c : value) {
        if (c < '0' || c > '9')
            return false;
        if (res > (std::numeric_limits<int64_t>::max() - (c - '0')) / 10)
            return false;
        res = res * 10 + (c - '0');
    }
    length = res;
    return true;
}

std::shared_ptr<body_reader> make_request_body(const http_request &req,
        stream &s, dynamic_buffer &buf, error &err) noexcept
{
    int64_t body_len = -1;
    std::string_view value;
    if (req.get_field("Content-Length", value) &&
        !parse_content_length(value, body_len)) {
        err = error::protocol(400, "Bad Content-Length");
        return nullptr;
    }

    bool chunked = req.get_field("Transfer-Encoding", value) &&
        iequals(value, "chunked");
    bool body_allowed = req.method != http_method::GET &&
        req.method != http_method::HEAD;

    if (!body_allowed && (body_len > 0 || chunked)) {
        err = error::protocol(400, "Body not allowed");
        return nullptr;
    }
    if (!body_allowed)
        body_len = 0;

    try {
        if (chunked)
            return std::make_shared<chunked_body_reader>(s, buf);
        if (body_len >= 0)
            return std::make_shared<length_body_reader>(s, buf, body_len);
    }
    catch (const std::bad_alloc &) {
        nazarick_log(LOG_EMERG, "Can't allocate memory for request body");
        err = error::transport(UV_ENOMEM);
        return nullptr;
    }

    nazarick_log(LOG_WARNING, "%s request without body length",
            method_name(req.method));
    err = error::protocol(411, "Length required");
    return nullptr;
}

} // namespace nazarick
