/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nazarick/body_reader.hpp>
#include <nazarick/error.hpp>

namespace nazarick {

class stream;

struct http_response {
    int code = 200;
    /// Header lines without CRLF. Content-Length is added by the writer.
    std::vector<std::string> headers;
    std::shared_ptr<body_reader> body;
};

/// Reason phrase for status code or "Unknown".
const char * reason_phrase(int code) noexcept;

/// Status line, header lines and blank line, each terminated by CRLF.
std::string encode_response_head(const http_response &res);

/// Writes one response at a time: head with one write, then every body
/// chunk with its own write until the body ends.
class response_writer {
public:
    using done_cb = std::function<void (error err)>;

    /// Appends Content-Length from the declared body length and starts
    /// writing. cb is called exactly once when the response is written or
    /// failed. Returns false without calling cb if the body length is
    /// unknown, memory is exhausted or another response is being written.
    bool start(stream &s, http_response res, done_cb cb) noexcept;
    bool active() const noexcept { return bool(done); }

private:
    void write_body() noexcept;
    void on_chunk(error err, std::string_view chunk) noexcept;
    void on_written(int status) noexcept;
    void finish(error err) noexcept;

    stream *s = nullptr;
    http_response res;
    done_cb done;
    /// write_body() loop is running. Completions arriving inside it
    /// only request next iteration.
    bool in_loop = false;
    bool again = false;
};

} // namespace nazarick
