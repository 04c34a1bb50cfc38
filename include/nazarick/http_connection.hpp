/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <memory>

#include <nazarick/body_reader.hpp>
#include <nazarick/dynamic_buffer.hpp>
#include <nazarick/error.hpp>
#include <nazarick/handler.hpp>
#include <nazarick/http_request.hpp>
#include <nazarick/http_response.hpp>

namespace nazarick {

class stream;

/// Serves requests of one connection strictly one after another.
/// Protocol errors are answered with error response and the stream is closed.
/// Transport and internal errors close the stream without response.
class http_connection {
public:
    enum state_enum {
        STATE_AWAIT_HEADERS,
        STATE_HAVE_REQUEST,
        STATE_DISCARD_BODY,
        /// Writing error response. The stream is closed after it.
        STATE_FAIL,
        STATE_CLOSE
    };

    http_connection(stream &s, request_handler handler) noexcept;
    http_connection(const http_connection &) = delete;
    void operator = (const http_connection &) = delete;

    void start() noexcept;
    /// Close the stream. Completions arriving later are ignored.
    void close() noexcept;

    state_enum state() const noexcept { return state_; }
    bool closed() const noexcept { return state_ == STATE_CLOSE; }
    /// Number of requests passed to handler.
    size_t requests() const noexcept { return requests_; }

private:
    void process_headers() noexcept;
    void on_read(int status, std::string_view data) noexcept;
    void handle() noexcept;
    void on_response_written(error err) noexcept;
    void discard_body() noexcept;
    void on_discarded(error err, std::string_view chunk) noexcept;
    void fail(error err) noexcept;
    void on_error_written(error err) noexcept;

    stream &s;
    request_handler handler;
    dynamic_buffer buf;
    http_request req;
    std::shared_ptr<body_reader> body;
    response_writer writer;
    response_writer error_writer;
    state_enum state_ = STATE_AWAIT_HEADERS;
    size_t requests_ = 0;
    /// discard_body() loop is running.
    bool in_loop = false;
    bool again = false;
};

} // namespace nazarick
