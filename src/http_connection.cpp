/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/http_connection.hpp>

#include <exception>
#include <new>

#include <uv.h>

#include <nazarick/log.hpp>
#include <nazarick/stream.hpp>

namespace nazarick {

http_connection::http_connection(stream &s, request_handler handler) noexcept
    : s(s), handler(std::move(handler))
{
}

void http_connection::start() noexcept
{
    state_ = STATE_AWAIT_HEADERS;
    process_headers();
}

void http_connection::close() noexcept
{
    if (state_ == STATE_CLOSE)
        return;
    state_ = STATE_CLOSE;
    s.close();
}

void http_connection::process_headers() noexcept
{
    if (state_ != STATE_AWAIT_HEADERS)
        return;

    error err;
    switch (cut_message(buf, req, err)) {
    case cut_result::COMPLETE:
        return handle();
    case cut_result::FAILED:
        return fail(err);
    case cut_result::NEED_MORE:
        break;
    }

    int r = s.read([this](int status, std::string_view data) {
        on_read(status, data);
    });
    if (r < 0) {
        nazarick_log_uv_err(LOG_ERR, "read", r);
        close();
    }
}

void http_connection::on_read(int status, std::string_view data) noexcept
{
    if (state_ != STATE_AWAIT_HEADERS)
        return;
    if (status < 0) {
        if (status != UV_ECANCELED)
            nazarick_log_uv_err(LOG_INFO, "Reading request", status);
        return close();
    }
    if (data.empty()) {
        if (buf.empty()) {
            nazarick_log(LOG_DEBUG, "Connection %s finished", s.name());
            return close();
        }
        return fail(error::protocol(400, "Unexpected EOF"));
    }
    if (!buf.push(data))
        return close();
    process_headers();
}

void http_connection::handle() noexcept
{
    state_ = STATE_HAVE_REQUEST;
    ++requests_;
    nazarick_log(LOG_INFO, "got %s request for %s from %s",
            method_name(req.method), req.uri.c_str(), s.name());

    error err;
    body = make_request_body(req, s, buf, err);
    if (!body)
        return fail(err);

    http_response res;
    try {
        res = handler(req, body);
    }
    catch (const std::exception &e) {
        nazarick_log(LOG_ERR, "Request handler failed: %s", e.what());
        return close();
    }

    bool ok = writer.start(s, std::move(res), [this](error result) {
        on_response_written(result);
    });
    if (!ok)
        close();
}

void http_connection::on_response_written(error err) noexcept
{
    if (state_ != STATE_HAVE_REQUEST)
        return;
    if (err)
        return fail(err);

    if (req.version == "1.0") {
        nazarick_log(LOG_DEBUG, "HTTP/1.0 connection %s done", s.name());
        return close();
    }
    state_ = STATE_DISCARD_BODY;
    discard_body();
}

void http_connection::discard_body() noexcept
{
    in_loop = true;
    do {
        again = false;
        body->read([this](error err, std::string_view chunk) {
            on_discarded(err, chunk);
        });
    } while (again && state_ == STATE_DISCARD_BODY);
    in_loop = false;
}

void http_connection::on_discarded(error err, std::string_view chunk) noexcept
{
    if (state_ != STATE_DISCARD_BODY)
        return;
    if (err)
        return fail(err);
    if (!chunk.empty()) {
        if (in_loop)
            again = true;
        else
            discard_body();
        return;
    }

    // Buffer is positioned at the start of the next request.
    state_ = STATE_AWAIT_HEADERS;
    process_headers();
}

void http_connection::fail(error err) noexcept
{
    if (state_ == STATE_CLOSE || state_ == STATE_FAIL)
        return;
    if (!err.is_protocol()) {
        if (err.is_transport() && err.uv_status != UV_ECANCELED)
            nazarick_log_uv_err(LOG_INFO, "Connection", err.uv_status);
        return close();
    }

    nazarick_log(LOG_INFO, "Request from %s failed: %d %s", s.name(),
            err.http_status, err.message);
    state_ = STATE_FAIL;

    http_response res;
    res.code = err.http_status;
    try {
        res.headers.push_back(SERVER_HEADER);
        res.body = std::make_shared<memory_body_reader>(
                std::string(err.message) + "\n");
    }
    catch (const std::bad_alloc &) {
        nazarick_log(LOG_EMERG, "Can't allocate memory for error response");
        return close();
    }
    bool ok = error_writer.start(s, std::move(res), [this](error result) {
        on_error_written(result);
    });
    if (!ok)
        close();
}

void http_connection::on_error_written(error err) noexcept
{
    if (state_ != STATE_FAIL)
        return;
    if (err)
        nazarick_log(LOG_WARNING, "Can't send error response to %s",
                s.name());
    close();
}

} // namespace nazarick
