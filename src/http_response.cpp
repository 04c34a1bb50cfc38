/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/http_response.hpp>

#include <cinttypes>
#include <new>

#include <nazarick/log.hpp>
#include <nazarick/stream.hpp>

namespace nazarick {

namespace {

struct status_reason {
    int code;
    const char *reason;
};

constexpr status_reason reasons[] = {
    {100, "Continue"},
    {101, "Switching Protocols"},
    {200, "OK"},
    {201, "Created"},
    {202, "Accepted"},
    {203, "Non-Authoritative Information"},
    {204, "No Content"},
    {205, "Reset Content"},
    {206, "Partial Content"},
    {300, "Multiple Choices"},
    {301, "Moved Permanently"},
    {302, "Found"},
    {303, "See Other"},
    {304, "Not Modified"},
    {305, "Use Proxy"},
    {307, "Temporary Redirect"},
    {308, "Permanent Redirect"},
    {400, "Bad Request"},
    {401, "Unauthorized"},
    {402, "Payment Required"},
    {403, "Forbidden"},
    {404, "Not Found"},
    {405, "Method Not Allowed"},
    {406, "Not Acceptable"},
    {407, "Proxy Authentication Required"},
    {408, "Request Timeout"},
    {409, "Conflict"},
    {410, "Gone"},
    {411, "Length Required"},
    {412, "Precondition Failed"},
    {413, "Payload Too Large"},
    {414, "URI Too Long"},
    {415, "Unsupported Media Type"},
    {416, "Range Not Satisfiable"},
    {417, "Expectation Failed"},
    {418, "I'm a teapot"},
    {421, "Misdirected Request"},
    {422, "Unprocessable Entity"},
    {423, "Locked"},
    {424, "Failed Dependency"},
    {425, "Too Early"},
    {426, "Upgrade Required"},
    {428, "Precondition Required"},
    {429, "Too Many Requests"},
    {431, "Request Header Fields Too Large"},
    {451, "Unavailable For Legal Reasons"},
    {500, "Internal Server Error"},
    {501, "Not Implemented"},
    {502, "Bad Gateway"},
    {503, "Service Unavailable"},
    {504, "Gateway Timeout"},
    {505, "HTTP Version Not Supported"},
    {506, "Variant Also Negotiates"},
    {507, "Insufficient Storage"},
    {508, "Loop Detected"},
    {510, "Not Extended"},
    {511, "Network Authentication Required"},
};

} // namespace

const char * reason_phrase(int code) noexcept
{
    for (const status_reason &r : reasons)
        if (r.code == code)
            return r.reason;
    return "Unknown";
}

std::string encode_response_head(const http_response &res)
{
    std::string head = "HTTP/1.1 ";
    head += std::to_string(res.code);
    head += ' ';
    head += reason_phrase(res.code);
    head += "\r\n";
    for (const std::string &h : res.headers) {
        head += h;
        head += "\r\n";
    }
    head += "\r\n";
    return head;
}

bool response_writer::start(stream &s, http_response res, done_cb cb) noexcept
{
    if (done) {
        nazarick_log(LOG_ERR, "Response writing already in progress");
        return false;
    }
    if (!res.body || res.body->length() < 0) {
        nazarick_log(LOG_ERR, "Response body of unknown length not supported");
        return false;
    }

    std::string head;
    try {
        res.headers.push_back("Content-Length: " +
                std::to_string(res.body->length()));
        head = encode_response_head(res);
    }
    catch (const std::bad_alloc &) {
        nazarick_log(LOG_EMERG, "Can't allocate memory for response");
        return false;
    }
    this->s = &s;
    this->res = std::move(res);
    done = std::move(cb);

    nazarick_log(LOG_DEBUG, "Writing response %d with %" PRId64 " bytes body",
            this->res.code, this->res.body->length());
    int r = s.write(std::move(head),
            [this](int status) { on_written(status); });
    if (r < 0)
        finish(error::transport(r));
    return true;
}

void response_writer::write_body() noexcept
{
    in_loop = true;
    do {
        again = false;
        res.body->read([this](error err, std::string_view chunk) {
            on_chunk(err, chunk);
        });
    } while (again);
    in_loop = false;
}

void response_writer::on_chunk(error err, std::string_view chunk) noexcept
{
    if (err)
        return finish(err);
    if (chunk.empty())
        return finish(error());

    int r = s->write(std::string(chunk),
            [this](int status) { on_written(status); });
    if (r < 0)
        finish(error::transport(r));
}

void response_writer::on_written(int status) noexcept
{
    if (status < 0)
        return finish(error::transport(status));
    if (!done)
        return;
    if (in_loop)
        again = true;
    else
        write_body();
}

void response_writer::finish(error err) noexcept
{
    // Keep body alive until the owner is notified, it may be the reader
    // which produced the last chunk.
    http_response old = std::move(res);
    res = http_response();
    done_cb cb = std::move(done);
    done = nullptr;
    if (cb)
        cb(err);
}

} // namespace nazarick
