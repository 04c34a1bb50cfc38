/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

namespace nazarick {

/// Failure of some step of request processing.
/// Protocol error carries HTTP status code and is reported to the client.
/// Transport error carries libuv error code and closes connection silently.
/// Default constructed value means success.
struct error {
    int http_status = 0;
    int uv_status = 0;
    const char *message = "";

    explicit operator bool () const noexcept
    {
        return http_status || uv_status;
    }
    bool is_protocol() const noexcept { return http_status; }
    bool is_transport() const noexcept { return uv_status; }

    /// message must be a string with static storage duration.
    static error protocol(int http_status, const char *message) noexcept
    {
        error e;
        e.http_status = http_status;
        e.message = message;
        return e;
    }

    static error transport(int uv_status) noexcept
    {
        error e;
        e.uv_status = uv_status;
        e.message = "Transport error";
        return e;
    }
};

} // namespace nazarick
