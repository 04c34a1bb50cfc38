/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef>
#include <functional>

#include <uv.h>

namespace nazarick {

/// Listening TCP socket with sequential accept.
class tcp_server {
public:
    /// On success (status == 0) one connection must be accepted from server
    /// inside the callback.
    using accept_cb = std::function<void (int status, uv_stream_t *server)>;

    tcp_server() noexcept;

    /// Resolve address and initialize handle. Doesn't bind.
    bool init(uv_loop_t *loop, const char *ip, int port) noexcept;
    /// Wait for next connection. Socket is bound and starts listening on the
    /// first call. Returns UV_EALREADY without calling cb if another accept
    /// is pending. Otherwise cb is called exactly once.
    int accept(accept_cb cb) noexcept;
    /// Stop listening. Pending accept fails with UV_ECANCELED.
    /// Can be called only after init().
    void close() noexcept;

    /// Accept connection pending on server and close it at once. Must be
    /// called from accept callback when the connection can't be served,
    /// otherwise libuv doesn't report further connections.
    static void reject(uv_stream_t *server) noexcept;
    /// Restart polling of server after failed uv_accept().
    static void resume(uv_stream_t *server) noexcept;

    /// Port of bound socket or -1.
    int port() const noexcept;
    bool listening() const noexcept { return listening_; }

    static constexpr int BACKLOG = 511;

private:
    static void on_connection(uv_stream_t *server, int status) noexcept;
    bool listen() noexcept;
    void fulfill(int status) noexcept;
    uv_stream_t * base() noexcept
    {
        return reinterpret_cast<uv_stream_t *>(&handle);
    }

    uv_tcp_t handle;
    sockaddr_storage addr;
    /// Continuation of pending accept.
    accept_cb acceptor;
    /// Connections arrived while no accept was pending.
    size_t ready = 0;
    /// Sticky error of bind or listen.
    int err = 0;
    bool initialized = false;
    bool listening_ = false;
};

} // namespace nazarick
