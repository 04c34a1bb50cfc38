/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/tcp_server.hpp>

#include <cstring>
#include <new>

#include <arpa/inet.h>

#include <nazarick/log.hpp>

namespace nazarick {

constexpr int tcp_server::BACKLOG;

tcp_server::tcp_server() noexcept
{
    memset(&addr, 0, sizeof(addr));
}

bool tcp_server::init(uv_loop_t *loop, const char *ip, int port) noexcept
{
    int r;
    if ((r = uv_ip4_addr(ip, port, (sockaddr_in *)&addr)) < 0) {
        int r2 = uv_ip6_addr(ip, port, (sockaddr_in6 *)&addr);
        if (r2 < 0) {
            nazarick_log_uv_err(LOG_EMERG, "uv_ip4_addr", r);
            nazarick_log_uv_err(LOG_EMERG, "uv_ip6_addr", r2);
            return false;
        }
    }

    if ((r = uv_tcp_init(loop, &handle)) < 0) {
        nazarick_log_uv_err(LOG_EMERG, "uv_tcp_init", r);
        return false;
    }
    handle.data = this;
    initialized = true;
    return true;
}

bool tcp_server::listen() noexcept
{
    int r = uv_tcp_bind(&handle, (const sockaddr *)&addr, 0);
    if (r < 0) {
        nazarick_log_uv_err(LOG_EMERG, "uv_tcp_bind", r);
        err = r;
        return false;
    }

    r = uv_listen(base(), BACKLOG, on_connection);
    if (r < 0) {
        nazarick_log_uv_err(LOG_EMERG, "uv_listen", r);
        err = r;
        return false;
    }
    listening_ = true;
    nazarick_log(LOG_NOTICE, "Listening on port %d", port());
    return true;
}

int tcp_server::accept(accept_cb cb) noexcept
{
    if (acceptor) {
        nazarick_log(LOG_ERR, "accept already pending");
        return UV_EALREADY;
    }
    if (!initialized) {
        cb(UV_EINVAL, nullptr);
        return 0;
    }
    if (err || (!listening_ && !listen())) {
        cb(err, nullptr);
        return 0;
    }

    if (ready) {
        --ready;
        cb(0, base());
        return 0;
    }
    acceptor = std::move(cb);
    return 0;
}

void tcp_server::close() noexcept
{
    if (!err)
        err = UV_ECANCELED;
    if (initialized && !uv_is_closing((uv_handle_t *)&handle))
        uv_close((uv_handle_t *)&handle, nullptr);
    listening_ = false;
    if (acceptor)
        fulfill(err);
}

void tcp_server::reject(uv_stream_t *server) noexcept
{
    uv_tcp_t *h = new (std::nothrow) uv_tcp_t;
    if (!h) {
        nazarick_log(LOG_EMERG, "Can't allocate memory to reject connection");
        return;
    }

    int r;
    if ((r = uv_tcp_init(server->loop, h)) < 0) {
        nazarick_log_uv_err(LOG_EMERG, "uv_tcp_init", r);
        delete h;
        return;
    }
    if ((r = uv_accept(server, (uv_stream_t *)h)) < 0) {
        nazarick_log_uv_err(LOG_ERR, "uv_accept", r);
        resume(server);
    }
    else
        nazarick_log(LOG_WARNING, "Connection rejected");
    uv_close((uv_handle_t *)h, [](uv_handle_t *h) {
        delete reinterpret_cast<uv_tcp_t *>(h);
    });
}

void tcp_server::resume(uv_stream_t *server) noexcept
{
    // Listening again on the same socket only restarts the watcher.
    int r = uv_listen(server, BACKLOG, on_connection);
    if (r < 0)
        nazarick_log_uv_err(LOG_EMERG, "uv_listen", r);
}

int tcp_server::port() const noexcept
{
    if (!listening_)
        return -1;
    sockaddr_storage name;
    int len = sizeof(name);
    int r = uv_tcp_getsockname(&handle, (sockaddr *)&name, &len);
    if (r < 0) {
        nazarick_log_uv_err(LOG_ERR, "uv_tcp_getsockname", r);
        return -1;
    }
    if (name.ss_family == AF_INET6)
        return ntohs(((const sockaddr_in6 *)&name)->sin6_port);
    return ntohs(((const sockaddr_in *)&name)->sin_port);
}

void tcp_server::fulfill(int status) noexcept
{
    accept_cb cb = std::move(acceptor);
    acceptor = nullptr;
    if (cb)
        cb(status, status < 0 ? nullptr : base());
}

void tcp_server::on_connection(uv_stream_t *server, int status) noexcept
{
    tcp_server *s = reinterpret_cast<tcp_server *>(server->data);
    if (status < 0) {
        nazarick_log_uv_err(LOG_ERR, "on_connection", status);
        if (s->acceptor)
            s->fulfill(status);
        return;
    }

    nazarick_log(LOG_DEBUG, "Connection received");
    if (s->acceptor)
        s->fulfill(0);
    else
        // libuv stops polling listening socket until this connection is
        // accepted, others wait in kernel backlog.
        ++s->ready;
}

} // namespace nazarick
