/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/tcp_con.hpp>

#include <cstdio>

#include <arpa/inet.h>

#include <nazarick/log.hpp>
#include <nazarick/tcp_server.hpp>

namespace nazarick {

tcp_con::tcp_con() noexcept
{
    handle.data = this;
    write_req.data = this;
}

bool tcp_con::accept(uv_loop_t *loop, uv_stream_t *server, void *owner,
        void (*deleter)(tcp_con *)) noexcept
{
    this->owner = owner;
    this->deleter = deleter;

    int r;
    if ((r = uv_tcp_init(loop, &handle)) < 0) {
        nazarick_log_uv_err(LOG_ERR, "uv_tcp_init", r);
        tcp_server::reject(server);
        // Handle isn't registered in loop, close_cb will never be called.
        if (deleter)
            deleter(this);
        return false;
    }
    initialized = true;
    handle.data = this;
    activity = uv_now(loop);

    if ((r = uv_accept(server, base())) < 0) {
        nazarick_log_uv_err(LOG_ERR, "uv_accept", r);
        tcp_server::resume(server);
        err = r;
        close();
        return false;
    }

    if ((r = uv_tcp_nodelay(&handle, 1)) < 0)
        nazarick_log_uv_err(LOG_WARNING, "uv_tcp_nodelay", r);

    fetch_peer_name();
    nazarick_log(LOG_DEBUG, "Connection from %s accepted", peer);
    return true;
}

void tcp_con::fetch_peer_name() noexcept
{
    sockaddr_storage addr;
    int len = sizeof(addr);
    int r = uv_tcp_getpeername(&handle, (sockaddr *)&addr, &len);
    if (r < 0) {
        nazarick_log_uv_err(LOG_DEBUG, "uv_tcp_getpeername", r);
        return;
    }

    char ip[INET6_ADDRSTRLEN] = "";
    int port = 0;
    if (addr.ss_family == AF_INET) {
        const sockaddr_in *a = (const sockaddr_in *)&addr;
        uv_ip4_name(a, ip, sizeof(ip));
        port = ntohs(a->sin_port);
    }
    else if (addr.ss_family == AF_INET6) {
        const sockaddr_in6 *a = (const sockaddr_in6 *)&addr;
        uv_ip6_name(a, ip, sizeof(ip));
        port = ntohs(a->sin6_port);
    }
    snprintf(peer, sizeof(peer), "%s:%d", ip, port);
}

int tcp_con::read(read_cb cb) noexcept
{
    if (reader) {
        nazarick_log(LOG_ERR, "Read already pending on %s", peer);
        return UV_EALREADY;
    }
    if (err) {
        cb(err, std::string_view());
        return 0;
    }
    if (eof) {
        cb(0, std::string_view());
        return 0;
    }

    reader = std::move(cb);
    int r = uv_read_start(base(), on_alloc, on_read);
    if (r < 0) {
        nazarick_log_uv_err(LOG_ERR, "uv_read_start", r);
        err = r;
        fulfill_read(r, std::string_view());
    }
    return 0;
}

int tcp_con::write(std::string data, write_cb cb) noexcept
{
    if (writer) {
        nazarick_log(LOG_ERR, "Write already pending on %s", peer);
        return UV_EALREADY;
    }
    if (err) {
        cb(err);
        return 0;
    }
    if (data.empty()) {
        cb(0);
        return 0;
    }

    write_buf = std::move(data);
    writer = std::move(cb);
    uv_buf_t buf = uv_buf_init(&write_buf[0], write_buf.size());
    int r = uv_write(&write_req, base(), &buf, 1, on_write);
    if (r < 0) {
        nazarick_log_uv_err(LOG_ERR, "uv_write", r);
        err = r;
        fulfill_write(r);
    }
    return 0;
}

void tcp_con::close() noexcept
{
    if (!err)
        err = UV_ECANCELED;
    if (initialized && !uv_is_closing((uv_handle_t *)&handle))
        uv_close((uv_handle_t *)&handle, on_close);
    // libuv cancels pending write itself, but pending read must be resolved
    // here, otherwise its owner waits forever.
    if (reader)
        fulfill_read(err, std::string_view());
}

void tcp_con::fulfill_read(int status, std::string_view data) noexcept
{
    read_cb cb = std::move(reader);
    reader = nullptr;
    if (cb)
        cb(status, data);
}

void tcp_con::fulfill_write(int status) noexcept
{
    write_cb cb = std::move(writer);
    writer = nullptr;
    write_buf.clear();
    if (cb)
        cb(status);
}

void tcp_con::on_alloc(uv_handle_t *h, size_t /*size*/, uv_buf_t *buf) noexcept
{
    tcp_con *con = reinterpret_cast<tcp_con *>(h->data);
    *buf = uv_buf_init(con->read_buf, sizeof(con->read_buf));
}

void tcp_con::on_read(uv_stream_t *s, ssize_t nread, const uv_buf_t *buf)
    noexcept
{
    if (!nread)
        return; // EAGAIN
    tcp_con *con = reinterpret_cast<tcp_con *>(s->data);
    con->activity = uv_now(s->loop);

    // Pause reading until next read() call.
    int r = uv_read_stop(s);
    if (r < 0)
        nazarick_log_uv_err(LOG_ERR, "uv_read_stop", r);

    if (nread == UV_EOF)
        con->eof = true;
    else if (nread < 0) {
        nazarick_log_uv_err(LOG_ERR, "read", (int)nread);
        con->err = (int)nread;
    }

    if (!con->reader) {
        if (nread > 0)
            nazarick_log(LOG_ERR, "Data from %s received without reader",
                    con->peer);
        return;
    }

    if (nread > 0)
        con->fulfill_read(0, std::string_view(buf->base, nread));
    else if (con->eof) {
        nazarick_log(LOG_DEBUG, "EOF from %s", con->peer);
        con->fulfill_read(0, std::string_view());
    }
    else
        con->fulfill_read(con->err, std::string_view());
}

void tcp_con::on_write(uv_write_t *req, int status) noexcept
{
    tcp_con *con = reinterpret_cast<tcp_con *>(req->data);
    con->activity = uv_now(req->handle->loop);
    if (status < 0) {
        if (status != UV_ECANCELED)
            nazarick_log_uv_err(LOG_ERR, "write", status);
        if (!con->err)
            con->err = status;
    }
    con->fulfill_write(status);
}

void tcp_con::on_close(uv_handle_t *h) noexcept
{
    tcp_con *con = reinterpret_cast<tcp_con *>(h->data);
    nazarick_log(LOG_DEBUG, "Connection %s closed", con->peer);
    if (con->deleter)
        con->deleter(con);
}

} // namespace nazarick
