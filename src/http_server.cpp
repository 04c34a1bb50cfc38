/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/http_server.hpp>

#include <algorithm>
#include <cassert>
#include <memory>
#include <new>

#include <nazarick/log.hpp>

namespace nazarick {

constexpr uint64_t http_server::IDLE_TIMEOUT;
constexpr uint64_t http_server::TIMER_PERIOD;

http_server::http_server(request_handler handler) noexcept
    : handler(std::move(handler))
{
}

http_server::~http_server()
{
    assert(clients.empty());
}

bool http_server::start(uv_loop_t *loop, const char *ip, int port) noexcept
{
    this->loop = loop;
    stopping = false;
    if (!listener.init(loop, ip, port))
        return false;

    // First accept binds the socket.
    accept_next();
    if (!listener.listening() || !start_timer()) {
        stop();
        return false;
    }
    return true;
}

void http_server::stop() noexcept
{
    if (stopping)
        return;
    stopping = true;
    nazarick_log(LOG_NOTICE, "Stopping server");

    listener.close();
    for (client &c : clients)
        c.http.close();
    if (timer_started && !uv_is_closing((uv_handle_t *)&timer))
        uv_close((uv_handle_t *)&timer, nullptr);
}

void http_server::accept_next() noexcept
{
    int r = listener.accept([this](int status, uv_stream_t *server) {
        on_accept(status, server);
    });
    if (r < 0)
        nazarick_log_uv_err(LOG_ERR, "accept", r);
}

void http_server::on_accept(int status, uv_stream_t *server) noexcept
{
    if (stopping)
        return;
    if (status < 0) {
        nazarick_log_uv_err(LOG_ERR, "Accepting connection", status);
        // Bind and listen errors are permanent.
        if (listener.listening())
            accept_next();
        return;
    }

    std::unique_ptr<client> c(new (std::nothrow) client(handler));
    if (!c) {
        nazarick_log(LOG_EMERG, "Can't allocate memory for connection");
        tcp_server::reject(server);
        return accept_next();
    }
    clients.push_back(c.get());
    client *cl = c.release();
    // On failure the client is released by free_client().
    if (cl->con.accept(loop, server, cl, free_client))
        cl->http.start();

    accept_next();
}

void http_server::free_client(tcp_con *con) noexcept
{
    client *c = reinterpret_cast<client *>(con->owner);
    c->remove_from_list();
    delete c;
}

bool http_server::start_timer() noexcept
{
    if (!idle_timeout)
        return true;

    int r;
    if ((r = uv_timer_init(loop, &timer)) < 0) {
        nazarick_log_uv_err(LOG_ERR, "uv_timer_init", r);
        return false;
    }
    timer_started = true;

    auto timeout_cb = [](uv_timer_t *t) {
        reinterpret_cast<http_server *>(t->data)->on_timer_tick();
    };

    timer.data = this;
    uint64_t period = std::min(TIMER_PERIOD, idle_timeout);
    if ((r = uv_timer_start(&timer, timeout_cb, period, period)) < 0) {
        nazarick_log_uv_err(LOG_ERR, "uv_timer_start", r);
        return false;
    }

    // Timer alone doesn't keep loop running.
    uv_unref((uv_handle_t *)&timer);
    return true;
}

void http_server::on_timer_tick() noexcept
{
    uint64_t now = uv_now(loop);
    for (client &c : clients) {
        if (c.http.closed() || now - c.con.last_activity() < idle_timeout)
            continue;
        nazarick_log(LOG_INFO, "Closing idle connection %s", c.con.name());
        // Client is released in the close callback, so list is intact.
        c.http.close();
    }
}

} // namespace nazarick
