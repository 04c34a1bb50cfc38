/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstdint>

#include <uv.h>

#include <nazarick/handler.hpp>
#include <nazarick/http_connection.hpp>
#include <nazarick/list_node.hpp>
#include <nazarick/tcp_con.hpp>
#include <nazarick/tcp_server.hpp>

namespace nazarick {

/// Accepts connections one by one and serves each of them independently.
class http_server {
public:
    explicit http_server(request_handler handler = handle_request) noexcept;
    ~http_server();
    http_server(const http_server &) = delete;
    void operator = (const http_server &) = delete;

    /// Start listening and accepting. port 0 selects ephemeral port.
    bool start(uv_loop_t *loop, const char *ip, int port) noexcept;
    /// Close listener, all connections and timer. Loop must run after it
    /// to release them.
    void stop() noexcept;

    /// Port of listening socket or -1.
    int port() const noexcept { return listener.port(); }
    /// Connections idle for more than ms milliseconds are closed.
    /// 0 disables. Must be called before start().
    void set_idle_timeout(uint64_t ms) noexcept { idle_timeout = ms; }
    size_t connections_count() const noexcept { return clients.size(); }

    static constexpr uint64_t IDLE_TIMEOUT = 30'000;
    static constexpr uint64_t TIMER_PERIOD = 5'000;

private:
    struct client : public list_node<client> {
        explicit client(const request_handler &handler) noexcept
            : http(con, handler) {}

        tcp_con con;
        http_connection http;
    };

    void accept_next() noexcept;
    void on_accept(int status, uv_stream_t *server) noexcept;
    bool start_timer() noexcept;
    void on_timer_tick() noexcept;
    static void free_client(tcp_con *con) noexcept;

    request_handler handler;
    uv_loop_t *loop = nullptr;
    tcp_server listener;
    list_node<client> clients;
    uv_timer_t timer;
    uint64_t idle_timeout = IDLE_TIMEOUT;
    bool timer_started = false;
    bool stopping = false;
};

} // namespace nazarick
