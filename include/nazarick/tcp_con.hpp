/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstdint>

#include <uv.h>

#include <nazarick/stream.hpp>

namespace nazarick {

/// TCP connection with sequential read/write.
/// Reading is paused while no read is requested.
class tcp_con : public stream {
public:
    tcp_con() noexcept;

    /// Accept connection pending on server.
    /// deleter is called when the handle is fully closed. If returns false,
    /// deleter will be called later or was already called.
    bool accept(uv_loop_t *loop, uv_stream_t *server, void *owner,
            void (*deleter)(tcp_con *)) noexcept;

    virtual int read(read_cb cb) noexcept override;
    virtual int write(std::string data, write_cb cb) noexcept override;
    virtual void close() noexcept override;
    virtual const char * name() const noexcept override { return peer; }

    /// Loop time of last completed transport operation.
    uint64_t last_activity() const noexcept { return activity; }
    /// Sticky error. 0 if none.
    int last_error() const noexcept { return err; }
    bool ended() const noexcept { return eof; }

    void *owner = nullptr;

private:
    static void on_alloc(uv_handle_t *h, size_t size, uv_buf_t *buf) noexcept;
    static void on_read(uv_stream_t *s, ssize_t nread, const uv_buf_t *buf)
        noexcept;
    static void on_write(uv_write_t *req, int status) noexcept;
    static void on_close(uv_handle_t *h) noexcept;

    void fulfill_read(int status, std::string_view data) noexcept;
    void fulfill_write(int status) noexcept;
    void fetch_peer_name() noexcept;
    uv_stream_t * base() noexcept
    {
        return reinterpret_cast<uv_stream_t *>(&handle);
    }

    uv_tcp_t handle;
    uv_write_t write_req;
    /// Continuation of pending read.
    read_cb reader;
    /// Continuation of pending write.
    write_cb writer;
    /// Data of pending write. Must live until write completes.
    std::string write_buf;
    void (*deleter)(tcp_con *) = nullptr;
    uint64_t activity = 0;
    int err = 0;
    bool eof = false;
    bool initialized = false;
    char peer[64] = "";
    char read_buf[64 * 1024];
};

} // namespace nazarick
