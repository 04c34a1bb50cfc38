/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <gtest/gtest.h>
#include <uv.h>

namespace nazarick {

::testing::AssertionResult uv_ok(ptrdiff_t r);

/// Test owning event loop. Handles closed by the test are released in
/// TearDown(), so they must outlive it or be released by run().
struct loop_fixture : ::testing::Test {
    virtual void SetUp() override;
    virtual void TearDown() override;

    /// Run loop until there are no active handles.
    ::testing::AssertionResult run();
    /// Run one iteration with timeout of ms milliseconds.
    ::testing::AssertionResult run_for(uint64_t ms);

    uv_loop_t loop;
};

/// 127.0.0.1:port
sockaddr_in loopback(int port);

/// While alive, the next operator new call for at least min_size bytes
/// throws std::bad_alloc. Only one call fails.
class allocation_failure {
public:
    explicit allocation_failure(size_t min_size = 0);
    ~allocation_failure();
    allocation_failure(const allocation_failure &) = delete;
    void operator = (const allocation_failure &) = delete;

    bool happened() const;
};

/// Client connection. Sends request, optionally shuts down its sending
/// side and collects everything until the server closes the connection.
struct test_client {
    void connect(uv_loop_t *loop, int port);

    std::string request;
    bool shutdown = true;
    /// Called after the handle is closed.
    std::function<void (test_client &)> on_finish;

    std::string response;
    int read_status = 0;
    bool finished = false;

    uv_tcp_t handle;
    uv_connect_t connect_req;
    uv_write_t write_req;
    uv_shutdown_t shutdown_req;
    char buf[64 * 1024];
};

} // namespace nazarick
