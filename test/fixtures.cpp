/*
 * Copyright (C) Andrey Pikas
 */

#include "fixtures.hpp"

#include <cstdlib>
#include <new>

namespace {

bool fail_armed = false;
bool fail_happened = false;
size_t fail_min_size = 0;

} // namespace

void * operator new(size_t size)
{
    if (fail_armed && size >= fail_min_size) {
        fail_armed = false;
        fail_happened = true;
        throw std::bad_alloc();
    }
    if (void *p = malloc(size ? size : 1))
        return p;
    throw std::bad_alloc();
}

void operator delete(void *p) noexcept
{
    free(p);
}

void operator delete(void *p, size_t) noexcept
{
    free(p);
}

namespace nazarick {

allocation_failure::allocation_failure(size_t min_size)
{
    fail_min_size = min_size;
    fail_happened = false;
    fail_armed = true;
}

allocation_failure::~allocation_failure()
{
    fail_armed = false;
}

bool allocation_failure::happened() const
{
    return fail_happened;
}

::testing::AssertionResult uv_ok(ptrdiff_t r)
{
    if (r < 0)
        return ::testing::AssertionFailure() << uv_strerror(r) << " " <<
            uv_err_name(r);
    else
        return ::testing::AssertionSuccess();
}

void loop_fixture::SetUp()
{
    ASSERT_TRUE(uv_ok(uv_loop_init(&loop)));
}

void loop_fixture::TearDown()
{
    ASSERT_TRUE(uv_ok(uv_run(&loop, UV_RUN_NOWAIT)));
    EXPECT_TRUE(uv_ok(uv_loop_close(&loop)));
}

::testing::AssertionResult loop_fixture::run()
{
    int r = uv_run(&loop, UV_RUN_DEFAULT);
    if (r)
        return ::testing::AssertionFailure() << "loop stopped with " << r <<
            " active handles";
    return ::testing::AssertionSuccess();
}

::testing::AssertionResult loop_fixture::run_for(uint64_t ms)
{
    uv_timer_t timer;
    int r = uv_timer_init(&loop, &timer);
    if (r < 0)
        return uv_ok(r);
    r = uv_timer_start(&timer, [](uv_timer_t *t) {
        uv_close((uv_handle_t *)t, nullptr);
    }, ms, 0);
    if (r < 0) {
        uv_close((uv_handle_t *)&timer, nullptr);
        uv_run(&loop, UV_RUN_NOWAIT);
        return uv_ok(r);
    }
    // Timer is released before return.
    while (!uv_is_closing((uv_handle_t *)&timer))
        uv_run(&loop, UV_RUN_ONCE);
    uv_run(&loop, UV_RUN_NOWAIT);
    return ::testing::AssertionSuccess();
}

sockaddr_in loopback(int port)
{
    sockaddr_in addr;
    uv_ip4_addr("127.0.0.1", port, &addr);
    return addr;
}

namespace {

void finish(test_client *c, int status)
{
    c->read_status = status;
    c->finished = true;
    c->handle.data = c;
    uv_close((uv_handle_t *)&c->handle, [](uv_handle_t *h) {
        test_client *c = reinterpret_cast<test_client *>(h->data);
        if (c->on_finish)
            c->on_finish(*c);
    });
}

void on_alloc(uv_handle_t *h, size_t, uv_buf_t *buf)
{
    test_client *c = reinterpret_cast<test_client *>(h->data);
    *buf = uv_buf_init(c->buf, sizeof(c->buf));
}

void on_read(uv_stream_t *strm, ssize_t nread, const uv_buf_t *buf)
{
    test_client *c = reinterpret_cast<test_client *>(strm->data);
    if (nread > 0)
        c->response.append(buf->base, nread);
    else if (nread < 0)
        finish(c, (int)nread);
}

void on_write(uv_write_t *req, int status)
{
    test_client *c = reinterpret_cast<test_client *>(req->data);
    ASSERT_TRUE(uv_ok(status));
    if (c->shutdown)
        EXPECT_TRUE(uv_ok(uv_shutdown(&c->shutdown_req,
                        (uv_stream_t *)&c->handle,
                        [](uv_shutdown_t *, int status) {
                            EXPECT_TRUE(uv_ok(status));
                        })));
}

void on_connect(uv_connect_t *req, int status)
{
    test_client *c = reinterpret_cast<test_client *>(req->data);
    if (status < 0) {
        ADD_FAILURE() << "connect: " << uv_strerror(status);
        return finish(c, status);
    }
    ASSERT_TRUE(uv_ok(uv_read_start((uv_stream_t *)&c->handle, on_alloc,
                    on_read)));
    if (c->request.empty())
        return;
    c->write_req.data = c;
    uv_buf_t buf = uv_buf_init(&c->request[0], c->request.size());
    ASSERT_TRUE(uv_ok(uv_write(&c->write_req, (uv_stream_t *)&c->handle,
                    &buf, 1, on_write)));
}

} // namespace

void test_client::connect(uv_loop_t *loop, int port)
{
    ASSERT_TRUE(uv_ok(uv_tcp_init(loop, &handle)));
    handle.data = this;
    sockaddr_in addr = loopback(port);
    connect_req.data = this;
    ASSERT_TRUE(uv_ok(uv_tcp_connect(&connect_req, &handle,
                    (sockaddr *)&addr, on_connect)));
}

} // namespace nazarick
