/*
 * Copyright (C) Andrey Pikas
 */

#include <string>

#include <gtest/gtest.h>
#include <uv.h>

#include <nazarick/dynamic_buffer.hpp>
#include <nazarick/http_request.hpp>

#include "fixtures.hpp"

namespace nazarick {

namespace {

error cut_error(const std::string &data)
{
    dynamic_buffer buf;
    EXPECT_TRUE(buf.push(data));
    http_request req;
    error err;
    EXPECT_EQ(cut_result::FAILED, cut_message(buf, req, err));
    return err;
}

} // namespace

TEST(cut_message, complete)
{
    const std::string head = "GET / HTTP/1.1\r\nHost: a\r\n\r\n";
    dynamic_buffer buf;
    ASSERT_TRUE(buf.push(head + "tail"));
    http_request req;
    error err;
    ASSERT_EQ(cut_result::COMPLETE, cut_message(buf, req, err));
    EXPECT_FALSE(err);
    EXPECT_EQ(http_method::GET, req.method);
    EXPECT_EQ("/", req.uri);
    EXPECT_EQ("1.1", req.version);
    ASSERT_EQ(1U, req.headers.size());
    EXPECT_EQ("Host: a", req.headers[0]);
    EXPECT_EQ("tail", buf.view());
}

TEST(cut_message, need_more)
{
    dynamic_buffer buf;
    ASSERT_TRUE(buf.push("GET / HTTP/1.1\r\nHost: a\r\n"));
    size_t len = buf.length();
    http_request req;
    error err;
    EXPECT_EQ(cut_result::NEED_MORE, cut_message(buf, req, err));
    EXPECT_FALSE(err);
    EXPECT_EQ(len, buf.length());
}

TEST(cut_message, header_too_long)
{
    error err = cut_error("GET / HTTP/1.1\r\nX: " +
            std::string(MAX_HEADER_SIZE, 'a'));
    EXPECT_EQ(413, err.http_status);
    EXPECT_STREQ("Header too long", err.message);
}

TEST(cut_message, limit_not_reached)
{
    dynamic_buffer buf;
    ASSERT_TRUE(buf.push(std::string(MAX_HEADER_SIZE, 'a')));
    http_request req;
    error err;
    EXPECT_EQ(cut_result::NEED_MORE, cut_message(buf, req, err));
}

TEST(cut_message, out_of_memory)
{
    dynamic_buffer buf;
    ASSERT_TRUE(buf.push("GET / HTTP/1.1\r\nHost: a\r\n\r\n"));
    size_t len = buf.length();
    http_request req;
    error err;
    {
        allocation_failure fail;
        EXPECT_EQ(cut_result::FAILED, cut_message(buf, req, err));
        EXPECT_TRUE(fail.happened());
    }
    EXPECT_FALSE(err.is_protocol());
    EXPECT_EQ(UV_ENOMEM, err.uv_status);
    EXPECT_EQ(len, buf.length());

    // Nothing is lost, the same block is parsed later.
    err = error();
    EXPECT_EQ(cut_result::COMPLETE, cut_message(buf, req, err));
    EXPECT_EQ("/", req.uri);
}

TEST(cut_message, pipelined)
{
    dynamic_buffer buf;
    ASSERT_TRUE(buf.push("GET /a HTTP/1.1\r\n\r\nHEAD /b HTTP/1.0\r\n\r\n"));
    http_request req;
    error err;
    ASSERT_EQ(cut_result::COMPLETE, cut_message(buf, req, err));
    EXPECT_EQ("/a", req.uri);
    ASSERT_EQ(cut_result::COMPLETE, cut_message(buf, req, err));
    EXPECT_EQ(http_method::HEAD, req.method);
    EXPECT_EQ("/b", req.uri);
    EXPECT_EQ("1.0", req.version);
    EXPECT_TRUE(req.headers.empty());
    EXPECT_TRUE(buf.empty());
}

TEST(parse_request, methods)
{
    for (const char *m : {"GET", "POST", "PUT", "DELETE", "HEAD", "TRACE"}) {
        http_request req;
        error err;
        std::string head = std::string(m) + " /x HTTP/1.1\r\n\r\n";
        EXPECT_TRUE(parse_request(head, req, err)) << m;
        EXPECT_STREQ(m, method_name(req.method));
    }
}

TEST(parse_request, method_not_allowed)
{
    EXPECT_EQ(405, cut_error("PATCH / HTTP/1.1\r\n\r\n").http_status);
    EXPECT_EQ(405, cut_error("get / HTTP/1.1\r\n\r\n").http_status);
}

TEST(parse_request, options)
{
    EXPECT_EQ(400, cut_error("OPTIONS /foo HTTP/1.1\r\n\r\n").http_status);

    http_request req;
    error err;
    EXPECT_TRUE(parse_request("OPTIONS * HTTP/1.1\r\n\r\n", req, err));
    EXPECT_EQ(http_method::OPTIONS, req.method);
    EXPECT_EQ("*", req.uri);
}

TEST(parse_request, connect)
{
    EXPECT_EQ(400, cut_error("CONNECT foo HTTP/1.1\r\n\r\n").http_status);

    http_request req;
    error err;
    EXPECT_TRUE(parse_request("CONNECT foo:443 HTTP/1.1\r\n\r\n", req, err));
    EXPECT_EQ("foo:443", req.uri);
}

TEST(parse_request, bad_request_line)
{
    EXPECT_EQ(400, cut_error("GET /\r\n\r\n").http_status);
    EXPECT_EQ(400, cut_error("GET  / HTTP/1.1\r\n\r\n").http_status);
    EXPECT_EQ(400, cut_error("GET / HTTP/1.1 x\r\n\r\n").http_status);
}

TEST(parse_request, version)
{
    EXPECT_EQ(505, cut_error("GET / HTTP/2.0\r\n\r\n").http_status);
    EXPECT_EQ(505, cut_error("GET / HTTP/1.2\r\n\r\n").http_status);
    EXPECT_EQ(505, cut_error("GET / FTP/1.1\r\n\r\n").http_status);
}

TEST(parse_request, bad_header)
{
    const char *lines[] = {
        "Host a",
        ": a",
        "Host:",
        "Host : a",
    };
    for (const char *line : lines) {
        error err = cut_error(std::string("GET / HTTP/1.1\r\n") + line +
                "\r\n\r\n");
        EXPECT_EQ(400, err.http_status) << line;
        EXPECT_STREQ("Bad header", err.message) << line;
    }
}

TEST(parse_request, header_order)
{
    http_request req;
    error err;
    ASSERT_TRUE(parse_request(
                "POST /echo HTTP/1.1\r\n"
                "B: 1\r\n"
                "A: 2\r\n"
                "b: 3\r\n"
                "\r\n", req, err));
    ASSERT_EQ(3U, req.headers.size());
    EXPECT_EQ("B: 1", req.headers[0]);
    EXPECT_EQ("A: 2", req.headers[1]);
    EXPECT_EQ("b: 3", req.headers[2]);
}

TEST(http_request, get_field)
{
    http_request req;
    req.headers = {"Host: example", "content-LENGTH:\t 12 ", "X: a: b"};
    std::string_view value;
    ASSERT_TRUE(req.get_field("Content-Length", value));
    EXPECT_EQ("12", value);
    ASSERT_TRUE(req.get_field("host", value));
    EXPECT_EQ("example", value);
    ASSERT_TRUE(req.get_field("X", value));
    EXPECT_EQ("a: b", value);
    EXPECT_FALSE(req.get_field("Transfer-Encoding", value));
}

TEST(http_request, iequals)
{
    EXPECT_TRUE(iequals("Chunked", "chunked"));
    EXPECT_FALSE(iequals("chunked,gzip", "chunked"));
    EXPECT_FALSE(iequals("", "a"));
}

} // namespace nazarick
