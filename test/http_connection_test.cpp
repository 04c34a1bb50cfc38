/*
 * Copyright (C) Andrey Pikas
 */

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <uv.h>

#include <nazarick/handler.hpp>
#include <nazarick/http_connection.hpp>

#include "script_stream.hpp"

namespace nazarick {

namespace {

const std::string GREETING_RESPONSE =
    "HTTP/1.1 200 OK\r\n"
    "Server: Nazarick\r\n"
    "Content-Length: 20\r\n"
    "\r\n"
    "Hello From Nazarick\n";

std::string error_response(int code, const std::string &message)
{
    return "HTTP/1.1 " + std::to_string(code) + " " + reason_phrase(code) +
        "\r\nServer: Nazarick\r\nContent-Length: " +
        std::to_string(message.size() + 1) + "\r\n\r\n" + message + "\n";
}

struct run_result {
    std::string written;
    size_t requests;
    bool closed;
};

run_result run(std::deque<std::string> chunks)
{
    script_stream s(std::move(chunks));
    http_connection con(s, handle_request);
    con.start();
    EXPECT_TRUE(con.closed());
    return {s.written, con.requests(), s.closed};
}

} // namespace

TEST(http_connection, greeting)
{
    run_result r = run({"GET / HTTP/1.1\r\n\r\n"});
    EXPECT_EQ(GREETING_RESPONSE, r.written);
    EXPECT_EQ(1U, r.requests);
    EXPECT_TRUE(r.closed);
}

TEST(http_connection, headers_in_pieces)
{
    run_result r = run({"GE", "T /index.html HT", "TP/1.1\r\nHost: a\r", "\n",
            "\r\n"});
    EXPECT_EQ(GREETING_RESPONSE, r.written);
}

TEST(http_connection, echo)
{
    run_result r = run({"POST /echo HTTP/1.1\r\nContent-Length: 3\r\n\r\nabc"});
    EXPECT_EQ("HTTP/1.1 200 OK\r\n"
            "Server: Nazarick\r\n"
            "Content-Length: 3\r\n"
            "\r\n"
            "abc", r.written);
}

TEST(http_connection, echo_body_in_later_read)
{
    run_result r = run({"PUT /echo HTTP/1.1\r\nContent-Length: 5\r\n\r\n",
            "he", "llo"});
    EXPECT_EQ("HTTP/1.1 200 OK\r\n"
            "Server: Nazarick\r\n"
            "Content-Length: 5\r\n"
            "\r\n"
            "hello", r.written);
}

TEST(http_connection, echo_unexpected_eof)
{
    run_result r = run({"POST /echo HTTP/1.1\r\nContent-Length: 3\r\n\r\nab"});
    EXPECT_EQ("HTTP/1.1 200 OK\r\n"
            "Server: Nazarick\r\n"
            "Content-Length: 3\r\n"
            "\r\n"
            "ab" + error_response(400, "Unexpected EOF"), r.written);
    EXPECT_TRUE(r.closed);
}

TEST(http_connection, body_not_allowed)
{
    run_result r = run({"GET / HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello"});
    EXPECT_EQ(error_response(400, "Body not allowed"), r.written);
    EXPECT_TRUE(r.closed);
}

TEST(http_connection, protocol_errors)
{
    struct {
        const char *request;
        int code;
        const char *message;
    } cases[] = {
        {"PATCH / HTTP/1.1\r\n\r\n", 405, "Method not allowed"},
        {"OPTIONS /foo HTTP/1.1\r\n\r\n", 400, "Bad URI"},
        {"CONNECT foo HTTP/1.1\r\n\r\n", 400, "Bad URI"},
        {"GET / HTTP/2.0\r\n\r\n", 505, "HTTP version not supported"},
        {"GET / HTTP/1.1\r\nHost\r\n\r\n", 400, "Bad header"},
        {"POST / HTTP/1.1\r\n\r\n", 411, "Length required"},
        {"POST / HTTP/1.1\r\nContent-Length: x\r\n\r\n", 400,
            "Bad Content-Length"},
        {"GET / HTTP/1.1", 400, "Unexpected EOF"},
    };
    for (const auto &c : cases) {
        run_result r = run({c.request});
        EXPECT_EQ(error_response(c.code, c.message), r.written) << c.request;
        EXPECT_TRUE(r.closed);
    }
}

TEST(http_connection, header_too_long)
{
    run_result r = run({"GET / HTTP/1.1\r\n", "X: " + std::string(9000, 'a')});
    EXPECT_EQ(error_response(413, "Header too long"), r.written);
    EXPECT_EQ(0U, r.requests);
}

TEST(http_connection, clean_close)
{
    run_result r = run({});
    EXPECT_TRUE(r.written.empty());
    EXPECT_EQ(0U, r.requests);
    EXPECT_TRUE(r.closed);
}

TEST(http_connection, keep_alive)
{
    run_result r = run({"GET /a HTTP/1.1\r\n\r\nGET /b HTTP/1.1\r\n\r\n",
            "GET /c HTTP/1.1\r\n\r\n"});
    EXPECT_EQ(GREETING_RESPONSE + GREETING_RESPONSE + GREETING_RESPONSE,
            r.written);
    EXPECT_EQ(3U, r.requests);
}

TEST(http_connection, http10_closes)
{
    run_result r = run({"GET / HTTP/1.0\r\n\r\nGET / HTTP/1.1\r\n\r\n"});
    EXPECT_EQ(GREETING_RESPONSE, r.written);
    EXPECT_EQ(1U, r.requests);
    EXPECT_TRUE(r.closed);
}

TEST(http_connection, discards_unread_body)
{
    run_result r = run({"POST / HTTP/1.1\r\nContent-Length: 4\r\n\r\nbo",
            "dyGET / HTTP/1.1\r\n\r\n"});
    EXPECT_EQ(GREETING_RESPONSE + GREETING_RESPONSE, r.written);
    EXPECT_EQ(2U, r.requests);
}

TEST(http_connection, discards_chunked_body)
{
    std::string body;
    for (int i = 0; i < 1000; ++i)
        body += "1\r\nx\r\n";
    run_result r = run({"POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n" +
            body + "0\r\n\r\nGET / HTTP/1.1\r\n\r\n"});
    EXPECT_EQ(GREETING_RESPONSE + GREETING_RESPONSE, r.written);
    EXPECT_EQ(2U, r.requests);
}

TEST(http_connection, bad_chunked_body)
{
    run_result r = run({"POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
            "zz\r\n"});
    EXPECT_EQ(GREETING_RESPONSE + error_response(400, "Invalid chunk size"),
            r.written);
}

TEST(http_connection, echo_chunked_closes)
{
    // Response of unknown length can't be written.
    run_result r = run({"POST /echo HTTP/1.1\r\nTransfer-Encoding: chunked\r\n"
            "\r\n3\r\nfoo\r\n0\r\n\r\n"});
    EXPECT_TRUE(r.written.empty());
    EXPECT_TRUE(r.closed);
}

TEST(http_connection, transport_error_no_response)
{
    script_stream s({"GET / HT"});
    s.read_error = UV_ECONNRESET;
    http_connection con(s, handle_request);
    con.start();
    EXPECT_TRUE(con.closed());
    EXPECT_TRUE(s.written.empty());
}

TEST(http_connection, error_response_write_fails)
{
    script_stream s({"PATCH / HTTP/1.1\r\n\r\n"});
    s.write_error = UV_EPIPE;
    http_connection con(s, handle_request);
    con.start();
    EXPECT_TRUE(con.closed());
    EXPECT_TRUE(s.closed);
}

TEST(http_connection, close_while_reading)
{
    script_stream s;
    s.hang = true;
    http_connection con(s, handle_request);
    con.start();
    EXPECT_EQ(http_connection::STATE_AWAIT_HEADERS, con.state());
    con.close();
    EXPECT_TRUE(con.closed());
    EXPECT_TRUE(s.closed);
    EXPECT_TRUE(s.written.empty());
}

TEST(http_connection, custom_handler)
{
    script_stream s({"DELETE /item HTTP/1.1\r\nContent-Length: 0\r\n\r\n"});
    std::vector<std::string> uris;
    http_connection con(s, [&](const http_request &req,
                std::shared_ptr<body_reader>) {
        uris.push_back(req.uri);
        http_response res;
        res.code = 204;
        res.body = std::make_shared<memory_body_reader>("");
        return res;
    });
    con.start();
    EXPECT_EQ(std::vector<std::string>{"/item"}, uris);
    EXPECT_EQ("HTTP/1.1 204 No Content\r\nContent-Length: 0\r\n\r\n",
            s.written);
}

} // namespace nazarick
