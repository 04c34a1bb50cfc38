/*
 * Copyright (C) Andrey Pikas
 */

#include <nazarick/handler.hpp>

namespace nazarick {

namespace {

constexpr const char *GREETING = "Hello From Nazarick\n";

} // namespace

http_response handle_request(const http_request &req,
        std::shared_ptr<body_reader> body)
{
    http_response res;
    res.code = 200;
    res.headers.push_back(SERVER_HEADER);
    if (req.uri == "/echo")
        res.body = std::move(body);
    else
        res.body = std::make_shared<memory_body_reader>(GREETING);
    return res;
}

} // namespace nazarick
