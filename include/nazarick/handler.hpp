/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <functional>
#include <memory>

#include <nazarick/body_reader.hpp>
#include <nazarick/http_request.hpp>
#include <nazarick/http_response.hpp>

namespace nazarick {

/// Header line sent with every response.
constexpr const char *SERVER_HEADER = "Server: Nazarick";

/// Produces response for parsed request. body is the request body reader,
/// the handler may pass it into the response.
using request_handler = std::function<http_response (const http_request &req,
        std::shared_ptr<body_reader> body)>;

/// "/echo" responds with request body, other URIs with a fixed greeting.
http_response handle_request(const http_request &req,
        std::shared_ptr<body_reader> body);

} // namespace nazarick
