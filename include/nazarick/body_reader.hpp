/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <nazarick/error.hpp>

namespace nazarick {

class dynamic_buffer;
class stream;
struct http_request;

/// Lazy producer of body bytes.
class body_reader {
public:
    /// Empty chunk without error means end of body.
    /// chunk is valid until the next read() or destruction of the reader.
    using chunk_cb = std::function<void (error err, std::string_view chunk)>;

    virtual ~body_reader() {}
    /// Declared body length or -1 if it is unknown.
    virtual int64_t length() const noexcept = 0;
    /// Produce next chunk. cb is called exactly once, maybe before return.
    virtual void read(chunk_cb cb) noexcept = 0;
};

/// Body known to the server. The whole data is the first chunk.
class memory_body_reader : public body_reader {
public:
    explicit memory_body_reader(std::string data) noexcept
        : data(std::move(data)) {}

    virtual int64_t length() const noexcept override { return data.size(); }
    virtual void read(chunk_cb cb) noexcept override;

private:
    std::string data;
    bool done = false;
};

/// Body of Content-Length bytes received after the header block.
class length_body_reader : public body_reader {
public:
    length_body_reader(stream &s, dynamic_buffer &buf, int64_t length)
        noexcept : s(s), buf(buf), length_(length), remaining(length) {}

    virtual int64_t length() const noexcept override { return length_; }
    virtual void read(chunk_cb cb) noexcept override;

private:
    void deliver(const chunk_cb &cb) noexcept;

    stream &s;
    dynamic_buffer &buf;
    const int64_t length_;
    int64_t remaining;
    std::string chunk;
};

/// Body in chunked transfer coding. Every chunk of the coding is produced
/// as one chunk. Chunk extensions and trailer fields are skipped.
class chunked_body_reader : public body_reader {
public:
    chunked_body_reader(stream &s, dynamic_buffer &buf) noexcept
        : s(s), buf(buf) {}

    virtual int64_t length() const noexcept override { return -1; }
    virtual void read(chunk_cb cb) noexcept override;

    /// Longest accepted chunk-size line without CRLF.
    static constexpr size_t MAX_SIZE_LINE = 1024;
    static constexpr uint64_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

private:
    enum state_enum {
        STATE_SIZE,
        STATE_DATA,
        STATE_TRAILER,
        STATE_DONE
    };

    enum step_result {
        STEP_CHUNK,
        STEP_END,
        STEP_MORE,
        STEP_FAILED
    };

    /// Decode buffered bytes until chunk or end of body is produced.
    step_result step(error &err) noexcept;

    stream &s;
    dynamic_buffer &buf;
    state_enum state = STATE_SIZE;
    uint64_t chunk_size = 0;
    size_t trailer_size = 0;
    error failure;
    std::string chunk;
};

/// Parse chunk-size line (without CRLF): 1*16HEXDIG [chunk-ext].
bool parse_chunk_size(std::string_view line, uint64_t &size) noexcept;

/// Parse Content-Length value: 1*DIGIT fitting in int64_t.
bool parse_content_length(std::string_view value, int64_t &length) noexcept;

/// Select body reader for request from its framing headers.
/// Returns nullptr and sets err on protocol error.
std::shared_ptr<body_reader> make_request_body(const http_request &req,
        stream &s, dynamic_buffer &buf, error &err) noexcept;

} // namespace nazarick
