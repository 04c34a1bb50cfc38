/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace nazarick {

/// Byte stream with sequential operations on top of event driven transport.
/// Each accepted operation calls its callback exactly once, maybe before
/// returning. Only one read and one write may be pending at a time.
class stream {
public:
    /// status < 0 is a libuv error. Empty data with status 0 is end of stream.
    /// data is valid only inside the callback.
    using read_cb = std::function<void (int status, std::string_view data)>;
    /// status < 0 is a libuv error.
    using write_cb = std::function<void (int status)>;

    virtual ~stream() {}

    /// Returns UV_EALREADY without calling cb if previous read is pending.
    virtual int read(read_cb cb) noexcept = 0;
    /// Returns UV_EALREADY without calling cb if previous write is pending.
    virtual int write(std::string data, write_cb cb) noexcept = 0;
    /// Tear down the transport. Pending operations fail.
    virtual void close() noexcept = 0;
    /// Peer address for log messages.
    virtual const char * name() const noexcept { return ""; }
};

} // namespace nazarick
