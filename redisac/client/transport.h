#pragma once
#include <functional>
#include <string>
#include <string_view>

#include "errors.h"

// Byte stream to one server. At most one send and one receive may be
// outstanding at a time. Failures are reported as positive errno values:
// ETIMEDOUT for an expired timeout, ECONNRESET when the peer closed.
//
// Implementations move a callback out of their own state before invoking
// it, so the callback may destroy or close the transport.
class transport
{
public:
    using connect_callback = std::function<void(const connect_error&)>;
    using send_callback = std::function<void(int err)>;
    // `data` is only valid for the duration of the call.
    using receive_callback = std::function<void(int err, std::string_view data)>;

    virtual ~transport() = default;

    virtual void connect(connect_callback cb) = 0;
    // Completes once every byte has been handed to the kernel.
    virtual void send(std::string bytes, send_callback cb) = 0;
    // Completes with the next chunk of received bytes.
    virtual void receive(receive_callback cb) = 0;
    // Drops pending callbacks without invoking them.
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};
