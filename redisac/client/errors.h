#pragma once
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

enum class connect_errc : uint8_t
{
    none              = 0,
    refused           = 1,
    timeout           = 2,
    protocol_mismatch = 3,
    invalid_address   = 4,
    resolve_failed    = 5,
    tls_failed        = 6,
    auth_failed       = 7,
    io_error          = 8
};

constexpr const char* to_string(connect_errc c)
{
    switch (c)
    {
        case connect_errc::none:              return "none";
        case connect_errc::refused:           return "refused";
        case connect_errc::timeout:           return "timeout";
        case connect_errc::protocol_mismatch: return "protocol mismatch";
        case connect_errc::invalid_address:   return "invalid address";
        case connect_errc::resolve_failed:    return "resolve failed";
        case connect_errc::tls_failed:        return "tls failed";
        case connect_errc::auth_failed:       return "auth failed";
        case connect_errc::io_error:          return "io error";
    }
    return "?";
}

// Like std::error_code: true when something went wrong.
struct connect_error
{
    connect_errc code = connect_errc::none;
    int sys_errno = 0;
    std::string message;

    explicit operator bool() const { return code != connect_errc::none; }

    static connect_error make(connect_errc c, std::string msg, int e = 0)
    {
        connect_error err;
        err.code = c;
        err.sys_errno = e;
        err.message = std::move(msg);
        return err;
    }

    std::string describe() const
    {
        std::string out = to_string(code);
        if (!message.empty())
        {
            out += ": ";
            out += message;
        }
        if (sys_errno != 0)
        {
            out += " (";
            out += std::strerror(sys_errno);
            out += ')';
        }
        return out;
    }
};

enum class command_errc : uint8_t
{
    none         = 0,
    network      = 1,   // transport failure; the connection is broken
    decode       = 2,   // reply shape does not fit the requested type
    server_error = 3,   // -ERR style reply; the connection stays usable
    protocol     = 4,   // unparseable reply bytes; the connection is broken
    busy         = 5    // rejected before sending; the connection stays usable
};

constexpr const char* to_string(command_errc c)
{
    switch (c)
    {
        case command_errc::none:         return "none";
        case command_errc::network:      return "network";
        case command_errc::decode:       return "decode";
        case command_errc::server_error: return "server error";
        case command_errc::protocol:     return "protocol";
        case command_errc::busy:         return "busy";
    }
    return "?";
}

struct command_error
{
    command_errc code = command_errc::none;
    int sys_errno = 0;
    bool timed_out = false;
    std::string message;

    explicit operator bool() const { return code != command_errc::none; }

    // Network and protocol failures leave the connection unusable.
    bool breaks_connection() const
    {
        return code == command_errc::network || code == command_errc::protocol;
    }

    static command_error network(int e, std::string msg = {})
    {
        command_error err;
        err.code = command_errc::network;
        err.sys_errno = e;
        err.timed_out = e == ETIMEDOUT;
        err.message = msg.empty() ? std::string(std::strerror(e)) : std::move(msg);
        return err;
    }

    static command_error busy(std::string msg)
    {
        command_error err;
        err.code = command_errc::busy;
        err.sys_errno = EBUSY;
        err.message = std::move(msg);
        return err;
    }

    static command_error decode(std::string_view expected, std::string_view actual)
    {
        command_error err;
        err.code = command_errc::decode;
        err.message = "expected ";
        err.message += expected;
        err.message += ", got ";
        err.message += actual;
        return err;
    }

    static command_error server(std::string msg)
    {
        command_error err;
        err.code = command_errc::server_error;
        err.message = std::move(msg);
        return err;
    }

    static command_error protocol(std::string msg)
    {
        command_error err;
        err.code = command_errc::protocol;
        err.message = std::move(msg);
        return err;
    }

    std::string describe() const
    {
        std::string out = to_string(code);
        if (timed_out)
            out += " (timed out)";
        if (!message.empty())
        {
            out += ": ";
            out += message;
        }
        return out;
    }
};
