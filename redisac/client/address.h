#pragma once
#include <cstdint>
#include <string>
#include <string_view>

enum class address_kind : uint8_t
{
    tcp  = 0,
    tls  = 1,
    unix_socket = 2
};

struct redis_address
{
    address_kind kind = address_kind::tcp;
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string path;           // unix_socket only
    uint32_t db = 0;
    std::string username;       // empty = default user
    std::string password;       // empty = no AUTH

    bool is_tls() const { return kind == address_kind::tls; }
    bool has_auth() const { return !password.empty(); }

    // Loggable form, password masked
    std::string to_string() const;
};

// Accepted forms:
//   redis://[user[:pass]@]host[:port][/db]
//   rediss://...                          (TLS)
//   unix:///path/to/sock[?db=N]  or  redis+unix:///path[?db=N]
//   host[:port]                           (plain TCP)
// IPv6 hosts go in brackets: redis://[::1]:6380
// Returns false with a message in `err` on malformed input.
bool parse_address(std::string_view url, redis_address& out, std::string& err);
