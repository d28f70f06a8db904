#include "address.h"

#include <charconv>

namespace
{

int hex_digit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool percent_decode(std::string_view in, std::string& out)
{
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); i++)
    {
        if (in[i] != '%')
        {
            out += in[i];
            continue;
        }
        if (i + 2 >= in.size())
            return false;
        int hi = hex_digit(in[i + 1]);
        int lo = hex_digit(in[i + 2]);
        if (hi < 0 || lo < 0)
            return false;
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return true;
}

template <typename T>
bool parse_number(std::string_view sv, T& out)
{
    if (sv.empty())
        return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

// Reads "db=N" out of a query string; other parameters are ignored.
bool parse_query(std::string_view query, redis_address& out, std::string& err)
{
    while (!query.empty())
    {
        size_t amp = query.find('&');
        std::string_view param = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        size_t eq = param.find('=');
        if (eq == std::string_view::npos)
            continue;
        if (param.substr(0, eq) == "db")
        {
            if (!parse_number(param.substr(eq + 1), out.db))
            {
                err = "invalid db in query: " + std::string(param);
                return false;
            }
        }
    }
    return true;
}

bool parse_host_port(std::string_view hp, redis_address& out, std::string& err)
{
    if (hp.empty())
    {
        err = "missing host";
        return false;
    }

    std::string_view port_part;
    if (hp.front() == '[')
    {
        size_t close = hp.find(']');
        if (close == std::string_view::npos)
        {
            err = "unterminated IPv6 literal";
            return false;
        }
        out.host.assign(hp.substr(1, close - 1));
        std::string_view rest = hp.substr(close + 1);
        if (!rest.empty())
        {
            if (rest.front() != ':')
            {
                err = "unexpected characters after IPv6 literal";
                return false;
            }
            port_part = rest.substr(1);
            if (port_part.empty())
            {
                err = "empty port";
                return false;
            }
        }
    }
    else
    {
        size_t colon = hp.rfind(':');
        if (colon != std::string_view::npos)
        {
            if (hp.find(':') != colon)
            {
                err = "IPv6 addresses must be bracketed";
                return false;
            }
            out.host.assign(hp.substr(0, colon));
            port_part = hp.substr(colon + 1);
            if (port_part.empty())
            {
                err = "empty port";
                return false;
            }
        }
        else
        {
            out.host.assign(hp);
        }
    }

    if (out.host.empty())
    {
        err = "missing host";
        return false;
    }

    if (!port_part.empty())
    {
        uint32_t port = 0;
        if (!parse_number(port_part, port) || port == 0 || port > 65535)
        {
            err = "invalid port: " + std::string(port_part);
            return false;
        }
        out.port = static_cast<uint16_t>(port);
    }
    return true;
}

} // namespace

std::string redis_address::to_string() const
{
    std::string out;
    if (kind == address_kind::unix_socket)
    {
        out = "unix://" + path;
        if (db != 0)
            out += "?db=" + std::to_string(db);
        return out;
    }

    out = kind == address_kind::tls ? "rediss://" : "redis://";
    if (!username.empty() || !password.empty())
    {
        out += username;
        if (!password.empty())
            out += ":***";
        out += '@';
    }
    if (host.find(':') != std::string::npos)
        out += '[' + host + ']';
    else
        out += host;
    out += ':' + std::to_string(port);
    if (db != 0)
        out += '/' + std::to_string(db);
    return out;
}

bool parse_address(std::string_view url, redis_address& out, std::string& err)
{
    out = redis_address{};
    err.clear();

    if (url.empty())
    {
        err = "empty address";
        return false;
    }

    std::string_view rest;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos)
    {
        out.kind = address_kind::tcp;
        rest = url;
        return parse_host_port(rest, out, err);
    }

    std::string_view scheme = url.substr(0, scheme_end);
    rest = url.substr(scheme_end + 3);

    if (scheme == "unix" || scheme == "redis+unix")
    {
        out.kind = address_kind::unix_socket;
        out.host.clear();
        size_t q = rest.find('?');
        std::string_view path = rest.substr(0, q);
        if (path.empty() || path.front() != '/')
        {
            err = "unix socket path must be absolute";
            return false;
        }
        if (!percent_decode(path, out.path))
        {
            err = "bad percent-encoding in path";
            return false;
        }
        if (q != std::string_view::npos)
            return parse_query(rest.substr(q + 1), out, err);
        return true;
    }

    if (scheme == "redis")
        out.kind = address_kind::tcp;
    else if (scheme == "rediss")
        out.kind = address_kind::tls;
    else
    {
        err = "unsupported scheme: " + std::string(scheme);
        return false;
    }

    std::string_view query;
    size_t q = rest.find('?');
    if (q != std::string_view::npos)
    {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }

    std::string_view db_part;
    size_t slash = rest.find('/');
    if (slash != std::string_view::npos)
    {
        db_part = rest.substr(slash + 1);
        rest = rest.substr(0, slash);
    }

    size_t at = rest.rfind('@');
    if (at != std::string_view::npos)
    {
        std::string_view userinfo = rest.substr(0, at);
        rest = rest.substr(at + 1);
        size_t colon = userinfo.find(':');
        bool ok = percent_decode(userinfo.substr(0, colon), out.username);
        if (ok && colon != std::string_view::npos)
            ok = percent_decode(userinfo.substr(colon + 1), out.password);
        if (!ok)
        {
            err = "bad percent-encoding in credentials";
            return false;
        }
    }

    if (!parse_host_port(rest, out, err))
        return false;

    if (!db_part.empty() && !parse_number(db_part, out.db))
    {
        err = "invalid db: " + std::string(db_part);
        return false;
    }

    return parse_query(query, out, err);
}
