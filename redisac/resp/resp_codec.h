#pragma once
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <charconv>
#include <initializer_list>
#include <iterator>

#include "resp_value.h"

// RESP2 encoder/decoder. Clients send commands as arrays of bulk strings
// and receive any reply kind back; the command-frame parser is the
// server half, used by the in-memory test server.

namespace resp {

// Command frames (server side)
constexpr int RESP_MAX_ARRAY_SIZE = 1024;
constexpr int RESP_MAX_BULK_LEN = 512 * 1024; // 512 KB

// Replies (client side)
constexpr int64_t REPLY_MAX_ARRAY_SIZE = 16 * 1024 * 1024;
constexpr int64_t REPLY_MAX_BULK_LEN = 512LL * 1024 * 1024;
constexpr int REPLY_MAX_DEPTH = 64;

// ─── Fast \r\n scanner - avoids std::string_view::find overhead ───
// Uses memchr for the first byte, then checks second byte.
inline const char* find_crlf(const char* data, size_t len) noexcept
{
    const char* end = data + len;
    while (true)
    {
        const char* p = static_cast<const char*>(std::memchr(data, '\r', static_cast<size_t>(end - data)));
        if (__builtin_expect(!p || p + 1 >= end, 0))
            return nullptr;
        if (__builtin_expect(p[1] == '\n', 1))
            return p;
        data = p + 1;
    }
}

static constexpr const char RESP_OK[]     = "+OK\r\n";
static constexpr const char RESP_NULL[]   = "$-1\r\n";
static constexpr const char RESP_PONG[]   = "+PONG\r\n";

// ─── Zero-allocation encoding (appends directly to caller's buffer) ───

inline void encode_ok_into(std::string& buf)
{
    buf.append(RESP_OK, 5);
}

inline void encode_null_into(std::string& buf)
{
    buf.append(RESP_NULL, 5);
}

// `msg` carries its own error prefix ("ERR ...", "WRONGTYPE ...").
inline void encode_error_into(std::string& buf, std::string_view msg)
{
    buf += '-';
    buf.append(msg.data(), msg.size());
    buf.append("\r\n", 2);
}

inline void encode_simple_into(std::string& buf, std::string_view msg)
{
    buf += '+';
    buf.append(msg.data(), msg.size());
    buf.append("\r\n", 2);
}

inline void encode_integer_into(std::string& buf, int64_t n)
{
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    buf += ':';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
}

inline void encode_bulk_into(std::string& buf, std::string_view str)
{
    // Single-digit lengths skip to_chars (most keys and small values).
    size_t sz = str.size();
    if (__builtin_expect(sz <= 9, 1))
    {
        char hdr[4] = { '$', static_cast<char>('0' + sz), '\r', '\n' };
        buf.append(hdr, 4);
        buf.append(str.data(), sz);
        buf.append("\r\n", 2);
        return;
    }
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), sz);
    buf += '$';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
    buf.append(str.data(), sz);
    buf.append("\r\n", 2);
}

inline void encode_array_header_into(std::string& buf, size_t n)
{
    if (__builtin_expect(n <= 9, 1))
    {
        char hdr[4] = { '*', static_cast<char>('0' + n), '\r', '\n' };
        buf.append(hdr, 4);
        return;
    }
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    buf += '*';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
}

// Command: array of bulk strings
template <typename Range>
inline void encode_command_into(std::string& buf, const Range& args)
{
    encode_array_header_into(buf, static_cast<size_t>(std::size(args)));
    for (const auto& a : args)
        encode_bulk_into(buf, std::string_view(a));
}

template <typename Range>
inline std::string encode_command(const Range& args)
{
    std::string out;
    encode_command_into(out, args);
    return out;
}

inline std::string encode_command(std::initializer_list<std::string_view> args)
{
    std::string out;
    encode_command_into(out, args);
    return out;
}

// Full reply value (used by the test server and tests)
inline void encode_value_into(std::string& buf, const value& v)
{
    switch (v.kind)
    {
        case type::simple_string: encode_simple_into(buf, v.str); break;
        case type::error:         encode_error_into(buf, v.str); break;
        case type::integer:       encode_integer_into(buf, v.integer); break;
        case type::bulk_string:   encode_bulk_into(buf, v.str); break;
        case type::nil:           encode_null_into(buf); break;
        case type::array:
            encode_array_header_into(buf, v.elements.size());
            for (const auto& e : v.elements)
                encode_value_into(buf, e);
            break;
    }
}

// ─── Allocating encoding ───

inline std::string encode_ok()
{
    return "+OK\r\n";
}

inline std::string encode_error(std::string_view msg)
{
    std::string out;
    encode_error_into(out, msg);
    return out;
}

inline std::string encode_integer(int64_t n)
{
    std::string out;
    encode_integer_into(out, n);
    return out;
}

inline std::string encode_bulk(std::string_view str)
{
    std::string out;
    encode_bulk_into(out, str);
    return out;
}

inline std::string encode_null()
{
    return "$-1\r\n";
}

inline std::string encode_simple(std::string_view msg)
{
    std::string out;
    encode_simple_into(out, msg);
    return out;
}

// ─── Decoding ───

enum class parse_result { ok, incomplete, error };

// Parse a single command frame (array of bulk strings) from a partial buffer.
// `consumed` is set to how many bytes were consumed from `buf`.
inline parse_result parse_message(std::string_view buf, std::vector<std::string>& args, size_t& consumed)
{
    args.clear();
    consumed = 0;

    const char* data = buf.data();
    size_t sz = buf.size();

    if (__builtin_expect(sz == 0, 0))
        return parse_result::incomplete;

    if (__builtin_expect(data[0] != '*', 0))
        return parse_result::error;

    const char* crlf = find_crlf(data + 1, sz - 1);
    if (__builtin_expect(!crlf, 0))
        return parse_result::incomplete;

    int count = 0;
    auto [ptr, ec] = std::from_chars(data + 1, crlf, count);
    if (ec != std::errc{} || ptr != crlf || count < 0 || count > RESP_MAX_ARRAY_SIZE)
        return parse_result::error;

    size_t offset = static_cast<size_t>(crlf - data) + 2;

    for (int i = 0; i < count; i++)
    {
        if (offset >= sz)
            return parse_result::incomplete;

        if (data[offset] != '$')
            return parse_result::error;

        const char* end_crlf = find_crlf(data + offset + 1, sz - offset - 1);
        if (!end_crlf)
            return parse_result::incomplete;

        int len = 0;
        auto [p2, e2] = std::from_chars(data + offset + 1, end_crlf, len);
        if (e2 != std::errc{} || p2 != end_crlf || len < 0 || len > RESP_MAX_BULK_LEN)
            return parse_result::error;

        offset = static_cast<size_t>(end_crlf - data) + 2;

        if (offset + static_cast<size_t>(len) + 2 > sz)
            return parse_result::incomplete;

        args.emplace_back(data + offset, static_cast<size_t>(len));
        offset += static_cast<size_t>(len) + 2;
    }

    consumed = offset;
    return parse_result::ok;
}

namespace detail {

// Reads the decimal header after a type byte at `offset`.
inline parse_result read_header(const char* data, size_t sz, size_t& offset, int64_t& n)
{
    const char* crlf = find_crlf(data + offset + 1, sz - offset - 1);
    if (!crlf)
        return parse_result::incomplete;

    auto [ptr, ec] = std::from_chars(data + offset + 1, crlf, n);
    if (ec != std::errc{} || ptr != crlf)
        return parse_result::error;

    offset = static_cast<size_t>(crlf - data) + 2;
    return parse_result::ok;
}

// `skip` validates framing without materializing the value.
inline parse_result parse_value(const char* data, size_t sz, size_t& offset,
                                value* out, int depth)
{
    if (depth > REPLY_MAX_DEPTH)
        return parse_result::error;
    if (offset >= sz)
        return parse_result::incomplete;

    const char tag = data[offset];
    switch (tag)
    {
        case '+':
        case '-':
        {
            const char* crlf = find_crlf(data + offset + 1, sz - offset - 1);
            if (!crlf)
                return parse_result::incomplete;
            if (out)
            {
                out->kind = tag == '+' ? type::simple_string : type::error;
                out->str.assign(data + offset + 1, static_cast<size_t>(crlf - (data + offset + 1)));
            }
            offset = static_cast<size_t>(crlf - data) + 2;
            return parse_result::ok;
        }
        case ':':
        {
            int64_t n = 0;
            auto r = read_header(data, sz, offset, n);
            if (r != parse_result::ok)
                return r;
            if (out)
            {
                out->kind = type::integer;
                out->integer = n;
            }
            return parse_result::ok;
        }
        case '$':
        {
            int64_t len = 0;
            auto r = read_header(data, sz, offset, len);
            if (r != parse_result::ok)
                return r;
            if (len == -1)
            {
                if (out) out->kind = type::nil;
                return parse_result::ok;
            }
            if (len < 0 || len > REPLY_MAX_BULK_LEN)
                return parse_result::error;
            size_t ulen = static_cast<size_t>(len);
            if (offset + ulen + 2 > sz)
                return parse_result::incomplete;
            if (data[offset + ulen] != '\r' || data[offset + ulen + 1] != '\n')
                return parse_result::error;
            if (out)
            {
                out->kind = type::bulk_string;
                out->str.assign(data + offset, ulen);
            }
            offset += ulen + 2;
            return parse_result::ok;
        }
        case '*':
        {
            int64_t count = 0;
            auto r = read_header(data, sz, offset, count);
            if (r != parse_result::ok)
                return r;
            if (count == -1)
            {
                if (out) out->kind = type::nil;
                return parse_result::ok;
            }
            if (count < 0 || count > REPLY_MAX_ARRAY_SIZE)
                return parse_result::error;
            if (out)
            {
                out->kind = type::array;
                out->elements.clear();
                // Each element takes at least 3 bytes; never reserve past what the buffer could hold.
                out->elements.reserve(static_cast<size_t>(std::min<int64_t>(count, static_cast<int64_t>(sz - offset) / 3 + 1)));
            }
            for (int64_t i = 0; i < count; i++)
            {
                if (out)
                {
                    out->elements.emplace_back();
                    r = parse_value(data, sz, offset, &out->elements.back(), depth + 1);
                }
                else
                {
                    r = parse_value(data, sz, offset, nullptr, depth + 1);
                }
                if (r != parse_result::ok)
                    return r;
            }
            return parse_result::ok;
        }
        default:
            return parse_result::error;
    }
}

} // namespace detail

// Finds where one reply frame ends, resuming where the previous call
// stopped: only bytes appended since then are examined, so a reply that
// arrives in many reads is scanned once. Offsets are relative to the start
// of the buffer, which must only grow between calls until reset().
class frame_scanner
{
public:
    parse_result scan(std::string_view buf)
    {
        const char* data = buf.data();
        const size_t sz = buf.size();

        while (true)
        {
            if (m_pending.size() > static_cast<size_t>(REPLY_MAX_DEPTH))
                return parse_result::error;
            if (m_offset >= sz)
                return parse_result::incomplete;

            // One element at a time; `off` is committed only when it is whole.
            size_t off = m_offset;
            const char tag = data[off];
            switch (tag)
            {
                case '+':
                case '-':
                {
                    const char* crlf = find_crlf(data + off + 1, sz - off - 1);
                    if (!crlf)
                        return parse_result::incomplete;
                    off = static_cast<size_t>(crlf - data) + 2;
                    break;
                }
                case ':':
                {
                    int64_t n = 0;
                    auto r = detail::read_header(data, sz, off, n);
                    if (r != parse_result::ok)
                        return r;
                    break;
                }
                case '$':
                {
                    int64_t len = 0;
                    auto r = detail::read_header(data, sz, off, len);
                    if (r != parse_result::ok)
                        return r;
                    if (len == -1)
                        break;
                    if (len < 0 || len > REPLY_MAX_BULK_LEN)
                        return parse_result::error;
                    size_t ulen = static_cast<size_t>(len);
                    if (off + ulen + 2 > sz)
                        return parse_result::incomplete;
                    if (data[off + ulen] != '\r' || data[off + ulen + 1] != '\n')
                        return parse_result::error;
                    off += ulen + 2;
                    break;
                }
                case '*':
                {
                    int64_t count = 0;
                    auto r = detail::read_header(data, sz, off, count);
                    if (r != parse_result::ok)
                        return r;
                    if (count == -1 || count == 0)
                        break;
                    if (count < 0 || count > REPLY_MAX_ARRAY_SIZE)
                        return parse_result::error;
                    m_offset = off;
                    m_pending.push_back(count);
                    continue;
                }
                default:
                    return parse_result::error;
            }

            m_offset = off;
            while (!m_pending.empty() && --m_pending.back() == 0)
                m_pending.pop_back();
            if (m_pending.empty())
                return parse_result::ok;
        }
    }

    // Length of the frame once scan() returned ok.
    size_t frame_size() const { return m_offset; }
    // Bytes already known to belong to the frame.
    size_t scanned() const { return m_offset; }
    void reset() { m_offset = 0; m_pending.clear(); }

private:
    size_t m_offset = 0;
    std::vector<int64_t> m_pending;   // elements still owed per open array
};

// Builds the reply from a buffer whose first `frame` bytes scan() accepted.
inline parse_result build_reply(std::string_view buf, size_t frame, value& out)
{
    size_t offset = 0;
    out = value{};
    auto r = detail::parse_value(buf.data(), frame, offset, &out, 0);
    if (r != parse_result::ok || offset != frame)
        return parse_result::error;
    return parse_result::ok;
}

// Parse one reply frame from the front of `buf`. On `ok`, `out` holds the
// reply and `consumed` the frame length. Framing is validated first, so a
// partial buffer costs no allocations.
inline parse_result parse_reply(std::string_view buf, value& out, size_t& consumed)
{
    consumed = 0;
    frame_scanner scanner;
    auto r = scanner.scan(buf);
    if (r != parse_result::ok)
        return r;

    if (build_reply(buf, scanner.frame_size(), out) != parse_result::ok)
        return parse_result::error;
    consumed = scanner.frame_size();
    return parse_result::ok;
}

// redis-cli style rendering for the command line tool
inline void format_value_into(std::string& buf, const value& v, size_t indent = 0)
{
    switch (v.kind)
    {
        case type::simple_string:
            buf += v.str;
            break;
        case type::error:
            buf += "(error) ";
            buf += v.str;
            break;
        case type::integer:
            buf += "(integer) ";
            buf += std::to_string(v.integer);
            break;
        case type::bulk_string:
            buf += '"';
            for (char c : v.str)
            {
                switch (c)
                {
                    case '"':  buf += "\\\""; break;
                    case '\\': buf += "\\\\"; break;
                    case '\n': buf += "\\n"; break;
                    case '\r': buf += "\\r"; break;
                    case '\t': buf += "\\t"; break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) >= 0x7f)
                        {
                            char hex[5];
                            std::snprintf(hex, sizeof(hex), "\\x%02x", static_cast<unsigned char>(c));
                            buf += hex;
                        }
                        else
                        {
                            buf += c;
                        }
                }
            }
            buf += '"';
            break;
        case type::nil:
            buf += "(nil)";
            break;
        case type::array:
        {
            if (v.elements.empty())
            {
                buf += "(empty array)";
                break;
            }
            std::string width = std::to_string(v.elements.size());
            for (size_t i = 0; i < v.elements.size(); i++)
            {
                if (i > 0)
                    buf.append(indent, ' ');
                std::string idx = std::to_string(i + 1);
                buf.append(width.size() - idx.size(), ' ');
                buf += idx;
                buf += ") ";
                format_value_into(buf, v.elements[i], indent + width.size() + 2);
                if (i + 1 < v.elements.size())
                    buf += '\n';
            }
            break;
        }
    }
}

inline std::string format_value(const value& v)
{
    std::string out;
    format_value_into(out, v);
    return out;
}

} // namespace resp
