// redisac/from_reply.h - reply decoding into C++ types
#pragma once
#include <charconv>
#include <concepts>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include "result.h"

namespace redisac {

// Specialize reply_decoder<T> to decode custom types:
//   static constexpr const char* name = "...";
//   static bool decode(resp::value&& v, T& out, command_error& err);
// Aggregates never decode into scalars and the reverse; such mismatches are
// command_errc::decode errors that leave the connection usable.
template <typename T, typename = void>
struct reply_decoder;

template <typename T>
bool from_reply(resp::value&& v, T& out, command_error& err)
{
    return reply_decoder<T>::decode(std::move(v), out, err);
}

template <typename T>
result<T> from_reply(resp::value&& v)
{
    result<T> r;
    from_reply(std::move(v), r.value, r.error);
    return r;
}

namespace detail {

inline bool mismatch(const char* expected, const resp::value& v, command_error& err)
{
    err = command_error::decode(expected, resp::type_name(v.kind));
    return false;
}

template <typename T>
bool parse_number(std::string_view s, T& out)
{
    if (s.empty())
        return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

template <typename T> struct is_pair : std::false_type {};
template <typename A, typename B> struct is_pair<std::pair<A, B>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename Map>
bool decode_map(resp::value&& v, Map& out, command_error& err)
{
    using K = typename Map::key_type;
    using V = typename Map::mapped_type;

    out.clear();
    if (v.is_nil())
        return true;
    if (!v.is_array())
        return mismatch("map (flat array)", v, err);
    if (v.elements.size() % 2 != 0) {
        err = command_error::decode("map (flat array)", "array of odd length");
        return false;
    }
    for (size_t i = 0; i < v.elements.size(); i += 2) {
        K k{};
        V val{};
        if (!from_reply(std::move(v.elements[i]), k, err) || !from_reply(std::move(v.elements[i + 1]), val, err))
            return false;
        out.insert_or_assign(std::move(k), std::move(val));
    }
    return true;
}

} // namespace detail

template <>
struct reply_decoder<resp::value> {
    static constexpr const char* name = "any";
    static bool decode(resp::value&& v, resp::value& out, command_error&) {
        out = std::move(v);
        return true;
    }
};

template <>
struct reply_decoder<std::string> {
    static constexpr const char* name = "string";
    static bool decode(resp::value&& v, std::string& out, command_error& err) {
        switch (v.kind) {
            case resp::type::bulk_string:
            case resp::type::simple_string:
                out = std::move(v.str);
                return true;
            case resp::type::integer:
                out = std::to_string(v.integer);
                return true;
            default:
                return detail::mismatch(name, v, err);
        }
    }
};

template <>
struct reply_decoder<status> {
    static constexpr const char* name = "status";
    static bool decode(resp::value&& v, status& out, command_error& err) {
        if (!v.is_string())
            return detail::mismatch(name, v, err);
        out.text = std::move(v.str);
        return true;
    }
};

template <>
struct reply_decoder<bool> {
    static constexpr const char* name = "bool";
    static bool decode(resp::value&& v, bool& out, command_error& err) {
        switch (v.kind) {
            case resp::type::integer:
                out = v.integer != 0;
                return true;
            case resp::type::simple_string:
                if (v.str == "OK") { out = true; return true; }
                [[fallthrough]];
            case resp::type::bulk_string:
                if (v.str == "1") { out = true; return true; }
                if (v.str == "0") { out = false; return true; }
                err = command_error::decode(name, "non-boolean string");
                return false;
            default:
                return detail::mismatch(name, v, err);
        }
    }
};

template <typename T>
struct reply_decoder<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr const char* name = "integer";
    static bool decode(resp::value&& v, T& out, command_error& err) {
        switch (v.kind) {
            case resp::type::integer:
                if (!std::in_range<T>(v.integer)) {
                    err = command_error::decode(name, "out-of-range integer");
                    return false;
                }
                out = static_cast<T>(v.integer);
                return true;
            case resp::type::bulk_string:
            case resp::type::simple_string:
                if (detail::parse_number(v.str, out))
                    return true;
                err = command_error::decode(name, "non-numeric string");
                return false;
            default:
                return detail::mismatch(name, v, err);
        }
    }
};

template <typename T>
struct reply_decoder<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static constexpr const char* name = "float";
    static bool decode(resp::value&& v, T& out, command_error& err) {
        switch (v.kind) {
            case resp::type::integer:
                out = static_cast<T>(v.integer);
                return true;
            case resp::type::bulk_string:
            case resp::type::simple_string:
                if (v.str == "inf" || v.str == "+inf") { out = std::numeric_limits<T>::infinity(); return true; }
                if (v.str == "-inf") { out = -std::numeric_limits<T>::infinity(); return true; }
                if (detail::parse_number(v.str, out))
                    return true;
                err = command_error::decode(name, "non-numeric string");
                return false;
            default:
                return detail::mismatch(name, v, err);
        }
    }
};

template <typename T>
struct reply_decoder<std::optional<T>> {
    static constexpr const char* name = "optional";
    static bool decode(resp::value&& v, std::optional<T>& out, command_error& err) {
        if (v.is_nil()) {
            out.reset();
            return true;
        }
        T inner{};
        if (!from_reply(std::move(v), inner, err))
            return false;
        out = std::move(inner);
        return true;
    }
};

template <typename T>
struct reply_decoder<std::vector<T>> {
    static constexpr const char* name = "array";
    static bool decode(resp::value&& v, std::vector<T>& out, command_error& err) {
        out.clear();
        if (v.is_nil())
            return true;
        if (!v.is_array())
            return detail::mismatch(name, v, err);
        out.reserve(v.elements.size());
        for (auto& e : v.elements) {
            T item{};
            if (!from_reply(std::move(e), item, err))
                return false;
            out.push_back(std::move(item));
        }
        return true;
    }
};

template <typename A, typename B>
struct reply_decoder<std::pair<A, B>> {
    static constexpr const char* name = "pair";
    static bool decode(resp::value&& v, std::pair<A, B>& out, command_error& err) {
        if (!v.is_array())
            return detail::mismatch(name, v, err);
        if (v.elements.size() != 2) {
            err = command_error::decode(name, "array of " + std::to_string(v.elements.size()));
            return false;
        }
        return from_reply(std::move(v.elements[0]), out.first, err)
            && from_reply(std::move(v.elements[1]), out.second, err);
    }
};

template <typename K, typename V, typename C, typename A>
struct reply_decoder<std::map<K, V, C, A>> {
    static constexpr const char* name = "map";
    static bool decode(resp::value&& v, std::map<K, V, C, A>& out, command_error& err) {
        return detail::decode_map(std::move(v), out, err);
    }
};

template <typename K, typename V, typename H, typename E, typename A>
struct reply_decoder<std::unordered_map<K, V, H, E, A>> {
    static constexpr const char* name = "map";
    static bool decode(resp::value&& v, std::unordered_map<K, V, H, E, A>& out, command_error& err) {
        return detail::decode_map(std::move(v), out, err);
    }
};

} // namespace redisac
