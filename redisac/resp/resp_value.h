#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace resp {

// RESP2 reply kinds. A nil array (*-1) decodes to `nil` as well.
enum class type : uint8_t
{
    simple_string,
    error,
    integer,
    bulk_string,
    nil,
    array
};

constexpr const char* type_name(type t)
{
    switch (t)
    {
        case type::simple_string: return "simple-string";
        case type::error:         return "error";
        case type::integer:       return "integer";
        case type::bulk_string:   return "bulk-string";
        case type::nil:           return "nil";
        case type::array:         return "array";
    }
    return "?";
}

// Decoded reply. `str` holds simple strings, errors and bulk payloads;
// `integer` holds integer replies; `elements` holds array members.
struct value
{
    type kind = type::nil;
    std::string str;
    int64_t integer = 0;
    std::vector<value> elements;

    bool is_nil() const { return kind == type::nil; }
    bool is_error() const { return kind == type::error; }
    bool is_array() const { return kind == type::array; }
    bool is_string() const { return kind == type::bulk_string || kind == type::simple_string; }

    static value nil() { return value{}; }

    static value simple(std::string_view s)
    {
        value v;
        v.kind = type::simple_string;
        v.str.assign(s.data(), s.size());
        return v;
    }

    static value error(std::string_view s)
    {
        value v;
        v.kind = type::error;
        v.str.assign(s.data(), s.size());
        return v;
    }

    static value bulk(std::string_view s)
    {
        value v;
        v.kind = type::bulk_string;
        v.str.assign(s.data(), s.size());
        return v;
    }

    static value from_integer(int64_t n)
    {
        value v;
        v.kind = type::integer;
        v.integer = n;
        return v;
    }

    static value array(std::vector<value> items)
    {
        value v;
        v.kind = type::array;
        v.elements = std::move(items);
        return v;
    }

    bool operator==(const value& o) const
    {
        return kind == o.kind && str == o.str && integer == o.integer && elements == o.elements;
    }
};

} // namespace resp
