// redisac/result.h - typed command outcome
#pragma once
#include <string>
#include <string_view>
#include "core.h"

namespace redisac {

// Usage:
//   if (r) use(r.value); else log(r.error.describe());
template <typename T>
struct result {
    T value{};
    command_error error;

    bool ok() const { return !error; }
    explicit operator bool() const { return ok(); }
};

// Simple-string reply such as "OK" or "PONG".
struct status {
    std::string text;

    bool operator==(std::string_view s) const { return text == s; }
    bool is_ok() const { return text == "OK"; }
};

} // namespace redisac
