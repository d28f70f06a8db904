// redisac/command.h - command builder
#pragma once
#include <charconv>
#include <concepts>
#include <string>
#include <string_view>
#include <vector>
#include "core.h"

namespace redisac {

// Usage:
//   auto c = cmd("SET").arg("k").arg("v").arg("EX").arg(60);
//   std::string wire = c.pack();
class command {
public:
    explicit command(std::string_view name) { m_parts.emplace_back(name); }

    command& arg(std::string_view a) { m_parts.emplace_back(a); return *this; }
    command& arg(const char* a)      { m_parts.emplace_back(a); return *this; }
    command& arg(const std::string& a) { m_parts.push_back(a); return *this; }

    template <std::integral T>
    command& arg(T n) {
        char tmp[24];
        auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
        m_parts.emplace_back(tmp, static_cast<size_t>(end - tmp));
        return *this;
    }

    template <std::floating_point T>
    command& arg(T d) {
        char tmp[32];
        auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), d);
        m_parts.emplace_back(tmp, static_cast<size_t>(end - tmp));
        return *this;
    }

    template <typename Range>
    command& args(const Range& r) {
        for (const auto& a : r)
            arg(a);
        return *this;
    }

    std::string pack() const { return resp::encode_command(m_parts); }

    std::string_view name() const { return m_parts.front(); }
    const std::vector<std::string>& parts() const { return m_parts; }

private:
    std::vector<std::string> m_parts;
};

inline command cmd(std::string_view name) { return command(name); }

} // namespace redisac
