#pragma once
#include <cstdint>
#include <string_view>

constexpr uint32_t fnv1a(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(c)) * 16777619u;
    return hash;
}

// Case-insensitive: "GET", "Get" and "get" hash alike.
constexpr uint32_t fnv1a_lower(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
    {
        char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
        hash = (hash ^ static_cast<uint8_t>(lower)) * 16777619u;
    }
    return hash;
}

// CLI subcommands, keyed by fnv1a_lower of their name.
namespace cli_cmd
{
    inline constexpr uint32_t ping     = fnv1a("ping");
    inline constexpr uint32_t get      = fnv1a("get");
    inline constexpr uint32_t set      = fnv1a("set");
    inline constexpr uint32_t del      = fnv1a("del");
    inline constexpr uint32_t scan     = fnv1a("scan");
    inline constexpr uint32_t hscan    = fnv1a("hscan");
    inline constexpr uint32_t sscan    = fnv1a("sscan");
    inline constexpr uint32_t zscan    = fnv1a("zscan");
    inline constexpr uint32_t scan_get = fnv1a("scan-get");
    inline constexpr uint32_t raw      = fnv1a("raw");

    // Subcommands that open a cursor scan.
    constexpr bool is_scan(uint32_t h)
    {
        return h == scan || h == hscan || h == sscan || h == zscan || h == scan_get;
    }
}

static_assert(fnv1a_lower("SCAN-GET") == cli_cmd::scan_get);
static_assert(cli_cmd::ping != cli_cmd::get && cli_cmd::scan != cli_cmd::sscan);
