#pragma once
#include <charconv>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "command_hashing.h"

// redisac [-u URL] [--config file.lua] [--tls] [--timeout ms] [-v|-vv] <command> [args]
//
// Global options come before the command. --type and --count are
// accepted after it (scan family only).
struct parsed_args
{
    std::string_view url;
    std::string_view config_path;
    bool tls = false;
    uint32_t timeout_ms = 0;        // 0 = keep configured timeouts
    int verbosity = 0;

    std::string_view command;
    uint32_t command_hash = 0;
    std::vector<std::string_view> operands;

    std::string_view type;
    uint32_t count = 0;

    bool parse(int argc, char** argv, std::string& err)
    {
        int i = 1;
        for (; i < argc; ++i)
        {
            std::string_view a = argv[i];
            if (a.empty() || a[0] != '-')
                break;

            switch (fnv1a(a))
            {
                case fnv1a("-u"):
                case fnv1a("--url"):
                    if (!value_of(argc, argv, i, url, err)) return false;
                    break;
                case fnv1a("--config"):
                    if (!value_of(argc, argv, i, config_path, err)) return false;
                    break;
                case fnv1a("--tls"):
                    tls = true;
                    break;
                case fnv1a("--timeout"):
                    if (!number_of(argc, argv, i, timeout_ms, err)) return false;
                    break;
                case fnv1a("-v"):
                    verbosity += 1;
                    break;
                case fnv1a("-vv"):
                    verbosity += 2;
                    break;
                default:
                    err = "unknown option: " + std::string(a);
                    return false;
            }
        }

        if (i >= argc)
        {
            err = "no command given";
            return false;
        }

        command = argv[i++];
        command_hash = fnv1a_lower(command);

        for (; i < argc; ++i)
        {
            std::string_view a = argv[i];
            if (command_hash != cli_cmd::raw && a.size() > 2 && a[0] == '-' && a[1] == '-')
            {
                switch (fnv1a(a))
                {
                    case fnv1a("--type"):
                        if (!scan_only(a, err) || !value_of(argc, argv, i, type, err)) return false;
                        continue;
                    case fnv1a("--count"):
                        if (!scan_only(a, err) || !number_of(argc, argv, i, count, err)) return false;
                        continue;
                    default:
                        err = "unknown option: " + std::string(a);
                        return false;
                }
            }
            operands.push_back(a);
        }
        return true;
    }

private:
    bool scan_only(std::string_view opt, std::string& err) const
    {
        if (cli_cmd::is_scan(command_hash))
            return true;
        err = std::string(opt) + " only applies to scan commands";
        return false;
    }

    static bool value_of(int argc, char** argv, int& i, std::string_view& out, std::string& err)
    {
        if (i + 1 >= argc)
        {
            err = std::string(argv[i]) + " needs a value";
            return false;
        }
        out = argv[++i];
        return true;
    }

    static bool number_of(int argc, char** argv, int& i, uint32_t& out, std::string& err)
    {
        std::string_view v;
        if (!value_of(argc, argv, i, v, err))
            return false;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
        if (ec != std::errc{} || ptr != v.data() + v.size())
        {
            err = std::string(argv[i - 1]) + ": not a number: " + std::string(v);
            return false;
        }
        return true;
    }
};
