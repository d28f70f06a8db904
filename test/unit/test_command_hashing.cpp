#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "redisac/cli/arg_parser.h"

#include <vector>

TEST_CASE("FNV-1a basic correctness")
{
    CHECK(fnv1a("") != 0);
    CHECK(fnv1a("get") != fnv1a("set"));
    CHECK(fnv1a("get") != fnv1a("GET"));
    CHECK(fnv1a("scan") == fnv1a("scan"));
}

TEST_CASE("FNV-1a case-insensitive variant")
{
    CHECK(fnv1a_lower("GET") == fnv1a("get"));
    CHECK(fnv1a_lower("HScan") == fnv1a("hscan"));
    CHECK(fnv1a_lower("SCAN-GET") == fnv1a("scan-get"));
}

TEST_CASE("FNV-1a CLI commands and options unique")
{
    uint32_t hashes[] = {
        fnv1a("ping"), fnv1a("get"), fnv1a("set"), fnv1a("del"),
        fnv1a("scan"), fnv1a("hscan"), fnv1a("sscan"), fnv1a("zscan"),
        fnv1a("scan-get"), fnv1a("raw"),
        fnv1a("-u"), fnv1a("--url"), fnv1a("--config"), fnv1a("--tls"),
        fnv1a("--timeout"), fnv1a("-v"), fnv1a("-vv"), fnv1a("--type"), fnv1a("--count")
    };

    size_t count = sizeof(hashes) / sizeof(hashes[0]);
    for (size_t i = 0; i < count; i++)
        for (size_t j = i + 1; j < count; j++)
            CHECK(hashes[i] != hashes[j]);
}

// argv helper: parsed_args keeps views into these strings.
struct argv_builder
{
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    explicit argv_builder(std::initializer_list<const char*> args)
    {
        storage.emplace_back("redisac");
        for (const char* a : args)
            storage.emplace_back(a);
        for (auto& s : storage)
            ptrs.push_back(s.data());
    }

    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
};

TEST_CASE("CLI argument parsing")
{
    parsed_args args;
    std::string err;

    SUBCASE("global options then command")
    {
        argv_builder a({ "-u", "redis://h:1", "--tls", "--timeout", "250", "-v", "GET", "key" });
        REQUIRE_MESSAGE(args.parse(a.argc(), a.argv(), err), err);
        CHECK(args.url == "redis://h:1");
        CHECK(args.tls);
        CHECK(args.timeout_ms == 250);
        CHECK(args.verbosity == 1);
        CHECK(args.command == "GET");
        CHECK(args.command_hash == fnv1a("get"));
        REQUIRE(args.operands.size() == 1);
        CHECK(args.operands[0] == "key");
    }

    SUBCASE("scan options after the command")
    {
        argv_builder a({ "--config", "c.lua", "scan", "user:*", "--type", "hash", "--count", "100" });
        REQUIRE(args.parse(a.argc(), a.argv(), err));
        CHECK(args.config_path == "c.lua");
        CHECK(args.type == "hash");
        CHECK(args.count == 100);
        REQUIRE(args.operands.size() == 1);
        CHECK(args.operands[0] == "user:*");
    }

    SUBCASE("raw passes dashes through")
    {
        argv_builder a({ "raw", "SET", "k", "--count" });
        REQUIRE(args.parse(a.argc(), a.argv(), err));
        CHECK(args.operands.size() == 3);
        CHECK(args.operands[2] == "--count");
    }

    SUBCASE("errors")
    {
        argv_builder none({ "-v" });
        CHECK_FALSE(args.parse(none.argc(), none.argv(), err));
        CHECK(err == "no command given");

        argv_builder bad_opt({ "--nope", "ping" });
        CHECK_FALSE(args.parse(bad_opt.argc(), bad_opt.argv(), err));

        argv_builder no_value({ "-u" });
        CHECK_FALSE(args.parse(no_value.argc(), no_value.argv(), err));

        argv_builder bad_num({ "--timeout", "soon", "ping" });
        CHECK_FALSE(args.parse(bad_num.argc(), bad_num.argv(), err));
        CHECK(err.find("not a number") != std::string::npos);

        parsed_args fresh;
        argv_builder not_scan({ "get", "k", "--count", "5" });
        CHECK_FALSE(fresh.parse(not_scan.argc(), not_scan.argv(), err));
        CHECK(err == "--count only applies to scan commands");
    }
}

TEST_CASE("subcommand table")
{
    CHECK(cli_cmd::get == fnv1a_lower("GET"));
    CHECK(cli_cmd::is_scan(cli_cmd::zscan));
    CHECK(cli_cmd::is_scan(cli_cmd::scan_get));
    CHECK_FALSE(cli_cmd::is_scan(cli_cmd::raw));
    CHECK_FALSE(cli_cmd::is_scan(fnv1a("scanx")));
}
