#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "redisac/shared/client_config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

TEST_CASE("config defaults")
{
    client_config cfg;
    connection_options opts;
    std::string err;
    REQUIRE(cfg.to_connection_options(opts, err));
    CHECK(opts.address.host == "127.0.0.1");
    CHECK(opts.address.port == 6379);
    CHECK(opts.connect_timeout_ms == 5000);
    CHECK(opts.response_timeout_ms == 0);
    CHECK(cfg.level == log_warn);
}

TEST_CASE("config from a Lua chunk")
{
    client_config cfg;
    std::string err;
    bool ok = cfg.load_string(R"(
        redis = {
            url = "rediss://app:pw@cache.internal:6380/2",
            connect_timeout_ms = 1500,
            response_timeout_ms = 250,
            client_name = "reporting",
            scan_count = 500,
            log_level = "debug",
            queue_depth = 64,
            tls = { ca_file = "/etc/ca.pem", verify = false, server_name = "cache" },
        }
    )", err);
    REQUIRE_MESSAGE(ok, err);

    CHECK(cfg.connect_timeout_ms == 1500);
    CHECK(cfg.scan_count == 500);
    CHECK(cfg.level == log_debug);
    CHECK(cfg.queue_depth == 64);
    CHECK(cfg.tls.ca_file == "/etc/ca.pem");
    CHECK_FALSE(cfg.tls.verify);

    connection_options opts;
    REQUIRE(cfg.to_connection_options(opts, err));
    CHECK(opts.address.is_tls());
    CHECK(opts.address.db == 2);
    CHECK(opts.address.password == "pw");
    CHECK(opts.response_timeout_ms == 250);
    CHECK(opts.client_name == "reporting");
    CHECK(opts.tls.server_name == "cache");
}

TEST_CASE("config scripts may compute values")
{
    client_config cfg;
    std::string err;
    REQUIRE(cfg.load_string(R"(
        local port = 6000 + 1
        redis = { url = "redis://10.1.1.1:" .. port, connect_timeout_ms = 2 * 1000 }
    )", err));
    CHECK(cfg.url == "redis://10.1.1.1:6001");
    CHECK(cfg.connect_timeout_ms == 2000);
}

TEST_CASE("missing redis table keeps defaults")
{
    client_config cfg;
    std::string err;
    CHECK(cfg.load_string("other = 1", err));
    CHECK(cfg.url == "redis://127.0.0.1:6379");
}

TEST_CASE("config errors are reported, not thrown")
{
    client_config cfg;
    std::string err;

    SUBCASE("syntax error")
    {
        CHECK_FALSE(cfg.load_string("redis = {", err));
        CHECK(err.find("failed to load config") != std::string::npos);
    }

    SUBCASE("runtime error")
    {
        CHECK_FALSE(cfg.load_string("error('boom')", err));
        CHECK(err.find("boom") != std::string::npos);
    }

    SUBCASE("wrong types")
    {
        CHECK_FALSE(cfg.load_string("redis = { connect_timeout_ms = 'soon' }", err));
        CHECK(err.find("connect_timeout_ms") != std::string::npos);
        CHECK_FALSE(cfg.load_string("redis = { url = 5 }", err));
        CHECK_FALSE(cfg.load_string("redis = { response_timeout_ms = -1 }", err));
    }

    SUBCASE("unknown log level")
    {
        CHECK_FALSE(cfg.load_string("redis = { log_level = 'loud' }", err));
    }

    SUBCASE("missing file")
    {
        CHECK_FALSE(cfg.load_file("/nonexistent/redisac.lua", err));
    }
}

TEST_CASE("config file on disk")
{
    char path[] = "/tmp/redisac_cfg_XXXXXX";
    int fd = mkstemp(path);
    REQUIRE(fd >= 0);
    close(fd);
    {
        std::ofstream f(path);
        f << "redis = { url = 'redis://file-host:7001', client_name = 'from-file' }\n";
    }

    client_config cfg;
    std::string err;
    CHECK_MESSAGE(cfg.load_file(path, err), err);
    CHECK(cfg.url == "redis://file-host:7001");
    CHECK(cfg.client_name == "from-file");
    unlink(path);
}

TEST_CASE("environment overrides")
{
    client_config cfg;
    std::string err;
    REQUIRE(cfg.load_string("redis = { url = 'redis://from-file', log_level = 'error' }", err));

    setenv("REDISAC_URL", "redis://from-env:6400", 1);
    setenv("REDISAC_LOG", "info", 1);
    cfg.apply_env();
    unsetenv("REDISAC_URL");
    unsetenv("REDISAC_LOG");

    CHECK(cfg.url == "redis://from-env:6400");
    CHECK(cfg.level == log_info);
}

TEST_CASE("conversion validates")
{
    client_config cfg;
    connection_options opts;
    std::string err;

    SUBCASE("bad url")
    {
        cfg.url = "ftp://x";
        CHECK_FALSE(cfg.to_connection_options(opts, err));
        CHECK(err.rfind("url:", 0) == 0);
    }

    SUBCASE("client cert without key")
    {
        cfg.url = "rediss://h";
        cfg.tls.cert_file = "/etc/client.pem";
        CHECK_FALSE(cfg.to_connection_options(opts, err));
    }

    SUBCASE("force_tls upgrades plain TCP")
    {
        cfg.force_tls = true;
        REQUIRE(cfg.to_connection_options(opts, err));
        CHECK(opts.address.is_tls());
    }

    SUBCASE("force_tls leaves unix sockets alone")
    {
        cfg.url = "unix:///tmp/r.sock";
        cfg.force_tls = true;
        REQUIRE(cfg.to_connection_options(opts, err));
        CHECK(opts.address.kind == address_kind::unix_socket);
    }
}

TEST_CASE("log level names")
{
    log_level lvl = log_error;
    CHECK(parse_log_level("debug", lvl));
    CHECK(lvl == log_debug);
    CHECK(parse_log_level("warning", lvl));
    CHECK(lvl == log_warn);
    CHECK_FALSE(parse_log_level("DEBUG", lvl));
    CHECK(lvl == log_warn);
}

TEST_CASE("an unknown REDISAC_LOG is logged and ignored")
{
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink);
    logger::g_sink = sink;
    logger::g_level = log_warn;

    client_config cfg;
    setenv("REDISAC_LOG", "loud", 1);
    cfg.apply_env();
    unsetenv("REDISAC_LOG");
    logger::g_sink = nullptr;

    CHECK(cfg.level == log_warn);

    std::rewind(sink);
    char line[256] = {};
    REQUIRE(std::fgets(line, sizeof(line), sink));
    std::string text(line);
    CHECK(text.find("[redisac] [WARN]") != std::string::npos);
    CHECK(text.find("REDISAC_LOG: unknown level 'loud'") != std::string::npos);
    std::fclose(sink);
}
