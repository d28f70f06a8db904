#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "fake_redis.h"
#include "redisac/connection.h"

#include <optional>

using redisac::connection;
using redisac::result;
using redisac::shared_connection;

namespace
{

shared_connection open_shared(fake_redis::server& srv)
{
    shared_connection out;
    redisac::connect(srv.make_connection(), [&](connection c, const connect_error& e) {
        CHECK_MESSAGE(!e, e.describe());
        out = redisac::share(std::move(c));
    });
    srv.pump();
    REQUIRE(out.valid());
    return out;
}

} // namespace

TEST_CASE("concurrent commands complete in submission order")
{
    fake_redis::server srv;
    srv.deferred = true;
    shared_connection con = open_shared(srv);

    constexpr int N = 50;
    for (int i = 0; i < N; i++)
        srv.strings["tag:" + std::to_string(i)] = "payload-" + std::to_string(i);

    std::vector<int> order;
    std::vector<std::string> payloads;
    for (int i = 0; i < N; i++)
    {
        // Every caller holds its own copy of the handle.
        shared_connection copy = con;
        copy.get("tag:" + std::to_string(i), [&, i](shared_connection, result<std::optional<std::string>> r) {
            CHECK(r);
            order.push_back(i);
            payloads.push_back(r.value.value_or("?"));
        });
    }

    CHECK(con.in_flight());
    CHECK(con.queued() == N - 1);

    srv.pump();
    REQUIRE(order.size() == N);
    for (int i = 0; i < N; i++)
    {
        CHECK(order[i] == i);
        CHECK(payloads[i] == "payload-" + std::to_string(i));
    }
    CHECK_FALSE(con.in_flight());
    CHECK(con.queued() == 0);
}

TEST_CASE("only one command is on the wire at a time")
{
    fake_redis::server srv;
    srv.deferred = true;
    shared_connection con = open_shared(srv);
    size_t before = srv.received.size();

    int done = 0;
    for (int i = 0; i < 3; i++)
        con.ping([&](shared_connection, result<redisac::status>) { done++; });

    // Run until the first command reaches the server: the rest are still queued.
    while (srv.received.size() == before && srv.step()) {}
    CHECK(srv.received.size() == before + 1);
    CHECK(con.queued() == 2);

    srv.pump();
    CHECK(done == 3);
}

TEST_CASE("cancelling a queued command")
{
    fake_redis::server srv;
    srv.deferred = true;
    shared_connection con = open_shared(srv);

    std::vector<std::string> seen;
    auto record = [&seen](std::string tag) {
        return [&seen, tag](const command_error& e, resp::value&&) {
            CHECK_FALSE(e);
            seen.push_back(tag);
        };
    };

    redisac::ticket a = con.submit(resp::encode_command({ "ECHO", "a" }), record("a"));
    redisac::ticket b = con.submit(resp::encode_command({ "ECHO", "b" }), record("b"));
    redisac::ticket c = con.submit(resp::encode_command({ "ECHO", "c" }), record("c"));
    CHECK(a != b);
    CHECK(b != c);

    CHECK(con.cancel(b));
    CHECK_FALSE(con.cancel(b));
    CHECK(con.queued() == 1);

    srv.pump();
    CHECK(seen == std::vector<std::string>{ "a", "c" });
    CHECK(srv.count_received("ECHO") == 2);
    CHECK_FALSE(con.cancel(a));
}

TEST_CASE("cancelling the in-flight command drops only its reply")
{
    fake_redis::server srv;
    srv.deferred = true;
    shared_connection con = open_shared(srv);

    bool first = false;
    std::string second;
    redisac::ticket t = con.submit(resp::encode_command({ "ECHO", "one" }),
                                   [&](const command_error&, resp::value&&) { first = true; });
    con.submit(resp::encode_command({ "ECHO", "two" }),
               [&](const command_error&, resp::value&& v) { second = v.str; });

    CHECK(con.cancel(t));
    srv.pump();
    CHECK_FALSE(first);
    CHECK(second == "two");
    CHECK(con.state() == connection_state::ready);
}

TEST_CASE("a broken shared connection fails queued requests in order")
{
    fake_redis::server srv;
    srv.deferred = true;
    shared_connection con = open_shared(srv);
    srv.fault.drop_on["GET"] = 1;

    std::vector<std::pair<int, command_error>> results;
    for (int i = 0; i < 3; i++)
        con.get("k", [&, i](shared_connection, result<std::optional<std::string>> r) {
            results.emplace_back(i, r.error);
        });
    srv.pump();

    REQUIRE(results.size() == 3);
    CHECK(results[0].first == 0);
    CHECK(results[0].second.code == command_errc::network);
    CHECK(results[0].second.sys_errno == ECONNRESET);
    for (int i = 1; i < 3; i++)
    {
        CHECK(results[i].first == i);
        CHECK(results[i].second.sys_errno == ENOTCONN);
    }
    CHECK(con.is_broken());

    SUBCASE("reset brings it back and waiting requests follow")
    {
        bool reset_ok = false;
        redisac::reset(con, [&](shared_connection, const connect_error& e) { reset_ok = !e; });
        CHECK_FALSE(con.is_broken());

        std::optional<std::string> value;
        srv.strings["k"] = "v";
        con.get("k", [&](shared_connection, result<std::optional<std::string>> r) { value = r.value; });
        CHECK_FALSE(value);

        srv.pump();
        CHECK(reset_ok);
        CHECK(value == std::optional<std::string>("v"));
        CHECK(srv.connects == 2);
    }

    SUBCASE("new requests fail fast until reset")
    {
        command_error err;
        con.ping([&](shared_connection, result<redisac::status> r) { err = r.error; });
        CHECK(err.sys_errno == ENOTCONN);
    }
}

TEST_CASE("reset is refused while a request is in flight")
{
    fake_redis::server srv;
    srv.deferred = true;
    shared_connection con = open_shared(srv);

    con.ping([](shared_connection, result<redisac::status>) {});
    connect_error err;
    redisac::reset(con, [&](shared_connection, const connect_error& e) { err = e; });
    CHECK(err.sys_errno == EBUSY);
    srv.pump();
}

TEST_CASE("handles keep the channel alive until replies arrive")
{
    fake_redis::server srv;
    srv.deferred = true;

    bool replied = false;
    {
        shared_connection con = open_shared(srv);
        con.set("k", "v", [&](shared_connection c, result<redisac::status> r) {
            replied = r.ok();
            CHECK(c.valid());
        });
    }
    CHECK(srv.closes == 0);
    srv.pump();
    CHECK(replied);
    CHECK(srv.strings["k"] == "v");
    CHECK(srv.closes == 1);
}

TEST_CASE("typed commands in immediate mode")
{
    fake_redis::server srv;
    shared_connection con = open_shared(srv);

    std::optional<std::string> got;
    con.set("k", "v", [&](shared_connection c, result<redisac::status> r) {
        CHECK(r);
        c.get("k", [&](shared_connection, result<std::optional<std::string>> r2) { got = r2.value; });
    });
    CHECK(got == std::optional<std::string>("v"));
}

TEST_CASE("empty shared handles")
{
    shared_connection con;
    CHECK_FALSE(con.valid());
    CHECK(con.is_broken());

    command_error err;
    con.ping([&](shared_connection, result<redisac::status> r) { err = r.error; });
    CHECK(err.sys_errno == ENOTCONN);

    CHECK_FALSE(redisac::share(connection{}).valid());
}
