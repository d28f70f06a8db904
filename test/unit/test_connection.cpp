#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "fake_redis.h"
#include "redisac/connection.h"

#include <optional>

using redisac::connection;
using redisac::result;
using redisac::status;

namespace
{

// Puts the handle back into `con` and keeps the result.
template <typename T>
auto into(connection& con, std::optional<result<T>>& out)
{
    return [&con, &out](connection c, result<T> r) {
        con = std::move(c);
        out = std::move(r);
    };
}

connection open(fake_redis::server& srv, connect_error& err, connection_options opts = {})
{
    connection out;
    bool called = false;
    redisac::connect(srv.make_connection(std::move(opts)), [&](connection c, const connect_error& e) {
        called = true;
        out = std::move(c);
        err = e;
    });
    srv.pump();
    CHECK(called);
    return out;
}

connection open(fake_redis::server& srv, connection_options opts = {})
{
    connect_error err;
    connection c = open(srv, err, std::move(opts));
    REQUIRE_MESSAGE(!err, err.describe());
    return c;
}

} // namespace

TEST_CASE("connect runs the handshake")
{
    fake_redis::server srv;

    SUBCASE("plain")
    {
        connection con = open(srv);
        CHECK(con);
        CHECK(con.state() == connection_state::ready);
        REQUIRE(srv.received.size() == 1);
        CHECK(srv.received[0] == std::vector<std::string>{ "PING" });
    }

    SUBCASE("auth, db and client name")
    {
        srv.password = "pw";
        connection_options opts;
        opts.address.username = "default";
        opts.address.password = "pw";
        opts.address.db = 3;
        opts.client_name = "worker-1";

        connection con = open(srv, opts);
        REQUIRE(srv.received.size() == 4);
        CHECK(srv.received[0] == std::vector<std::string>{ "AUTH", "default", "pw" });
        CHECK(srv.received[1] == std::vector<std::string>{ "SELECT", "3" });
        CHECK(srv.received[2] == std::vector<std::string>{ "CLIENT", "SETNAME", "worker-1" });
        CHECK(srv.received[3] == std::vector<std::string>{ "PING" });

        auto t = srv.transports.back().lock();
        REQUIRE(t);
        CHECK(t->state().db == 3);
        CHECK(t->state().name == "worker-1");
    }

    SUBCASE("password without username")
    {
        srv.password = "pw";
        connection_options opts;
        opts.address.password = "pw";
        open(srv, opts);
        CHECK(srv.received[0] == std::vector<std::string>{ "AUTH", "pw" });
    }

    SUBCASE("a rejected client name is not fatal")
    {
        connection_options opts;
        opts.client_name = "has space";
        connection con = open(srv, opts);
        CHECK(con);
    }
}

TEST_CASE("connect failures")
{
    fake_redis::server srv;
    connect_error err;
    connection_options opts;

    SUBCASE("refused")
    {
        srv.fault.refuse_connect = true;
        connection con = open(srv, err);
        CHECK(err.code == connect_errc::refused);
        CHECK_FALSE(con.valid());
    }

    SUBCASE("wrong password")
    {
        srv.password = "right";
        opts.address.password = "wrong";
        open(srv, err, opts);
        CHECK(err.code == connect_errc::auth_failed);
        CHECK(err.message.find("WRONGPASS") != std::string::npos);
    }

    SUBCASE("password required but not given")
    {
        srv.password = "pw";
        open(srv, err);
        CHECK(err.code == connect_errc::auth_failed);
    }

    SUBCASE("malformed greeting")
    {
        srv.fault.ping_reply = "+HELLO\r\n";
        open(srv, err);
        CHECK(err.code == connect_errc::protocol_mismatch);
    }

    SUBCASE("unparseable greeting")
    {
        srv.fault.garbage_on["PING"] = 1;
        open(srv, err);
        CHECK(err.code == connect_errc::protocol_mismatch);
    }

    SUBCASE("bad database")
    {
        opts.address.db = 99;
        open(srv, err, opts);
        CHECK(err.code == connect_errc::protocol_mismatch);
    }

    SUBCASE("peer hangs up during the handshake")
    {
        srv.fault.drop_on["PING"] = 1;
        open(srv, err);
        CHECK(err.code == connect_errc::io_error);
    }

    SUBCASE("invalid url")
    {
        event_loop loop;
        bool called = false;
        redisac::connect(loop, "ftp://nowhere", [&](connection c, const connect_error& e) {
            called = true;
            CHECK_FALSE(c.valid());
            CHECK(e.code == connect_errc::invalid_address);
        });
        CHECK(called);
    }

    CHECK(srv.closes == srv.connects);
}

TEST_CASE("set then get returns the value")
{
    fake_redis::server srv;
    connection con = open(srv);

    std::optional<result<status>> set_r;
    con.set("k", "v", into(con, set_r));
    REQUIRE(set_r);
    CHECK(set_r->ok());
    CHECK(set_r->value == "OK");

    std::optional<result<std::optional<std::string>>> get_r;
    con.get("k", into(con, get_r));
    REQUIRE(get_r);
    REQUIRE(get_r->value.has_value());
    CHECK(*get_r->value == "v");

    SUBCASE("repeated get is stable")
    {
        std::optional<result<std::optional<std::string>>> again;
        con.get("k", into(con, again));
        REQUIRE(again);
        CHECK(again->value == get_r->value);
    }

    SUBCASE("missing key is absent, not an error")
    {
        std::optional<result<std::optional<std::string>>> missing;
        con.get("missing", into(con, missing));
        REQUIRE(missing);
        CHECK(missing->ok());
        CHECK_FALSE(missing->value.has_value());
    }

    SUBCASE("decoding into a plain string is also possible")
    {
        std::optional<result<std::string>> plain;
        con.get<std::string>("k", into(con, plain));
        REQUIRE(plain);
        CHECK(plain->value == "v");
    }
}

TEST_CASE("typed command surface")
{
    fake_redis::server srv;
    connection con = open(srv);

    std::optional<result<int64_t>> n;
    con.hset("h", "f1", "v1", into(con, n));
    con.hset("h", "f2", "v2", into(con, n));
    CHECK(n->value == 1);

    std::optional<result<std::map<std::string, std::string>>> all;
    con.hgetall("h", into(con, all));
    REQUIRE(all);
    CHECK(all->value == std::map<std::string, std::string>{ { "f1", "v1" }, { "f2", "v2" } });

    std::optional<result<std::optional<std::string>>> field;
    con.hget("h", "f2", into(con, field));
    CHECK(field->value == std::optional<std::string>("v2"));

    con.sadd("s", "a", into(con, n));
    con.sadd("s", "a", into(con, n));
    CHECK(n->value == 0);

    std::optional<result<std::vector<std::string>>> members;
    con.smembers("s", into(con, members));
    CHECK(members->value == std::vector<std::string>{ "a" });

    con.zadd("z", 2.5, "m", into(con, n));
    CHECK(n->value == 1);
    CHECK(srv.zsets["z"]["m"] == doctest::Approx(2.5));

    con.incr("counter", into(con, n));
    con.incr("counter", into(con, n));
    CHECK(n->value == 2);

    std::optional<result<status>> st;
    con.set_ex("tmp", "x", 60, into(con, st));
    CHECK(srv.received.back() == std::vector<std::string>{ "SET", "tmp", "x", "EX", "60" });

    std::optional<result<bool>> exists;
    con.exists("tmp", into(con, exists));
    CHECK(exists->value);
    con.expire("tmp", 10, into(con, exists));
    CHECK(exists->value);

    std::optional<result<std::vector<std::optional<std::string>>>> values;
    con.mget({ "tmp", "nope", "counter" }, into(con, values));
    REQUIRE(values->value.size() == 3);
    CHECK(values->value[0] == std::optional<std::string>("x"));
    CHECK_FALSE(values->value[1].has_value());
    CHECK(values->value[2] == std::optional<std::string>("2"));

    con.del(std::vector<std::string>{ "tmp", "counter", "nope" }, into(con, n));
    CHECK(n->value == 2);

    std::optional<result<std::string>> echo;
    con.echo("hi there", into(con, echo));
    CHECK(echo->value == "hi there");

    std::optional<result<status>> pong;
    con.ping(into(con, pong));
    CHECK(pong->value == "PONG");

    std::optional<result<resp::value>> raw;
    con.query(redisac::cmd("DBSIZE"), into(con, raw));
    CHECK(raw->value.kind == resp::type::integer);
    CHECK(raw->value.integer == 3);
}

TEST_CASE("recoverable errors leave the connection usable")
{
    fake_redis::server srv;
    connection con = open(srv);
    srv.sets["s"] = { "a", "b" };

    SUBCASE("decode mismatch")
    {
        std::optional<result<int64_t>> r;
        con.query<int64_t>(redisac::cmd("SMEMBERS").arg("s"), into(con, r));
        REQUIRE(r);
        CHECK(r->error.code == command_errc::decode);
        CHECK_FALSE(con.is_broken());
    }

    SUBCASE("server error reply")
    {
        std::optional<result<std::optional<std::string>>> r;
        con.get("s", into(con, r));
        REQUIRE(r);
        CHECK(r->error.code == command_errc::server_error);
        CHECK(r->error.message.rfind("WRONGTYPE", 0) == 0);
        CHECK_FALSE(con.is_broken());
    }

    SUBCASE("unknown command")
    {
        std::optional<result<resp::value>> r;
        con.query(redisac::cmd("NOPE"), into(con, r));
        CHECK(r->error.code == command_errc::server_error);
    }

    std::optional<result<status>> pong;
    con.ping(into(con, pong));
    REQUIRE(pong);
    CHECK(pong->ok());
    CHECK(con.state() == connection_state::ready);
}

TEST_CASE("transport failures break the connection")
{
    fake_redis::server srv;
    connection con = open(srv);
    std::optional<result<std::optional<std::string>>> r;

    SUBCASE("peer reset")
    {
        srv.fault.drop_on["GET"] = 1;
        con.get("k", into(con, r));
        REQUIRE(r);
        CHECK(r->error.code == command_errc::network);
        CHECK(r->error.sys_errno == ECONNRESET);
    }

    SUBCASE("garbage bytes")
    {
        srv.fault.garbage_on["GET"] = 1;
        con.get("k", into(con, r));
        REQUIRE(r);
        CHECK(r->error.code == command_errc::protocol);
    }

    SUBCASE("response timeout")
    {
        srv.fault.silent_on["GET"] = 1;
        con.get("k", into(con, r));
        CHECK_FALSE(r);
        CHECK(con.raw() == nullptr);
        CHECK(srv.expire_waiting() == 1);
        REQUIRE(r);
        CHECK(r->error.timed_out);
    }

    CHECK(con.valid());
    CHECK(con.is_broken());
    CHECK(con.state() == connection_state::broken);

    // A broken handle fails fast.
    std::optional<result<status>> after;
    con.ping(into(con, after));
    REQUIRE(after);
    CHECK(after->error.sys_errno == ENOTCONN);

    // reset() reconnects with the same options.
    bool reopened = false;
    redisac::reset(std::move(con), [&](connection c, const connect_error& e) {
        reopened = !e;
        con = std::move(c);
    });
    CHECK(reopened);
    CHECK(srv.connects == 2);

    std::optional<result<status>> pong;
    con.ping(into(con, pong));
    CHECK(pong->ok());
}

TEST_CASE("replies split across reads")
{
    fake_redis::server srv;
    srv.fault.chunk = 1;
    connection con = open(srv);

    srv.hashes["h"] = { { "field", std::string(300, 'x') } };
    std::optional<result<std::map<std::string, std::string>>> r;
    con.hgetall("h", into(con, r));
    REQUIRE(r);
    CHECK(r->value["field"].size() == 300);
}

TEST_CASE("a large array reply arriving in 16 KB reads")
{
    fake_redis::server srv;
    srv.fault.chunk = 16 * 1024;
    connection con = open(srv);

    auto& members = srv.sets["big"];
    for (int i = 0; i < 20000; i++)
        members.insert("member:" + std::to_string(i));

    std::optional<result<std::vector<std::string>>> r;
    con.smembers("big", into(con, r));
    REQUIRE(r);
    REQUIRE(r->ok());
    CHECK(r->value.size() == 20000);

    // The connection stays in sync for the next reply.
    std::optional<result<status>> pong;
    con.ping(into(con, pong));
    REQUIRE(pong);
    CHECK(pong->ok());
}

TEST_CASE("empty handle")
{
    connection con;
    CHECK_FALSE(con.valid());
    CHECK(con.is_broken());
    CHECK(con.state() == connection_state::closed);

    std::optional<result<status>> r;
    con.ping(into(con, r));
    REQUIRE(r);
    CHECK(r->error.code == command_errc::network);
    CHECK(r->error.sys_errno == ENOTCONN);
}

TEST_CASE("redis_connection states and one command at a time")
{
    fake_redis::server srv;
    srv.deferred = true;

    auto conn = srv.make_connection();
    CHECK(conn->state() == connection_state::disconnected);

    connect_error open_err;
    bool opened = false;
    conn->open([&](const connect_error& e) { opened = true; open_err = e; });
    CHECK(conn->state() == connection_state::connecting);
    srv.pump();
    REQUIRE(opened);
    CHECK_FALSE(open_err);
    CHECK(conn->is_ready());

    int replies = 0;
    conn->execute(resp::encode_command({ "PING" }), [&](const command_error& e, resp::value&&) {
        CHECK_FALSE(e);
        replies++;
    });
    CHECK(conn->is_busy());

    command_error busy_err;
    conn->execute(resp::encode_command({ "PING" }), [&](const command_error& e, resp::value&&) { busy_err = e; });
    CHECK(busy_err.sys_errno == EBUSY);
    CHECK(busy_err.code == command_errc::busy);
    CHECK_FALSE(busy_err.breaks_connection());
    CHECK_FALSE(conn->is_broken());

    bool reset_called = false;
    conn->reset([&](const connect_error& e) {
        reset_called = true;
        CHECK(e.sys_errno == EBUSY);
    });
    CHECK(reset_called);

    srv.pump();
    CHECK(replies == 1);
    CHECK(conn->is_ready());
    CHECK(conn->commands_sent() == 2);   // handshake PING + one command

    conn->close();
    CHECK(conn->state() == connection_state::closed);
    CHECK(srv.closes == 1);
}

TEST_CASE("a command rejected while busy leaves the connection usable")
{
    fake_redis::server srv;
    srv.deferred = true;
    auto conn = srv.make_connection();
    conn->open([](const connect_error&) {});
    srv.pump();
    REQUIRE(conn->is_ready());

    std::optional<std::string> first;
    conn->execute(resp::encode_command({ "SET", "k", "v" }), [](const command_error& e, resp::value&&) {
        CHECK_FALSE(e);
    });

    command_error rejected;
    conn->execute(resp::encode_command({ "GET", "k" }), [&](const command_error& e, resp::value&&) { rejected = e; });
    CHECK(rejected.code == command_errc::busy);
    CHECK(rejected.describe() == "busy: a command is already in flight");

    srv.pump();
    REQUIRE(conn->is_ready());

    // Nothing of the rejected command reached the server.
    conn->execute(resp::encode_command({ "GET", "k" }), [&](const command_error& e, resp::value&& v) {
        CHECK_FALSE(e);
        first = v.str;
    });
    srv.pump();
    CHECK(first == std::optional<std::string>("v"));
    CHECK(conn->commands_sent() == 3);   // handshake PING, SET, GET
}

TEST_CASE("discarding the in-flight reply keeps the stream in sync")
{
    fake_redis::server srv;
    srv.deferred = true;
    connection con = open(srv);
    srv.strings["a"] = "1";
    srv.strings["b"] = "2";

    bool first_called = false;
    redisac::ticket t = con.submit(resp::encode_command({ "GET", "a" }),
                                   [&](const command_error&, resp::value&&) { first_called = true; });
    CHECK(con.cancel(t));
    srv.pump();
    CHECK_FALSE(first_called);
    CHECK(con.state() == connection_state::ready);

    resp::value second;
    con.submit(resp::encode_command({ "GET", "b" }), [&](const command_error&, resp::value&& v) { second = std::move(v); });
    srv.pump();
    CHECK(second.str == "2");
}

TEST_CASE("an abandoned connection closes once its reply drains")
{
    fake_redis::server srv;
    srv.deferred = true;

    auto conn = srv.make_connection();
    conn->open([](const connect_error&) {});
    srv.pump();
    REQUIRE(conn->is_ready());

    bool called = false;
    conn->execute(resp::encode_command({ "PING" }), [&](const command_error&, resp::value&&) { called = true; });
    redis_connection::close_when_idle(std::move(conn));
    CHECK(srv.closes == 0);

    srv.pump();
    CHECK_FALSE(called);
    CHECK(srv.closes == 1);
    CHECK(srv.count_received("PING") == 2);
}
