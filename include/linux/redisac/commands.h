// redisac/commands.h - typed command methods shared by both handle kinds
#pragma once
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "execute.h"
#include "scan_stream.h"

namespace redisac {

// CRTP mixin. Every method takes the handle out of *this and hands it back
// in the callback:  cb(Derived con, result<T> r)
// For an exclusive connection *this is empty until the callback returns it.
template <typename Derived>
class commands {
public:
    // ── Generic ─────────────────────────────────────────────────────────
    template <typename T = resp::value, typename F>
    void query(const command& c, F&& cb) { execute<T>(self().take(), c, std::forward<F>(cb)); }

    template <typename F>
    void ping(F&& cb) { query<status>(cmd("PING"), std::forward<F>(cb)); }

    template <typename T = std::string, typename F>
    void echo(std::string_view msg, F&& cb) { query<T>(cmd("ECHO").arg(msg), std::forward<F>(cb)); }

    // ── Strings ─────────────────────────────────────────────────────────
    template <typename T = std::optional<std::string>, typename F>
    void get(std::string_view key, F&& cb) { query<T>(cmd("GET").arg(key), std::forward<F>(cb)); }

    template <typename F>
    void set(std::string_view key, std::string_view value, F&& cb) {
        query<status>(cmd("SET").arg(key).arg(value), std::forward<F>(cb));
    }

    template <typename F>
    void set_ex(std::string_view key, std::string_view value, uint64_t seconds, F&& cb) {
        query<status>(cmd("SET").arg(key).arg(value).arg("EX").arg(seconds), std::forward<F>(cb));
    }

    template <typename T = std::vector<std::optional<std::string>>, typename F>
    void mget(const std::vector<std::string>& keys, F&& cb) {
        query<T>(cmd("MGET").args(keys), std::forward<F>(cb));
    }

    template <typename T = int64_t, typename F>
    void incr(std::string_view key, F&& cb) { query<T>(cmd("INCR").arg(key), std::forward<F>(cb)); }

    // ── Keys ────────────────────────────────────────────────────────────
    template <typename F>
    void del(std::string_view key, F&& cb) { query<int64_t>(cmd("DEL").arg(key), std::forward<F>(cb)); }

    template <typename F>
    void del(const std::vector<std::string>& keys, F&& cb) {
        query<int64_t>(cmd("DEL").args(keys), std::forward<F>(cb));
    }

    template <typename F>
    void exists(std::string_view key, F&& cb) { query<bool>(cmd("EXISTS").arg(key), std::forward<F>(cb)); }

    template <typename F>
    void expire(std::string_view key, uint64_t seconds, F&& cb) {
        query<bool>(cmd("EXPIRE").arg(key).arg(seconds), std::forward<F>(cb));
    }

    // ── Hashes / sets / sorted sets ─────────────────────────────────────
    template <typename F>
    void hset(std::string_view key, std::string_view field, std::string_view value, F&& cb) {
        query<int64_t>(cmd("HSET").arg(key).arg(field).arg(value), std::forward<F>(cb));
    }

    template <typename T = std::optional<std::string>, typename F>
    void hget(std::string_view key, std::string_view field, F&& cb) {
        query<T>(cmd("HGET").arg(key).arg(field), std::forward<F>(cb));
    }

    template <typename T = std::map<std::string, std::string>, typename F>
    void hgetall(std::string_view key, F&& cb) { query<T>(cmd("HGETALL").arg(key), std::forward<F>(cb)); }

    template <typename F>
    void sadd(std::string_view key, std::string_view member, F&& cb) {
        query<int64_t>(cmd("SADD").arg(key).arg(member), std::forward<F>(cb));
    }

    template <typename T = std::vector<std::string>, typename F>
    void smembers(std::string_view key, F&& cb) { query<T>(cmd("SMEMBERS").arg(key), std::forward<F>(cb)); }

    template <typename F>
    void zadd(std::string_view key, double score, std::string_view member, F&& cb) {
        query<int64_t>(cmd("ZADD").arg(key).arg(score).arg(member), std::forward<F>(cb));
    }

    // ── Cursor scans ────────────────────────────────────────────────────
    template <typename RV = std::string>
    scan_stream<Derived, RV> scan(scan_request req = {}) {
        req.kind = scan_kind::scan;
        req.cursor = 0;
        return scan_stream<Derived, RV>(self().take(), std::move(req));
    }

    template <typename RV = std::string>
    scan_stream<Derived, RV> scan_match(std::string_view pattern) {
        return scan<RV>(make_request(scan_kind::scan, {}, pattern));
    }

    template <typename RV = std::pair<std::string, std::string>>
    scan_stream<Derived, RV> hscan(std::string_view key) {
        return keyed<RV>(scan_kind::hscan, key, {});
    }

    template <typename RV = std::pair<std::string, std::string>>
    scan_stream<Derived, RV> hscan_match(std::string_view key, std::string_view pattern) {
        return keyed<RV>(scan_kind::hscan, key, pattern);
    }

    template <typename RV = std::string>
    scan_stream<Derived, RV> sscan(std::string_view key) {
        return keyed<RV>(scan_kind::sscan, key, {});
    }

    template <typename RV = std::string>
    scan_stream<Derived, RV> sscan_match(std::string_view key, std::string_view pattern) {
        return keyed<RV>(scan_kind::sscan, key, pattern);
    }

    template <typename RV = std::pair<std::string, double>>
    scan_stream<Derived, RV> zscan(std::string_view key) {
        return keyed<RV>(scan_kind::zscan, key, {});
    }

    template <typename RV = std::pair<std::string, double>>
    scan_stream<Derived, RV> zscan_match(std::string_view key, std::string_view pattern) {
        return keyed<RV>(scan_kind::zscan, key, pattern);
    }

    // Full request control (COUNT, TYPE) for any kind.
    template <typename RV>
    scan_stream<Derived, RV> scan_with(scan_request req) {
        req.cursor = 0;
        return scan_stream<Derived, RV>(self().take(), std::move(req));
    }

    //   cb(Derived con, result<std::vector<std::pair<std::string, std::string>>> r)
    template <typename F>
    void scan_and_get(std::string_view pattern, F&& cb, uint32_t count = 0) {
        redisac::scan_and_get(self().take(), std::string(pattern), count, std::forward<F>(cb));
    }

private:
    Derived& self() { return static_cast<Derived&>(*this); }

    static scan_request make_request(scan_kind kind, std::string_view key, std::string_view pattern) {
        scan_request req;
        req.kind = kind;
        req.key.assign(key);
        req.pattern.assign(pattern);
        return req;
    }

    template <typename RV>
    scan_stream<Derived, RV> keyed(scan_kind kind, std::string_view key, std::string_view pattern) {
        return scan_with<RV>(make_request(kind, key, pattern));
    }
};

} // namespace redisac
