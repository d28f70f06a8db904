// redisac/scan_stream.h - SCAN / HSCAN / SSCAN / ZSCAN as a lazy stream
#pragma once
#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "execute.h"

namespace redisac {

enum class scan_kind : uint8_t { scan, hscan, sscan, zscan };

constexpr const char* to_string(scan_kind k)
{
    switch (k) {
        case scan_kind::scan:  return "SCAN";
        case scan_kind::hscan: return "HSCAN";
        case scan_kind::sscan: return "SSCAN";
        case scan_kind::zscan: return "ZSCAN";
    }
    return "?";
}

// Parameters of one scan plus the cursor it has reached.
struct scan_request {
    scan_kind kind = scan_kind::scan;
    std::string key;        // HSCAN/SSCAN/ZSCAN
    std::string pattern;    // empty = no MATCH
    std::string type;       // SCAN only; empty = any type
    uint32_t count = 0;     // COUNT hint; 0 = server default
    uint64_t cursor = 0;

    command to_command() const {
        command c(to_string(kind));
        if (kind != scan_kind::scan)
            c.arg(key);
        c.arg(cursor);
        if (!pattern.empty())
            c.arg("MATCH").arg(pattern);
        if (count != 0)
            c.arg("COUNT").arg(count);
        if (kind == scan_kind::scan && !type.empty())
            c.arg("TYPE").arg(type);
        return c;
    }
};

enum class scan_state : uint8_t { init, awaiting_batch, draining, done, failed };

constexpr const char* to_string(scan_state s)
{
    switch (s) {
        case scan_state::init:           return "init";
        case scan_state::awaiting_batch: return "awaiting_batch";
        case scan_state::draining:       return "draining";
        case scan_state::done:           return "done";
        case scan_state::failed:         return "failed";
    }
    return "?";
}

// One pull from a stream: an item, the end, or the error that ended it.
template <typename RV>
struct scan_step {
    enum kind_t : uint8_t { item, end, error } kind = end;
    RV value{};
    command_error err;

    bool has_item() const { return kind == item; }
};

// ─── Cursor-driven stream ───────────────────────────────────────────────────
// Usage:
//   con.scan_match("user:*").all([](redisac::connection c, auto r) { ... });
//
//   auto s = con.scan_match("user:*");
//   s.next([](redisac::scan_step<std::string> st) { ... });
//
// Requests are issued only while a consumer is waiting; each reply is
// drained before the next cursor is sent. An empty batch with a non-zero
// cursor simply issues the next request; only cursor 0 ends the stream.
// Item pairs (HSCAN field/value, ZSCAN member/score) are decoded two flat
// elements at a time when RV is a std::pair.
//
// A pending consumer keeps the stream alive; cancel() abandons it. Dropping
// an idle stream releases its connection with nothing in flight.
template <typename C, typename RV>
class scan_stream {
public:
    using item_fn = std::function<void(RV&&)>;
    using done_fn = std::function<void(C, const command_error&)>;
    using step_fn = std::function<void(scan_step<RV>&&)>;
    using filter_fn = std::function<bool(const RV&)>;

    scan_stream(C con, scan_request req)
        : m_impl(std::make_shared<impl>(std::move(con), std::move(req))) {}

    scan_stream(scan_stream&&) noexcept = default;
    scan_stream& operator=(scan_stream&&) noexcept = default;
    scan_stream(const scan_stream&) = delete;
    scan_stream& operator=(const scan_stream&) = delete;

    // ── Configuration (before the first pull) ───────────────────────────
    scan_stream& filter(filter_fn pred) & { m_impl->m_filter = std::move(pred); return *this; }
    scan_stream&& filter(filter_fn pred) && { m_impl->m_filter = std::move(pred); return std::move(*this); }
    // Nil elements are skipped unless this is called (RV must accept nil then).
    scan_stream& keep_nil() & { m_impl->m_skip_nil = false; return *this; }
    scan_stream&& keep_nil() && { m_impl->m_skip_nil = false; return std::move(*this); }

    // ── Consumption ─────────────────────────────────────────────────────
    void next(step_fn cb) {
        m_impl->m_waiter = std::move(cb);
        m_impl->pump();
    }

    // on_item for every item, then on_done with the connection and the
    // error (none on success).
    void for_each(item_fn on_item, done_fn on_done) {
        m_impl->m_on_item = std::move(on_item);
        m_impl->m_on_done = std::move(on_done);
        m_impl->pump();
    }

    // Collects everything:  cb(C con, result<std::vector<RV>> r)
    template <typename F>
    void all(F&& cb) {
        auto items = std::make_shared<std::vector<RV>>();
        for_each(
            [items](RV&& v) { items->push_back(std::move(v)); },
            [items, cb = std::forward<F>(cb)](C con, const command_error& err) mutable {
                result<std::vector<RV>> r;
                r.error = err;
                if (!err)
                    r.value = std::move(*items);
                cb(std::move(con), std::move(r));
            });
    }

    // Abandons the scan. A pending consumer gets an ECANCELED network error.
    void cancel() { m_impl->cancel(); }

    // The connection, once done or failed (an empty handle otherwise).
    C release() { return m_impl->release(); }

    scan_state state() const { return m_impl->m_state; }
    uint64_t cursor() const { return m_impl->m_req.cursor; }
    uint64_t round_trips() const { return m_impl->m_round_trips; }
    const scan_request& request() const { return m_impl->m_req; }

private:
    struct impl : std::enable_shared_from_this<impl> {
        impl(C con, scan_request req) : m_con(std::move(con)), m_req(std::move(req)) {}

        ~impl() {
            if (m_state == scan_state::awaiting_batch)
                m_con.abandon(m_ticket);
        }

        bool has_demand() const { return static_cast<bool>(m_waiter) || static_cast<bool>(m_on_done); }

        // Trampoline: replies and consumer callbacks that arrive while we
        // are already pumping only flag another pass, so stack depth stays
        // flat no matter how many batches complete synchronously.
        void pump() {
            if (m_pumping) {
                m_repump = true;
                return;
            }
            // A waiting consumer holds the stream; the guard outlives its release.
            auto guard = this->shared_from_this();
            if (has_demand())
                m_self = guard;

            m_pumping = true;
            do {
                m_repump = false;
                while (has_demand() && step()) {}
            } while (m_repump);
            m_pumping = false;

            if (!has_demand())
                m_self.reset();
        }

        // Advances by one transition; false when waiting on the network.
        bool step() {
            switch (m_state) {
                case scan_state::init:
                    issue();
                    return true;
                case scan_state::awaiting_batch:
                    return false;
                case scan_state::draining:
                    if (!m_queue.empty()) {
                        RV v = std::move(m_queue.front());
                        m_queue.pop_front();
                        deliver_item(std::move(v));
                        return true;
                    }
                    if (m_req.cursor == 0)
                        m_state = scan_state::done;
                    else
                        issue();
                    return true;
                case scan_state::done:
                case scan_state::failed:
                    deliver_end();
                    return true;
            }
            return false;
        }

        void issue() {
            m_state = scan_state::awaiting_batch;
            m_round_trips++;
            std::weak_ptr<impl> weak = this->shared_from_this();
            m_ticket = m_con.submit(m_req.to_command().pack(),
                [weak](const command_error& err, resp::value&& v) {
                    if (auto self = weak.lock()) {
                        self->on_batch(err, std::move(v));
                        self->pump();
                    }
                });
        }

        void on_batch(const command_error& err, resp::value&& v) {
            if (m_state != scan_state::awaiting_batch)
                return;
            m_ticket = 0;

            if (err) {
                fail(err);
                return;
            }

            // [cursor, [items...]]
            if (!v.is_array() || v.elements.size() != 2 || !v.elements[1].is_array()) {
                fail(command_error::decode("scan reply [cursor, items]", resp::type_name(v.kind)));
                return;
            }

            uint64_t next_cursor = 0;
            command_error cerr;
            if (!from_reply(std::move(v.elements[0]), next_cursor, cerr)) {
                fail(command_error::decode("scan cursor", cerr.message));
                return;
            }

            auto& items = v.elements[1].elements;
            if constexpr (detail::is_pair<RV>::value) {
                if (items.size() % 2 != 0) {
                    fail(command_error::decode("field/value pairs", "array of odd length"));
                    return;
                }
                for (size_t i = 0; i < items.size(); i += 2) {
                    RV pair{};
                    command_error derr;
                    if (!from_reply(std::move(items[i]), pair.first, derr)
                        || !from_reply(std::move(items[i + 1]), pair.second, derr)) {
                        fail(derr);
                        return;
                    }
                    accept(std::move(pair));
                }
            } else {
                for (auto& e : items) {
                    if (m_skip_nil && e.is_nil())
                        continue;
                    RV item{};
                    command_error derr;
                    if (!from_reply(std::move(e), item, derr)) {
                        fail(derr);
                        return;
                    }
                    accept(std::move(item));
                }
            }

            m_req.cursor = next_cursor;
            m_state = scan_state::draining;
        }

        void accept(RV&& item) {
            if (m_filter && !m_filter(item))
                return;
            m_queue.push_back(std::move(item));
        }

        void fail(const command_error& err) {
            LOG_DEBUG(("scan stream ended: " + err.describe()).c_str());
            m_error = err;
            m_queue.clear();
            m_state = scan_state::failed;
        }

        void deliver_item(RV&& v) {
            if (m_on_item) {
                m_on_item(std::move(v));
                return;
            }
            auto cb = std::move(m_waiter);
            m_waiter = nullptr;
            scan_step<RV> st;
            st.kind = scan_step<RV>::item;
            st.value = std::move(v);
            cb(std::move(st));
        }

        void deliver_end() {
            if (m_on_done) {
                auto done = std::move(m_on_done);
                m_on_done = nullptr;
                m_on_item = nullptr;
                done(std::move(m_con), m_error);
                return;
            }
            auto cb = std::move(m_waiter);
            m_waiter = nullptr;
            scan_step<RV> st;
            st.kind = m_state == scan_state::failed ? scan_step<RV>::error : scan_step<RV>::end;
            st.err = m_error;
            cb(std::move(st));
        }

        void cancel() {
            auto guard = this->shared_from_this();
            if (m_state == scan_state::done || m_state == scan_state::failed)
                return;
            if (m_state == scan_state::awaiting_batch)
                m_con.abandon(m_ticket);
            m_ticket = 0;
            fail(command_error::network(ECANCELED, "scan cancelled"));
            pump();
        }

        C release() {
            if (m_state == scan_state::awaiting_batch || m_state == scan_state::draining)
                return C{};
            return std::move(m_con);
        }

        C m_con;
        scan_request m_req;
        scan_state m_state{scan_state::init};
        std::deque<RV> m_queue;
        command_error m_error;
        uint64_t m_round_trips{0};
        uint64_t m_ticket{0};

        filter_fn m_filter;
        bool m_skip_nil{true};

        step_fn m_waiter;
        item_fn m_on_item;
        done_fn m_on_done;

        bool m_pumping{false};
        bool m_repump{false};
        std::shared_ptr<impl> m_self;
    };

    std::shared_ptr<impl> m_impl;
};

// ─── Scan then fetch ────────────────────────────────────────────────────────
// Keys matching `pattern`, then their values through MGET in chunks.
// Keys whose value is gone by the time of the MGET are dropped.
//   cb(C con, result<std::vector<std::pair<std::string, std::string>>> r)
constexpr size_t SCAN_GET_CHUNK = 512;

template <typename C, typename F>
void scan_and_get(C con, std::string pattern, uint32_t count, F&& cb)
{
    using pairs = std::vector<std::pair<std::string, std::string>>;

    struct state {
        std::vector<std::string> keys;
        size_t next = 0;
        pairs out;
        std::function<void(C, result<pairs>)> done;
        std::function<void(C)> fetch;
    };

    auto st = std::make_shared<state>();
    st->done = std::forward<F>(cb);
    // `fetch` refers to st weakly; the in-flight request owns the strong reference.
    std::weak_ptr<state> weak = st;
    st->fetch = [weak](C c) {
        auto s = weak.lock();
        if (!s)
            return;
        if (s->next >= s->keys.size()) {
            result<pairs> r;
            r.value = std::move(s->out);
            auto done = std::move(s->done);
            done(std::move(c), std::move(r));
            return;
        }
        size_t end = std::min(s->keys.size(), s->next + SCAN_GET_CHUNK);
        command mget("MGET");
        for (size_t i = s->next; i < end; i++)
            mget.arg(s->keys[i]);
        size_t first = s->next;
        s->next = end;
        execute<std::vector<std::optional<std::string>>>(std::move(c), mget,
            [s, first, end](C c2, result<std::vector<std::optional<std::string>>> r) {
                if (r && r.value.size() != end - first)
                    r.error = command_error::decode("MGET reply per key",
                                                    std::to_string(r.value.size()) + " values for "
                                                    + std::to_string(end - first) + " keys");
                if (!r) {
                    result<pairs> fail;
                    fail.error = r.error;
                    auto done = std::move(s->done);
                    done(std::move(c2), std::move(fail));
                    return;
                }
                for (size_t i = 0; i < r.value.size(); i++) {
                    if (r.value[i])
                        s->out.emplace_back(std::move(s->keys[first + i]), std::move(*r.value[i]));
                }
                s->fetch(std::move(c2));
            });
    };

    scan_request req;
    req.kind = scan_kind::scan;
    req.pattern = std::move(pattern);
    req.count = count;

    scan_stream<C, std::string> keys(std::move(con), std::move(req));
    keys.all([st](C c, result<std::vector<std::string>> r) {
        if (!r) {
            result<pairs> fail;
            fail.error = r.error;
            auto done = std::move(st->done);
            done(std::move(c), std::move(fail));
            return;
        }
        // SCAN may report a key twice; MGET it once.
        std::sort(r.value.begin(), r.value.end());
        r.value.erase(std::unique(r.value.begin(), r.value.end()), r.value.end());
        st->keys = std::move(r.value);
        st->out.reserve(st->keys.size());
        st->fetch(std::move(c));
    });
}

} // namespace redisac
