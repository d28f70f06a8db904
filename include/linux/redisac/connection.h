// redisac/connection.h - exclusive and shared connection handles
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include "commands.h"

namespace redisac {

using ticket = uint64_t;
using reply_callback = redis_connection::reply_callback;

// ─── Exclusive handle ───────────────────────────────────────────────────────
// Move-only. Each command consumes it and the callback gives it back.
class connection : public commands<connection> {
public:
    connection() = default;
    explicit connection(std::unique_ptr<redis_connection> impl) : m_impl(std::move(impl)) {}

    connection(connection&&) noexcept = default;
    connection& operator=(connection&&) noexcept = default;
    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    // Raw request: `packed` is a complete RESP frame. The callback may run
    // before submit() returns (empty or broken handle).
    ticket submit(std::string packed, reply_callback cb) {
        if (!m_impl) {
            cb(command_error::network(ENOTCONN, "empty connection handle"), resp::value{});
            return 0;
        }
        m_impl->execute(std::move(packed), std::move(cb));
        return 1;
    }

    // Drops the in-flight reply; the connection stays in sync.
    bool cancel(ticket t) {
        if (!m_impl || t == 0 || !m_impl->is_busy())
            return false;
        m_impl->discard_current();
        return true;
    }

    // Gives up the handle; any in-flight reply drains before it closes.
    void abandon(ticket) { redis_connection::close_when_idle(std::move(m_impl)); }

    connection take() { return std::move(*this); }

    bool valid() const { return m_impl != nullptr; }
    explicit operator bool() const { return valid() && !is_broken(); }
    bool is_broken() const { return !m_impl || m_impl->is_broken(); }
    connection_state state() const { return m_impl ? m_impl->state() : connection_state::closed; }

    redis_connection* raw() { return m_impl.get(); }
    std::unique_ptr<redis_connection> release() { return std::move(m_impl); }

private:
    std::unique_ptr<redis_connection> m_impl;
};

// ─── Shared handle ──────────────────────────────────────────────────────────
// Copyable. All copies feed one FIFO queue over one physical connection.
class shared_connection : public commands<shared_connection> {
public:
    shared_connection() = default;
    explicit shared_connection(std::shared_ptr<shared_channel> ch) : m_channel(std::move(ch)) {}

    ticket submit(std::string packed, reply_callback cb) {
        if (!m_channel) {
            cb(command_error::network(ENOTCONN, "empty connection handle"), resp::value{});
            return 0;
        }
        return m_channel->submit(std::move(packed), std::move(cb));
    }

    bool cancel(ticket t) { return m_channel && m_channel->cancel(t); }
    void abandon(ticket t) { cancel(t); }

    shared_connection take() const { return *this; }

    bool valid() const { return m_channel != nullptr; }
    explicit operator bool() const { return valid() && !is_broken(); }
    bool is_broken() const { return !m_channel || m_channel->is_broken(); }
    connection_state state() const { return m_channel ? m_channel->state() : connection_state::closed; }

    size_t queued() const { return m_channel ? m_channel->queued() : 0; }
    bool in_flight() const { return m_channel && m_channel->in_flight(); }
    shared_channel* channel() { return m_channel.get(); }

private:
    std::shared_ptr<shared_channel> m_channel;
};

// ─── Establishing ───────────────────────────────────────────────────────────

using connect_callback = std::function<void(connection, const connect_error&)>;

// Opens `impl` (connect plus handshake) and hands it over as an exclusive handle.
inline void connect(std::unique_ptr<redis_connection> impl, connect_callback cb)
{
    auto holder = std::make_shared<std::unique_ptr<redis_connection>>(std::move(impl));
    redis_connection* raw = holder->get();
    raw->open([holder, cb = std::move(cb)](const connect_error& err) {
        if (err) {
            cb(connection{}, err);
            return;
        }
        cb(connection(std::move(*holder)), err);
    });
}

inline void connect(event_loop& loop, connection_options opts, connect_callback cb)
{
    connect(std::make_unique<redis_connection>(loop, std::move(opts)), std::move(cb));
}

inline void connect(event_loop& loop, std::string_view url, connect_callback cb)
{
    connection_options opts;
    std::string err;
    if (!parse_address(url, opts.address, err)) {
        cb(connection{}, connect_error::make(connect_errc::invalid_address, err));
        return;
    }
    connect(loop, std::move(opts), std::move(cb));
}

// The exclusive handle is emptied; only the shared handle reaches the connection.
inline shared_connection share(connection&& con)
{
    if (!con.valid())
        return shared_connection{};
    return shared_connection(std::make_shared<shared_channel>(con.release()));
}

// Reconnects with the same options; the usual way back from is_broken().
inline void reset(connection&& con, connect_callback cb)
{
    auto impl = con.release();
    if (!impl) {
        cb(connection{}, connect_error::make(connect_errc::invalid_address, "empty connection handle"));
        return;
    }
    auto holder = std::make_shared<std::unique_ptr<redis_connection>>(std::move(impl));
    redis_connection* raw = holder->get();
    raw->reset([holder, cb = std::move(cb)](const connect_error& err) {
        cb(connection(std::move(*holder)), err);
    });
}

inline void reset(shared_connection con, std::function<void(shared_connection, const connect_error&)> cb)
{
    shared_channel* ch = con.channel();
    if (!ch) {
        cb(std::move(con), connect_error::make(connect_errc::invalid_address, "empty connection handle"));
        return;
    }
    ch->reset([con, cb = std::move(cb)](const connect_error& err) mutable {
        cb(std::move(con), err);
    });
}

} // namespace redisac
