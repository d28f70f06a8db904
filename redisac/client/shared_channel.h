#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "redis_connection.h"

// Serializes commands from many logical callers over one redis_connection.
// One command in flight; the rest wait in submission order. Create with
// std::make_shared.
class shared_channel : public std::enable_shared_from_this<shared_channel>
{
public:
    using ticket = uint64_t;
    using reply_callback = redis_connection::reply_callback;

    explicit shared_channel(std::unique_ptr<redis_connection> conn);

    shared_channel(const shared_channel&) = delete;
    shared_channel& operator=(const shared_channel&) = delete;

    // The callback may run before submit() returns when the connection
    // is already broken.
    ticket submit(std::string packed, reply_callback cb);

    // Queued: removed without running its callback. In flight: the reply
    // is read and dropped. Returns false for unknown or finished tickets.
    bool cancel(ticket t);

    // Reconnects the physical connection. Requests submitted meanwhile
    // wait for the outcome.
    void reset(redis_connection::open_callback cb);

    bool is_broken() const { return !m_reopening && m_conn->is_broken(); }
    size_t queued() const { return m_queue.size(); }
    bool in_flight() const { return m_inflight != 0; }
    connection_state state() const { return m_conn->state(); }
    const connection_options& options() const { return m_conn->options(); }

private:
    struct pending
    {
        ticket id;
        std::string packed;
        reply_callback cb;
    };

    void dispatch();
    void on_reply(ticket id, const command_error& err, resp::value&& v);

    std::unique_ptr<redis_connection> m_conn;
    std::deque<pending> m_queue;
    ticket m_next_ticket{1};

    ticket m_inflight{0};
    reply_callback m_inflight_cb;
    bool m_inflight_cancelled{false};

    bool m_dispatching{false};
    bool m_redispatch{false};
    bool m_reopening{false};
};
