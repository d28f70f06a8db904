#include "shared_channel.h"
#include "../shared/logging.h"

#include <cerrno>

shared_channel::shared_channel(std::unique_ptr<redis_connection> conn)
    : m_conn(std::move(conn))
{
}

shared_channel::ticket shared_channel::submit(std::string packed, reply_callback cb)
{
    ticket id = m_next_ticket++;
    m_queue.push_back({ id, std::move(packed), std::move(cb) });
    dispatch();
    return id;
}

bool shared_channel::cancel(ticket t)
{
    if (t == 0)
        return false;

    if (t == m_inflight)
    {
        if (m_inflight_cancelled)
            return false;
        m_inflight_cancelled = true;
        m_inflight_cb = nullptr;
        LOG_DEBUG(("shared channel: in-flight request " + std::to_string(t) + " cancelled").c_str());
        return true;
    }

    for (auto it = m_queue.begin(); it != m_queue.end(); ++it)
    {
        if (it->id == t)
        {
            m_queue.erase(it);
            LOG_DEBUG(("shared channel: queued request " + std::to_string(t) + " cancelled").c_str());
            return true;
        }
    }
    return false;
}

void shared_channel::reset(redis_connection::open_callback cb)
{
    if (m_inflight != 0 || m_reopening)
    {
        cb(connect_error::make(connect_errc::io_error, "cannot reset while a request is in flight", EBUSY));
        return;
    }

    m_reopening = true;
    auto self = shared_from_this();
    m_conn->reset([self, cb = std::move(cb)](const connect_error& err) {
        self->m_reopening = false;
        cb(err);
        self->dispatch();
    });
}

// Iterative: a reply that completes synchronously re-enters through
// on_reply() and only flags another pass.
void shared_channel::dispatch()
{
    if (m_dispatching)
    {
        m_redispatch = true;
        return;
    }

    auto self = shared_from_this();
    m_dispatching = true;
    do
    {
        m_redispatch = false;
        while (m_inflight == 0 && !m_reopening && !m_queue.empty())
        {
            pending req = std::move(m_queue.front());
            m_queue.pop_front();

            if (m_conn->is_broken())
            {
                req.cb(command_error::network(ENOTCONN, std::string("shared connection is ")
                                              + to_string(m_conn->state())),
                       resp::value{});
                continue;
            }

            m_inflight = req.id;
            m_inflight_cb = std::move(req.cb);
            m_inflight_cancelled = false;

            ticket id = req.id;
            m_conn->execute(std::move(req.packed), [this, id](const command_error& err, resp::value&& v) {
                on_reply(id, err, std::move(v));
            });
        }
    } while (m_redispatch);
    m_dispatching = false;
}

void shared_channel::on_reply(ticket id, const command_error& err, resp::value&& v)
{
    // The callback may drop the last handle to this channel.
    auto self = shared_from_this();

    if (id != m_inflight)
        return;

    auto cb = std::move(m_inflight_cb);
    m_inflight_cb = nullptr;
    bool cancelled = m_inflight_cancelled;
    m_inflight = 0;
    m_inflight_cancelled = false;

    if (!cancelled && cb)
        cb(err, std::move(v));

    dispatch();
}
