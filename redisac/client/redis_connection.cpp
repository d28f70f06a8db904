#include "redis_connection.h"
#include "uring_transport.h"
#include "../resp/resp_codec.h"
#include "../shared/logging.h"

#include <cerrno>

redis_connection::redis_connection(event_loop& loop, connection_options opts)
    : m_factory([&loop](const connection_options& o) -> std::shared_ptr<transport> {
          return std::make_shared<uring_transport>(loop, o);
      }),
      m_opts(std::move(opts))
{
}

redis_connection::redis_connection(connection_options opts, transport_factory factory)
    : m_factory(std::move(factory)), m_opts(std::move(opts))
{
}

redis_connection::~redis_connection()
{
    if (m_transport)
        m_transport->close();
}

void redis_connection::open(open_callback cb)
{
    if (m_state != connection_state::disconnected && m_state != connection_state::closed
        && m_state != connection_state::broken)
    {
        cb(connect_error::make(connect_errc::io_error, "connection already open", EISCONN));
        return;
    }

    if (m_transport)
        m_transport->close();

    m_rbuf.clear();
    m_scan.reset();
    m_reply_cb = nullptr;
    m_discard = false;
    m_open_cb = std::move(cb);
    m_state = connection_state::connecting;

    LOG_DEBUG(("connecting to " + m_opts.address.to_string()).c_str());

    m_transport = m_factory(m_opts);
    m_transport->connect([this](const connect_error& err) {
        if (err)
        {
            finish_open(err);
            return;
        }
        run_handshake();
    });
}

void redis_connection::reset(open_callback cb)
{
    if (m_reply_cb || m_state == connection_state::connecting)
    {
        cb(connect_error::make(connect_errc::io_error, "cannot reset while a request is in flight", EBUSY));
        return;
    }

    if (m_transport)
        m_transport->close();
    m_state = connection_state::closed;

    open(std::move(cb));
}

void redis_connection::run_handshake()
{
    m_steps.clear();
    m_step = 0;

    const redis_address& a = m_opts.address;
    if (a.has_auth())
    {
        if (a.username.empty())
            m_steps.push_back({ step_kind::auth, resp::encode_command({ "AUTH", a.password }) });
        else
            m_steps.push_back({ step_kind::auth, resp::encode_command({ "AUTH", a.username, a.password }) });
    }
    if (a.db != 0)
    {
        std::string db = std::to_string(a.db);
        m_steps.push_back({ step_kind::select, resp::encode_command({ "SELECT", db }) });
    }
    if (!m_opts.client_name.empty())
        m_steps.push_back({ step_kind::set_name, resp::encode_command({ "CLIENT", "SETNAME", m_opts.client_name }) });
    m_steps.push_back({ step_kind::ping, resp::encode_command({ "PING" }) });

    next_handshake_step();
}

void redis_connection::next_handshake_step()
{
    if (m_step >= m_steps.size())
    {
        m_steps.clear();
        m_state = connection_state::ready;
        LOG_DEBUG(("connected to " + m_opts.address.to_string()).c_str());
        finish_open(connect_error{});
        return;
    }

    dispatch(m_steps[m_step].packed, [this](const command_error& err, resp::value&& v) {
        handshake_reply(err, std::move(v));
    });
}

void redis_connection::handshake_reply(const command_error& err, resp::value&& v)
{
    const step_kind kind = m_steps[m_step].kind;

    if (err.code == command_errc::network)
    {
        finish_open(connect_error::make(err.timed_out ? connect_errc::timeout : connect_errc::io_error,
                                        "handshake: " + err.message, err.sys_errno));
        return;
    }
    if (err.code == command_errc::protocol)
    {
        finish_open(connect_error::make(connect_errc::protocol_mismatch, err.message));
        return;
    }

    if (err.code == command_errc::server_error)
    {
        switch (kind)
        {
            case step_kind::auth:
                finish_open(connect_error::make(connect_errc::auth_failed, err.message));
                return;
            case step_kind::set_name:
                LOG_WARN(("CLIENT SETNAME rejected: " + err.message).c_str());
                break;
            case step_kind::select:
                finish_open(connect_error::make(connect_errc::protocol_mismatch, "SELECT: " + err.message));
                return;
            case step_kind::ping:
                if (err.message.starts_with("NOAUTH") || err.message.starts_with("WRONGPASS"))
                    finish_open(connect_error::make(connect_errc::auth_failed, err.message));
                else
                    finish_open(connect_error::make(connect_errc::protocol_mismatch, "PING: " + err.message));
                return;
        }
    }
    else if (kind == step_kind::ping && !(v.is_string() && v.str == "PONG"))
    {
        finish_open(connect_error::make(connect_errc::protocol_mismatch,
                                        std::string("unexpected PING reply: ") + resp::type_name(v.kind)));
        return;
    }

    m_step++;
    next_handshake_step();
}

void redis_connection::finish_open(const connect_error& err)
{
    if (err)
    {
        LOG_WARN(("connect to " + m_opts.address.to_string() + " failed: " + err.describe()).c_str());
        if (m_transport)
            m_transport->close();
        m_state = connection_state::disconnected;
        m_steps.clear();
    }

    auto cb = std::move(m_open_cb);
    m_open_cb = nullptr;
    if (cb)
        cb(err);
}

void redis_connection::execute(std::string packed, reply_callback cb)
{
    switch (m_state)
    {
        case connection_state::ready:
            dispatch(std::move(packed), std::move(cb));
            return;
        case connection_state::busy:
        case connection_state::connecting:
            cb(command_error::busy("a command is already in flight"), resp::value{});
            return;
        default:
            cb(command_error::network(ENOTCONN, std::string("connection is ") + to_string(m_state)), resp::value{});
            return;
    }
}

void redis_connection::dispatch(std::string packed, reply_callback cb)
{
    if (m_state == connection_state::ready)
        m_state = connection_state::busy;
    m_reply_cb = std::move(cb);
    m_commands_sent++;

    LOG_DEBUG(("command #" + std::to_string(m_commands_sent) + " (" + std::to_string(packed.size())
               + " bytes) -> " + m_opts.address.to_string()).c_str());

    m_transport->send(std::move(packed), [this](int err) {
        if (err)
        {
            finish(command_error::network(err), resp::value{});
            return;
        }
        try_complete();
    });
}

void redis_connection::try_complete()
{
    auto r = m_scan.scan(m_rbuf);

    if (r == resp::parse_result::incomplete)
    {
        m_transport->receive([this](int err, std::string_view data) { on_data(err, data); });
        return;
    }

    resp::value v;
    size_t frame = m_scan.frame_size();
    m_scan.reset();
    if (r == resp::parse_result::ok)
        r = resp::build_reply(m_rbuf, frame, v);

    if (r == resp::parse_result::error)
    {
        m_rbuf.clear();
        finish(command_error::protocol("malformed reply from " + m_opts.address.to_string()), resp::value{});
        return;
    }

    m_rbuf.erase(0, frame);
    if (v.is_error())
    {
        command_error err = command_error::server(v.str);
        finish(err, std::move(v));
        return;
    }
    finish(command_error{}, std::move(v));
}

void redis_connection::on_data(int err, std::string_view data)
{
    if (err)
    {
        finish(command_error::network(err), resp::value{});
        return;
    }
    m_rbuf.append(data.data(), data.size());
    try_complete();
}

void redis_connection::finish(const command_error& err, resp::value&& v)
{
    if (err.breaks_connection())
    {
        LOG_WARN(("connection to " + m_opts.address.to_string() + " broken: " + err.describe()).c_str());
        if (m_transport)
            m_transport->close();
        m_state = connection_state::broken;
    }
    else if (m_state == connection_state::busy)
    {
        m_state = connection_state::ready;
    }

    auto cb = std::move(m_reply_cb);
    m_reply_cb = nullptr;

    if (m_discard)
    {
        m_discard = false;
        if (m_self_owned)
        {
            // Last use of this object: `self` destroys it on scope exit.
            auto self = std::move(m_self_owned);
            close();
        }
        return;
    }

    if (cb)
        cb(err, std::move(v));
}

void redis_connection::discard_current()
{
    if (m_reply_cb)
        m_discard = true;
}

void redis_connection::close_when_idle(std::unique_ptr<redis_connection> conn)
{
    if (!conn || !conn->m_reply_cb)
        return;

    conn->m_discard = true;
    redis_connection* raw = conn.get();
    raw->m_self_owned = std::move(conn);
}

void redis_connection::close()
{
    if (m_transport)
        m_transport->close();
    m_state = connection_state::closed;
}
