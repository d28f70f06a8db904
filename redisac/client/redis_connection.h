#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "connection_options.h"
#include "errors.h"
#include "transport.h"
#include "../resp/resp_codec.h"

class event_loop;

enum class connection_state : uint8_t
{
    disconnected = 0,
    connecting   = 1,
    ready        = 2,
    busy         = 3,   // one command in flight
    broken       = 4,   // transport or protocol failure; reset() to reuse
    closed       = 5
};

constexpr const char* to_string(connection_state s)
{
    switch (s)
    {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connecting:   return "connecting";
        case connection_state::ready:        return "ready";
        case connection_state::busy:         return "busy";
        case connection_state::broken:       return "broken";
        case connection_state::closed:       return "closed";
    }
    return "?";
}

// One physical session: handshake, then strictly one command at a time.
// Callbacks run on the loop thread. A completion callback may destroy
// the connection.
class redis_connection
{
public:
    using transport_factory = std::function<std::shared_ptr<transport>(const connection_options&)>;
    using open_callback = std::function<void(const connect_error&)>;
    // Server error replies arrive as server_error with the error value attached.
    using reply_callback = std::function<void(const command_error&, resp::value&&)>;

    redis_connection(event_loop& loop, connection_options opts);
    redis_connection(connection_options opts, transport_factory factory);
    ~redis_connection();

    redis_connection(const redis_connection&) = delete;
    redis_connection& operator=(const redis_connection&) = delete;

    void open(open_callback cb);
    // Drops the current transport and runs open() again with the same options.
    void reset(open_callback cb);

    // `packed` is a complete RESP command frame.
    void execute(std::string packed, reply_callback cb);

    // The in-flight reply is still read off the wire, then dropped.
    void discard_current();

    // Takes ownership of an abandoned connection: closes it once the
    // in-flight reply has drained, or right away when idle.
    static void close_when_idle(std::unique_ptr<redis_connection> conn);

    void close();

    connection_state state() const { return m_state; }
    bool is_ready() const { return m_state == connection_state::ready; }
    bool is_busy() const { return m_state == connection_state::busy; }
    bool is_broken() const
    {
        return m_state == connection_state::broken || m_state == connection_state::closed
            || m_state == connection_state::disconnected;
    }

    const connection_options& options() const { return m_opts; }
    uint64_t commands_sent() const { return m_commands_sent; }

private:
    enum class step_kind : uint8_t { auth, select, set_name, ping };
    struct handshake_step
    {
        step_kind kind;
        std::string packed;
    };

    void dispatch(std::string packed, reply_callback cb);
    void try_complete();
    void on_data(int err, std::string_view data);
    void finish(const command_error& err, resp::value&& v);

    void run_handshake();
    void next_handshake_step();
    void handshake_reply(const command_error& err, resp::value&& v);
    void finish_open(const connect_error& err);

    transport_factory m_factory;
    connection_options m_opts;
    std::shared_ptr<transport> m_transport;
    connection_state m_state{connection_state::disconnected};

    std::string m_rbuf;
    resp::frame_scanner m_scan;
    reply_callback m_reply_cb;
    bool m_discard{false};
    std::unique_ptr<redis_connection> m_self_owned;

    open_callback m_open_cb;
    std::vector<handshake_step> m_steps;
    size_t m_step{0};

    uint64_t m_commands_sent{0};
};
