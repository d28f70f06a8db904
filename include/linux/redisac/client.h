// redisac/client.h - owns the event loop and opens connections
#pragma once
#include <csignal>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include "connection.h"

namespace redisac {

namespace detail {

inline event_loop* g_signal_loop = nullptr;

inline void on_stop_signal(int)
{
    if (g_signal_loop)
        g_signal_loop->request_stop();
}

inline void install_signal_handlers(event_loop* loop)
{
    g_signal_loop = loop;
    signal(SIGPIPE, SIG_IGN);

    struct sigaction sa{};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace detail

// ─── High-level client ──────────────────────────────────────────────────────
// Usage:
//   redisac::client cli("redis://127.0.0.1:6379/0");
//   cli.connect([&](redisac::connection con, const redisac::connect_error& err) {
//       if (err) { cli.stop(); return; }
//       con.get("greeting", [&](redisac::connection, redisac::result<std::optional<std::string>> r) {
//           cli.stop();
//       });
//   });
//   cli.run();
class client {
public:
    explicit client(std::string_view url = "redis://127.0.0.1:6379") { m_cfg.url.assign(url); }
    explicit client(client_config cfg) : m_cfg(std::move(cfg)) {}

    // ── Chainable config ────────────────────────────────────────────────
    client& url(std::string_view u)             { m_cfg.url.assign(u); return *this; }
    client& tls()                               { m_cfg.force_tls = true; return *this; }
    client& tls_ca(std::string_view ca)         { m_cfg.force_tls = true; m_cfg.tls.ca_file.assign(ca); return *this; }
    client& tls_verify(bool v)                  { m_cfg.tls.verify = v; return *this; }
    client& connect_timeout(uint32_t ms)        { m_cfg.connect_timeout_ms = ms; return *this; }
    client& response_timeout(uint32_t ms)       { m_cfg.response_timeout_ms = ms; return *this; }
    client& name(std::string_view n)            { m_cfg.client_name.assign(n); return *this; }
    client& log(log_level lvl)                  { m_cfg.level = lvl; return *this; }

    // Lua config file; later chained calls still override it.
    bool config_file(std::string_view path, std::string& err) { return m_cfg.load_file(path, err); }

    // ── Connecting ──────────────────────────────────────────────────────
    void connect(connect_callback cb) {
        connection_options opts;
        std::string err;
        if (!prepare(opts, err)) {
            cb(connection{}, connect_error::make(connect_errc::invalid_address, err));
            return;
        }
        redisac::connect(loop(), std::move(opts), std::move(cb));
    }

    void connect_shared(std::function<void(shared_connection, const connect_error&)> cb) {
        connect([cb = std::move(cb)](connection con, const connect_error& err) {
            if (err) {
                cb(shared_connection{}, err);
                return;
            }
            cb(share(std::move(con)), err);
        });
    }

    // ── Lifecycle ───────────────────────────────────────────────────────
    // Runs until stop(), SIGINT or SIGTERM.
    bool run() {
        if (!loop().is_initialized())
            return false;
        detail::install_signal_handlers(m_loop.get());
        m_loop->run();
        detail::g_signal_loop = nullptr;
        return true;
    }
    void stop() { if (m_loop) m_loop->request_stop(); }

    // ── Escape hatches ──────────────────────────────────────────────────
    event_loop& loop() {
        if (!m_loop) {
            logger::g_level = m_cfg.level;
            m_loop = std::make_unique<event_loop>(m_cfg.queue_depth);
            if (!m_loop->init())
                LOG_ERROR("failed to initialize io_uring");
        }
        return *m_loop;
    }
    client_config&       config()       { return m_cfg; }
    const client_config& config() const { return m_cfg; }

private:
    bool prepare(connection_options& opts, std::string& err) {
        if (!loop().is_initialized()) {
            err = "event loop unavailable";
            return false;
        }
        return m_cfg.to_connection_options(opts, err);
    }

    client_config               m_cfg;
    std::unique_ptr<event_loop> m_loop;
};

} // namespace redisac
