#include "uring_transport.h"
#include "../shared/event_loop.h"
#include "../shared/logging.h"
#include "../shared/tls_context.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/un.h>
#include <cerrno>
#include <cstddef>
#include <cstring>

namespace
{

void to_timespec(uint32_t ms, struct __kernel_timespec& ts)
{
    ts.tv_sec = ms / 1000;
    ts.tv_nsec = static_cast<long long>(ms % 1000) * 1000000LL;
}

} // namespace

uring_transport::uring_transport(event_loop& loop, connection_options opts)
    : m_loop(loop), m_opts(std::move(opts))
{
    to_timespec(m_opts.connect_timeout_ms, m_connect_ts);
    to_timespec(m_opts.response_timeout_ms, m_response_ts);
}

uring_transport::~uring_transport()
{
    tls_context::free_ssl(m_ssl);
}

void uring_transport::op_started()
{
    if (m_inflight_ops++ == 0)
        m_self = shared_from_this();
}

void uring_transport::op_finished()
{
    if (--m_inflight_ops > 0)
        return;

    // Deferred from close(): the fd stayed open until the kernel let go of it.
    if (m_phase == phase::closed)
        m_fd.reset();
    m_self.reset();
}

bool uring_transport::resolve(connect_error& err)
{
    m_addrs.clear();
    m_addr_lens.clear();
    m_addr_idx = 0;

    const redis_address& a = m_opts.address;

    if (a.kind == address_kind::unix_socket)
    {
        struct sockaddr_un un{};
        if (a.path.size() >= sizeof(un.sun_path))
        {
            err = connect_error::make(connect_errc::invalid_address, "unix socket path too long: " + a.path);
            return false;
        }
        un.sun_family = AF_UNIX;
        std::memcpy(un.sun_path, a.path.data(), a.path.size());

        sockaddr_storage ss{};
        std::memcpy(&ss, &un, sizeof(un));
        m_addrs.push_back(ss);
        m_addr_lens.push_back(static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + a.path.size() + 1));
        return true;
    }

    // Literal fast path: no resolver round-trip
    {
        sockaddr_storage ss{};
        auto* v4 = reinterpret_cast<struct sockaddr_in*>(&ss);
        if (inet_pton(AF_INET, a.host.c_str(), &v4->sin_addr) == 1)
        {
            v4->sin_family = AF_INET;
            v4->sin_port = htons(a.port);
            m_addrs.push_back(ss);
            m_addr_lens.push_back(sizeof(struct sockaddr_in));
            return true;
        }
        auto* v6 = reinterpret_cast<struct sockaddr_in6*>(&ss);
        if (inet_pton(AF_INET6, a.host.c_str(), &v6->sin6_addr) == 1)
        {
            v6->sin6_family = AF_INET6;
            v6->sin6_port = htons(a.port);
            m_addrs.push_back(ss);
            m_addr_lens.push_back(sizeof(struct sockaddr_in6));
            return true;
        }
    }

    // Blocking lookup for hostnames
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    std::string port = std::to_string(a.port);
    int rc = getaddrinfo(a.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0)
    {
        err = connect_error::make(connect_errc::resolve_failed, a.host + ": " + gai_strerror(rc));
        return false;
    }

    for (struct addrinfo* p = res; p; p = p->ai_next)
    {
        if (p->ai_addrlen > sizeof(sockaddr_storage))
            continue;
        sockaddr_storage ss{};
        std::memcpy(&ss, p->ai_addr, p->ai_addrlen);
        m_addrs.push_back(ss);
        m_addr_lens.push_back(p->ai_addrlen);
    }
    freeaddrinfo(res);

    if (m_addrs.empty())
    {
        err = connect_error::make(connect_errc::resolve_failed, a.host + ": no usable addresses");
        return false;
    }
    return true;
}

void uring_transport::connect(connect_callback cb)
{
    if (m_phase != phase::idle)
    {
        cb(connect_error::make(connect_errc::io_error, "transport already used", EALREADY));
        return;
    }

    m_connect_cb = std::move(cb);
    m_phase = phase::connecting;

    connect_error err;
    if (!resolve(err))
    {
        finish_connect(err);
        return;
    }

    m_last_connect_err = connect_error::make(connect_errc::io_error, "no address tried");
    try_next_address();
}

void uring_transport::try_next_address()
{
    while (m_addr_idx < m_addrs.size())
    {
        const sockaddr_storage& ss = m_addrs[m_addr_idx];
        m_fd = open_stream_socket(ss.ss_family);
        if (!m_fd)
        {
            int e = errno;
            m_last_connect_err = connect_error::make(connect_errc::io_error, "socket()", e);
            m_addr_idx++;
            continue;
        }

        m_connect_req = { this, nullptr, m_fd.get(), 0, op_connect };
        op_started();
        if (m_loop.submit_connect(m_fd.get(), reinterpret_cast<const struct sockaddr*>(&ss),
                                  m_addr_lens[m_addr_idx], &m_connect_req,
                                  m_opts.connect_timeout_ms ? &m_connect_ts : nullptr))
            return;

        // No retry: every address would hit the same full ring.
        auto guard = m_self;
        op_finished();
        m_fd.reset();
        LOG_WARN("io_uring submission queue full");
        finish_connect(connect_error::make(connect_errc::io_error, "connect: submission queue full", EAGAIN));
        return;
    }

    finish_connect(m_last_connect_err);
}

void uring_transport::handle_connect(int res)
{
    if (res < 0)
    {
        int e = -res;
        std::string where = m_opts.address.to_string();
        if (e == ECANCELED)
            m_last_connect_err = connect_error::make(connect_errc::timeout, where, ETIMEDOUT);
        else if (e == ECONNREFUSED || e == ENOENT)
            m_last_connect_err = connect_error::make(connect_errc::refused, where, e);
        else
            m_last_connect_err = connect_error::make(connect_errc::io_error, where, e);

        LOG_DEBUG(("connect attempt failed: " + m_last_connect_err.describe()).c_str());
        m_fd.reset();
        m_addr_idx++;
        try_next_address();
        return;
    }

    if (m_opts.address.is_tls())
    {
        connect_error err;
        if (!start_tls(err))
        {
            finish_connect(err);
            return;
        }
        m_phase = phase::handshaking;
        drive_handshake();
        return;
    }

    finish_connect(connect_error{});
}

void uring_transport::finish_connect(const connect_error& err)
{
    if (err)
    {
        m_phase = phase::closed;
        if (m_inflight_ops == 0)
            m_fd.reset();
    }
    else
    {
        m_phase = phase::open;
    }

    auto cb = std::move(m_connect_cb);
    m_connect_cb = nullptr;
    if (cb)
        cb(err);
}

bool uring_transport::start_tls(connect_error& err)
{
    const tls_options& t = m_opts.tls;

    m_tls = std::make_unique<tls_context>();
    if (!m_tls->init_client(t.ca_file, t.cert_file, t.key_file, t.verify))
    {
        err = connect_error::make(connect_errc::tls_failed, "context setup: " + tls_context::last_error());
        return false;
    }

    const std::string& name = t.server_name.empty() ? m_opts.address.host : t.server_name;
    m_ssl = m_tls->create_ssl_client(name);
    if (!m_ssl)
    {
        err = connect_error::make(connect_errc::tls_failed, "SSL_new: " + tls_context::last_error());
        return false;
    }
    return true;
}

void uring_transport::drive_handshake()
{
    int r = tls_context::do_handshake(m_ssl);
    if (r < 0)
    {
        finish_connect(connect_error::make(connect_errc::tls_failed, "handshake: " + tls_context::last_error()));
        return;
    }

    if (!flush_tls_out())
    {
        finish_connect(connect_error::make(connect_errc::tls_failed, "handshake: BIO read failed"));
        return;
    }
    if (m_phase != phase::handshaking)
        return;

    // Let the last flight reach the kernel before reporting success.
    if (m_write_pending)
        return;

    if (r == 1)
    {
        LOG_DEBUG(("tls established with " + m_opts.address.to_string()).c_str());
        finish_connect(connect_error{});
        return;
    }

    if (!m_read_pending)
        submit_read(m_opts.connect_timeout_ms ? &m_connect_ts : nullptr);
}

// Moves encrypted bytes from the SSL write BIO into the socket write buffer.
bool uring_transport::flush_tls_out()
{
    char tmp[16384];
    while (tls_context::has_pending_out(m_ssl))
    {
        int n = tls_context::bio_read_out(m_ssl, tmp, sizeof(tmp));
        if (n < 0)
            return false;
        if (n == 0)
            break;
        append_out(std::string_view(tmp, static_cast<size_t>(n)));
    }

    if (!m_write_pending && m_write_off < m_write_buf.size())
        submit_write();
    return true;
}

void uring_transport::send(std::string bytes, send_callback cb)
{
    if (m_phase != phase::open)
    {
        cb(ENOTCONN);
        return;
    }
    if (m_send_cb)
    {
        cb(EBUSY);
        return;
    }

    m_send_cb = std::move(cb);

    if (m_ssl)
    {
        size_t off = 0;
        while (off < bytes.size())
        {
            int n = tls_context::ssl_write(m_ssl, bytes.data() + off, static_cast<int>(bytes.size() - off));
            if (n <= 0)
            {
                fail_io(EPROTO);
                return;
            }
            off += static_cast<size_t>(n);
        }
        if (!flush_tls_out())
            fail_io(EPROTO);
        return;
    }

    append_out(bytes);
    if (!m_write_pending)
        submit_write();
}

// The kernel may be reading m_write_buf; while a write is pending new
// bytes go to m_write_queue so the buffer never reallocates under it.
void uring_transport::append_out(std::string_view bytes)
{
    if (m_write_pending)
        m_write_queue.append(bytes.data(), bytes.size());
    else
        m_write_buf.append(bytes.data(), bytes.size());
}

void uring_transport::submit_write()
{
    m_write_req = { this, m_write_buf.data() + m_write_off, m_fd.get(),
                    static_cast<uint32_t>(m_write_buf.size() - m_write_off), op_write };
    m_write_pending = true;
    op_started();
    if (!m_loop.submit_write(m_fd.get(), m_write_req.buffer, m_write_req.length, &m_write_req,
                             m_opts.response_timeout_ms ? &m_response_ts : nullptr))
    {
        m_write_pending = false;
        submit_failed();
    }
}

void uring_transport::receive(receive_callback cb)
{
    if (m_phase != phase::open)
    {
        cb(ENOTCONN, {});
        return;
    }
    if (m_recv_cb)
    {
        cb(EBUSY, {});
        return;
    }

    m_recv_cb = std::move(cb);
    if (!m_read_pending)
        submit_read(m_opts.response_timeout_ms ? &m_response_ts : nullptr);
}

void uring_transport::submit_read(struct __kernel_timespec* ts)
{
    m_read_req = { this, m_read_buf, m_fd.get(), sizeof(m_read_buf), op_read };
    m_read_pending = true;
    op_started();
    if (!m_loop.submit_read(m_fd.get(), m_read_buf, sizeof(m_read_buf), &m_read_req, ts))
    {
        m_read_pending = false;
        submit_failed();
    }
}

// The loop took no SQE, so no CQE will balance op_started().
void uring_transport::submit_failed()
{
    auto guard = m_self;
    op_finished();
    LOG_WARN("io_uring submission queue full");

    if (m_phase == phase::handshaking)
    {
        finish_connect(connect_error::make(connect_errc::io_error, "tls handshake: submission queue full", EAGAIN));
        return;
    }
    fail_io(EAGAIN);
}

void uring_transport::close()
{
    if (m_phase == phase::closed)
        return;

    m_phase = phase::closed;
    m_connect_cb = nullptr;
    m_send_cb = nullptr;
    m_recv_cb = nullptr;

    if (!m_fd)
        return;

    if (m_inflight_ops > 0)
    {
        // Pending CQEs still reference our buffers; the fd is released
        // in op_finished() once they have all arrived.
        m_loop.submit_cancel_fd(m_fd.get());
        ::shutdown(m_fd.get(), SHUT_RDWR);
        return;
    }
    m_fd.reset();
}

void uring_transport::fail_io(int err)
{
    auto send_cb = std::move(m_send_cb);
    auto recv_cb = std::move(m_recv_cb);
    m_send_cb = nullptr;
    m_recv_cb = nullptr;

    auto self = shared_from_this();
    close();

    if (send_cb)
        send_cb(err);
    if (recv_cb)
        recv_cb(err, {});
}

void uring_transport::on_cqe(struct io_uring_cqe* cqe)
{
    auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
    if (!req)
        return;

    // May drop the last external reference; keep this alive until we return.
    auto guard = m_self;
    int res = cqe->res;

    switch (req->type)
    {
        case op_connect:
            if (m_phase == phase::connecting)
                handle_connect(res);
            break;
        case op_read:
            m_read_pending = false;
            if (m_phase != phase::closed)
                handle_read(res);
            break;
        case op_write:
            m_write_pending = false;
            if (m_phase != phase::closed)
                handle_write(res);
            break;
        default:
            break;
    }

    op_finished();
}

void uring_transport::handle_read(int res)
{
    if (m_phase == phase::handshaking)
    {
        if (res <= 0)
        {
            if (res == -ECANCELED)
                finish_connect(connect_error::make(connect_errc::timeout, "tls handshake", ETIMEDOUT));
            else
                finish_connect(connect_error::make(connect_errc::tls_failed, "peer closed during handshake",
                                                   res < 0 ? -res : ECONNRESET));
            return;
        }
        if (tls_context::bio_write_in(m_ssl, m_read_buf, res) != res)
        {
            finish_connect(connect_error::make(connect_errc::tls_failed, "BIO write failed"));
            return;
        }
        drive_handshake();
        return;
    }

    if (res == 0)
    {
        fail_io(ECONNRESET);
        return;
    }
    if (res < 0)
    {
        fail_io(res == -ECANCELED ? ETIMEDOUT : -res);
        return;
    }

    std::string_view data(m_read_buf, static_cast<size_t>(res));

    if (m_ssl)
    {
        if (tls_context::bio_write_in(m_ssl, m_read_buf, res) != res)
        {
            fail_io(EPROTO);
            return;
        }

        m_plain.clear();
        char tmp[16384];
        while (true)
        {
            int n = tls_context::ssl_read(m_ssl, tmp, sizeof(tmp));
            if (n < 0)
            {
                fail_io(ECONNRESET);
                return;
            }
            if (n == 0)
                break;
            m_plain.append(tmp, static_cast<size_t>(n));
        }

        // Post-handshake messages (key updates) may need a reply.
        if (tls_context::has_pending_out(m_ssl) && !flush_tls_out())
        {
            fail_io(EPROTO);
            return;
        }
        if (m_phase == phase::closed)
            return;

        if (m_plain.empty())
        {
            submit_read(m_opts.response_timeout_ms ? &m_response_ts : nullptr);
            return;
        }
        data = m_plain;
    }

    auto cb = std::move(m_recv_cb);
    m_recv_cb = nullptr;
    if (cb)
        cb(0, data);
}

void uring_transport::handle_write(int res)
{
    if (res <= 0)
    {
        int err = res == 0 ? EPIPE : (res == -ECANCELED ? ETIMEDOUT : -res);
        if (m_phase == phase::handshaking)
        {
            finish_connect(connect_error::make(err == ETIMEDOUT ? connect_errc::timeout : connect_errc::tls_failed,
                                               "tls handshake write", err));
            return;
        }
        fail_io(err);
        return;
    }

    m_write_off += static_cast<size_t>(res);
    if (m_write_off < m_write_buf.size())
    {
        submit_write();
        return;
    }

    m_write_buf.clear();
    m_write_off = 0;

    if (!m_write_queue.empty())
    {
        m_write_buf.swap(m_write_queue);
        submit_write();
        return;
    }

    if (m_phase == phase::handshaking)
    {
        drive_handshake();
        return;
    }

    auto cb = std::move(m_send_cb);
    m_send_cb = nullptr;
    if (cb)
        cb(0);
}
