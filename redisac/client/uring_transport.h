#pragma once
#include <memory>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <linux/time_types.h>

#include "transport.h"
#include "connection_options.h"
#include "../shared/event_loop_definitions.h"
#include "../shared/scoped_fd.h"

class event_loop;
class tls_context;
typedef struct ssl_st SSL;

// io_uring socket transport: TCP, TLS over TCP (OpenSSL memory BIOs),
// or a unix socket. Must be owned by a std::shared_ptr; it keeps itself
// alive while kernel operations reference its buffers.
class uring_transport : public transport, public io_handler,
                        public std::enable_shared_from_this<uring_transport>
{
public:
    uring_transport(event_loop& loop, connection_options opts);
    ~uring_transport() override;

    uring_transport(const uring_transport&) = delete;
    uring_transport& operator=(const uring_transport&) = delete;

    void connect(connect_callback cb) override;
    void send(std::string bytes, send_callback cb) override;
    void receive(receive_callback cb) override;
    void close() override;
    bool is_open() const override { return m_phase == phase::open; }

    void on_cqe(struct io_uring_cqe* cqe) override;

private:
    enum class phase : uint8_t { idle, connecting, handshaking, open, closed };

    bool resolve(connect_error& err);
    void try_next_address();
    void handle_connect(int res);
    void finish_connect(const connect_error& err);

    bool start_tls(connect_error& err);
    void drive_handshake();

    void handle_read(int res);
    void handle_write(int res);
    void submit_read(struct __kernel_timespec* ts);
    void submit_write();
    bool flush_tls_out();
    void append_out(std::string_view bytes);

    void fail_io(int err);
    void submit_failed();
    void op_started();
    void op_finished();

    event_loop& m_loop;
    connection_options m_opts;
    scoped_fd m_fd;
    phase m_phase{phase::idle};

    std::vector<sockaddr_storage> m_addrs;
    std::vector<socklen_t> m_addr_lens;
    size_t m_addr_idx{0};
    connect_error m_last_connect_err;

    io_request m_connect_req{};
    io_request m_read_req{};
    io_request m_write_req{};
    char m_read_buf[16384];
    std::string m_write_buf;
    std::string m_write_queue;
    size_t m_write_off{0};
    bool m_read_pending{false};
    bool m_write_pending{false};

    struct __kernel_timespec m_connect_ts{};
    struct __kernel_timespec m_response_ts{};

    std::unique_ptr<tls_context> m_tls;
    SSL* m_ssl{nullptr};
    std::string m_plain;

    connect_callback m_connect_cb;
    send_callback m_send_cb;
    receive_callback m_recv_cb;

    uint32_t m_inflight_ops{0};
    std::shared_ptr<uring_transport> m_self;
};
