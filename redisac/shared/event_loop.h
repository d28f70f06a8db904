#pragma once
#include <atomic>
#include <cstdint>
#include <liburing.h>
#include <sys/socket.h>

#include "event_loop_definitions.h"

class event_loop
{
public:
    explicit event_loop(uint32_t queue_depth = 256);
    ~event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    bool init();
    bool is_initialized() const { return m_initialized; }

    // Runs until request_stop(). May be called again after it returns;
    // a stop requested before run() starts is discarded.
    void run();
    void request_stop();

    // Batched submissions - these queue SQEs without submitting.
    // A non-null timeout links an IORING_OP_LINK_TIMEOUT to the operation;
    // on expiry the operation completes with -ECANCELED.
    // False when no SQE could be had; no CQE will arrive for `req` then.
    bool submit_read(int fd, char* buf, uint32_t len, io_request* req,
                     struct __kernel_timespec* timeout = nullptr);
    bool submit_write(int fd, const char* buf, uint32_t len, io_request* req,
                      struct __kernel_timespec* timeout = nullptr);
    bool submit_connect(int fd, const struct sockaddr* addr, socklen_t len, io_request* req,
                        struct __kernel_timespec* timeout = nullptr);

    // Cancel all pending io_uring ops for a fd (user_data=null, CQE is ignored).
    // Submit this BEFORE close(fd) so the kernel generates cancellation
    // CQEs for every outstanding request.
    void submit_cancel_fd(int fd);

    // Flush all pending submissions (single syscall)
    void flush();

private:
    struct io_uring_sqe* get_sqe();
    // Reserve two adjacent SQEs so a linked timeout never straddles a submit.
    bool reserve_linked();
    void link_timeout(struct io_uring_sqe* sqe, struct __kernel_timespec* ts);
    void arm_signal_read();

    struct io_uring m_ring{};
    bool m_initialized{false};
    std::atomic<bool> m_stop_requested{false};
    uint32_t m_queue_depth;
    uint32_t m_pending_submissions{0};
    int m_signal_pipe[2]{-1, -1};
    io_request m_signal_req{};
    char m_signal_buf{};
    bool m_signal_armed{false};
    bool m_sqpoll_enabled{false};
};
