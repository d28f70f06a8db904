#include "event_loop.h"
#include <unistd.h>
#include <fcntl.h>
#include <cstring>
#include <utility>

#include "logging.h"

event_loop::event_loop(uint32_t queue_depth)
    : m_queue_depth(queue_depth), m_pending_submissions(0)
{
}

event_loop::~event_loop()
{
    if (m_initialized)
        io_uring_queue_exit(&m_ring);

    if (m_signal_pipe[0] >= 0) close(m_signal_pipe[0]);
    if (m_signal_pipe[1] >= 0) close(m_signal_pipe[1]);
}

bool event_loop::init()
{
    if (m_initialized)
        return true;

    bool initialized = false;

    // Priority 1: SQPOLL + SINGLE_ISSUER (avoids submit syscalls, needs privileges)
    {
        struct io_uring_params params{};
        params.flags = IORING_SETUP_SQPOLL | IORING_SETUP_SINGLE_ISSUER
                     | IORING_SETUP_SUBMIT_ALL;
        params.sq_thread_idle = 2000;
        params.flags |= IORING_SETUP_CQSIZE;
        params.cq_entries = m_queue_depth * 4;
        if (io_uring_queue_init_params(m_queue_depth, &m_ring, &params) == 0)
        {
            m_sqpoll_enabled = true;
            initialized = true;
        }
    }

    // Priority 2: SINGLE_ISSUER + DEFER_TASKRUN (kernel 6.1+)
    if (!initialized)
    {
        struct io_uring_params p2{};
        p2.flags = IORING_SETUP_SINGLE_ISSUER | IORING_SETUP_DEFER_TASKRUN
                 | IORING_SETUP_SUBMIT_ALL | IORING_SETUP_COOP_TASKRUN;
        p2.flags |= IORING_SETUP_CQSIZE;
        p2.cq_entries = m_queue_depth * 4;
        if (io_uring_queue_init_params(m_queue_depth, &m_ring, &p2) == 0)
            initialized = true;
    }

    // Priority 3: Plain mode
    if (!initialized)
    {
        int ret = io_uring_queue_init(m_queue_depth, &m_ring, 0);
        if (ret < 0)
        {
            LOG_ERROR(("io_uring_queue_init failed: " + std::string(std::strerror(-ret))).c_str());
            return false;
        }
    }

    m_initialized = true;
    io_uring_register_ring_fd(&m_ring);

    // O_CLOEXEC keeps the stop pipe out of spawned children (the live
    // tests fork redis-server).
    if (pipe2(m_signal_pipe, O_NONBLOCK | O_CLOEXEC) < 0)
    {
        LOG_WARN("event loop: could not create stop pipe, cross-thread stop disabled");
        m_signal_pipe[0] = m_signal_pipe[1] = -1;
    }
    else
    {
        m_signal_req = { nullptr, &m_signal_buf, m_signal_pipe[0], 1, op_read };
    }

    LOG_DEBUG(m_sqpoll_enabled ? "event loop: io_uring ready (sqpoll)" : "event loop: io_uring ready");
    return true;
}

void event_loop::arm_signal_read()
{
    if (m_signal_armed || m_signal_pipe[0] < 0)
        return;

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe)
        return;

    io_uring_prep_read(sqe, m_signal_pipe[0], &m_signal_buf, 1, 0);
    io_uring_sqe_set_data(sqe, &m_signal_req);
    m_pending_submissions++;
    m_signal_armed = true;
}

// Centralized SQE acquisition: get an SQE, flushing if the ring is full.
inline struct io_uring_sqe* event_loop::get_sqe()
{
    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (REDISAC_UNLIKELY(!sqe))
    {
        io_uring_submit(&m_ring);
        m_pending_submissions = 0;
        sqe = io_uring_get_sqe(&m_ring);
    }
    return sqe;
}

bool event_loop::reserve_linked()
{
    if (io_uring_sq_space_left(&m_ring) >= 2)
        return true;

    io_uring_submit(&m_ring);
    m_pending_submissions = 0;
    return io_uring_sq_space_left(&m_ring) >= 2;
}

void event_loop::link_timeout(struct io_uring_sqe* sqe, struct __kernel_timespec* ts)
{
    sqe->flags |= IOSQE_IO_LINK;

    struct io_uring_sqe* tsqe = io_uring_get_sqe(&m_ring);
    io_uring_prep_link_timeout(tsqe, ts, 0);
    // Null user_data: the timeout's own CQE is discarded by run().
    io_uring_sqe_set_data(tsqe, nullptr);
    m_pending_submissions++;
}

void event_loop::flush()
{
    if (m_pending_submissions > 0)
    {
        io_uring_submit(&m_ring);
        m_pending_submissions = 0;
    }
}

void event_loop::run()
{
    if (!m_initialized)
    {
        LOG_ERROR("event loop: run() before init()");
        return;
    }

    m_stop_requested.store(false, std::memory_order_release);
    arm_signal_read();

    struct io_uring_cqe* cqe;

    while (REDISAC_LIKELY(!m_stop_requested.load(std::memory_order_acquire)))
    {
        if (m_pending_submissions > 0)
        {
            if (REDISAC_LIKELY(m_sqpoll_enabled))
                io_uring_submit(&m_ring);
            else
                io_uring_submit_and_wait(&m_ring, 1);
            m_pending_submissions = 0;
        }

        if (io_uring_peek_cqe(&m_ring, &cqe) != 0)
        {
            int ret = io_uring_wait_cqe(&m_ring, &cqe);
            if (ret == -EINTR)
                continue;
            if (ret < 0)
            {
                LOG_ERROR(("event loop: wait_cqe failed: " + std::string(std::strerror(-ret))).c_str());
                break;
            }
        }

        unsigned head;
        unsigned count = 0;
        bool got_signal = false;

        io_uring_for_each_cqe(&m_ring, head, cqe)
        {
            count++;

            auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));

            if (REDISAC_UNLIKELY(req == &m_signal_req))
            {
                got_signal = true;
                continue;
            }

            if (REDISAC_LIKELY(req != nullptr && req->owner != nullptr))
                req->owner->on_cqe(cqe);
        }

        io_uring_cq_advance(&m_ring, count);

        if (REDISAC_UNLIKELY(got_signal))
        {
            m_signal_armed = false;
            char sink[16];
            while (read(m_signal_pipe[0], sink, sizeof(sink)) > 0) {}
            arm_signal_read();
        }
    }

    flush();
}

void event_loop::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);

    if (m_signal_pipe[1] >= 0)
    {
        char c = 1;
        if (write(m_signal_pipe[1], &c, 1) < 0) {}
    }
}

bool event_loop::submit_read(int fd, char* buf, uint32_t len, io_request* req,
                             struct __kernel_timespec* timeout)
{
    if (timeout && !reserve_linked())
        return false;

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return false;

    // recv() is more efficient than read() for sockets: skips VFS layer
    io_uring_prep_recv(sqe, fd, buf, len, 0);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;

    if (timeout)
        link_timeout(sqe, timeout);
    return true;
}

bool event_loop::submit_write(int fd, const char* buf, uint32_t len, io_request* req,
                              struct __kernel_timespec* timeout)
{
    if (timeout && !reserve_linked())
        return false;

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return false;

    // MSG_NOSIGNAL: no SIGPIPE if the server hung up between our check and the send
    io_uring_prep_send(sqe, fd, buf, len, MSG_NOSIGNAL);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;

    if (timeout)
        link_timeout(sqe, timeout);
    return true;
}

bool event_loop::submit_connect(int fd, const struct sockaddr* addr, socklen_t len, io_request* req,
                                struct __kernel_timespec* timeout)
{
    if (timeout && !reserve_linked())
        return false;

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return false;

    io_uring_prep_connect(sqe, fd, addr, len);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;

    if (timeout)
        link_timeout(sqe, timeout);
    return true;
}

void event_loop::submit_cancel_fd(int fd)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    // IORING_ASYNC_CANCEL_ALL: a pending read and write on the same fd
    // are both cancelled by one SQE.
    io_uring_prep_cancel_fd(sqe, fd, IORING_ASYNC_CANCEL_ALL);
    io_uring_sqe_set_data(sqe, nullptr);
    m_pending_submissions++;
}
