#pragma once
#include <cstdint>

// Branch prediction hints for hot-path optimization
#ifndef REDISAC_LIKELY
#define REDISAC_LIKELY(x)   __builtin_expect(!!(x), 1)
#endif
#ifndef REDISAC_UNLIKELY
#define REDISAC_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif

class io_handler
{
public:
    virtual ~io_handler() = default;
    virtual void on_cqe(struct io_uring_cqe* cqe) = 0;
};

enum op_type : uint8_t
{
    op_read     = 0,
    op_write    = 1,
    op_connect  = 2
};

struct io_request
{
    io_handler* owner;
    char* buffer;
    int fd;
    uint32_t length;
    op_type type;
};
