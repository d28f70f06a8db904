// redisac/execute.h - one command, one typed reply
#pragma once
#include <memory>
#include <utility>
#include "command.h"
#include "from_reply.h"

namespace redisac {

// Sends `c` over `con` and decodes the reply as T. The handle travels
// with the request and comes back in the callback, successful or not:
//   cb(C con, result<T> r)
// After a network or protocol error `con.is_broken()` is true and the
// handle must be reset before reuse. Decode, server and busy errors leave it usable.
//
// C is redisac::connection or redisac::shared_connection.
template <typename T, typename C, typename F>
void execute(C con, const command& c, F&& cb)
{
    auto holder = std::make_shared<C>(std::move(con));
    C& ref = *holder;
    ref.submit(c.pack(),
        [holder, cb = std::forward<F>(cb)](const command_error& err, resp::value&& v) mutable {
            result<T> r;
            if (err)
                r.error = err;
            else
                from_reply(std::move(v), r.value, r.error);
            cb(std::move(*holder), std::move(r));
        });
}

} // namespace redisac
