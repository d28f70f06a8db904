// redisac SDK - set a key, read it back, count up
//
// Build:
//   g++ -std=c++23 sdk/examples/basic/get_set.cpp \
//       -I. -Iinclude/linux \
//       -Lbuild -lredisac -luring -lssl -lcrypto -lluajit \
//       -o /tmp/get_set
//
// Run: redis-server & /tmp/get_set redis://127.0.0.1:6379

#include <cstdio>
#include <redisac.h>

int main(int argc, char* argv[])
{
    redisac::client cli(argc > 1 ? argv[1] : "redis://127.0.0.1:6379");
    cli.name("get_set_example").response_timeout(2000);

    int rc = 1;
    cli.connect([&](redisac::connection con, const redisac::connect_error& err) {
        if (err) {
            std::fprintf(stderr, "connect: %s\n", err.describe().c_str());
            cli.stop();
            return;
        }

        con.set("greeting", "hello", [&](redisac::connection con, redisac::result<redisac::status> r) {
            if (!r) { std::fprintf(stderr, "set: %s\n", r.error.describe().c_str()); cli.stop(); return; }

            con.get("greeting", [&](redisac::connection con, redisac::result<std::optional<std::string>> r) {
                if (!r) { std::fprintf(stderr, "get: %s\n", r.error.describe().c_str()); cli.stop(); return; }
                std::printf("greeting = %s\n", r.value ? r.value->c_str() : "(nil)");

                con.incr("visits", [&](redisac::connection, redisac::result<int64_t> r) {
                    if (r) {
                        std::printf("visits = %lld\n", static_cast<long long>(r.value));
                        rc = 0;
                    }
                    cli.stop();
                });
            });
        });
    });

    cli.run();
    return rc;
}
