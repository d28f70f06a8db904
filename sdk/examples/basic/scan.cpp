// redisac SDK - stream keys matching a pattern, several clients sharing one connection
//
// Build:
//   g++ -std=c++23 sdk/examples/basic/scan.cpp \
//       -I. -Iinclude/linux \
//       -Lbuild -lredisac -luring -lssl -lcrypto -lluajit \
//       -o /tmp/scan
//
// Run: /tmp/scan 'user:*'

#include <cstdio>
#include <redisac.h>

int main(int argc, char* argv[])
{
    const char* pattern = argc > 1 ? argv[1] : "*";

    redisac::client cli;
    size_t seen = 0;
    cli.connect_shared([&](redisac::shared_connection con, const redisac::connect_error& err) {
        if (err) {
            std::fprintf(stderr, "connect: %s\n", err.describe().c_str());
            cli.stop();
            return;
        }

        // Runs on the same connection as the scan, in submission order.
        con.query<int64_t>(redisac::cmd("DBSIZE"), [](redisac::shared_connection, redisac::result<int64_t> r) {
            if (r)
                std::printf("dbsize: %lld\n", static_cast<long long>(r.value));
        });

        con.scan_match(pattern).for_each(
            [&seen](std::string&& key) {
                seen++;
                std::printf("%s\n", key.c_str());
            },
            [&](redisac::shared_connection, const redisac::command_error& e) {
                if (e)
                    std::fprintf(stderr, "scan: %s\n", e.describe().c_str());
                else
                    std::printf("%zu keys\n", seen);
                cli.stop();
            });
    });

    cli.run();
    return 0;
}
