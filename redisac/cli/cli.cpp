#include "cli.h"
#include <iostream>
#include <string>
#include <string_view>

#include <redisac.h>

#include "arg_parser.h"
#include "command_hashing.h"

using redisac::connection;

void cli_usage()
{
    std::cerr <<
        "redisac " REDISAC_VERSION "\n"
        "usage: redisac [-u URL] [--config file.lua] [--tls] [--timeout ms] [-v|-vv] <command> [args]\n"
        "\n"
        "commands:\n"
        "  ping\n"
        "  get <key>\n"
        "  set <key> <value>\n"
        "  del <key>...\n"
        "  scan [pattern] [--type T] [--count N]\n"
        "  hscan|sscan|zscan <key> [pattern] [--count N]\n"
        "  scan-get <pattern>\n"
        "  raw <name> [args]...\n";
}

static bool check_arity(const parsed_args& args, size_t min, size_t max)
{
    size_t n = args.operands.size();
    if (n >= min && n <= max)
        return true;
    std::cerr << args.command << ": wrong number of arguments\n";
    return false;
}

static bool validate(const parsed_args& args)
{
    constexpr size_t any = static_cast<size_t>(-1);

    switch (args.command_hash)
    {
        case cli_cmd::ping:     return check_arity(args, 0, 0);
        case cli_cmd::get:      return check_arity(args, 1, 1);
        case cli_cmd::set:      return check_arity(args, 2, 2);
        case cli_cmd::del:      return check_arity(args, 1, any);
        case cli_cmd::scan:     return check_arity(args, 0, 1);
        case cli_cmd::hscan:
        case cli_cmd::sscan:
        case cli_cmd::zscan:    return check_arity(args, 1, 2);
        case cli_cmd::scan_get: return check_arity(args, 1, 1);
        case cli_cmd::raw:      return check_arity(args, 1, any);
        default:
            std::cerr << "unknown command: " << args.command << "\n";
            return false;
    }
}

static bool build_config(const parsed_args& args, client_config& cfg)
{
    std::string err;
    if (!args.config_path.empty() && !cfg.load_file(args.config_path, err))
    {
        std::cerr << err << "\n";
        return false;
    }
    cfg.apply_env();

    if (!args.url.empty())
        cfg.url.assign(args.url);
    if (args.tls)
        cfg.force_tls = true;
    if (args.timeout_ms != 0)
    {
        cfg.connect_timeout_ms = args.timeout_ms;
        cfg.response_timeout_ms = args.timeout_ms;
    }
    if (args.verbosity >= 2)
        cfg.level = log_debug;
    else if (args.verbosity == 1 && cfg.level > log_info)
        cfg.level = log_info;

    return true;
}

namespace
{

// One command against one connection; `rc` and the loop are shared with cli_dispatch.
struct cli_run
{
    redisac::client& cli;
    const parsed_args& args;
    uint32_t scan_count;
    int rc = CLI_OK;

    void finish(int code)
    {
        rc = code;
        cli.stop();
    }

    void fail(const redisac::command_error& err)
    {
        std::cerr << "(error) " << err.describe() << "\n";
        finish(CLI_COMMAND_FAILED);
    }

    template <typename T>
    bool check(const redisac::result<T>& r)
    {
        if (r)
            return true;
        fail(r.error);
        return false;
    }

    void scan_done(const redisac::command_error& err)
    {
        if (err)
            fail(err);
        else
            finish(CLI_OK);
    }

    redisac::scan_request make_scan(redisac::scan_kind kind) const
    {
        redisac::scan_request req;
        req.kind = kind;
        req.count = args.count != 0 ? args.count : scan_count;
        if (kind == redisac::scan_kind::scan)
        {
            if (!args.operands.empty())
                req.pattern.assign(args.operands[0]);
            req.type.assign(args.type);
        }
        else
        {
            req.key.assign(args.operands[0]);
            if (args.operands.size() > 1)
                req.pattern.assign(args.operands[1]);
        }
        return req;
    }

    void run(connection con)
    {
        switch (args.command_hash)
        {
            case cli_cmd::ping:
                con.ping([this](connection, redisac::result<redisac::status> r) {
                    if (!check(r)) return;
                    std::cout << r.value.text << "\n";
                    finish(CLI_OK);
                });
                break;

            case cli_cmd::get:
                con.get(args.operands[0], [this](connection, redisac::result<std::optional<std::string>> r) {
                    if (!check(r)) return;
                    std::cout << (r.value ? *r.value : std::string("(nil)")) << "\n";
                    finish(CLI_OK);
                });
                break;

            case cli_cmd::set:
                con.set(args.operands[0], args.operands[1], [this](connection, redisac::result<redisac::status> r) {
                    if (!check(r)) return;
                    std::cout << r.value.text << "\n";
                    finish(CLI_OK);
                });
                break;

            case cli_cmd::del:
            {
                std::vector<std::string> keys(args.operands.begin(), args.operands.end());
                con.del(keys, [this](connection, redisac::result<int64_t> r) {
                    if (!check(r)) return;
                    std::cout << "(integer) " << r.value << "\n";
                    finish(CLI_OK);
                });
                break;
            }

            case cli_cmd::scan:
                con.scan_with<std::string>(make_scan(redisac::scan_kind::scan)).for_each(
                    [](std::string&& key) { std::cout << key << "\n"; },
                    [this](connection, const redisac::command_error& err) { scan_done(err); });
                break;

            case cli_cmd::sscan:
                con.scan_with<std::string>(make_scan(redisac::scan_kind::sscan)).for_each(
                    [](std::string&& member) { std::cout << member << "\n"; },
                    [this](connection, const redisac::command_error& err) { scan_done(err); });
                break;

            case cli_cmd::hscan:
                con.scan_with<std::pair<std::string, std::string>>(make_scan(redisac::scan_kind::hscan)).for_each(
                    [](std::pair<std::string, std::string>&& fv) { std::cout << fv.first << "\t" << fv.second << "\n"; },
                    [this](connection, const redisac::command_error& err) { scan_done(err); });
                break;

            case cli_cmd::zscan:
                con.scan_with<std::pair<std::string, double>>(make_scan(redisac::scan_kind::zscan)).for_each(
                    [](std::pair<std::string, double>&& ms) { std::cout << ms.first << "\t" << ms.second << "\n"; },
                    [this](connection, const redisac::command_error& err) { scan_done(err); });
                break;

            case cli_cmd::scan_get:
                con.scan_and_get(args.operands[0],
                    [this](connection, redisac::result<std::vector<std::pair<std::string, std::string>>> r) {
                        if (!check(r)) return;
                        for (const auto& [k, v] : r.value)
                            std::cout << k << "\t" << v << "\n";
                        finish(CLI_OK);
                    }, scan_count);
                break;

            case cli_cmd::raw:
            {
                redisac::command c(args.operands[0]);
                for (size_t i = 1; i < args.operands.size(); ++i)
                    c.arg(args.operands[i]);
                con.query(c, [this](connection, redisac::result<resp::value> r) {
                    // A server error reply is still printed the way redis-cli does.
                    if (r.error.code == command_errc::server_error)
                    {
                        std::cout << "(error) " << r.error.message << "\n";
                        finish(CLI_COMMAND_FAILED);
                        return;
                    }
                    if (!check(r)) return;
                    std::cout << resp::format_value(r.value) << "\n";
                    finish(CLI_OK);
                });
                break;
            }
        }
    }
};

} // namespace

int cli_dispatch(int argc, char** argv)
{
    if (argc >= 2)
    {
        std::string_view first = argv[1];
        if (first == "-h" || first == "--help")
        {
            cli_usage();
            return CLI_OK;
        }
        if (first == "--version")
        {
            std::cout << "redisac " REDISAC_VERSION "\n";
            return CLI_OK;
        }
    }

    parsed_args args;
    std::string err;
    if (!args.parse(argc, argv, err))
    {
        std::cerr << err << "\n";
        cli_usage();
        return CLI_USAGE;
    }
    if (!validate(args))
        return CLI_USAGE;

    client_config cfg;
    if (!build_config(args, cfg))
        return CLI_USAGE;

    redisac::client cli(cfg);
    cli_run job{ cli, args, cfg.scan_count };

    cli.connect([&](connection con, const redisac::connect_error& cerr) {
        if (cerr)
        {
            std::cerr << "could not connect: " << cerr.describe() << "\n";
            job.finish(CLI_CONNECT_FAILED);
            return;
        }
        job.run(std::move(con));
    });

    // connect() reports a bad url or loop failure synchronously.
    if (job.rc != CLI_OK)
        return job.rc;

    if (!cli.run())
    {
        std::cerr << "io_uring unavailable\n";
        return CLI_CONNECT_FAILED;
    }
    return job.rc;
}
