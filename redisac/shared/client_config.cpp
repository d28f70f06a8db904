#include "client_config.h"

#include <cstdlib>
#include <limits>
#include <sol/sol.hpp>

namespace
{

bool read_u32(const sol::table& t, const char* key, uint32_t& out, std::string& err)
{
    sol::object obj = t[key];
    if (!obj.valid() || obj.get_type() == sol::type::lua_nil)
        return true;

    sol::optional<int64_t> v = obj.as<sol::optional<int64_t>>();
    if (!v || *v < 0 || *v > static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
    {
        err = std::string("redis.") + key + " must be a non-negative integer";
        return false;
    }
    out = static_cast<uint32_t>(*v);
    return true;
}

bool read_string(const sol::table& t, const char* key, std::string& out, std::string& err,
                 const char* scope = "redis")
{
    sol::object obj = t[key];
    if (!obj.valid() || obj.get_type() == sol::type::lua_nil)
        return true;

    if (obj.get_type() != sol::type::string)
    {
        err = std::string(scope) + "." + key + " must be a string";
        return false;
    }
    out = obj.as<std::string>();
    return true;
}

bool apply_table(client_config& cfg, const sol::table& redis, std::string& err)
{
    if (!read_string(redis, "url", cfg.url, err)) return false;
    if (!read_u32(redis, "connect_timeout_ms", cfg.connect_timeout_ms, err)) return false;
    if (!read_u32(redis, "response_timeout_ms", cfg.response_timeout_ms, err)) return false;
    if (!read_string(redis, "client_name", cfg.client_name, err)) return false;
    if (!read_u32(redis, "scan_count", cfg.scan_count, err)) return false;
    if (!read_u32(redis, "queue_depth", cfg.queue_depth, err)) return false;

    std::string level;
    if (!read_string(redis, "log_level", level, err)) return false;
    if (!level.empty() && !parse_log_level(level, cfg.level))
    {
        err = "redis.log_level: unknown level '" + level + "'";
        return false;
    }

    sol::optional<sol::table> tls = redis["tls"];
    if (tls)
    {
        if (!read_string(*tls, "ca_file", cfg.tls.ca_file, err, "redis.tls")) return false;
        if (!read_string(*tls, "cert_file", cfg.tls.cert_file, err, "redis.tls")) return false;
        if (!read_string(*tls, "key_file", cfg.tls.key_file, err, "redis.tls")) return false;
        if (!read_string(*tls, "server_name", cfg.tls.server_name, err, "redis.tls")) return false;

        sol::optional<bool> verify = (*tls)["verify"];
        if (verify)
            cfg.tls.verify = *verify;
    }

    return true;
}

bool run_config(client_config& cfg, sol::state& lua, sol::load_result& script, std::string& err)
{
    if (!script.valid())
    {
        sol::error e = script;
        err = std::string("failed to load config: ") + e.what();
        return false;
    }

    sol::protected_function_result result = script();
    if (!result.valid())
    {
        sol::error e = result;
        err = std::string("error executing config: ") + e.what();
        return false;
    }

    sol::optional<sol::table> redis = lua["redis"];
    if (!redis)
        return true;

    return apply_table(cfg, *redis, err);
}

} // namespace

bool client_config::load_file(std::string_view path, std::string& err)
{
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::os);

    sol::load_result script = lua.load_file(std::string(path));
    return run_config(*this, lua, script, err);
}

bool client_config::load_string(std::string_view chunk, std::string& err)
{
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::os);

    sol::load_result script = lua.load(chunk);
    return run_config(*this, lua, script, err);
}

void client_config::apply_env()
{
    if (const char* url_env = std::getenv("REDISAC_URL"); url_env && url_env[0])
        url = url_env;

    if (const char* log_env = std::getenv("REDISAC_LOG"); log_env && log_env[0])
    {
        if (!parse_log_level(log_env, level))
            LOG_WARN((std::string("REDISAC_LOG: unknown level '") + log_env + "', ignored").c_str());
    }
}

bool client_config::to_connection_options(connection_options& out, std::string& err) const
{
    out = connection_options{};
    if (!parse_address(url, out.address, err))
    {
        err = "url: " + err;
        return false;
    }

    if (force_tls && out.address.kind == address_kind::tcp)
        out.address.kind = address_kind::tls;

    if (out.address.kind != address_kind::tls
        && (!tls.ca_file.empty() || !tls.cert_file.empty() || !tls.key_file.empty()))
        LOG_WARN("tls settings given for a non-TLS url; they are ignored");

    if (tls.cert_file.empty() != tls.key_file.empty())
    {
        err = "tls.cert_file and tls.key_file must be given together";
        return false;
    }

    if (queue_depth == 0)
    {
        err = "queue_depth must be positive";
        return false;
    }

    out.connect_timeout_ms = connect_timeout_ms;
    out.response_timeout_ms = response_timeout_ms;
    out.client_name = client_name;
    out.tls = tls;
    return true;
}
