#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "logging.h"
#include "../client/connection_options.h"

// Client settings, loaded from a Lua file of the form
//
//   redis = {
//       url = "redis://127.0.0.1:6379/0",
//       connect_timeout_ms = 2000,
//       response_timeout_ms = 5000,
//       client_name = "reporting",
//       scan_count = 500,
//       log_level = "info",
//       queue_depth = 256,
//       tls = { ca_file = "ca.pem", cert_file = "", key_file = "",
//               verify = true, server_name = "cache.internal" },
//   }
//
// Every key is optional. REDISAC_URL and REDISAC_LOG override the file.
struct client_config
{
    std::string url = "redis://127.0.0.1:6379";
    uint32_t connect_timeout_ms = 5000;
    uint32_t response_timeout_ms = 0;
    std::string client_name;
    uint32_t scan_count = 0;
    log_level level = log_warn;
    uint32_t queue_depth = 256;
    tls_options tls;
    bool force_tls = false;     // upgrade redis:// to rediss://

    bool load_file(std::string_view path, std::string& err);
    bool load_string(std::string_view chunk, std::string& err);
    void apply_env();

    bool to_connection_options(connection_options& out, std::string& err) const;
};
