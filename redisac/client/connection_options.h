#pragma once
#include <cstdint>
#include <string>

#include "address.h"

struct tls_options
{
    std::string ca_file;        // empty = system trust store
    std::string cert_file;      // client certificate (mTLS)
    std::string key_file;
    std::string server_name;    // SNI / verified name; empty = address host
    bool verify = true;
};

struct connection_options
{
    redis_address address;
    uint32_t connect_timeout_ms = 5000;     // 0 = no limit
    uint32_t response_timeout_ms = 0;       // 0 = no limit
    std::string client_name;                // CLIENT SETNAME during the handshake
    tls_options tls;
};
