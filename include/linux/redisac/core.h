// ═══════════════════════════════════════════════════════════════════
//  redisac/core.h - Engine core (requires libredisac.a)
//
//  Event loop, RESP codec, connection and shared channel.
//  Link with -lredisac -luring -lssl -lcrypto -lluajit
// ═══════════════════════════════════════════════════════════════════
#pragma once

#ifndef __linux__
#  error "redisac requires Linux (io_uring)"
#endif

#include "redisac/shared/event_loop_definitions.h"
#include "redisac/shared/logging.h"
#include "redisac/shared/event_loop.h"
#include "redisac/shared/client_config.h"
#include "redisac/resp/resp_value.h"
#include "redisac/resp/resp_codec.h"
#include "redisac/client/address.h"
#include "redisac/client/errors.h"
#include "redisac/client/connection_options.h"
#include "redisac/client/transport.h"
#include "redisac/client/redis_connection.h"
#include "redisac/client/shared_channel.h"

namespace redisac {

using ::event_loop;
using ::connect_errc;
using ::connect_error;
using ::command_errc;
using ::command_error;
using ::connection_options;
using ::tls_options;
using ::redis_address;
using ::connection_state;
using ::client_config;
using ::log_level;

} // namespace redisac
