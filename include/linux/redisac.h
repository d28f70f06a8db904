#pragma once
// redisac C++ SDK - umbrella header (Linux only, io_uring kernel 5.11+)
// Include this single header to access all redisac SDK types.
//
// Required include paths (repo root must be in -I):
//   -I<repo_root>  -I<repo_root>/include/linux
//
// Required link libraries:
//   -lredisac -luring -lssl -lcrypto -lluajit
#include "redisac/core.h"
#include "redisac/result.h"
#include "redisac/command.h"
#include "redisac/from_reply.h"
#include "redisac/execute.h"
#include "redisac/scan_stream.h"
#include "redisac/commands.h"
#include "redisac/connection.h"
#include "redisac/client.h"
