#pragma once

#ifndef REDISAC_VERSION
#define REDISAC_VERSION "0.3.0"
#endif

// Exit codes
constexpr int CLI_OK = 0;
constexpr int CLI_USAGE = 1;
constexpr int CLI_CONNECT_FAILED = 2;
constexpr int CLI_COMMAND_FAILED = 3;

int cli_dispatch(int argc, char** argv);
void cli_usage();
