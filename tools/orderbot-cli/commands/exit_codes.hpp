#pragma once

namespace orderbot::cli {

// Exit codes for CLI commands
// Named with ORDERBOT_ prefix to avoid conflict with system macros
constexpr int ORDERBOT_EXIT_SUCCESS = 0;
constexpr int ORDERBOT_EXIT_USER_ERROR = 1;    // Invalid arguments, usage errors
constexpr int ORDERBOT_EXIT_IO_ERROR = 3;      // Menu/state file errors
constexpr int ORDERBOT_EXIT_INTERNAL = 4;      // Internal/unexpected errors

}  // namespace orderbot::cli
