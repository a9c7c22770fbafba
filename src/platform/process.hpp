#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Run a program to completion and capture its output.
//
// The child gets /dev/null as stdin and runs in its own process group, so a
// terminal Ctrl+C delivered to the caller does not reach it. Blocks until the
// child exits; there is no timeout.
//
// exit_code is the child's exit status, 128 + signal number if it was killed,
// 127 if the program could not be executed (stderr_data then says why).
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args);

// Render a command line for logs and operator guidance.
std::string format_command(const std::string& program,
                           const std::vector<std::string>& args);

} // namespace platform
