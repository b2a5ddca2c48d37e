#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace cork {

// ============================================================================
// External Process Execution
// ============================================================================

struct ProcessSpec {
    std::vector<std::string> argv;  // argv[0] is resolved through PATH
    std::vector<std::pair<std::string, std::string>> environment;  // Added on top of the inherited environment
    std::string cwd;
    std::chrono::milliseconds timeout{0};  // 0 = wait indefinitely
};

struct ProcessResult {
    bool ok = false;          // Process was spawned and reaped
    bool timed_out = false;   // Killed after exceeding the timeout
    int exit_code = -1;       // 128 + signal for signalled processes
    std::string output;       // Captured stdout
    std::string errors;       // Captured stderr
    std::string error;        // Spawn/wait failure description when !ok
};

/**
 * Run a process to completion, capturing stdout and stderr.
 *
 * The child runs in its own process group. On timeout the whole group is
 * killed with SIGKILL. Once the direct child has exited, output still held
 * open by detached grandchildren (e.g. a lingering wineserver) is not waited
 * for.
 */
ProcessResult run_process(const ProcessSpec& spec);

// Render argv for logging ("a 'b c' d")
std::string format_command(const std::vector<std::string>& argv);

} // namespace cork
