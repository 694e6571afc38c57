#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Subprocess Execution
// ============================================================================

struct ProcessResult {
    bool ok = false;        // Process was spawned and reaped
    int exit_code = -1;
    std::string output;     // Combined stdout/stderr
    std::string error;

    bool succeeded() const { return ok && exit_code == 0; }
};

// Run argv[0] (searched on PATH) with the given arguments and wait for it.
// No shell is involved. Blocks until the child exits; there is no timeout.
ProcessResult run_process(const std::vector<std::string>& argv);

// Locate an executable on PATH
std::optional<std::string> find_executable(const std::string& name);

// Render argv for logging, quoting arguments that contain spaces
std::string format_command(const std::vector<std::string>& argv);

} // namespace pawkit
