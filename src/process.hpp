#pragma once

#include <string>
#include <variant>
#include <vector>

namespace proc {

struct Success {
    std::string out; // captured stdout
};

struct ScriptFailure {
    int exit_code = 1; // 128 + signal when killed
    std::string err;   // captured stderr
};

struct LaunchFailure {
    std::string description;
};

using Outcome = std::variant<Success, ScriptFailure, LaunchFailure>;

// Runs `program args...` (PATH lookup) to completion with stdin on
// /dev/null, capturing stdout and stderr. Blocks; no timeout.
Outcome invoke(const std::string& program,
               const std::vector<std::string>& args);

std::string describe_command(const std::string& program,
                             const std::vector<std::string>& args);

} // namespace proc
