#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "process.hpp"
#include "settings.hpp"

namespace actions {

// One external script run: what is invoked and how the outcome reads.
struct ScriptCall {
    const char* label;  // "Download", "Preprocess", "Model"
    std::filesystem::path script;
    std::vector<std::string> args;
};

ScriptCall download_call(const Settings& settings, const std::string& ticker);
ScriptCall preprocess_call(const Settings& settings, const std::string& ticker);
ScriptCall predict_call(const Settings& settings);

// Runs the interpreter on the call's script. A script that does not exist
// is reported as a launch failure without forking.
proc::Outcome run_script(const Settings& settings, const ScriptCall& call);

// Output-panel messages, one per outcome kind
std::string describe_download(const std::string& ticker,
                              const ScriptCall& call,
                              const proc::Outcome& outcome);
std::string describe_preprocess(const std::string& ticker,
                                const ScriptCall& call,
                                const proc::Outcome& outcome);
std::string describe_predict(const std::string& ticker,
                             const ScriptCall& call,
                             const proc::Outcome& outcome);

std::string download(const Settings& settings, const std::string& ticker);
std::string preprocess(const Settings& settings, const std::string& ticker);
std::string predict(const Settings& settings, const std::string& ticker);

} // namespace actions
