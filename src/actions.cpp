#include "actions.hpp"
#include "data/catalog.hpp"
#include "text.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <type_traits>
#include <variant>

namespace actions {

namespace {

template <typename OnSuccess>
std::string describe_outcome(const ScriptCall& call,
                             const proc::Outcome& outcome,
                             OnSuccess&& on_success)
{
    return std::visit(
        [&](const auto& o) -> std::string {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, proc::Success>) {
                return on_success(o.out);
            }
            else if constexpr (std::is_same_v<T, proc::ScriptFailure>) {
                std::string detail = trim_copy(o.err);
                if (detail.empty()) {
                    detail = "exited with status " + std::to_string(o.exit_code);
                }
                return std::string(call.label) + " error: " + detail;
            }
            else {
                static_assert(std::is_same_v<T, proc::LaunchFailure>);
                return "Failed to run " + call.script.filename().string() +
                       ": " + o.description;
            }
        },
        outcome);
}

void log_outcome(const ScriptCall& call, const proc::Outcome& outcome)
{
    if (std::holds_alternative<proc::Success>(outcome)) {
        spdlog::info("{} finished", call.script.string());
    }
    else if (const auto* f = std::get_if<proc::ScriptFailure>(&outcome)) {
        spdlog::warn("{} exited with status {}: {}",
                     call.script.string(),
                     f->exit_code,
                     trim_copy(f->err));
    }
    else if (const auto* l = std::get_if<proc::LaunchFailure>(&outcome)) {
        spdlog::error("{} could not be started: {}",
                      call.script.string(),
                      l->description);
    }
}

} // namespace

ScriptCall download_call(const Settings& settings, const std::string& ticker)
{
    return ScriptCall{"Download", settings.download_script, {ticker}};
}

ScriptCall preprocess_call(const Settings& settings, const std::string& ticker)
{
    const auto csv =
        data::series_path(settings.cache_dir, ticker, settings.series_ext);
    return ScriptCall{"Preprocess", settings.preprocess_script, {csv.string()}};
}

ScriptCall predict_call(const Settings& settings)
{
    return ScriptCall{"Model", settings.predict_script, {}};
}

proc::Outcome run_script(const Settings& settings, const ScriptCall& call)
{
    std::error_code ec;
    if (!std::filesystem::exists(call.script, ec)) {
        proc::Outcome missing =
            proc::LaunchFailure{"script not found: " + call.script.string()};
        log_outcome(call, missing);
        return missing;
    }

    std::vector<std::string> argv;
    argv.reserve(call.args.size() + 1);
    argv.push_back(call.script.string());
    argv.insert(argv.end(), call.args.begin(), call.args.end());

    spdlog::info("running {}", proc::describe_command(settings.interpreter, argv));
    proc::Outcome outcome = proc::invoke(settings.interpreter, argv);
    log_outcome(call, outcome);
    return outcome;
}

std::string describe_download(const std::string& ticker,
                              const ScriptCall& call,
                              const proc::Outcome& outcome)
{
    return describe_outcome(call, outcome, [&](const std::string&) {
        return "Downloaded data for " + ticker;
    });
}

std::string describe_preprocess(const std::string& ticker,
                                const ScriptCall& call,
                                const proc::Outcome& outcome)
{
    return describe_outcome(call, outcome, [&](const std::string&) {
        return "Preprocess OK for " + ticker;
    });
}

std::string describe_predict(const std::string& ticker,
                             const ScriptCall& call,
                             const proc::Outcome& outcome)
{
    return describe_outcome(call, outcome, [&](const std::string& out) {
        return "ML Prediction for " + ticker + ": " + trim_copy(out);
    });
}

std::string download(const Settings& settings, const std::string& ticker)
{
    const auto call = download_call(settings, ticker);
    return describe_download(ticker, call, run_script(settings, call));
}

std::string preprocess(const Settings& settings, const std::string& ticker)
{
    const auto call = preprocess_call(settings, ticker);
    return describe_preprocess(ticker, call, run_script(settings, call));
}

std::string predict(const Settings& settings, const std::string& ticker)
{
    const auto call = predict_call(settings);
    return describe_predict(ticker, call, run_script(settings, call));
}

} // namespace actions
