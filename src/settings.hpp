#pragma once
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "paths.hpp"
#include "text.hpp"

struct Settings {
    // defaults -> relative to the working directory
    std::filesystem::path accounts_file = "account_summary.csv";
    std::filesystem::path trades_file = "trading_history.csv";
    std::filesystem::path cache_dir = "pre_stock";
    std::string series_ext = "csv";
    int close_column = 4;

    std::string interpreter = "python3";
    std::filesystem::path download_script = "download_stock.py";
    std::filesystem::path preprocess_script = "ml/preprocess.py";
    std::filesystem::path predict_script = "ml/model.py";

    int poll_ms = 300;
    std::filesystem::path log_file; // empty -> platform default
};

inline constexpr int kMinPollMs = 10;
inline constexpr int kMaxPollMs = 5000;

inline std::filesystem::path stockdash_config_path(std::string* err)
{
    try {
        const auto base = stockdash::platform::config_home(err);
        if (base.empty()) return {};
        return base / stockdash::platform::kAppDirName / "config.ini";
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return {};
    }
}

inline std::string strip_series_ext(std::string value)
{
    while (!value.empty() && value.front() == '.') value.erase(0, 1);
    return value;
}

// Applies one key=value pair. Unknown keys are ignored; a known key with an
// unusable value appends to *problems and leaves the default in place.
inline void apply_setting(Settings& s,
                          const std::string& key,
                          const std::string& raw,
                          std::vector<std::string>* problems)
{
    auto bad = [&](const char* why) {
        if (problems) problems->push_back(key + ": " + why + " '" + raw + "'");
    };

    if (key == "accounts_file") {
        if (raw.empty()) return bad("empty path");
        s.accounts_file = raw;
    }
    else if (key == "trades_file") {
        if (raw.empty()) return bad("empty path");
        s.trades_file = raw;
    }
    else if (key == "cache_dir") {
        if (raw.empty()) return bad("empty path");
        s.cache_dir = raw;
    }
    else if (key == "series_ext") {
        // kept as written: file extensions match case-sensitively
        const std::string ext = strip_series_ext(raw);
        if (ext.empty()) return bad("empty extension");
        s.series_ext = ext;
    }
    else if (key == "close_column") {
        int v = 0;
        if (!parse_int(raw, &v) || v < 0) return bad("not a column index");
        s.close_column = v;
    }
    else if (key == "interpreter") {
        if (raw.empty()) return bad("empty command");
        s.interpreter = raw;
    }
    else if (key == "download_script") {
        if (raw.empty()) return bad("empty path");
        s.download_script = raw;
    }
    else if (key == "preprocess_script") {
        if (raw.empty()) return bad("empty path");
        s.preprocess_script = raw;
    }
    else if (key == "predict_script" || key == "model_script") {
        if (raw.empty()) return bad("empty path");
        s.predict_script = raw;
    }
    else if (key == "poll_ms") {
        int v = 0;
        if (!parse_int(raw, &v)) return bad("not a number");
        s.poll_ms = std::clamp(v, kMinPollMs, kMaxPollMs);
    }
    else if (key == "log_file") {
        s.log_file = raw;
    }
}

inline bool load_settings_from(const std::filesystem::path& cfg,
                               Settings& s,
                               std::string* err)
{
    std::ifstream in(cfg, std::ios::binary);
    if (!in) {
        // no file yet -> defaults remain
        return true;
    }

    std::vector<std::string> problems;
    std::string line;
    while (std::getline(in, line)) {
        line = trim_copy(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = lower_copy(trim_copy(line.substr(0, eq)));
        const std::string val = trim_copy(line.substr(eq + 1));
        apply_setting(s, key, val, &problems);
    }

    if (problems.empty()) return true;

    if (err) {
        std::string msg = "invalid config values in " + cfg.string() + ": ";
        for (std::size_t i = 0; i < problems.size(); ++i) {
            if (i) msg += "; ";
            msg += problems[i];
        }
        *err = std::move(msg);
    }
    return false;
}

inline bool load_settings(Settings& s, std::string* err)
{
    try {
        std::string path_err;
        const auto cfg = stockdash_config_path(&path_err);
        if (cfg.empty()) {
            if (err) *err = path_err;
            return false;
        }
        return load_settings_from(cfg, s, err);
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}
