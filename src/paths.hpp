#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

namespace stockdash::platform {

inline constexpr const char* kAppDirName = "stockdash";

inline bool env_path(const char* name, std::filesystem::path* out)
{
    if (!name || !out) return false;
    const char* value = std::getenv(name);
    if (!value || !*value) return false;
    *out = std::filesystem::path(value);
    return true;
}

// XDG base dir lookup: $<xdg_var>, else $HOME/<home_suffix> (or
// ~/Library/Application Support on macOS)
inline std::filesystem::path xdg_home(const char* xdg_var,
                                      const char* home_suffix,
                                      const char* what,
                                      std::string* err)
{
    namespace fs = std::filesystem;

    fs::path base;
    if (env_path(xdg_var, &base)) return base;

    if (env_path("HOME", &base)) {
#if defined(__APPLE__)
        (void)home_suffix;
        return base / "Library" / "Application Support";
#else
        return base / home_suffix;
#endif
    }

    if (err) {
        *err = std::string("Neither ") + xdg_var +
               " nor HOME is set; cannot resolve " + what;
    }
    return {};
}

inline std::filesystem::path config_home(std::string* err)
{
    return xdg_home("XDG_CONFIG_HOME", ".config", "config path", err);
}

inline std::filesystem::path data_home(std::string* err)
{
    return xdg_home("XDG_DATA_HOME", ".local/share", "log location", err);
}

inline std::filesystem::path default_log_path(std::string* err)
{
    const auto base = data_home(err);
    if (base.empty()) return {};
    return base / kAppDirName / "stockdash.log";
}

} // namespace stockdash::platform
