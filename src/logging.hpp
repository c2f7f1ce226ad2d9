#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "paths.hpp"

// The terminal belongs to ncurses, so logs only ever go to a file. When no
// file can be opened logging is switched off instead of leaking to stdout.
inline bool init_file_logging(std::filesystem::path file, std::string* err)
{
    namespace fs = std::filesystem;

    try {
        if (file.empty()) {
            std::string path_err;
            file = stockdash::platform::default_log_path(&path_err);
            if (file.empty()) {
                spdlog::set_level(spdlog::level::off);
                if (err) *err = path_err;
                return false;
            }
        }

        std::error_code ec;
        if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);
        if (ec) {
            spdlog::set_level(spdlog::level::off);
            if (err) {
                *err = "failed to create log directory '" +
                       file.parent_path().string() + "': " + ec.message();
            }
            return false;
        }

        auto logger = spdlog::basic_logger_mt("stockdash", file.string());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->flush_on(spdlog::level::info);
        spdlog::set_default_logger(std::move(logger));
        return true;
    }
    catch (const spdlog::spdlog_ex& e) {
        spdlog::set_level(spdlog::level::off);
        if (err) *err = e.what();
        return false;
    }
}
