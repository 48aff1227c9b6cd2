/* This file is part of Tessera project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <tessera/logger.hpp>

namespace tessera::logger {
    static std::mutex last_error_mutex {};
    static std::shared_ptr<std::string> last_error_ptr {};

    std::shared_ptr<std::string> last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        return last_error_ptr;
    }

    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("TESSERA_DEBUG") != nullptr;
        return enabled;
    }

    static std::string log_path()
    {
        const char *env_log_path = std::getenv("TESSERA_LOG");
        return env_log_path ? env_log_path : "./log/tessera.log";
    }

    static bool console_enabled()
    {
        return !std::getenv("TESSERA_LOG_NO_CONSOLE");
    }

    static bool file_writable(const std::string &path)
    {
        const std::filesystem::path fs_path { path };
        if (fs_path.has_parent_path()) {
            std::error_code ec {};
            std::filesystem::create_directories(fs_path.parent_path(), ec);
        }
        const std::ofstream os { path, std::ios_base::app };
        return static_cast<bool>(os);
    }

    // an embedding application must keep running even when the log file cannot be written
    static spdlog::logger create(const std::string &path)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        const bool have_file = file_writable(path);
        if (console_enabled() || !have_file) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (have_file) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        }
        spdlog::logger logger { "tessera", sinks.begin(), sinks.end() };
        logger.set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        if (!have_file)
            logger.warn("the log file {} is not writable, logging to the console only", path);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    void log(level lev, const std::string &msg)
    {
        switch (lev) {
            case level::trace:
                get().trace(msg);
                break;
            case level::debug:
                get().debug(msg);
                break;
            case level::info:
                get().info(msg);
                break;
            case level::warn:
                get().warn(msg);
                break;
            case level::error: {
                get().error(msg);
                std::scoped_lock lk { last_error_mutex };
                last_error_ptr = std::make_shared<std::string>(msg);
                break;
            }
            default:
                throw tessera::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}
