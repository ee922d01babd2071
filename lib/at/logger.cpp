/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <at/common/error.hpp>
#include <at/logger.hpp>

namespace avro_turbo::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("AT_DEBUG") != nullptr;
        return enabled;
    }

    static std::optional<std::string> log_path()
    {
        if (const char *env_log_path = std::getenv("AT_LOG"); env_log_path && *env_log_path)
            return std::string { env_log_path };
        return {};
    }

    static bool console_enabled()
    {
        return !std::getenv("AT_LOG_NO_CONSOLE");
    }

    static spdlog::logger create(const std::optional<std::string> &path)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (console_enabled()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (path) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        }
        spdlog::logger logger { "at", sinks.begin(), sinks.end() };
        if (tracing_enabled()) {
            logger.set_level(spdlog::level::trace);
        } else {
            logger.set_level(spdlog::level::debug);
        }
        logger.flush_on(spdlog::level::debug);
        if (path)
            logger.debug("log file: {}", *path);
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
            case level::error:
                get().error(msg);
                break;
            default:
                throw avro_turbo::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}
