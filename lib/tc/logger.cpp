/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <tc/logger.hpp>

namespace turbo_cbor::logger {
    namespace {
        struct settings {
            std::optional<std::string> path {};
            bool console = true;
            bool tracing = false;

            static settings from_env()
            {
                settings s {};
                if (const char *env_log_path = std::getenv("TC_LOG"); env_log_path)
                    s.path = env_log_path;
                s.console = std::getenv("TC_LOG_NO_CONSOLE") == nullptr;
                s.tracing = std::getenv("TC_DEBUG") != nullptr;
                return s;
            }
        };

        spdlog::level::level_enum native_level(const level lev)
        {
            switch (lev) {
                case level::trace: return spdlog::level::trace;
                case level::debug: return spdlog::level::debug;
                case level::info: return spdlog::level::info;
                case level::warn: return spdlog::level::warn;
                case level::error: return spdlog::level::err;
                default:
                    throw turbo_cbor::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
            }
        }

        spdlog::logger create(const settings &cfg)
        {
            std::vector<spdlog::sink_ptr> sinks {};
            if (cfg.console) {
                auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                console_sink->set_level(spdlog::level::info);
                console_sink->set_pattern("[%^%l%$] %v");
                sinks.emplace_back(std::move(console_sink));
            }
            if (cfg.path) {
                {
                    std::ofstream os { *cfg.path, std::ios_base::app };
                    if (!os) {
                        std::cerr << fmt::format("TC_INIT: Unable to write to the log file: {}; terminating.\n", *cfg.path);
                        std::terminate();
                    }
                }
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*cfg.path);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
                sinks.emplace_back(std::move(file_sink));
            }
            spdlog::logger logger { "tc", sinks.begin(), sinks.end() };
            logger.set_level(cfg.tracing ? spdlog::level::trace : spdlog::level::debug);
            logger.flush_on(spdlog::level::debug);
            return logger;
        }

        spdlog::logger &get()
        {
            static spdlog::logger logger = create(settings::from_env());
            return logger;
        }

        // the lowest level accepted by any sink, messages below it are dropped without formatting
        spdlog::level::level_enum sink_level(const spdlog::logger &logger)
        {
            auto min_level = spdlog::level::off;
            for (const auto &sink: logger.sinks())
                min_level = std::min(min_level, sink->level());
            return min_level;
        }
    }

    bool enabled(const level lev)
    {
        static const auto min_sink_level = sink_level(get());
        const auto native = native_level(lev);
        return get().should_log(native) && native >= min_sink_level;
    }

    void log(const level lev, const std::string &msg)
    {
        get().log(native_level(lev), msg);
    }
}
