/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_LOGGER_HPP
#define TURBO_CBOR_LOGGER_HPP

#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <typeinfo>
#include <tc/common/error.hpp>
#include <tc/common/format.hpp>

namespace turbo_cbor::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    // whether a message of the given level reaches at least one sink
    extern bool enabled(level lev);
    extern void log(level lev, const std::string &msg);

    // formats the message only when its level is enabled, the format string is checked at compile time
    template<typename... Args>
    void log(const level lev, fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        if (enabled(lev))
            log(lev, fmt::format(fmt_str, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::trace, fmt_str, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::debug, fmt_str, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::info, fmt_str, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::warn, fmt_str, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::error, fmt_str, std::forward<Args>(a)...);
    }

    using action = std::function<void()>;
    using optional_action = std::optional<action>;

    // runs main, logs the exception if any, then runs cleanup and returns the exception
    inline std::exception_ptr run_log_errors(const action &main, const optional_action &cleanup={},
            const std::source_location &loc=std::source_location::current())
    {
        std::exception_ptr cur_ex {};
        try {
            main();
        } catch (const std::exception &ex) {
            cur_ex = std::current_exception();
            logger::error("block at {}:{} failed with {}: {}", loc.file_name(), loc.line(), typeid(ex).name(), ex.what());
        }
        if (cleanup)
            (*cleanup)();
        return cur_ex;
    }

    inline void run_log_errors_rethrow(const action &main, const optional_action &cleanup={},
        const std::source_location &loc=std::source_location::current())
    {
        if (const auto cur_ex = run_log_errors(main, cleanup, loc))
            std::rethrow_exception(cur_ex);
    }
}

#endif // !TURBO_CBOR_LOGGER_HPP
