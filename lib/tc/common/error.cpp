/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <typeinfo>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <tc/logger.hpp>

namespace turbo_cbor {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skips the frames of safe_dump_to and of the constructors
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    std::string base_error::stacktrace() const
    {
        thread_local std::array<char, 0x2000> buf {};
        boost::interprocess::obufferstream os { buf.data(), buf.size() };
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
        // a trace longer than the buffer is cut off
        const auto written = os.tellp();
        if (written <= 0)
            return { buf.data(), os.good() ? 0 : buf.size() };
        return { buf.data(), static_cast<size_t>(written) };
    }

    const char *base_error::what() const noexcept
    {
        if (!_trace_logged) {
            _trace_logged = true;
            logger::debug("stacktrace of '{}': {}", _msg, stacktrace());
        }
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause)
        : error { fmt::format("{} caused by {}: {}", msg, typeid(cause).name(), cause.what()) }
    {
    }
}
