/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_COMMON_ERROR_HPP
#define TURBO_CBOR_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace turbo_cbor {
    // the root of all exceptions thrown by the library, it records the stack of the throw site
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        // logs the recorded stack at debug level on the first call
        const char *what() const noexcept override;
        std::string stacktrace() const;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
        mutable bool _trace_logged = false;
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        // keeps the type and the message of the exception that caused this one
        explicit error(std::string_view msg, const std::exception &cause);
    };
}

#endif // !TURBO_CBOR_COMMON_ERROR_HPP
