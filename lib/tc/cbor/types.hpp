/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_TYPES_HPP
#define TURBO_CBOR_CBOR_TYPES_HPP

#include <cstdint>
#include <tc/common/format.hpp>

namespace turbo_cbor::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    enum class float_width: uint8_t {
        half = 2,
        single = 4,
        dbl = 8
    };

    // the well-known tag ids the codec itself must recognize
    namespace tag_id {
        static constexpr uint64_t datetime = 0;
        static constexpr uint64_t epoch = 1;
        static constexpr uint64_t pbignum = 2;
        static constexpr uint64_t nbignum = 3;
        static constexpr uint64_t nthstring = 25;
        static constexpr uint64_t shareable = 28;
        static constexpr uint64_t sharedref = 29;
        static constexpr uint64_t stringref = 256;
        static constexpr uint64_t magic_cbor = 55799;
    }
}

namespace fmt {
    template<>
    struct formatter<turbo_cbor::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using turbo_cbor::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<turbo_cbor::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using turbo_cbor::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<turbo_cbor::cbor::float_width>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using turbo_cbor::cbor::float_width;
            switch (v) {
                case float_width::half: return fmt::format_to(ctx.out(), "half");
                case float_width::single: return fmt::format_to(ctx.out(), "single");
                case float_width::dbl: return fmt::format_to(ctx.out(), "double");
                default: return fmt::format_to(ctx.out(), "float_width: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TURBO_CBOR_CBOR_TYPES_HPP
