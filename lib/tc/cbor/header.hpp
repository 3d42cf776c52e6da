/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_HEADER_HPP
#define TURBO_CBOR_CBOR_HEADER_HPP

#include <tc/common/bytes.hpp>
#include <tc/cbor/types.hpp>

namespace turbo_cbor::cbor {
    static constexpr uint8_t info_indefinite = 31;

    struct header {
        major_type type = major_type::uint;
        // the low five bits of the initial byte
        uint8_t info = 0;
        // the argument: the immediate value, the length, the count, the tag id, or the raw float bits
        uint64_t val = 0;
        // the number of bytes occupied by the header itself
        size_t size = 1;

        bool indefinite() const noexcept
        {
            return info == info_indefinite && type != major_type::simple;
        }

        bool is_break() const noexcept
        {
            return info == info_indefinite && type == major_type::simple;
        }

        bool is_float() const noexcept
        {
            return type == major_type::simple && info >= 25 && info <= 27;
        }

        float_width width() const;
        double float_value() const;
    };

    // pos is the 0-based offset of the initial byte within data
    extern header decode_header(buffer data, size_t pos);
    extern void encode_header(uint8_vector &out, major_type type, uint64_t val);
}

namespace fmt {
    template<>
    struct formatter<turbo_cbor::cbor::header>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "header(type: {} info: {} val: {} size: {})", v.type, v.info, v.val, v.size);
        }
    };
}

#endif // !TURBO_CBOR_CBOR_HEADER_HPP
