/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_FLOAT_HPP
#define TURBO_CBOR_CBOR_FLOAT_HPP

#include <cstdint>
#include <system_error>
#include <tc/cbor/types.hpp>

namespace turbo_cbor::cbor {
    /*
     * A width-independent representation of an IEEE-754 binary float.
     * For finite non-zero numbers frac has the leading one at bit 63 and exp is unbiased.
     * For NaNs frac carries the payload aligned the same way but without the leading one.
     * Zero is represented by frac == 0 with inf and nan unset.
     */
    struct dnf {
        bool sign = false;
        bool inf = false;
        bool nan = false;
        int exp = 0;
        uint64_t frac = 0;

        bool zero() const noexcept
        {
            return !inf && !nan && frac == 0;
        }

        bool operator==(const dnf &o) const noexcept =default;
    };

    extern dnf from_half(uint16_t h) noexcept;
    extern dnf from_single(float f) noexcept;
    extern dnf from_double(double d) noexcept;

    // return std::errc::result_out_of_range when the exponent does not fit
    // and std::errc::argument_out_of_domain when fraction bits would be lost
    extern std::errc to_half(uint16_t &h, const dnf &v) noexcept;
    extern std::errc to_single(float &f, const dnf &v) noexcept;
    extern std::errc to_double(double &d, const dnf &v) noexcept;

    // the narrowest width that represents the value exactly
    extern float_width min_width(double d) noexcept;

    // the raw IEEE-754 bits are returned and taken so that NaN payloads never pass through a native float
    extern uint16_t encode_half(double d);
    extern uint32_t encode_single(double d);
    extern double decode_half(uint16_t h) noexcept;
    extern double decode_single(uint32_t bits) noexcept;
}

namespace fmt {
    template<>
    struct formatter<turbo_cbor::cbor::dnf>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v.nan)
                return fmt::format_to(ctx.out(), "dnf({}nan frac: {:016X})", v.sign ? "-" : "+", v.frac);
            if (v.inf)
                return fmt::format_to(ctx.out(), "dnf({}inf)", v.sign ? "-" : "+");
            return fmt::format_to(ctx.out(), "dnf({} exp: {} frac: {:016X})", v.sign ? "-" : "+", v.exp, v.frac);
        }
    };
}

#endif // !TURBO_CBOR_CBOR_FLOAT_HPP
