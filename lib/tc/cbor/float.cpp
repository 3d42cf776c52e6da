/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstring>
#include <tc/cbor/error.hpp>
#include <tc/cbor/float.hpp>

namespace turbo_cbor::cbor {
    // FRAC_BITS and EXP_BITS are the IEEE-754 field widths: 10/5, 23/8 and 52/11
    template<typename U, int FRAC_BITS, int EXP_BITS>
    struct ieee_layout {
        static constexpr int shift = 63 - FRAC_BITS;
        static constexpr int exp_max_raw = (1 << EXP_BITS) - 1;
        static constexpr int bias = exp_max_raw >> 1;
        static constexpr int min_normal = 1 - bias;
        static constexpr int min_subnormal = min_normal - FRAC_BITS;
        static constexpr uint64_t top_bit = 0x8000000000000000ULL;
        static constexpr uint64_t frac_mask = (1ULL << FRAC_BITS) - 1;
        static constexpr uint64_t precision_mask = (1ULL << shift) - 1;

        static dnf decode(const U bits) noexcept
        {
            dnf v {};
            v.sign = (bits >> (FRAC_BITS + EXP_BITS)) & 1;
            const int raw_exp = static_cast<int>((bits >> FRAC_BITS) & exp_max_raw);
            v.frac = (static_cast<uint64_t>(bits) & frac_mask) << shift;
            if (raw_exp == exp_max_raw) {
                if (v.frac == 0)
                    v.inf = true;
                else
                    v.nan = true;
            } else if (raw_exp == 0) {
                // subnormal: renormalize so that the leading one is at bit 63
                if (v.frac != 0) {
                    v.exp = min_normal;
                    while ((v.frac & top_bit) == 0) {
                        v.frac <<= 1;
                        --v.exp;
                    }
                }
            } else {
                v.exp = raw_exp - bias;
                v.frac |= top_bit;
            }
            return v;
        }

        static std::errc encode(U &out, const dnf &v) noexcept
        {
            uint64_t bits = 0;
            if (v.inf) {
                bits = static_cast<uint64_t>(exp_max_raw) << FRAC_BITS;
            } else if (v.nan) {
                if ((v.frac & precision_mask) != 0)
                    return std::errc::argument_out_of_domain;
                auto payload = (v.frac >> shift) & frac_mask;
                if (payload == 0)
                    payload = 1ULL << (FRAC_BITS - 1);
                bits = (static_cast<uint64_t>(exp_max_raw) << FRAC_BITS) | payload;
            } else if (v.frac != 0) {
                if (v.exp < min_subnormal || v.exp > bias)
                    return std::errc::result_out_of_range;
                auto frac = v.frac;
                uint64_t raw_exp = 0;
                if (v.exp < min_normal) {
                    const int k = min_normal - v.exp;
                    if ((frac & ((1ULL << k) - 1)) != 0)
                        return std::errc::argument_out_of_domain;
                    frac >>= k;
                } else {
                    raw_exp = static_cast<uint64_t>(v.exp + bias);
                }
                if ((frac & precision_mask) != 0)
                    return std::errc::argument_out_of_domain;
                bits = (raw_exp << FRAC_BITS) | ((frac >> shift) & frac_mask);
            }
            if (v.sign)
                bits |= 1ULL << (FRAC_BITS + EXP_BITS);
            out = static_cast<U>(bits);
            return {};
        }
    };

    using half_layout = ieee_layout<uint16_t, 10, 5>;
    using single_layout = ieee_layout<uint32_t, 23, 8>;
    using double_layout = ieee_layout<uint64_t, 52, 11>;
    static_assert(sizeof(float) == sizeof(uint32_t));
    static_assert(sizeof(double) == sizeof(uint64_t));

    dnf from_half(const uint16_t h) noexcept
    {
        return half_layout::decode(h);
    }

    dnf from_single(const float f) noexcept
    {
        uint32_t bits;
        memcpy(&bits, &f, sizeof(bits));
        return single_layout::decode(bits);
    }

    dnf from_double(const double d) noexcept
    {
        uint64_t bits;
        memcpy(&bits, &d, sizeof(bits));
        return double_layout::decode(bits);
    }

    std::errc to_half(uint16_t &h, const dnf &v) noexcept
    {
        return half_layout::encode(h, v);
    }

    std::errc to_single(float &f, const dnf &v) noexcept
    {
        uint32_t bits;
        const auto err = single_layout::encode(bits, v);
        if (err == std::errc {})
            memcpy(&f, &bits, sizeof(f));
        return err;
    }

    std::errc to_double(double &d, const dnf &v) noexcept
    {
        uint64_t bits;
        const auto err = double_layout::encode(bits, v);
        if (err == std::errc {})
            memcpy(&d, &bits, sizeof(d));
        return err;
    }

    float_width min_width(const double d) noexcept
    {
        const auto v = from_double(d);
        uint16_t h;
        if (to_half(h, v) == std::errc {})
            return float_width::half;
        float f;
        if (to_single(f, v) == std::errc {})
            return float_width::single;
        return float_width::dbl;
    }

    [[noreturn]] static void _throw_conversion_error(const std::errc err, const double d, const float_width w)
    {
        switch (err) {
            case std::errc::result_out_of_range:
                throw range_error(fmt::format("the exponent of {} does not fit into a {} float", d, w));
            case std::errc::argument_out_of_domain:
                throw precision_loss_error(fmt::format("{} cannot be represented as a {} float without a loss of precision", d, w));
            default:
                throw error(fmt::format("unexpected float conversion error: {}", static_cast<int>(err)));
        }
    }

    uint16_t encode_half(const double d)
    {
        uint16_t h;
        if (const auto err = to_half(h, from_double(d)); err != std::errc {})
            _throw_conversion_error(err, d, float_width::half);
        return h;
    }

    uint32_t encode_single(const double d)
    {
        uint32_t bits;
        if (const auto err = single_layout::encode(bits, from_double(d)); err != std::errc {})
            _throw_conversion_error(err, d, float_width::single);
        return bits;
    }

    double decode_half(const uint16_t h) noexcept
    {
        double d = 0.0;
        // every half value is exactly representable as a double
        [[maybe_unused]] const auto err = to_double(d, from_half(h));
        return d;
    }

    double decode_single(const uint32_t bits) noexcept
    {
        double d = 0.0;
        [[maybe_unused]] const auto err = to_double(d, single_layout::decode(bits));
        return d;
    }
}
