/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <bit>
#include <cmath>
#include <limits>
#include <tc/common/test.hpp>
#include <tc/cbor/error.hpp>
#include <tc/cbor/float.hpp>

using namespace turbo_cbor;
using namespace turbo_cbor::cbor;

suite cbor_float_test = [] {
    "cbor::float"_test = [] {
        "from_half normal"_test = [] {
            const auto v = from_half(0x3E00);
            expect(!v.sign);
            test_same(v.exp, 0);
            test_same(v.frac, 0xC000000000000000ULL);
            test_same(decode_half(0x3E00), 1.5);
            test_same(decode_half(0xC400), -4.0);
            test_same(decode_half(0x7BFF), 65504.0);
        };
        "from_half subnormal"_test = [] {
            const auto v = from_half(0x0001);
            test_same(v.exp, -24);
            test_same(v.frac, 0x8000000000000000ULL);
            test_same(decode_half(0x0001), 5.960464477539063e-8);
            test_same(decode_half(0x0400), 0.00006103515625);
        };
        "from_half specials"_test = [] {
            expect(from_half(0x7C00).inf);
            expect(from_half(0xFC00).inf && from_half(0xFC00).sign);
            expect(from_half(0x7E00).nan);
            expect(from_half(0x0000).zero());
            expect(from_half(0x8000).zero() && from_half(0x8000).sign);
            expect(std::isinf(decode_half(0x7C00)));
            expect(std::isnan(decode_half(0x7E00)));
            expect(std::signbit(decode_half(0x8000)));
        };
        "to_half"_test = [] {
            uint16_t h = 0;
            expect(to_half(h, from_double(1.5)) == std::errc {});
            test_same(h, 0x3E00);
            expect(to_half(h, from_double(65504.0)) == std::errc {});
            test_same(h, 0x7BFF);
            expect(to_half(h, from_double(5.960464477539063e-8)) == std::errc {});
            test_same(h, 0x0001);
            expect(to_half(h, from_double(-0.0)) == std::errc {});
            test_same(h, 0x8000);
            expect(to_half(h, from_double(-std::numeric_limits<double>::infinity())) == std::errc {});
            test_same(h, 0xFC00);
            expect(to_half(h, from_double(std::numeric_limits<double>::quiet_NaN())) == std::errc {});
            test_same(h & 0x7FFF, 0x7E00);
        };
        "to_half failures"_test = [] {
            uint16_t h = 0;
            expect(to_half(h, from_double(65536.0)) == std::errc::result_out_of_range);
            expect(to_half(h, from_double(100000.0)) == std::errc::result_out_of_range);
            expect(to_half(h, from_double(65505.0)) == std::errc::argument_out_of_domain);
            expect(to_half(h, from_double(0.1)) == std::errc::argument_out_of_domain);
            expect(to_half(h, from_double(2.98023223876953125e-8)) == std::errc::result_out_of_range);
            // 1.5 * 2^-24 would need a bit below the smallest subnormal
            expect(to_half(h, from_double(8.940696716308594e-8)) == std::errc::argument_out_of_domain);
        };
        "NaN payloads"_test = [] {
            test_same(std::bit_cast<uint64_t>(decode_half(0x7C01)), 0x7FF0040000000000ULL);
            test_same(std::bit_cast<uint64_t>(decode_single(0x7F800001)), 0x7FF0000020000000ULL);
            test_same(std::bit_cast<uint64_t>(decode_single(0xFFC00001)), 0xFFF8000020000000ULL);
            test_same(encode_half(std::bit_cast<double>(0x7FF0040000000000ULL)), 0x7C01);
            test_same(encode_single(std::bit_cast<double>(0x7FF0000020000000ULL)), 0x7F800001U);
            test_same(encode_single(std::bit_cast<double>(0xFFF8000020000000ULL)), 0xFFC00001U);
            expect(throws<precision_loss_error>([] { encode_single(std::bit_cast<double>(0x7FF0000000000001ULL)); }));
            test_same(min_width(std::bit_cast<double>(0x7FF0000020000000ULL)), float_width::single);
        };
        "to_single"_test = [] {
            float f = 0;
            expect(to_single(f, from_double(100000.0)) == std::errc {});
            test_same(f, 100000.0F);
            expect(to_single(f, from_double(3.4028234663852886e+38)) == std::errc {});
            test_same(f, std::numeric_limits<float>::max());
            expect(to_single(f, from_double(1e300)) == std::errc::result_out_of_range);
            expect(to_single(f, from_double(-4.1)) == std::errc::argument_out_of_domain);
            expect(to_single(f, from_single(std::numeric_limits<float>::denorm_min())) == std::errc {});
            test_same(f, std::numeric_limits<float>::denorm_min());
        };
        "to_double"_test = [] {
            double d = 0;
            for (const double x: { 1.1, -4.1, 1e300, 1e-300, std::numeric_limits<double>::denorm_min(), std::numeric_limits<double>::max() }) {
                expect(to_double(d, from_double(x)) == std::errc {});
                test_same(d, x);
            }
            dnf v {};
            v.exp = 1024;
            v.frac = 0x8000000000000000ULL;
            expect(to_double(d, v) == std::errc::result_out_of_range);
        };
        "min_width"_test = [] {
            test_same(min_width(0.0), float_width::half);
            test_same(min_width(1.5), float_width::half);
            test_same(min_width(-4.0), float_width::half);
            test_same(min_width(65504.0), float_width::half);
            test_same(min_width(100000.0), float_width::single);
            test_same(min_width(3.4028234663852886e+38), float_width::single);
            test_same(min_width(1e300), float_width::dbl);
            test_same(min_width(-4.1), float_width::dbl);
            test_same(min_width(std::numeric_limits<double>::infinity()), float_width::half);
            test_same(min_width(std::numeric_limits<double>::quiet_NaN()), float_width::half);
        };
        "throwing wrappers"_test = [] {
            test_same(encode_half(1.5), 0x3E00);
            test_same(encode_single(100000.0), 0x47C35000U);
            expect(throws<range_error>([] { encode_half(100000.0); }));
            expect(throws<precision_loss_error>([] { encode_half(0.1); }));
            expect(throws<range_error>([] { encode_single(1e300); }));
            expect(throws<precision_loss_error>([] { encode_single(-4.1); }));
        };
    };
};
