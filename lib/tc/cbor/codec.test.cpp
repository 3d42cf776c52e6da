/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <stdexcept>
#include <tc/common/test.hpp>
#include <tc/cbor.hpp>

using namespace turbo_cbor;
using namespace turbo_cbor::cbor;

namespace {
    value decode_hex(arena &a, const std::string_view hex)
    {
        const auto data = uint8_vector::from_hex(hex);
        const auto res = decode(a, data);
        test_same(std::string { hex }, res.next_pos, data.size());
        return res.val;
    }

    value bin(const std::string_view s)
    {
        return value::bytes(buffer { s });
    }

    struct point: encodable {
        uint64_t x;
        uint64_t y;

        point(const uint64_t x_, const uint64_t y_): x { x_ }, y { y_ }
        {
        }

        void to_cbor(encoder &enc) const override
        {
            enc.array(2).uint(x).uint(y);
        }
    };
}

suite cbor_codec_test = [] {
    "cbor::codec"_test = [] {
        "integers"_test = [] {
            arena a {};
            const auto data = uint8_vector::from_hex("1a000f4240");
            const auto res = decode(a, data);
            test_same(res.val.uint(), 1000000);
            test_same(res.next_pos, 5);
            test_same(decode_hex(a, "3903e7").integer(), -1000);
            test_same(decode_hex(a, "3bffffffffffffffff").nint_raw(), 0xFFFFFFFFFFFFFFFFULL);
            test_hex(encode(value::integer(-1000)), "3903e7");
        };
        "decode from an offset"_test = [] {
            arena a {};
            const auto data = uint8_vector::from_hex("0102181903");
            const auto res = decode(a, data, 2);
            test_same(res.val.uint(), 25);
            test_same(res.next_pos, 4);
        };
        "canonical round trip"_test = [] {
            for (const auto hex: {
                    "00", "01", "0a", "17", "1818", "1819", "1864", "1903e8", "1a000f4240", "1b000000e8d4a51000",
                    "1bffffffffffffffff", "3bffffffffffffffff", "20", "29", "3863", "3903e7",
                    "f90000", "f98000", "f93c00", "fb3ff199999999999a", "f93e00", "f97bff", "fa47c35000", "fa7f7fffff",
                    "fb7e37e43c8800759c", "f90001", "f90400", "f9c400", "fbc010666666666666", "f97c00", "f9fc00",
                    "fa7f800000", "faff800000", "fb7ff0000000000000", "fbfff0000000000000",
                    "f4", "f5", "f6", "f7", "f0", "f818", "f8ff",
                    "c074323031332d30332d32315432303a30343a30305a", "c11a514b67b0", "c1fb41d452d9ec200000",
                    "d74401020304", "d818456449455446", "d82076687474703a2f2f7777772e6578616d706c652e636f6d",
                    "c249010000000000000000", "c349010000000000000000",
                    "40", "4401020304", "60", "6161", "6449455446", "62225c", "62c3bc", "63e6b0b4", "64f0908591",
                    "80", "83010203", "8301820203820405",
                    "98190102030405060708090a0b0c0d0e0f101112131415161718181819",
                    "a0", "a201020304", "a26161016162820203", "826161a161626163",
                    "a56161614161626142616361436164614461656145" }) {
                arena a {};
                const auto data = uint8_vector::from_hex(hex);
                const auto v = decode_hex(a, hex);
                test_same(hex, encode(v), data);
            }
        };
        "indefinite items"_test = [] {
            arena a {};
            test_same(decode_hex(a, "7f657374726561646d696e67ff").text(), std::string { "streaming" });
            test_hex(decode_hex(a, "5f42010243030405ff").bytes(), "0102030405");
            test_same(decode_hex(a, "5fff").bytes(), uint8_vector {});
            expect(decode_hex(a, "9fff") == a.array());
            expect(decode_hex(a, "9f018202039f0405ffff")
                == a.array({ value::uint(1), a.array({ value::uint(2), value::uint(3) }), a.array({ value::uint(4), value::uint(5) }) }));
            expect(decode_hex(a, "bf61610161629f0203ffff")
                == a.map({ { value::text("a"), value::uint(1) }, { value::text("b"), a.array({ value::uint(2), value::uint(3) }) } }));
            expect(decode_hex(a, "bf6346756ef563416d7421ff")
                == a.map({ { value::text("Fun"), value::boolean(true) }, { value::text("Amt"), value::integer(-2) } }));
            test_hex(encode(decode_hex(a, "9f01ff")), "8101");
        };
        "break ends a definite array"_test = [] {
            arena a {};
            const auto data = uint8_vector::from_hex("830102ff");
            const auto res = decode(a, data);
            expect(res.val == a.array({ value::uint(1), value::uint(2) }));
            test_same(res.next_pos, 4);
            test_same(decode(a, uint8_vector::from_hex("a201020304ff")).val.map().size(), 2);
        };
        "minimal float width"_test = [] {
            test_hex(encode(value::float64(1.5)), "F93E00");
            test_hex(encode(value::float64(100000.0)), "FA47C35000");
            test_hex(encode(value::float64(1e300)), "FB7E37E43C8800759C");
            test_hex(encode(value::float64(5.960464477539063e-8)), "F90001");
            test_hex(encode(value::float64(0.00006103515625)), "F90400");
            test_hex(encode(value::float64(-4.0)), "F9C400");
            test_hex(encode(value::float64(-4.1)), "FBC010666666666666");
            test_same(encode(value::float64(std::numeric_limits<double>::infinity())), uint8_vector::from_hex("F97C00"));
            test_hex(encode(value::float_fixed(1.5, float_width::dbl)), "FB3FF8000000000000");
        };
        "NaN"_test = [] {
            const auto nan = encode(value::float64(std::numeric_limits<double>::quiet_NaN()));
            test_same(nan.size(), 3);
            test_same(nan[0], 0xF9);
            // the sign of a NaN is platform specific
            test_same(nan[1] & 0x7F, 0x7E);
            test_same(nan[2], 0x00);
            arena a {};
            const auto v = decode_hex(a, "f97e00");
            expect(std::isnan(v.flt().val));
            test_same(v.flt().width, float_width::half);
        };
        "NaN payloads"_test = [] {
            arena a {};
            for (const auto *hex: { "F97C01", "F9FE01", "FA7F800001", "FA7FC00001", "FAFF800001", "FB7FF0000000000001", "FB7FF8000000000001" }) {
                const auto v = decode_hex(a, hex);
                expect(std::isnan(v.flt().val));
                test_same(std::string { hex }, encode(v), uint8_vector::from_hex(hex));
            }
            expect(decode_hex(a, "FA7F800001") == decode_hex(a, "FA7F800001"));
            expect(decode_hex(a, "FA7F800001") != decode_hex(a, "FA7F800002"));
            expect(decode_hex(a, "F97C01") != decode_hex(a, "F97E00"));
        };
        "simple values"_test = [] {
            arena a {};
            test_same(decode_hex(a, "f0").simple(), 16);
            test_same(decode_hex(a, "f818").simple(), 24);
            test_same(decode_hex(a, "f8ff").simple(), 255);
            test_hex(encode(value::simple(16)), "F0");
            test_hex(encode(value::simple(24)), "F818");
            test_hex(encode(value::simple(255)), "F8FF");
            expect(throws<unencodable_error>([] { encode(value::simple(21)); }));
            expect(decode_hex(a, "f7") == value::undefined());
            expect(decode_hex(a, "ff").is_break());
        };
        "unknown tag passthrough"_test = [] {
            arena a {};
            const auto v = decode_hex(a, "DA499602D200");
            test_same(v.type(), value_type::tag);
            test_same(v.tag().id, 1234567890);
            expect(*v.tag().inner == value::uint(0));
            test_hex(encode(v), "DA499602D200");
            test_same(encode(value::tagged(1234567890, value::uint(0))), uint8_vector::from_hex("DA499602D200"));
        };
        "semantic tags"_test = [] {
            arena a {};
            expect(decode_hex(a, "C074323031332D30332D32315432303A30343A30305A") == value::semantic("_datetime", value::text("2013-03-21T20:04:00Z")));
            expect(decode_hex(a, "C24A01020304050607080910") == value::semantic("_pbignum", value::bytes(uint8_vector::from_hex("01020304050607080910"))));
            expect(decode_hex(a, "C4820103") == value::semantic("_decimalfraction", a.array({ value::uint(1), value::uint(3) })));
            expect(decode_hex(a, "C5822003") == value::semantic("_bigfloat", a.array({ value::integer(-1), value::uint(3) })));
            expect(decode_hex(a, "D825506BA7B8119DAD11D180B400C04FD430C8") == value::semantic("_uuid", value::bytes(uint8_vector::from_hex("6BA7B8119DAD11D180B400C04FD430C8"))));
            expect(decode_hex(a, "d8268262656E6548656C6C6F") == value::semantic("_language", a.array({ value::text("en"), value::text("Hello") })));
            expect(decode_hex(a, "d8268262667267426F6E6A6F7572") == value::semantic("_language", a.array({ value::text("fr"), value::text("Bonjour") })));
            expect(decode_hex(a, "D82768696F2E737464696E") == value::semantic("_id", value::text("io.stdin")));
            expect(decode_hex(a, "D901014401020304") == value::semantic("_bmime", value::bytes(uint8_vector::from_hex("01020304"))));
            expect(decode_hex(a, "D90108824A0102030405060708090A03") == value::semantic("_decimalfractionexp",
                a.array({ value::bytes(uint8_vector::from_hex("0102030405060708090A")), value::uint(3) })));
            expect(decode_hex(a, "D90109824A0102030405060708090A03") == value::semantic("_bigfloatexp",
                a.array({ value::bytes(uint8_vector::from_hex("0102030405060708090A")), value::uint(3) })));
            expect(decode_hex(a, "D95652820102") == value::semantic("_indirection", a.array({ value::uint(1), value::uint(2) })));
            expect(decode_hex(a, "d81e820103") == value::semantic("_rational", a.array({ value::uint(1), value::uint(3) })));
            expect(decode_hex(a, "d81a826c4d793a3a4461746554696d651a00bc614e") == value::semantic("_perlobj",
                a.array({ value::text("My::DateTime"), value::uint(12345678) })));
            expect(decode_hex(a, "D9010444C0A80001") == value::semantic("_ipaddress", value::bytes(uint8_vector::from_hex("C0A80001"))));
            for (const auto hex: {
                    "C074323031332D30332D32315432303A30343A30305A", "C4820103", "C5822003", "D825506BA7B8119DAD11D180B400C04FD430C8",
                    "D8268262656E6548656C6C6F", "D82768696F2E737464696E", "D901014401020304", "D90108824A0102030405060708090A03",
                    "D95652820102", "D81E820103", "D81A826C4D793A3A4461746554696D651A00BC614E" }) {
                arena ra {};
                test_same(hex, encode(decode_hex(ra, hex)), uint8_vector::from_hex(hex));
            }
        };
        "magic and rains"_test = [] {
            arena a {};
            const auto magic = uint8_vector::from_hex("D9D9F7");
            const auto res = decode(a, magic);
            expect(res.val == value::semantic("_magic_cbor", value::null()));
            test_same(res.next_pos, 3);
            test_same(encode(value::semantic("_magic_cbor", value::null())), magic);
            const auto items = decode_all(a, uint8_vector::from_hex("D9D9F78101"));
            test_same(items.size(), 2);
            expect(items.at(0).is_semantic("_magic_cbor"));
            expect(items.at(1) == a.array({ value::uint(1) }));
            test_same(encode(value::semantic("_rains", a.map())), uint8_vector::from_hex("DA00E99BA8A0"));
            expect(decode_hex(a, "DA00E99BA8A0").is_semantic("_rains"));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("DA00E99BA801")); }));
        };
        "tag mismatch"_test = [] {
            arena a {};
            try {
                decode(a, uint8_vector::from_hex("8101C001"));
                expect(false);
            } catch (const tag_mismatch_error &ex) {
                test_same(ex.pos(), 2);
                test_same(ex.expected(), std::string { "text" });
                test_same(ex.actual(), std::string { "uint" });
            }
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("C26161")); }));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("C48101")); }));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("C482616101")); }));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("D8254401020304")); }));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("D81E820100")); }));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("D81A80")); }));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("D826816161")); }));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("D9010443010203")); }));
            expect(throws<unencodable_error>([] { encode(value::semantic("_datetime", value::uint(1))); }));
            expect(throws<unencodable_error>([] { encode(value::semantic("_no_such_tag", value::uint(1))); }));
        };
        "shared containers"_test = [] {
            arena a {};
            const auto v = decode_hex(a, "83d81c80d81d0080");
            const auto &items = v.array();
            test_same(items.size(), 3);
            expect(items[0].identity() == items[1].identity());
            expect(items[0].identity() != items[2].identity());
            expect(items[0] == items[2]);
            test_hex(encode(v, { .shared_refs=true }), "D81C83D81C80D81D01D81C80");
            test_hex(encode(v), "83808080");
        };
        "self reference"_test = [] {
            arena a {};
            const auto v = decode_hex(a, "d81c81d81d00");
            expect(v.array().at(0).identity() == v.identity());
            const auto t = a.array();
            t.array().emplace_back(t);
            test_hex(encode(t, { .shared_refs=true }), "D81C81D81D00");
            expect(throws<unencodable_error>([&] { encode(t); }));
            expect(v == t);
            const auto m = a.map();
            m.map().emplace_back(value::text("self"), m);
            const auto m_bytes = encode(m, { .shared_refs=true });
            const auto m2 = decode(a, m_bytes).val;
            expect(m2.map().at(0).second.identity() == m2.identity());
        };
        "bad references"_test = [] {
            arena a {};
            try {
                decode(a, uint8_vector::from_hex("82d81c80d81d05"));
                expect(false);
            } catch (const bad_reference_error &ex) {
                test_same(ex.pos(), 4);
            }
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("d81c01")); }));
            expect(throws<tag_mismatch_error>([&] { decode(a, uint8_vector::from_hex("d81d6161")); }));
            expect(throws<bad_reference_error>([&] { decode(a, uint8_vector::from_hex("d81900")); }));
            expect(throws<bad_reference_error>([&] { decode(a, uint8_vector::from_hex("d9010082d81900d81900")); }));
        };
        "string references"_test = [] {
            arena a {};
            const auto expected = a.array({
                a.map({ { bin("rank"), value::uint(4) }, { bin("count"), value::uint(417) }, { bin("name"), bin("Cocktail") } }),
                a.map({ { bin("name"), bin("Bath") }, { bin("count"), value::uint(312) }, { bin("rank"), value::uint(4) } }),
                a.map({ { bin("name"), bin("Food") }, { bin("count"), value::uint(691) }, { bin("rank"), value::uint(4) } })
            });
            const std::string_view hex = "d9010083a34472616e6b0445636f756e741901a1446e616d6548436f636b7461696ca3d819024442617468d81901190138d8190004a3d8190244466f6f64d819011902b3d8190004";
            expect(decode_hex(a, hex) == expected);
            test_same(encode(expected, { .string_refs=true }), uint8_vector::from_hex(hex));
        };
        "string reference thresholds"_test = [] {
            arena a {};
            std::vector<value> items {};
            for (const auto s: { "1", "222", "333", "4", "555", "666", "777", "888", "999",
                    "aaa", "bbb", "ccc", "ddd", "eee", "fff", "ggg", "hhh", "iii",
                    "jjj", "kkk", "lll", "mmm", "nnn", "ooo", "ppp", "qqq", "rrr",
                    "ssss", "333", "qqq", "rrr", "ssss" })
                items.emplace_back(bin(s));
            const auto expected = a.array(std::move(items));
            const std::string_view hex = "d9010098204131433232324333333341344335353543363636433737374338383843393939436161614362626243636363436464644365656543666666436767674368686843696969436a6a6a436b6b6b436c6c6c436d6d6d436e6e6e436f6f6f4370707043717171437272724473737373d81901d8191743727272d8191818";
            expect(decode_hex(a, hex) == expected);
            test_same(encode(expected, { .string_refs=true }), uint8_vector::from_hex(hex));
        };
        "nested string scopes"_test = [] {
            arena a {};
            const std::string_view hex = "d901008563616161d81900d90100836362626263616161d81901d901008263636363d81900d81900";
            const auto aaa = value::text("aaa");
            expect(decode_hex(a, hex) == a.array({ aaa, aaa,
                a.array({ value::text("bbb"), aaa, aaa }), a.array({ value::text("ccc"), value::text("ccc") }), aaa }));
            const auto v = a.array({ aaa, aaa,
                value::semantic("_stringref", a.array({ value::text("bbb"), aaa, aaa })),
                value::semantic("_stringref", a.array({ value::text("ccc"), value::text("ccc") })), aaa });
            test_same(encode(v, { .string_refs=true }), uint8_vector::from_hex(hex));
        };
        "string references shrink the output"_test = [] {
            arena a {};
            const auto v = a.array({ value::text("hello"), value::text("hello"), value::text("hello") });
            const auto plain = encode(v);
            const auto packed = encode(v, { .string_refs=true });
            expect(packed.size() < plain.size());
            const auto back = decode(a, packed).val;
            test_same(back.array().size(), 3);
            for (const auto &item: back.array())
                expect(item == value::text("hello"));
        };
        "shared and string references together"_test = [] {
            arena a {};
            const auto hoade = a.array({ value::text("first"), value::text("Sean"), value::text("last"), value::text("Hoade"),
                value::text("occupation"), value::text("writer") });
            const auto conner = a.array({ value::text("first"), value::text("Sean"), value::text("last"), value::text("Conner"),
                value::text("occupation"), value::text("programmer") });
            const auto v = a.array({ hoade, hoade, hoade, conner, conner, conner });
            const std::string_view hex = "D90100D81C86D81C86656669727374645365616E646C61737465486F6164656A6F636375706174696F6E66777269746572D81D01D81D01D81C86D81900D81901D8190266436F6E6E6572D819046A70726F6772616D6D6572D81D02D81D02";
            test_same(encode(v, { .shared_refs=true, .string_refs=true }), uint8_vector::from_hex(hex));
            const auto back = decode_hex(a, hex);
            expect(back == v);
            const auto &items = back.array();
            expect(items[0].identity() == items[2].identity());
            expect(items[3].identity() == items[5].identity());
            expect(items[0].identity() != items[3].identity());

            const auto hoade2 = a.map({ { value::text("first"), value::text("Sean") }, { value::text("last"), value::text("Hoade") },
                { value::text("occupation"), value::text("writer") } });
            const auto conner2 = a.map({ { value::text("first"), value::text("Sean") }, { value::text("last"), value::text("Conner") },
                { value::text("occupation"), value::text("programmer") } });
            const auto v2 = a.array({ hoade2, hoade2, hoade2, conner2, conner2, conner2 });
            expect(decode(a, encode(v2, { .shared_refs=true, .string_refs=true })).val == v2);
        };
        "round trip"_test = [] {
            arena a {};
            const auto v = a.map({
                { value::text("ints"), a.array({ value::uint(0), value::uint(0xFFFFFFFFFFFFFFFFULL), value::integer(-1), value::nint(0xFFFFFFFFFFFFFFFFULL) }) },
                { value::text("floats"), a.array({ value::float64(1.5), value::float64(100000.0), value::float64(1e300), value::float64(-0.0) }) },
                { value::uint(7), value::bytes(uint8_vector::from_hex("DEADBEEF")) },
                { a.array(), a.map() },
                { value::boolean(false), value::null() },
                { value::undefined(), value::simple(99) },
                { value::text("tags"), value::tagged(99999, value::semantic("_url", value::text("http://example.com"))) },
                { value::text("unicode"), value::text("\xC3\xBC\xE2\x82\xAC\xF0\x9F\x98\x80") }
            });
            for (const auto &opts: { encode_options {}, encode_options { .shared_refs=true }, encode_options { .string_refs=true },
                    encode_options { .shared_refs=true, .string_refs=true } }) {
                arena ra {};
                expect(decode(ra, encode(v, opts)).val == v);
            }
        };
        "table inference"_test = [] {
            arena a {};
            test_hex(encode(a.table({})), "A0");
            test_same(encode(a.table({ { value::uint(1), value::text("a") }, { value::uint(2), value::text("b") } })), uint8_vector::from_hex("8261616162"));
            test_same(encode(a.table({ { value::uint(2), value::text("b") } })), uint8_vector::from_hex("A1026162"));
        };
        "custom values"_test = [] {
            arena a {};
            test_same(encode(value::custom(std::make_shared<point>(1, 2))), uint8_vector::from_hex("820102"));
            test_same(encode(a.array({ value::custom(std::make_shared<point>(3, 4)), value::null() })), uint8_vector::from_hex("82820304F6"));
        };
        "unencodable"_test = [] {
            expect(throws<unencodable_error>([] { encode(value::text(std::string_view { "\xC3\x28" })); }));
            expect(throws<precision_loss_error>([] { encode(value::float_fixed(1.1, float_width::half)); }));
            expect(throws<range_error>([] { encode(value::float_fixed(1e10, float_width::half)); }));
        };
        "try_decode"_test = [] {
            arena a {};
            const auto ok = try_decode(a, uint8_vector::from_hex("8101"));
            expect(static_cast<bool>(ok));
            test_same(ok.result->next_pos, 2);
            const auto bad = try_decode(a, uint8_vector::from_hex("820162FF"));
            expect(!bad);
            test_same(bad.error_pos, 2);
            expect(!bad.error.empty());
            const auto refs = try_decode(a, uint8_vector::from_hex("d81d00"));
            expect(!refs);
            test_same(refs.error_pos, 0);
            register_tag(80010, "_failing_hook", {}, [](const uint64_t, const value &, const size_t) -> value {
                throw std::runtime_error { "the hook has failed" };
            });
            const auto hooked = try_decode(a, uint8_vector::from_hex("00DA0001388A00"), 1);
            expect(!hooked);
            test_same(hooked.error, std::string { "the hook has failed" });
            test_same(hooked.error_pos, 1);
        };
        "decode_all"_test = [] {
            arena a {};
            const auto items = decode_all(a, uint8_vector::from_hex("0161616180"));
            test_same(items.size(), 3);
            expect(items.at(0) == value::uint(1));
            expect(items.at(1) == value::text("a"));
            expect(items.at(2) == a.array());
            test_same(decode_all(a, uint8_vector {}).size(), 0);
            expect(throws<malformed_header_error>([&] { decode_all(a, uint8_vector::from_hex("0119")); }));
        };
        "encode into an existing encoder"_test = [] {
            encoder enc {};
            enc.array(2).uint(1);
            encode(enc, value::text("a"));
            test_hex(enc.cbor(), "82016161");
        };
    };
};
