/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstring>
#include <limits>
#include <tc/cbor/error.hpp>
#include <tc/cbor/float.hpp>
#include <tc/cbor/header.hpp>

namespace turbo_cbor::cbor {
    float_width header::width() const
    {
        switch (info) {
            case static_cast<uint8_t>(special_val::two_bytes): return float_width::half;
            case static_cast<uint8_t>(special_val::four_bytes): return float_width::single;
            case static_cast<uint8_t>(special_val::eight_bytes): return float_width::dbl;
            default: throw error(fmt::format("{} does not describe a float", *this));
        }
    }

    double header::float_value() const
    {
        switch (width()) {
            case float_width::half:
                return decode_half(static_cast<uint16_t>(val));
            case float_width::single:
                return decode_single(static_cast<uint32_t>(val));
            case float_width::dbl: {
                double d;
                memcpy(&d, &val, sizeof(d));
                return d;
            }
            default:
                throw error(fmt::format("unsupported float width: {}", width()));
        }
    }

    template<typename T>
    static uint64_t _read_uint(const buffer data, const size_t pos)
    {
        T v;
        memcpy(&v, data.data() + pos, sizeof(v));
        return net_to_host(v);
    }

    header decode_header(const buffer data, const size_t pos)
    {
        if (pos >= data.size()) [[unlikely]]
            throw malformed_header_error(pos, "the item header is missing");
        const auto ib = data[pos];
        header h {};
        h.type = static_cast<major_type>(ib >> 5);
        h.info = ib & 0x1F;
        const auto avail = data.size() - pos - 1;
        switch (h.info) {
            case static_cast<uint8_t>(special_val::one_byte):
                if (avail < 1) [[unlikely]]
                    throw malformed_header_error(pos, "a one-byte argument is truncated");
                h.val = data[pos + 1];
                h.size = 2;
                break;
            case static_cast<uint8_t>(special_val::two_bytes):
                if (avail < 2) [[unlikely]]
                    throw malformed_header_error(pos, "a two-byte argument is truncated");
                h.val = _read_uint<uint16_t>(data, pos + 1);
                h.size = 3;
                break;
            case static_cast<uint8_t>(special_val::four_bytes):
                if (avail < 4) [[unlikely]]
                    throw malformed_header_error(pos, "a four-byte argument is truncated");
                h.val = _read_uint<uint32_t>(data, pos + 1);
                h.size = 5;
                break;
            case static_cast<uint8_t>(special_val::eight_bytes):
                if (avail < 8) [[unlikely]]
                    throw malformed_header_error(pos, "an eight-byte argument is truncated");
                h.val = _read_uint<uint64_t>(data, pos + 1);
                h.size = 9;
                break;
            case 28:
            case 29:
            case 30:
                throw malformed_header_error(pos, fmt::format("reserved additional information value {}", h.info));
            case info_indefinite:
                switch (h.type) {
                    case major_type::uint:
                    case major_type::nint:
                    case major_type::tag:
                        throw malformed_header_error(pos, fmt::format("an indefinite length is not allowed for {}", h.type));
                    default:
                        break;
                }
                break;
            default:
                h.val = h.info;
                break;
        }
        return h;
    }

    void encode_header(uint8_vector &out, const major_type type, const uint64_t val)
    {
        const auto ib = static_cast<uint8_t>(static_cast<uint8_t>(type) << 5);
        if (val < 24) {
            out << static_cast<uint8_t>(ib | val);
        } else if (val <= std::numeric_limits<uint8_t>::max()) {
            out << static_cast<uint8_t>(ib | static_cast<uint8_t>(special_val::one_byte));
            out << static_cast<uint8_t>(val);
        } else if (val <= std::numeric_limits<uint16_t>::max()) {
            out << static_cast<uint8_t>(ib | static_cast<uint8_t>(special_val::two_bytes));
            out << buffer::from(host_to_net<uint16_t>(val));
        } else if (val <= std::numeric_limits<uint32_t>::max()) {
            out << static_cast<uint8_t>(ib | static_cast<uint8_t>(special_val::four_bytes));
            out << buffer::from(host_to_net<uint32_t>(val));
        } else {
            out << static_cast<uint8_t>(ib | static_cast<uint8_t>(special_val::eight_bytes));
            out << buffer::from(host_to_net<uint64_t>(val));
        }
    }
}
