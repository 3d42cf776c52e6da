/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_ENCODER_HPP
#define TURBO_CBOR_CBOR_ENCODER_HPP

#include <bit>
#include <functional>
#include <tc/common/bytes.hpp>
#include <tc/cbor/error.hpp>
#include <tc/cbor/float.hpp>
#include <tc/cbor/header.hpp>
#include <tc/cbor/types.hpp>

namespace turbo_cbor::cbor {
    // appends CBOR items one at a time, the caller is responsible for the overall structure
    struct encoder {
        using prepare_data_func = std::function<void()>;

        encoder &array()
        {
            _encode_item(major_type::array, info_indefinite);
            return *this;
        }

        encoder &array(const size_t sz)
        {
            encode_header(_buf, major_type::array, sz);
            return *this;
        }

        encoder &array_compact(const size_t sz, const prepare_data_func &prepare_data)
        {
            if (sz >= 24)
                array();
            else
                array(sz);
            prepare_data();
            if (sz >= 24)
                s_break();
            return *this;
        }

        encoder &map()
        {
            _encode_item(major_type::map, info_indefinite);
            return *this;
        }

        encoder &map(const size_t sz)
        {
            encode_header(_buf, major_type::map, sz);
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            encode_header(_buf, major_type::uint, val);
            return *this;
        }

        // the negative value must be already converted to the uint64_t representation
        encoder &nint(const uint64_t val)
        {
            encode_header(_buf, major_type::nint, val);
            return *this;
        }

        encoder &integer(const int64_t val)
        {
            if (val >= 0)
                return uint(static_cast<uint64_t>(val));
            return nint(static_cast<uint64_t>(-(val + 1)));
        }

        // throws range_error or precision_loss_error if val is not exactly representable
        encoder &float16(const double val)
        {
            const auto bits = host_to_net(encode_half(val));
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::two_bytes));
            _encode_data(buffer::from(bits));
            return *this;
        }

        encoder &float32(const float val)
        {
            const auto bits = host_to_net(std::bit_cast<uint32_t>(val));
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::four_bytes));
            _encode_data(buffer::from(bits));
            return *this;
        }

        // the bits are byte-swapped as an integer so that NaN payloads survive
        encoder &float64(const double val)
        {
            const auto bits = host_to_net(std::bit_cast<uint64_t>(val));
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::eight_bytes));
            _encode_data(buffer::from(bits));
            return *this;
        }

        encoder &flt(const double val, const float_width width)
        {
            switch (width) {
                case float_width::half: return float16(val);
                case float_width::single: {
                    const auto bits = host_to_net(encode_single(val));
                    _encode_item(major_type::simple, static_cast<uint8_t>(special_val::four_bytes));
                    _encode_data(buffer::from(bits));
                    return *this;
                }
                case float_width::dbl: return float64(val);
                default: throw error(fmt::format("unsupported float width: {}", width));
            }
        }

        // the shortest lossless width
        encoder &flt(const double val)
        {
            return flt(val, min_width(val));
        }

        encoder &bytes()
        {
            _encode_item(major_type::bytes, info_indefinite);
            return *this;
        }

        encoder &bytes(const buffer buf)
        {
            encode_header(_buf, major_type::bytes, buf.size());
            _encode_data(buf);
            return *this;
        }

        encoder &text()
        {
            _encode_item(major_type::text, info_indefinite);
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            encode_header(_buf, major_type::text, sv.size());
            _encode_data(sv);
            return *this;
        }

        encoder &raw_cbor(const buffer buf)
        {
            _encode_data(buf);
            return *this;
        }

        encoder &simple(const uint8_t val)
        {
            if (val < 24) {
                _encode_item(major_type::simple, val);
            } else {
                _encode_item(major_type::simple, static_cast<uint8_t>(special_val::one_byte));
                _buf.emplace_back(val);
            }
            return *this;
        }

        encoder &s_null()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_null));
            return *this;
        }

        encoder &s_undefined()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_undefined));
            return *this;
        }

        encoder &s_break()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &s_false()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_false));
            return *this;
        }

        encoder &s_true()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_true));
            return *this;
        }

        encoder &boolean(const bool val)
        {
            return val ? s_true() : s_false();
        }

        encoder &tag(const uint64_t id)
        {
            encode_header(_buf, major_type::tag, id);
            return *this;
        }

        encoder &custom(const std::function<void(encoder &)> &gen)
        {
            gen(*this);
            return *this;
        }

        [[nodiscard]] uint8_vector &cbor()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    protected:
        void _encode_data(const buffer buf)
        {
            _buf << buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_item(const major_type typ, const uint8_t info)
        {
            _buf.emplace_back((static_cast<uint8_t>(typ) << 5) | (info & 0x1F));
        }
    };

    inline encoder &operator<<(encoder &dst, const encoder &src)
    {
        dst.cbor() << src.cbor();
        return dst;
    }

    inline encoder &operator<<(encoder &dst, const buffer &src)
    {
        dst.cbor() << src;
        return dst;
    }
}

#endif // !TURBO_CBOR_CBOR_ENCODER_HPP
