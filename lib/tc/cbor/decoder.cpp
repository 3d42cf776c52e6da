/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <tc/cbor/decoder.hpp>
#include <tc/cbor/error.hpp>
#include <tc/cbor/tag-registry.hpp>
#include <tc/logger.hpp>

namespace turbo_cbor::cbor {
    value decoder::read()
    {
        _refs = {};
        const auto start = _pos;
        auto v = _read(0);
        logger::trace("decoded a top-level {} at bytes [{}, {})", v.type(), start, _pos);
        return v;
    }

    value decoder::_read(const size_t depth)
    {
        const auto start = _pos;
        if (depth >= _opts.max_depth) [[unlikely]]
            throw depth_exceeded_error(start, _opts.max_depth);
        const auto h = decode_header(_data, _pos);
        _pos += h.size;
        switch (h.type) {
            case major_type::uint:
                return value::uint(h.val);
            case major_type::nint:
                return value::nint(h.val);
            case major_type::bytes:
            case major_type::text:
                return _read_string(h, start);
            case major_type::array: {
                _check_size(h, start, 1);
                auto v = _arena.array();
                _fill_array(h, start, depth, v.array());
                return v;
            }
            case major_type::map: {
                _check_size(h, start, 2);
                auto v = _arena.map();
                _fill_map(h, start, depth, v.map());
                return v;
            }
            case major_type::tag:
                return _read_tag(h, start, depth);
            case major_type::simple:
                return _read_simple(h, start);
            default:
                throw malformed_header_error(start, fmt::format("unsupported major type {}", h.type));
        }
    }

    void decoder::_check_size(const header &h, const size_t start, const uint64_t min_bytes_per_item) const
    {
        if (h.indefinite())
            return;
        if (h.val > _opts.max_collection_size) [[unlikely]]
            throw decode_error(start, fmt::format("{} of {} items exceeds the limit of {}", h.type, h.val, _opts.max_collection_size));
        const auto remaining = _data.size() - _pos;
        // every item takes at least one byte, so the count can be checked before anything is allocated
        if (h.val > remaining / min_bytes_per_item) [[unlikely]]
            throw truncated_body_error(start, h.val * min_bytes_per_item, remaining);
    }

    void decoder::_read_chunk(const header &h, const size_t start, uint8_vector &out)
    {
        _check_size(h, start, 1);
        const auto chunk = _data.subbuf(_pos, h.val);
        if (h.type == major_type::text && !is_valid_utf8(chunk)) [[unlikely]]
            throw invalid_utf8_error(start);
        out << chunk;
        _pos += h.val;
    }

    value decoder::_read_string(const header &h, const size_t start)
    {
        uint8_vector data {};
        if (!h.indefinite()) {
            _read_chunk(h, start, data);
        } else {
            for (;;) {
                const auto chunk_start = _pos;
                const auto ch = decode_header(_data, _pos);
                if (ch.is_break()) {
                    _pos += ch.size;
                    break;
                }
                if (ch.type != h.type || ch.indefinite()) [[unlikely]]
                    throw chunk_type_mismatch_error(chunk_start, fmt::format("a chunk of an indefinite {} must be a definite {} but got {}{}",
                        h.type, h.type, ch.indefinite() ? "an indefinite " : "", ch.type));
                _pos += ch.size;
                _read_chunk(ch, chunk_start, data);
                if (data.size() > _opts.max_collection_size) [[unlikely]]
                    throw decode_error(chunk_start, fmt::format("an indefinite {} exceeds the limit of {} bytes", h.type, _opts.max_collection_size));
            }
        }
        auto v = h.type == major_type::text ? value::text(data.str()) : value::bytes(data);
        // only definite strings take part in string references
        if (auto *strings = _refs.strings(); strings && !h.indefinite())
            strings->add(v);
        return v;
    }

    void decoder::_fill_array(const header &h, const size_t start, const size_t depth, array_node &items)
    {
        if (h.indefinite()) {
            for (;;) {
                auto item = _read(depth + 1);
                if (item.is_break())
                    break;
                if (items.size() >= _opts.max_collection_size) [[unlikely]]
                    throw decode_error(start, fmt::format("an indefinite array exceeds the limit of {} items", _opts.max_collection_size));
                items.emplace_back(std::move(item));
            }
        } else {
            items.reserve(h.val);
            for (uint64_t i = 0; i < h.val; ++i) {
                auto item = _read(depth + 1);
                // a break ends a definite array early
                if (item.is_break())
                    break;
                items.emplace_back(std::move(item));
            }
        }
    }

    void decoder::_fill_map(const header &h, const size_t start, const size_t depth, map_node &items)
    {
        const auto max_items = h.indefinite() ? _opts.max_collection_size : h.val;
        if (!h.indefinite())
            items.reserve(h.val);
        for (uint64_t i = 0; h.indefinite() || i < max_items; ++i) {
            auto key = _read(depth + 1);
            if (key.is_break())
                break;
            if (h.indefinite() && items.size() >= max_items) [[unlikely]]
                throw decode_error(start, fmt::format("an indefinite map exceeds the limit of {} items", max_items));
            const auto val_start = _pos;
            auto val = _read(depth + 1);
            if (val.is_break()) [[unlikely]]
                throw decode_error(val_start, "a map value cannot be a break");
            items.emplace_back(std::move(key), std::move(val));
        }
    }

    uint64_t decoder::_read_index(const char *name, const size_t start, const size_t depth)
    {
        const auto idx = _read(depth + 1);
        if (idx.type() != value_type::uint) [[unlikely]]
            throw tag_mismatch_error(start, name, "uint", fmt::format("{}", idx.type()));
        return idx.uint();
    }

    value decoder::_read_shareable(const size_t start, const size_t depth)
    {
        const auto body_start = _pos;
        if (depth + 1 >= _opts.max_depth) [[unlikely]]
            throw depth_exceeded_error(body_start, _opts.max_depth);
        const auto h = decode_header(_data, _pos);
        switch (h.type) {
            case major_type::array: {
                _pos += h.size;
                _check_size(h, body_start, 1);
                auto v = _arena.array();
                _refs.shared.add(v);
                _fill_array(h, body_start, depth + 1, v.array());
                return v;
            }
            case major_type::map: {
                _pos += h.size;
                _check_size(h, body_start, 2);
                auto v = _arena.map();
                _refs.shared.add(v);
                _fill_map(h, body_start, depth + 1, v.map());
                return v;
            }
            default:
                throw tag_mismatch_error(start, "_shareable", "array or map", fmt::format("{}", h.type));
        }
    }

    value decoder::_read_tag(const header &h, const size_t start, const size_t depth)
    {
        const auto &entry = tag_registry::get().resolve(h.val);
        if (entry.reference) {
            switch (h.val) {
                case tag_id::shareable:
                    return _read_shareable(start, depth);
                case tag_id::sharedref:
                    return _refs.shared.at(_read_index("_sharedref", start, depth), start);
                case tag_id::nthstring: {
                    const auto idx = _read_index("_nthstring", start, depth);
                    const auto *strings = _refs.strings();
                    if (!strings) [[unlikely]]
                        throw bad_reference_error(start, "string reference outside of a stringref scope");
                    return strings->at(idx, start);
                }
                case tag_id::stringref: {
                    string_scope scope { _refs };
                    return _read(depth + 1);
                }
                default:
                    throw error(fmt::format("tag {} is marked as a reference but has no reference semantics", h.val));
            }
        }
        if (entry.bodyless)
            return entry.decode(h.val, value::null(), start);
        const auto body = _read(depth + 1);
        return entry.decode(h.val, body, start);
    }

    value decoder::_read_simple(const header &h, const size_t start)
    {
        switch (h.info) {
            case static_cast<uint8_t>(special_val::s_false): return value::boolean(false);
            case static_cast<uint8_t>(special_val::s_true): return value::boolean(true);
            case static_cast<uint8_t>(special_val::s_null): return value::null();
            case static_cast<uint8_t>(special_val::s_undefined): return value::undefined();
            case static_cast<uint8_t>(special_val::one_byte): return value::simple(static_cast<uint8_t>(h.val));
            case static_cast<uint8_t>(special_val::two_bytes):
            case static_cast<uint8_t>(special_val::four_bytes):
            case static_cast<uint8_t>(special_val::eight_bytes):
                return value::float_fixed(h.float_value(), h.width());
            case static_cast<uint8_t>(special_val::s_break): return value::s_break();
            default:
                if (h.info < 20)
                    return value::simple(h.info);
                throw malformed_header_error(start, fmt::format("unsupported simple value info {}", h.info));
        }
    }
}
