/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_DECODER_HPP
#define TURBO_CBOR_CBOR_DECODER_HPP

#include <tc/common/bytes.hpp>
#include <tc/cbor/header.hpp>
#include <tc/cbor/options.hpp>
#include <tc/cbor/references.hpp>
#include <tc/cbor/value.hpp>

namespace turbo_cbor::cbor {
    /*
     * Reads consecutive top-level items from a buffer into values allocated in the given arena.
     * Each top-level item gets its own shared and string reference tables.
     */
    struct decoder {
        decoder(arena &a, const buffer data, const size_t pos=0, const decode_options &opts={}):
            _arena { a }, _data { data }, _pos { pos }, _opts { opts }
        {
        }

        value read();

        bool done() const noexcept
        {
            return _pos >= _data.size();
        }

        size_t pos() const noexcept
        {
            return _pos;
        }
    private:
        arena &_arena;
        buffer _data;
        size_t _pos;
        decode_options _opts;
        reference_tracker _refs {};

        value _read(size_t depth);
        value _read_string(const header &h, size_t start);
        void _read_chunk(const header &h, size_t start, uint8_vector &out);
        void _fill_array(const header &h, size_t start, size_t depth, array_node &items);
        void _fill_map(const header &h, size_t start, size_t depth, map_node &items);
        value _read_tag(const header &h, size_t start, size_t depth);
        value _read_shareable(size_t start, size_t depth);
        value _read_simple(const header &h, size_t start);
        uint64_t _read_index(const char *name, size_t start, size_t depth);
        void _check_size(const header &h, size_t start, uint64_t min_bytes_per_item) const;
    };
}

#endif // !TURBO_CBOR_CBOR_DECODER_HPP
