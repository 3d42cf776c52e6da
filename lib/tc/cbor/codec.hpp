/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_CODEC_HPP
#define TURBO_CBOR_CBOR_CODEC_HPP

#include <optional>
#include <string>
#include <vector>
#include <tc/common/bytes.hpp>
#include <tc/cbor/encoder.hpp>
#include <tc/cbor/options.hpp>
#include <tc/cbor/value.hpp>

namespace turbo_cbor::cbor {
    struct decoded {
        value val {};
        // the offset of the first byte after the decoded item
        size_t next_pos = 0;
    };

    struct decode_status {
        std::optional<decoded> result {};
        std::string error {};
        size_t error_pos = 0;

        explicit operator bool() const noexcept
        {
            return result.has_value();
        }
    };

    extern uint8_vector encode(const value &v, const encode_options &opts={});
    // writes v into an existing encoder so that it can be combined with hand-written items
    extern void encode(encoder &enc, const value &v, const encode_options &opts={});
    // pos is 0-based, containers of the result are allocated in the arena
    extern decoded decode(arena &a, buffer data, size_t pos=0, const decode_options &opts={});
    // reports decode errors through the result instead of throwing them
    extern decode_status try_decode(arena &a, buffer data, size_t pos=0, const decode_options &opts={});
    // decodes a sequence of concatenated items until the end of data
    extern std::vector<value> decode_all(arena &a, buffer data, const decode_options &opts={});
}

#endif // !TURBO_CBOR_CBOR_CODEC_HPP
