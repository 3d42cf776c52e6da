/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_OPTIONS_HPP
#define TURBO_CBOR_CBOR_OPTIONS_HPP

#include <cstddef>

namespace turbo_cbor::cbor {
    static constexpr size_t default_max_depth = 1024;
    static constexpr size_t default_max_collection_size = 0x1'000'000;

    struct encode_options {
        // emit shareable/sharedref tags so that repeated and cyclic containers are written once
        bool shared_refs = false;
        // wrap the output into a stringref scope and replace repeated strings with nthstring tags
        bool string_refs = false;
    };

    struct decode_options {
        size_t max_depth = default_max_depth;
        // the maximum number of items in an array or a map and of bytes in a string
        size_t max_collection_size = default_max_collection_size;
    };
}

#endif // !TURBO_CBOR_CBOR_OPTIONS_HPP
