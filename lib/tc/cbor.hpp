/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_HPP
#define TURBO_CBOR_CBOR_HPP

#include <tc/cbor/codec.hpp>
#include <tc/cbor/encoder.hpp>
#include <tc/cbor/error.hpp>
#include <tc/cbor/float.hpp>
#include <tc/cbor/options.hpp>
#include <tc/cbor/tag-registry.hpp>
#include <tc/cbor/types.hpp>
#include <tc/cbor/value.hpp>

#endif // !TURBO_CBOR_CBOR_HPP
