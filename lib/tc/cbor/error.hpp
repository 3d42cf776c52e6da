/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_ERROR_HPP
#define TURBO_CBOR_CBOR_ERROR_HPP

#include <string>
#include <string_view>
#include <tc/common/error.hpp>
#include <tc/common/format.hpp>

namespace turbo_cbor::cbor {
    struct error: turbo_cbor::error {
        using turbo_cbor::error::error;
    };

    // every decode failure knows the offset of the byte where it has been detected
    struct decode_error: error {
        decode_error(const size_t pos, const std::string_view msg):
            error { fmt::format("{} at byte {}", msg, pos) }, _pos { pos }
        {
        }

        size_t pos() const noexcept
        {
            return _pos;
        }
    private:
        size_t _pos;
    };

    struct malformed_header_error: decode_error {
        using decode_error::decode_error;
    };

    struct truncated_body_error: decode_error {
        truncated_body_error(const size_t pos, const uint64_t need, const size_t have):
            decode_error { pos, fmt::format("the item needs {} bytes but only {} remain", need, have) }
        {
        }
    };

    struct invalid_utf8_error: decode_error {
        explicit invalid_utf8_error(const size_t pos):
            decode_error { pos, "text contains an invalid UTF-8 sequence" }
        {
        }
    };

    struct chunk_type_mismatch_error: decode_error {
        using decode_error::decode_error;
    };

    struct tag_mismatch_error: decode_error {
        tag_mismatch_error(const size_t pos, const std::string_view name, const std::string_view expected, const std::string_view actual):
            decode_error { pos, fmt::format("{}: wanted {}, got {}", name, expected, actual) },
            _expected { expected }, _actual { actual }
        {
        }

        const std::string &expected() const noexcept
        {
            return _expected;
        }

        const std::string &actual() const noexcept
        {
            return _actual;
        }
    private:
        std::string _expected;
        std::string _actual;
    };

    struct bad_reference_error: decode_error {
        using decode_error::decode_error;
    };

    struct depth_exceeded_error: decode_error {
        depth_exceeded_error(const size_t pos, const size_t max_depth):
            decode_error { pos, fmt::format("the item is nested deeper than {} levels", max_depth) }
        {
        }
    };

    struct unencodable_error: error {
        using error::error;
    };

    struct precision_loss_error: error {
        using error::error;
    };

    struct range_error: error {
        using error::error;
    };
}

#endif // !TURBO_CBOR_CBOR_ERROR_HPP
