/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_VALUE_HPP
#define TURBO_CBOR_CBOR_VALUE_HPP

#include <deque>
#include <initializer_list>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <tc/common/bytes.hpp>
#include <tc/common/format.hpp>
#include <tc/cbor/types.hpp>

namespace turbo_cbor::cbor {
    struct encoder;
    struct value;
    struct array_node;
    struct map_node;

    // user types that know how to write themselves into an encoder
    struct encodable {
        virtual ~encodable() =default;
        virtual void to_cbor(encoder &enc) const =0;
    };

    enum class value_type: uint8_t {
        uint, nint, bytes, text, array, map, boolean, null, undefined,
        flt, simple, tag, semantic, brk, custom
    };

    // the logical value is -1 - raw
    struct nint_val {
        uint64_t raw = 0;

        bool operator==(const nint_val &o) const noexcept =default;
    };

    struct null_val {
        bool operator==(const null_val &) const noexcept =default;
    };

    struct undefined_val {
        bool operator==(const undefined_val &) const noexcept =default;
    };

    struct break_val {
        bool operator==(const break_val &) const noexcept =default;
    };

    struct float_val {
        double val = 0.0;
        float_width width = float_width::dbl;
    };

    struct simple_val {
        uint8_t val = 0;

        bool operator==(const simple_val &o) const noexcept =default;
    };

    struct tag_val {
        uint64_t id = 0;
        std::shared_ptr<const value> inner {};
    };

    struct semantic_val {
        std::string name {};
        std::shared_ptr<const value> body {};
    };

    struct custom_val {
        std::shared_ptr<const encodable> obj {};
    };

    struct value {
        using data_type = std::variant<
            uint64_t, nint_val, uint8_vector, std::string, array_node *, map_node *, bool,
            null_val, undefined_val, float_val, simple_val, tag_val, semantic_val, break_val, custom_val>;

        static value uint(uint64_t v);
        static value nint(uint64_t raw);
        static value integer(int64_t v);
        static value bytes(buffer b);
        static value text(std::string_view s);
        // TEXT when s passes is_text and BYTES otherwise
        static value string(std::string_view s);
        static value boolean(bool b);
        static value null();
        static value undefined();
        static value s_break();
        // picks the narrowest float width that keeps the value exact
        static value float64(double d);
        // throws range_error or precision_loss_error when d does not fit the width
        static value float_fixed(double d, float_width width);
        static value simple(uint8_t v);
        static value tagged(uint64_t id, value inner);
        static value semantic(std::string_view name, value body);
        static value custom(std::shared_ptr<const encodable> obj);

        value() =default;
        explicit value(array_node &node);
        explicit value(map_node &node);

        value_type type() const noexcept;

        bool is_null() const noexcept
        {
            return std::holds_alternative<null_val>(_data);
        }

        bool is_break() const noexcept
        {
            return std::holds_alternative<break_val>(_data);
        }

        bool is_container() const noexcept
        {
            return std::holds_alternative<array_node *>(_data) || std::holds_alternative<map_node *>(_data);
        }

        bool is_semantic(std::string_view name) const noexcept;

        uint64_t uint(const std::source_location &loc=std::source_location::current()) const;
        uint64_t nint_raw(const std::source_location &loc=std::source_location::current()) const;
        // uint and nint values that fit into int64_t
        int64_t integer(const std::source_location &loc=std::source_location::current()) const;
        const uint8_vector &bytes(const std::source_location &loc=std::source_location::current()) const;
        const std::string &text(const std::source_location &loc=std::source_location::current()) const;
        // containers are shared handles, so a const value still gives mutable access to them
        array_node &array(const std::source_location &loc=std::source_location::current()) const;
        map_node &map(const std::source_location &loc=std::source_location::current()) const;
        bool boolean(const std::source_location &loc=std::source_location::current()) const;
        const float_val &flt(const std::source_location &loc=std::source_location::current()) const;
        uint8_t simple(const std::source_location &loc=std::source_location::current()) const;
        const tag_val &tag(const std::source_location &loc=std::source_location::current()) const;
        const semantic_val &semantic(const std::source_location &loc=std::source_location::current()) const;
        const encodable &custom(const std::source_location &loc=std::source_location::current()) const;

        // the address of the container node for arrays and maps, nullptr otherwise
        const void *identity() const noexcept;

        const data_type &data() const noexcept
        {
            return _data;
        }

        // structural comparison that terminates on cyclic graphs
        bool operator==(const value &o) const;
    private:
        data_type _data { null_val {} };

        explicit value(data_type &&d);

        template<typename T>
        const T &_get(value_type expected, const std::source_location &loc) const;
    };

    struct array_node: std::vector<value> {
        using std::vector<value>::vector;
    };

    struct map_node: std::vector<std::pair<value, value>> {
        using std::vector<std::pair<value, value>>::vector;

        // the first value with an equal key or nullptr
        const value *find(const value &key) const;
    };

    /*
     * Owns all the array and map nodes of one value graph.
     * Node addresses stay stable for the lifetime of the arena, which makes them usable as identities
     * and lets the graph contain cycles without ownership cycles.
     */
    struct arena {
        arena() =default;
        arena(const arena &) =delete;
        arena(arena &&) =default;
        arena &operator=(const arena &) =delete;

        value array(std::initializer_list<value> items={});
        value array(std::vector<value> &&items);
        value map(std::initializer_list<std::pair<value, value>> items={});
        value map(std::vector<std::pair<value, value>> &&items);
        // an ARRAY when the keys are exactly the uints 1..n with n > 0, a MAP otherwise
        value table(const std::vector<std::pair<value, value>> &entries);

        size_t size() const noexcept
        {
            return _arrays.size() + _maps.size();
        }
    private:
        std::deque<array_node> _arrays {};
        std::deque<map_node> _maps {};
    };

    // the restricted UTF-8 grammar used to decide between TEXT and BYTES for a generic string
    extern bool is_text(buffer data) noexcept;
    // RFC 3629 validity
    extern bool is_valid_utf8(buffer data) noexcept;

    extern std::string to_string(const value &v);
}

namespace fmt {
    template<>
    struct formatter<turbo_cbor::cbor::value_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using turbo_cbor::cbor::value_type;
            switch (v) {
                case value_type::uint: return fmt::format_to(ctx.out(), "uint");
                case value_type::nint: return fmt::format_to(ctx.out(), "nint");
                case value_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case value_type::text: return fmt::format_to(ctx.out(), "text");
                case value_type::array: return fmt::format_to(ctx.out(), "array");
                case value_type::map: return fmt::format_to(ctx.out(), "map");
                case value_type::boolean: return fmt::format_to(ctx.out(), "bool");
                case value_type::null: return fmt::format_to(ctx.out(), "null");
                case value_type::undefined: return fmt::format_to(ctx.out(), "undefined");
                case value_type::flt: return fmt::format_to(ctx.out(), "float");
                case value_type::simple: return fmt::format_to(ctx.out(), "simple");
                case value_type::tag: return fmt::format_to(ctx.out(), "tag");
                case value_type::semantic: return fmt::format_to(ctx.out(), "semantic");
                case value_type::brk: return fmt::format_to(ctx.out(), "break");
                case value_type::custom: return fmt::format_to(ctx.out(), "custom");
                default: return fmt::format_to(ctx.out(), "value_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<turbo_cbor::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", turbo_cbor::cbor::to_string(v));
        }
    };
}

#endif // !TURBO_CBOR_CBOR_VALUE_HPP
