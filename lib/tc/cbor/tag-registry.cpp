/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <optional>
#include <tc/cbor/error.hpp>
#include <tc/cbor/tag-registry.hpp>
#include <tc/logger.hpp>

namespace turbo_cbor::cbor {
    namespace {
        struct mismatch {
            std::string expected;
            std::string actual;
        };
        using body_check = std::function<std::optional<mismatch>(const value &)>;

        std::string describe(const value &v)
        {
            switch (v.type()) {
                case value_type::array: return fmt::format("array[{}]", v.array().size());
                case value_type::map: return fmt::format("map[{}]", v.map().size());
                case value_type::bytes: return fmt::format("bytes[{}]", v.bytes().size());
                case value_type::semantic: return v.semantic().name;
                default: return fmt::format("{}", v.type());
            }
        }

        bool is_integer(const value &v)
        {
            return v.type() == value_type::uint || v.type() == value_type::nint;
        }

        bool is_number(const value &v)
        {
            return is_integer(v) || v.type() == value_type::flt;
        }

        bool is_bigint_part(const value &v)
        {
            return is_integer(v) || v.type() == value_type::bytes || v.is_semantic("_pbignum") || v.is_semantic("_nbignum");
        }

        body_check any_body()
        {
            return [](const value &) -> std::optional<mismatch> {
                return {};
            };
        }

        body_check of_type(const value_type typ)
        {
            return [typ](const value &v) -> std::optional<mismatch> {
                if (v.type() != typ)
                    return mismatch { fmt::format("{}", typ), describe(v) };
                return {};
            };
        }

        body_check number_body()
        {
            return [](const value &v) -> std::optional<mismatch> {
                if (!is_number(v))
                    return mismatch { "number", describe(v) };
                return {};
            };
        }

        body_check sized_bytes(std::vector<size_t> sizes, std::string expected)
        {
            return [sizes=std::move(sizes), expected=std::move(expected)](const value &v) -> std::optional<mismatch> {
                if (v.type() != value_type::bytes || std::find(sizes.begin(), sizes.end(), v.bytes().size()) == sizes.end())
                    return mismatch { expected, describe(v) };
                return {};
            };
        }

        body_check pair_of(const std::function<bool(const value &)> &first, const std::function<bool(const value &)> &second, std::string expected)
        {
            return [first, second, expected=std::move(expected)](const value &v) -> std::optional<mismatch> {
                if (v.type() != value_type::array || v.array().size() != 2)
                    return mismatch { "array[2]", describe(v) };
                const auto &items = v.array();
                if (!first(items[0]) || !second(items[1]))
                    return mismatch { expected, fmt::format("array[{}, {}]", describe(items[0]), describe(items[1])) };
                return {};
            };
        }

        body_check serialized_object()
        {
            return [](const value &v) -> std::optional<mismatch> {
                if (v.type() != value_type::array || v.array().empty())
                    return mismatch { "non-empty array", describe(v) };
                if (v.array()[0].type() != value_type::text)
                    return mismatch { "text class name", describe(v.array()[0]) };
                return {};
            };
        }

        body_check container_body()
        {
            return [](const value &v) -> std::optional<mismatch> {
                if (!v.is_container())
                    return mismatch { "array or map", describe(v) };
                return {};
            };
        }

        tag_entry make_entry(const uint64_t id, const std::string_view name, body_check check, const bool reference=false, const bool bodyless=false)
        {
            tag_entry e {};
            e.id = id;
            e.name = name;
            e.reference = reference;
            e.bodyless = bodyless;
            e.encode = [name=e.name, check](const value &body) -> value {
                if (const auto m = check(body); m)
                    throw unencodable_error(fmt::format("{}: wanted {}, got {}", name, m->expected, m->actual));
                return body;
            };
            e.decode = [name=e.name, check](const uint64_t, const value &body, const size_t pos) -> value {
                if (const auto m = check(body); m)
                    throw tag_mismatch_error(pos, name, m->expected, m->actual);
                return value::semantic(name, body);
            };
            return e;
        }
    }

    tag_registry &tag_registry::get()
    {
        static tag_registry reg {};
        return reg;
    }

    tag_registry::tag_registry()
    {
        _unknown.name = "tag";
        _unknown.encode = [](const value &body) {
            return body;
        };
        _unknown.decode = [](const uint64_t id, const value &body, const size_t) {
            return value::tagged(id, body);
        };

        const auto rational_num = [](const value &v) { return is_integer(v); };
        const auto rational_den = [](const value &v) { return v.type() == value_type::uint && v.uint() != 0; };
        const auto integer = [](const value &v) { return is_integer(v); };
        const auto text = [](const value &v) { return v.type() == value_type::text; };

        add(make_entry(0, "_datetime", of_type(value_type::text)));
        add(make_entry(1, "_epoch", number_body()));
        add(make_entry(2, "_pbignum", of_type(value_type::bytes)));
        add(make_entry(3, "_nbignum", of_type(value_type::bytes)));
        add(make_entry(4, "_decimalfraction", pair_of(integer, integer, "array[integer exponent, integer mantissa]")));
        add(make_entry(5, "_bigfloat", pair_of(integer, integer, "array[integer exponent, integer mantissa]")));
        add(make_entry(21, "_tobase64url", any_body()));
        add(make_entry(22, "_tobase64", any_body()));
        add(make_entry(23, "_tobase16", any_body()));
        add(make_entry(24, "_cbor", of_type(value_type::bytes)));
        add(make_entry(tag_id::nthstring, "_nthstring", of_type(value_type::uint), true));
        add(make_entry(26, "_perlobj", serialized_object()));
        add(make_entry(27, "_serialobj", serialized_object()));
        add(make_entry(tag_id::shareable, "_shareable", container_body(), true));
        add(make_entry(tag_id::sharedref, "_sharedref", of_type(value_type::uint), true));
        add(make_entry(30, "_rational", pair_of(rational_num, rational_den, "array[integer numerator, non-zero uint denominator]")));
        add(make_entry(32, "_url", of_type(value_type::text)));
        add(make_entry(33, "_base64url", of_type(value_type::text)));
        add(make_entry(34, "_base64", of_type(value_type::text)));
        add(make_entry(35, "_regex", of_type(value_type::text)));
        add(make_entry(36, "_mime", of_type(value_type::text)));
        add(make_entry(37, "_uuid", sized_bytes({ 16 }, "bytes[16]")));
        add(make_entry(38, "_language", pair_of(text, text, "array[text language, text value]")));
        add(make_entry(39, "_id", any_body()));
        add(make_entry(tag_id::stringref, "_stringref", any_body(), true));
        add(make_entry(257, "_bmime", of_type(value_type::bytes)));
        add(make_entry(260, "_ipaddress", sized_bytes({ 4, 6, 16 }, "bytes[4], bytes[6] or bytes[16]")));
        add(make_entry(264, "_decimalfractionexp", pair_of(is_bigint_part, is_bigint_part, "array[bignum exponent, bignum mantissa]")));
        add(make_entry(265, "_bigfloatexp", pair_of(is_bigint_part, is_bigint_part, "array[bignum exponent, bignum mantissa]")));
        add(make_entry(22098, "_indirection", any_body()));
        add(make_entry(tag_id::magic_cbor, "_magic_cbor", any_body(), false, true));
        add(make_entry(15309736, "_rains", of_type(value_type::map)));
    }

    const tag_entry &tag_registry::resolve(const uint64_t id) const noexcept
    {
        if (const auto it = _by_id.find(id); it != _by_id.end())
            return it->second;
        return _unknown;
    }

    const tag_entry *tag_registry::find(const std::string_view name) const noexcept
    {
        if (const auto it = _by_name.find(name); it != _by_name.end())
            return &_by_id.at(it->second);
        return nullptr;
    }

    void tag_registry::add(tag_entry entry)
    {
        if (entry.name.empty())
            throw error(fmt::format("tag {} must have a non-empty name", entry.id));
        if (const auto it = _by_id.find(entry.id); it != _by_id.end()) {
            logger::debug("tag {} registered as {} replaces {}", entry.id, entry.name, it->second.name);
            // the old name may already belong to a later registration of another id
            if (const auto name_it = _by_name.find(it->second.name); name_it != _by_name.end() && name_it->second == entry.id)
                _by_name.erase(name_it);
        }
        if (const auto it = _by_name.find(entry.name); it != _by_name.end() && it->second != entry.id)
            logger::debug("tag name {} moves from tag {} to tag {}, the former keeps decoding under it", entry.name, it->second, entry.id);
        _by_name.insert_or_assign(entry.name, entry.id);
        const auto id = entry.id;
        _by_id.insert_or_assign(id, std::move(entry));
    }

    void register_tag(const uint64_t id, const std::string_view name, encode_hook encode, decode_hook decode)
    {
        tag_entry e {};
        e.id = id;
        e.name = name;
        if (encode) {
            e.encode = std::move(encode);
        } else {
            e.encode = [](const value &body) {
                return body;
            };
        }
        if (decode) {
            e.decode = std::move(decode);
        } else {
            e.decode = [name=e.name](const uint64_t, const value &body, const size_t) {
                return value::semantic(name, body);
            };
        }
        tag_registry::get().add(std::move(e));
    }
}
