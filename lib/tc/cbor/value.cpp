/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstring>
#include <limits>
#include <set>
#include <tc/common/variant.hpp>
#include <tc/cbor/error.hpp>
#include <tc/cbor/float.hpp>
#include <tc/cbor/value.hpp>

namespace turbo_cbor::cbor {
    value value::uint(const uint64_t v)
    {
        return value { data_type { std::in_place_type<uint64_t>, v } };
    }

    value value::nint(const uint64_t raw)
    {
        return value { data_type { nint_val { raw } } };
    }

    value value::integer(const int64_t v)
    {
        if (v >= 0)
            return uint(static_cast<uint64_t>(v));
        return nint(static_cast<uint64_t>(-(v + 1)));
    }

    value value::bytes(const buffer b)
    {
        return value { data_type { std::in_place_type<uint8_vector>, b } };
    }

    value value::text(const std::string_view s)
    {
        return value { data_type { std::in_place_type<std::string>, s } };
    }

    value value::string(const std::string_view s)
    {
        if (is_text(buffer { s }))
            return text(s);
        return bytes(buffer { s });
    }

    value value::boolean(const bool b)
    {
        return value { data_type { std::in_place_type<bool>, b } };
    }

    value value::null()
    {
        return value { data_type { std::in_place_type<null_val> } };
    }

    value value::undefined()
    {
        return value { data_type { std::in_place_type<undefined_val> } };
    }

    value value::s_break()
    {
        return value { data_type { std::in_place_type<break_val> } };
    }

    value value::float64(const double d)
    {
        return value { data_type { float_val { d, min_width(d) } } };
    }

    value value::float_fixed(const double d, const float_width width)
    {
        switch (width) {
            case float_width::half:
                encode_half(d);
                break;
            case float_width::single:
                encode_single(d);
                break;
            case float_width::dbl:
                break;
            default:
                throw error(fmt::format("unsupported float width: {}", width));
        }
        return value { data_type { float_val { d, width } } };
    }

    value value::simple(const uint8_t v)
    {
        return value { data_type { simple_val { v } } };
    }

    value value::tagged(const uint64_t id, value inner)
    {
        return value { data_type { tag_val { id, std::make_shared<const value>(std::move(inner)) } } };
    }

    value value::semantic(const std::string_view name, value body)
    {
        return value { data_type { semantic_val { std::string { name }, std::make_shared<const value>(std::move(body)) } } };
    }

    value value::custom(std::shared_ptr<const encodable> obj)
    {
        if (!obj)
            throw error("a custom value requires a non-null encodable");
        return value { data_type { custom_val { std::move(obj) } } };
    }

    value::value(data_type &&d):
        _data { std::move(d) }
    {
    }

    value::value(array_node &node):
        _data { std::in_place_type<array_node *>, &node }
    {
    }

    value::value(map_node &node):
        _data { std::in_place_type<map_node *>, &node }
    {
    }

    value_type value::type() const noexcept
    {
        // the order of the data_type alternatives
        static constexpr value_type types[] = {
            value_type::uint, value_type::nint, value_type::bytes, value_type::text, value_type::array,
            value_type::map, value_type::boolean, value_type::null, value_type::undefined, value_type::flt,
            value_type::simple, value_type::tag, value_type::semantic, value_type::brk, value_type::custom
        };
        static_assert(sizeof(types) / sizeof(types[0]) == std::variant_size_v<data_type>);
        return types[_data.index()];
    }

    bool value::is_semantic(const std::string_view name) const noexcept
    {
        if (const auto *sv = std::get_if<semantic_val>(&_data); sv)
            return sv->name == name;
        return false;
    }

    template<typename T>
    const T &value::_get(const value_type expected, const std::source_location &loc) const
    {
        if (type() != expected) [[unlikely]]
            throw error(fmt::format("invalid cbor value access: expected {} but the value is {} at {}", expected, type(), loc));
        return variant::get_nice<T>(_data, loc);
    }

    uint64_t value::uint(const std::source_location &loc) const
    {
        return _get<uint64_t>(value_type::uint, loc);
    }

    uint64_t value::nint_raw(const std::source_location &loc) const
    {
        return _get<nint_val>(value_type::nint, loc).raw;
    }

    int64_t value::integer(const std::source_location &loc) const
    {
        static constexpr auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        switch (type()) {
            case value_type::uint: {
                const auto v = uint(loc);
                if (v > max)
                    throw error(fmt::format("uint {} does not fit into int64_t at {}", v, loc));
                return static_cast<int64_t>(v);
            }
            case value_type::nint: {
                const auto raw = nint_raw(loc);
                if (raw > max)
                    throw error(fmt::format("nint with raw value {} does not fit into int64_t at {}", raw, loc));
                return -static_cast<int64_t>(raw) - 1;
            }
            default:
                throw error(fmt::format("invalid cbor value access: expected an integer but the value is {} at {}", type(), loc));
        }
    }

    const uint8_vector &value::bytes(const std::source_location &loc) const
    {
        return _get<uint8_vector>(value_type::bytes, loc);
    }

    const std::string &value::text(const std::source_location &loc) const
    {
        return _get<std::string>(value_type::text, loc);
    }

    array_node &value::array(const std::source_location &loc) const
    {
        return *_get<array_node *>(value_type::array, loc);
    }

    map_node &value::map(const std::source_location &loc) const
    {
        return *_get<map_node *>(value_type::map, loc);
    }

    bool value::boolean(const std::source_location &loc) const
    {
        return _get<bool>(value_type::boolean, loc);
    }

    const float_val &value::flt(const std::source_location &loc) const
    {
        return _get<float_val>(value_type::flt, loc);
    }

    uint8_t value::simple(const std::source_location &loc) const
    {
        return _get<simple_val>(value_type::simple, loc).val;
    }

    const tag_val &value::tag(const std::source_location &loc) const
    {
        return _get<tag_val>(value_type::tag, loc);
    }

    const semantic_val &value::semantic(const std::source_location &loc) const
    {
        return _get<semantic_val>(value_type::semantic, loc);
    }

    const encodable &value::custom(const std::source_location &loc) const
    {
        return *_get<custom_val>(value_type::custom, loc).obj;
    }

    const void *value::identity() const noexcept
    {
        if (const auto *a = std::get_if<array_node *>(&_data); a)
            return *a;
        if (const auto *m = std::get_if<map_node *>(&_data); m)
            return *m;
        return nullptr;
    }

    namespace {
        using visited_pairs = std::set<std::pair<const void *, const void *>>;

        bool same_bits(const double a, const double b)
        {
            return memcmp(&a, &b, sizeof(a)) == 0;
        }

        bool equal(const value &a, const value &b, visited_pairs &visited);

        bool equal_ptr(const std::shared_ptr<const value> &a, const std::shared_ptr<const value> &b, visited_pairs &visited)
        {
            if (!a || !b)
                return a == b;
            return equal(*a, *b, visited);
        }

        bool equal(const value &a, const value &b, visited_pairs &visited)
        {
            if (a.type() != b.type())
                return false;
            switch (a.type()) {
                case value_type::uint: return a.uint() == b.uint();
                case value_type::nint: return a.nint_raw() == b.nint_raw();
                case value_type::bytes: return a.bytes() == b.bytes();
                case value_type::text: return a.text() == b.text();
                case value_type::boolean: return a.boolean() == b.boolean();
                case value_type::null:
                case value_type::undefined:
                case value_type::brk:
                    return true;
                case value_type::flt:
                    return a.flt().width == b.flt().width && same_bits(a.flt().val, b.flt().val);
                case value_type::simple: return a.simple() == b.simple();
                case value_type::tag:
                    return a.tag().id == b.tag().id && equal_ptr(a.tag().inner, b.tag().inner, visited);
                case value_type::semantic:
                    return a.semantic().name == b.semantic().name && equal_ptr(a.semantic().body, b.semantic().body, visited);
                case value_type::custom:
                    return &a.custom() == &b.custom();
                case value_type::array: {
                    // a pair of nodes already under comparison is assumed equal so that cycles terminate
                    if (!visited.emplace(a.identity(), b.identity()).second)
                        return true;
                    const auto &aa = a.array();
                    const auto &ba = b.array();
                    if (aa.size() != ba.size())
                        return false;
                    for (size_t i = 0; i < aa.size(); ++i) {
                        if (!equal(aa[i], ba[i], visited))
                            return false;
                    }
                    return true;
                }
                case value_type::map: {
                    if (!visited.emplace(a.identity(), b.identity()).second)
                        return true;
                    const auto &am = a.map();
                    const auto &bm = b.map();
                    if (am.size() != bm.size())
                        return false;
                    for (size_t i = 0; i < am.size(); ++i) {
                        if (!equal(am[i].first, bm[i].first, visited) || !equal(am[i].second, bm[i].second, visited))
                            return false;
                    }
                    return true;
                }
                default:
                    throw error(fmt::format("unsupported value type: {}", a.type()));
            }
        }
    }

    bool value::operator==(const value &o) const
    {
        visited_pairs visited {};
        return equal(*this, o, visited);
    }

    const value *map_node::find(const value &key) const
    {
        for (const auto &[k, v]: *this) {
            if (k == key)
                return &v;
        }
        return nullptr;
    }

    value arena::array(const std::initializer_list<value> items)
    {
        return value { _arrays.emplace_back(items) };
    }

    value arena::array(std::vector<value> &&items)
    {
        auto &node = _arrays.emplace_back();
        node.reserve(items.size());
        for (auto &v: items)
            node.emplace_back(std::move(v));
        return value { node };
    }

    value arena::map(const std::initializer_list<std::pair<value, value>> items)
    {
        return value { _maps.emplace_back(items) };
    }

    value arena::map(std::vector<std::pair<value, value>> &&items)
    {
        auto &node = _maps.emplace_back();
        node.reserve(items.size());
        for (auto &kv: items)
            node.emplace_back(std::move(kv));
        return value { node };
    }

    value arena::table(const std::vector<std::pair<value, value>> &entries)
    {
        const auto n = entries.size();
        bool sequence = n > 0;
        std::vector<const value *> ordered(n, nullptr);
        for (const auto &[k, v]: entries) {
            if (!sequence)
                break;
            if (k.type() != value_type::uint || k.uint() < 1 || k.uint() > n || ordered[k.uint() - 1]) {
                sequence = false;
                break;
            }
            ordered[k.uint() - 1] = &v;
        }
        if (sequence) {
            auto &node = _arrays.emplace_back();
            node.reserve(n);
            for (const auto *v: ordered)
                node.emplace_back(*v);
            return value { node };
        }
        return value { _maps.emplace_back(entries.begin(), entries.end()) };
    }

    bool is_text(const buffer data) noexcept
    {
        size_t i = 0;
        while (i < data.size()) {
            const auto b = data[i];
            size_t cont = 0;
            if ((b >= 0x07 && b <= 0x0D) || (b >= 0x20 && b <= 0x7E))
                cont = 0;
            else if (b >= 0xC2 && b <= 0xDF)
                cont = 1;
            else if (b >= 0xE0 && b <= 0xEF)
                cont = 2;
            else if (b >= 0xF0 && b <= 0xF4)
                cont = 3;
            else
                return false;
            if (data.size() - i - 1 < cont)
                return false;
            for (size_t j = 1; j <= cont; ++j) {
                if ((data[i + j] & 0xC0) != 0x80)
                    return false;
            }
            i += cont + 1;
        }
        return true;
    }

    bool is_valid_utf8(const buffer data) noexcept
    {
        size_t i = 0;
        while (i < data.size()) {
            const auto b = data[i];
            if (b < 0x80) {
                ++i;
                continue;
            }
            size_t cont;
            uint8_t lo = 0x80, hi = 0xBF;
            if (b >= 0xC2 && b <= 0xDF) {
                cont = 1;
            } else if (b >= 0xE0 && b <= 0xEF) {
                cont = 2;
                // reject overlong forms and UTF-16 surrogates
                if (b == 0xE0)
                    lo = 0xA0;
                else if (b == 0xED)
                    hi = 0x9F;
            } else if (b >= 0xF0 && b <= 0xF4) {
                cont = 3;
                if (b == 0xF0)
                    lo = 0x90;
                else if (b == 0xF4)
                    hi = 0x8F;
            } else {
                return false;
            }
            if (data.size() - i - 1 < cont)
                return false;
            if (data[i + 1] < lo || data[i + 1] > hi)
                return false;
            for (size_t j = 2; j <= cont; ++j) {
                if ((data[i + j] & 0xC0) != 0x80)
                    return false;
            }
            i += cont + 1;
        }
        return true;
    }

    namespace {
        using active_nodes = std::set<const void *>;

        void format_value(std::string &out, const value &v, active_nodes &active);

        void format_ptr(std::string &out, const std::shared_ptr<const value> &v, active_nodes &active)
        {
            if (v)
                format_value(out, *v, active);
            else
                out += "nullptr";
        }

        void format_value(std::string &out, const value &v, active_nodes &active)
        {
            auto out_it = std::back_inserter(out);
            switch (v.type()) {
                case value_type::uint:
                    fmt::format_to(out_it, "{}", v.uint());
                    break;
                case value_type::nint:
                    if (v.nint_raw() == std::numeric_limits<uint64_t>::max())
                        out += "-18446744073709551616";
                    else
                        fmt::format_to(out_it, "-{}", v.nint_raw() + 1);
                    break;
                case value_type::bytes:
                    fmt::format_to(out_it, "h'{}'", v.bytes());
                    break;
                case value_type::text:
                    fmt::format_to(out_it, "\"{}\"", v.text());
                    break;
                case value_type::boolean:
                    out += v.boolean() ? "true" : "false";
                    break;
                case value_type::null:
                    out += "null";
                    break;
                case value_type::undefined:
                    out += "undefined";
                    break;
                case value_type::brk:
                    out += "break";
                    break;
                case value_type::flt:
                    fmt::format_to(out_it, "{}_{}", v.flt().val, v.flt().width);
                    break;
                case value_type::simple:
                    fmt::format_to(out_it, "simple({})", v.simple());
                    break;
                case value_type::tag:
                    fmt::format_to(out_it, "{}(", v.tag().id);
                    format_ptr(out, v.tag().inner, active);
                    out += ')';
                    break;
                case value_type::semantic:
                    fmt::format_to(out_it, "{}(", v.semantic().name);
                    format_ptr(out, v.semantic().body, active);
                    out += ')';
                    break;
                case value_type::custom:
                    out += "custom";
                    break;
                case value_type::array: {
                    if (!active.emplace(v.identity()).second) {
                        out += "[...]";
                        break;
                    }
                    out += '[';
                    const auto &items = v.array();
                    for (size_t i = 0; i < items.size(); ++i) {
                        if (i)
                            out += ", ";
                        format_value(out, items[i], active);
                    }
                    out += ']';
                    active.erase(v.identity());
                    break;
                }
                case value_type::map: {
                    if (!active.emplace(v.identity()).second) {
                        out += "{...}";
                        break;
                    }
                    out += '{';
                    const auto &items = v.map();
                    for (size_t i = 0; i < items.size(); ++i) {
                        if (i)
                            out += ", ";
                        format_value(out, items[i].first, active);
                        out += ": ";
                        format_value(out, items[i].second, active);
                    }
                    out += '}';
                    active.erase(v.identity());
                    break;
                }
                default:
                    throw error(fmt::format("unsupported value type: {}", v.type()));
            }
        }
    }

    std::string to_string(const value &v)
    {
        std::string out {};
        active_nodes active {};
        format_value(out, v, active);
        return out;
    }
}
