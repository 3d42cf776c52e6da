/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tc/cbor/error.hpp>
#include <tc/cbor/references.hpp>

namespace turbo_cbor::cbor {
    std::optional<size_t> shared_table::find(const void *identity) const
    {
        if (const auto it = _index.find(identity); it != _index.end())
            return it->second;
        return {};
    }

    size_t shared_table::add(const value &container)
    {
        if (!container.is_container())
            throw error(fmt::format("only arrays and maps can be shared but got {}", container.type()));
        const auto idx = _items.size();
        const auto [it, created] = _index.try_emplace(container.identity(), idx);
        if (!created)
            throw error(fmt::format("the container is already shared at index {}", it->second));
        _items.emplace_back(container);
        return idx;
    }

    const value &shared_table::at(const uint64_t idx, const size_t pos) const
    {
        if (idx >= _items.size())
            throw bad_reference_error(pos, fmt::format("shared reference {} is out of range, only {} containers are shared", idx, _items.size()));
        return _items[idx];
    }

    size_t min_stringref_length(const size_t table_size) noexcept
    {
        if (table_size < 24)
            return 3;
        if (table_size < 256)
            return 4;
        if (table_size < 65536)
            return 5;
        if (table_size < 4294967296ULL)
            return 7;
        return 11;
    }

    string_table::key_type string_table::_key(const value &s)
    {
        switch (s.type()) {
            case value_type::text: return { value_type::text, s.text() };
            case value_type::bytes: return { value_type::bytes, std::string { s.bytes().str() } };
            default: throw error(fmt::format("only text and byte strings can be referenced but got {}", s.type()));
        }
    }

    std::optional<size_t> string_table::find(const value &s) const
    {
        if (const auto it = _index.find(_key(s)); it != _index.end())
            return it->second;
        return {};
    }

    bool string_table::add(const value &s)
    {
        auto key = _key(s);
        if (key.second.size() < min_stringref_length(_items.size()))
            return false;
        if (!_index.try_emplace(std::move(key), _items.size()).second)
            return false;
        _items.emplace_back(s);
        return true;
    }

    const value &string_table::at(const uint64_t idx, const size_t pos) const
    {
        if (idx >= _items.size())
            throw bad_reference_error(pos, fmt::format("string reference {} is out of range, only {} strings are known", idx, _items.size()));
        return _items[idx];
    }

    void reference_tracker::push_string_scope()
    {
        _strings.emplace_back();
    }

    void reference_tracker::pop_string_scope()
    {
        if (!_strings.empty())
            _strings.pop_back();
    }
}
