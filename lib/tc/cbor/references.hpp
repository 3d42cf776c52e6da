/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_REFERENCES_HPP
#define TURBO_CBOR_CBOR_REFERENCES_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <tc/cbor/value.hpp>

namespace turbo_cbor::cbor {
    // containers marked with the shareable tag in the order of their appearance
    struct shared_table {
        std::optional<size_t> find(const void *identity) const;
        // registers a container before its children are visited so that they can refer back to it
        size_t add(const value &container);
        // pos is reported when the index is out of range
        const value &at(uint64_t idx, size_t pos) const;

        size_t size() const noexcept
        {
            return _items.size();
        }
    private:
        std::map<const void *, size_t> _index {};
        std::vector<value> _items {};
    };

    // the shortest text or byte string worth remembering given the number of already remembered strings
    extern size_t min_stringref_length(size_t table_size) noexcept;

    struct string_table {
        // s must be a text or a byte string
        std::optional<size_t> find(const value &s) const;
        // remembers s if it is long enough and no equal string is present
        bool add(const value &s);
        const value &at(uint64_t idx, size_t pos) const;

        size_t size() const noexcept
        {
            return _items.size();
        }
    private:
        using key_type = std::pair<value_type, std::string>;

        std::map<key_type, size_t> _index {};
        std::vector<value> _items {};

        static key_type _key(const value &s);
    };

    // the reference state of a single encode or decode call
    struct reference_tracker {
        shared_table shared {};

        void push_string_scope();
        void pop_string_scope();

        bool string_scope_active() const noexcept
        {
            return !_strings.empty();
        }

        // the innermost string scope or nullptr outside of any
        string_table *strings() noexcept
        {
            return _strings.empty() ? nullptr : &_strings.back();
        }
    private:
        std::vector<string_table> _strings {};
    };

    // restores the enclosing string scope on the way out including by an exception
    struct string_scope {
        explicit string_scope(reference_tracker &refs):
            _refs { refs }
        {
            _refs.push_string_scope();
        }

        string_scope(const string_scope &) =delete;

        ~string_scope()
        {
            _refs.pop_string_scope();
        }
    private:
        reference_tracker &_refs;
    };
}

#endif // !TURBO_CBOR_CBOR_REFERENCES_HPP
