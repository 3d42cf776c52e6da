/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_CBOR_TAG_REGISTRY_HPP
#define TURBO_CBOR_CBOR_TAG_REGISTRY_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <tc/cbor/value.hpp>

namespace turbo_cbor::cbor {
    // turns the decoded body of a tag into its interpretation, pos is the offset of the tag's header
    using decode_hook = std::function<value(uint64_t id, const value &body, size_t pos)>;
    // validates the body of a semantic value and returns what must be written after the tag header
    using encode_hook = std::function<value(const value &body)>;

    struct tag_entry {
        uint64_t id = 0;
        std::string name {};
        encode_hook encode {};
        decode_hook decode {};
        // shareable, sharedref, nthstring and stringref are resolved by the codec itself
        bool reference = false;
        // a marker tag that is not followed by a body
        bool bodyless = false;
    };

    /*
     * Process-wide id <-> interpretation table initialized with the built-in tags on the first use.
     * Registration is not synchronized and must happen before concurrent encode and decode calls.
     */
    struct tag_registry {
        static tag_registry &get();

        // the pass-through entry that produces tag_val for unregistered ids
        const tag_entry &resolve(uint64_t id) const noexcept;
        const tag_entry *find(std::string_view name) const noexcept;
        void add(tag_entry entry);

        size_t size() const noexcept
        {
            return _by_id.size();
        }
    private:
        std::map<uint64_t, tag_entry> _by_id {};
        std::map<std::string, uint64_t, std::less<>> _by_name {};
        tag_entry _unknown {};

        tag_registry();
    };

    // replaces any previous registration of the id
    // a name taken from another id is used for encoding with the new id while the other id still decodes
    extern void register_tag(uint64_t id, std::string_view name, encode_hook encode, decode_hook decode);
}

#endif // !TURBO_CBOR_CBOR_TAG_REGISTRY_HPP
