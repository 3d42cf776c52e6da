/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <set>
#include <typeinfo>
#include <tc/cbor/codec.hpp>
#include <tc/cbor/decoder.hpp>
#include <tc/cbor/error.hpp>
#include <tc/cbor/references.hpp>
#include <tc/cbor/tag-registry.hpp>
#include <tc/logger.hpp>

namespace turbo_cbor::cbor {
    namespace {
        struct value_writer {
            value_writer(encoder &enc, const encode_options &opts):
                _enc { enc }, _opts { opts }
            {
            }

            void write_top(const value &v)
            {
                if (_opts.string_refs) {
                    _enc.tag(tag_id::stringref);
                    string_scope scope { _refs };
                    write(v);
                } else {
                    write(v);
                }
            }

            void write(const value &v)
            {
                switch (v.type()) {
                    case value_type::uint:
                        _enc.uint(v.uint());
                        break;
                    case value_type::nint:
                        _enc.nint(v.nint_raw());
                        break;
                    case value_type::bytes:
                        _write_string(v);
                        break;
                    case value_type::text:
                        if (!is_valid_utf8(buffer { v.text() })) [[unlikely]]
                            throw unencodable_error(fmt::format("text is not valid UTF-8: {}", hex_preview { buffer { v.text() } }));
                        _write_string(v);
                        break;
                    case value_type::array:
                    case value_type::map:
                        _write_container(v);
                        break;
                    case value_type::boolean:
                        _enc.boolean(v.boolean());
                        break;
                    case value_type::null:
                        _enc.s_null();
                        break;
                    case value_type::undefined:
                        _enc.s_undefined();
                        break;
                    case value_type::brk:
                        _enc.s_break();
                        break;
                    case value_type::flt:
                        _enc.flt(v.flt().val, v.flt().width);
                        break;
                    case value_type::simple:
                        // these ids are reserved for false, true, null and undefined
                        if (v.simple() >= 20 && v.simple() <= 23) [[unlikely]]
                            throw unencodable_error(fmt::format("simple({}) collides with a predefined simple value", v.simple()));
                        _enc.simple(v.simple());
                        break;
                    case value_type::tag:
                        _enc.tag(v.tag().id);
                        write(*v.tag().inner);
                        break;
                    case value_type::semantic:
                        _write_semantic(v.semantic());
                        break;
                    case value_type::custom:
                        v.custom().to_cbor(_enc);
                        break;
                    default:
                        throw unencodable_error(fmt::format("values of type {} have no CBOR representation", v.type()));
                }
            }
        private:
            encoder &_enc;
            const encode_options &_opts;
            reference_tracker _refs {};
            // the containers being written, used to detect cycles when shared references are off
            std::set<const void *> _active {};

            void _write_string(const value &v)
            {
                if (auto *strings = _refs.strings(); strings) {
                    if (const auto idx = strings->find(v); idx) {
                        _enc.tag(tag_id::nthstring).uint(*idx);
                        return;
                    }
                    strings->add(v);
                }
                if (v.type() == value_type::text)
                    _enc.text(v.text());
                else
                    _enc.bytes(v.bytes());
            }

            void _write_container(const value &v)
            {
                if (_opts.shared_refs) {
                    if (const auto idx = _refs.shared.find(v.identity()); idx) {
                        _enc.tag(tag_id::sharedref).uint(*idx);
                        return;
                    }
                    _enc.tag(tag_id::shareable);
                    _refs.shared.add(v);
                } else if (!_active.emplace(v.identity()).second) [[unlikely]] {
                    throw unencodable_error("a cyclic value can be encoded only with shared references enabled");
                }
                if (v.type() == value_type::array) {
                    const auto &items = v.array();
                    _enc.array(items.size());
                    for (const auto &item: items)
                        write(item);
                } else {
                    const auto &items = v.map();
                    _enc.map(items.size());
                    for (const auto &[key, val]: items) {
                        write(key);
                        write(val);
                    }
                }
                if (!_opts.shared_refs)
                    _active.erase(v.identity());
            }

            void _write_semantic(const semantic_val &sv)
            {
                if (!sv.body) [[unlikely]]
                    throw unencodable_error(fmt::format("semantic value {} has no body", sv.name));
                const auto *entry = tag_registry::get().find(sv.name);
                if (!entry) [[unlikely]]
                    throw unencodable_error(fmt::format("no tag is registered under the name {}", sv.name));
                const auto body = entry->encode(*sv.body);
                _enc.tag(entry->id);
                if (entry->bodyless)
                    return;
                if (entry->reference && entry->id == tag_id::stringref) {
                    string_scope scope { _refs };
                    write(body);
                } else {
                    write(body);
                }
            }
        };
    }

    void encode(encoder &enc, const value &v, const encode_options &opts)
    {
        value_writer w { enc, opts };
        w.write_top(v);
    }

    uint8_vector encode(const value &v, const encode_options &opts)
    {
        encoder enc {};
        encode(enc, v, opts);
        return std::move(enc.cbor());
    }

    decoded decode(arena &a, const buffer data, const size_t pos, const decode_options &opts)
    {
        decoder dec { a, data, pos, opts };
        auto v = dec.read();
        return { std::move(v), dec.pos() };
    }

    decode_status try_decode(arena &a, const buffer data, const size_t pos, const decode_options &opts)
    {
        try {
            return { decode(a, data, pos, opts) };
        } catch (const decode_error &ex) {
            logger::debug("CBOR decode failed at byte {}: {}", ex.pos(), ex.what());
            return { {}, ex.what(), ex.pos() };
        } catch (const error &ex) {
            logger::debug("CBOR decode failed at byte {}: {}", pos, ex.what());
            return { {}, ex.what(), pos };
        } catch (const std::exception &ex) {
            // failures of user decode hooks are reported at the start of the item
            logger::debug("CBOR decode failed at byte {} with {}: {}", pos, typeid(ex).name(), ex.what());
            return { {}, ex.what(), pos };
        }
    }

    std::vector<value> decode_all(arena &a, const buffer data, const decode_options &opts)
    {
        std::vector<value> items {};
        decoder dec { a, data, 0, opts };
        while (!dec.done())
            items.emplace_back(dec.read());
        return items;
    }
}
