/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TURBO_CBOR_COMMON_VARIANT_HPP
#define TURBO_CBOR_COMMON_VARIANT_HPP

#include <source_location>
#include <typeinfo>
#include <variant>
#include <tc/common/error.hpp>
#include <tc/common/format.hpp>

namespace turbo_cbor::variant {
    // std::get with an error message that names the requested type, the held alternative and the caller
    template<typename TO, typename FROM>
    const TO &get_nice(const FROM &v, const std::source_location &loc=std::source_location::current())
    {
        if (const auto *p = std::get_if<TO>(&v); p) [[likely]]
            return *p;
        const auto held = std::visit([](const auto &vo) { return typeid(vo).name(); }, v);
        throw error(fmt::format("expected type {} but got {} (alternative #{}) at {}", typeid(TO).name(), held, v.index(), loc));
    }
}

#endif // !TURBO_CBOR_COMMON_VARIANT_HPP
