#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace docscope::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i32 = std::int32_t;
    using i64 = std::int64_t;

    // Separator between namespace and type name in an EntityType tag.
    inline constexpr char kNamespaceSeparator = '.';

    // Name of the tenancy tag field stamped on every saved record.
    inline constexpr std::string_view kEntityTypeField = "EntityType";

    // Conventional identifier field name on document types, and the name the
    // store reserves for it.
    inline constexpr std::string_view kIdField = "Id";
    inline constexpr std::string_view kStoreIdField = "id";

} // namespace docscope::core
