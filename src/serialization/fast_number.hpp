#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

namespace wh::serialization
{
    enum class NumberErrorCode
    {
        empty_input,
        invalid_character,
        overflow,
        underflow,
    };

    struct NumberError final
    {
        NumberErrorCode code{ NumberErrorCode::invalid_character };
    };

    // Decimal parsing of config values and CLI sizes. No whitespace, no
    // locale handling.
    [[nodiscard]] std::expected<std::int32_t, NumberError> parse_i32(std::wstring_view text) noexcept;
    [[nodiscard]] std::expected<std::uint32_t, NumberError> parse_u32(std::wstring_view text) noexcept;

    // Hexadecimal window handle values (`0x1A2B`). With `require_prefix`
    // the `0x`/`0X` prefix is mandatory, otherwise optional.
    [[nodiscard]] std::expected<std::uint64_t, NumberError> parse_hex_u64(std::wstring_view text, bool require_prefix) noexcept;
}
