#include "serialization/fast_number.hpp"

#include <limits>

namespace wh::serialization
{
    namespace
    {
        [[nodiscard]] constexpr NumberError make_error(const NumberErrorCode code) noexcept
        {
            return NumberError{ .code = code };
        }

        [[nodiscard]] constexpr int hex_digit_value(const wchar_t ch) noexcept
        {
            if (ch >= L'0' && ch <= L'9')
            {
                return ch - L'0';
            }
            if (ch >= L'a' && ch <= L'f')
            {
                return ch - L'a' + 10;
            }
            if (ch >= L'A' && ch <= L'F')
            {
                return ch - L'A' + 10;
            }
            return -1;
        }

        // Accumulates decimal digits into a 64-bit value, failing once `limit`
        // is exceeded.
        [[nodiscard]] std::expected<std::uint64_t, NumberError> accumulate_decimal(
            const std::wstring_view digits,
            const std::uint64_t limit,
            const NumberErrorCode overflow_code) noexcept
        {
            if (digits.empty())
            {
                return std::unexpected(make_error(NumberErrorCode::invalid_character));
            }

            std::uint64_t value = 0;
            for (const wchar_t ch : digits)
            {
                if (ch < L'0' || ch > L'9')
                {
                    return std::unexpected(make_error(NumberErrorCode::invalid_character));
                }

                value = value * 10 + static_cast<std::uint64_t>(ch - L'0');
                if (value > limit)
                {
                    return std::unexpected(make_error(overflow_code));
                }
            }
            return value;
        }
    }

    std::expected<std::int32_t, NumberError> parse_i32(const std::wstring_view text) noexcept
    {
        if (text.empty())
        {
            return std::unexpected(make_error(NumberErrorCode::empty_input));
        }

        const bool negative = text.front() == L'-';
        const bool has_sign = negative || text.front() == L'+';
        const std::wstring_view digits = has_sign ? text.substr(1) : text;

        constexpr std::uint64_t max_positive = static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
        const auto magnitude = accumulate_decimal(
            digits,
            negative ? max_positive + 1 : max_positive,
            negative ? NumberErrorCode::underflow : NumberErrorCode::overflow);
        if (!magnitude)
        {
            return std::unexpected(magnitude.error());
        }

        if (negative)
        {
            return static_cast<std::int32_t>(-static_cast<std::int64_t>(*magnitude));
        }
        return static_cast<std::int32_t>(*magnitude);
    }

    std::expected<std::uint32_t, NumberError> parse_u32(const std::wstring_view text) noexcept
    {
        if (text.empty())
        {
            return std::unexpected(make_error(NumberErrorCode::empty_input));
        }

        const auto value = accumulate_decimal(
            text,
            std::numeric_limits<std::uint32_t>::max(),
            NumberErrorCode::overflow);
        if (!value)
        {
            return std::unexpected(value.error());
        }
        return static_cast<std::uint32_t>(*value);
    }

    std::expected<std::uint64_t, NumberError> parse_hex_u64(std::wstring_view text, const bool require_prefix) noexcept
    {
        if (text.empty())
        {
            return std::unexpected(make_error(NumberErrorCode::empty_input));
        }

        const bool has_prefix = text.size() >= 2 && text[0] == L'0' && (text[1] == L'x' || text[1] == L'X');
        if (require_prefix && !has_prefix)
        {
            return std::unexpected(make_error(NumberErrorCode::invalid_character));
        }
        if (has_prefix)
        {
            text.remove_prefix(2);
        }
        if (text.empty())
        {
            return std::unexpected(make_error(NumberErrorCode::invalid_character));
        }
        if (text.size() > 16)
        {
            return std::unexpected(make_error(NumberErrorCode::overflow));
        }

        std::uint64_t value = 0;
        for (const wchar_t ch : text)
        {
            const int digit = hex_digit_value(ch);
            if (digit < 0)
            {
                return std::unexpected(make_error(NumberErrorCode::invalid_character));
            }
            value = (value << 4) | static_cast<std::uint64_t>(digit);
        }
        return value;
    }
}
