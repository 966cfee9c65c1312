#include "hub/tab_actions.hpp"

#include <cwctype>
#include <string>

namespace wh::hub
{
    namespace
    {
        struct Chord final
        {
            bool shift{ false };
            bool control{ false };
            bool alt{ false };
            std::wstring key;
        };

        [[nodiscard]] std::optional<Chord> split_chord(const std::wstring_view text)
        {
            Chord chord{};
            std::wstring token;
            std::wstring lowered;
            lowered.reserve(text.size());
            for (const wchar_t ch : text)
            {
                if (ch != L' ')
                {
                    lowered.push_back(static_cast<wchar_t>(std::towlower(ch)));
                }
            }

            size_t start = 0;
            for (;;)
            {
                const size_t plus = lowered.find(L'+', start);
                token = lowered.substr(start, plus == std::wstring::npos ? std::wstring::npos : plus - start);
                const bool last = plus == std::wstring::npos;

                if (token.empty())
                {
                    return std::nullopt;
                }
                if (last)
                {
                    chord.key = std::move(token);
                    return chord;
                }

                if (token == L"shift")
                {
                    chord.shift = true;
                }
                else if (token == L"control" || token == L"ctrl")
                {
                    chord.control = true;
                }
                else if (token == L"alt")
                {
                    chord.alt = true;
                }
                else
                {
                    return std::nullopt;
                }
                start = plus + 1;
            }
        }
    }

    std::optional<TabAction> parse_chord(const std::wstring_view chord_text)
    {
        const std::optional<Chord> chord = split_chord(chord_text);
        if (!chord)
        {
            return std::nullopt;
        }

        if (chord->alt && !chord->control && !chord->shift)
        {
            constexpr std::wstring_view digit_prefix = L"digit";
            if (chord->key.size() == digit_prefix.size() + 1 && chord->key.starts_with(digit_prefix))
            {
                const wchar_t digit = chord->key.back();
                if (digit >= L'1' && digit <= L'9')
                {
                    return TabAction{ .kind = TabActionKind::activate_index, .index = static_cast<std::size_t>(digit - L'1') };
                }
            }
            return std::nullopt;
        }

        if (!chord->control || chord->alt)
        {
            return std::nullopt;
        }

        if (chord->key == L"tab")
        {
            return TabAction{ .kind = chord->shift ? TabActionKind::previous : TabActionKind::next };
        }
        if (chord->key == L"keyw" && !chord->shift)
        {
            return TabAction{ .kind = TabActionKind::close_current };
        }
        if (chord->key == L"keyo" && chord->shift)
        {
            return TabAction{ .kind = TabActionKind::pop_out_current };
        }
        return std::nullopt;
    }

    std::optional<std::size_t> neighbour_after_removal(const std::size_t removed_index, const std::size_t remaining) noexcept
    {
        if (remaining == 0)
        {
            return std::nullopt;
        }
        return removed_index < remaining ? removed_index : remaining - 1;
    }

    std::size_t cycle_index(const std::size_t current, const std::size_t count, const bool forward) noexcept
    {
        if (count == 0)
        {
            return 0;
        }
        if (forward)
        {
            return (current + 1) % count;
        }
        return current == 0 ? count - 1 : current - 1;
    }
}
