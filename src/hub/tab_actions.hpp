#pragma once

// Hotkey-mapped tab actions. Registration of the global hotkeys belongs to
// the UI layer; the engine only receives the resulting chord strings.
//
// Chords use the `modifier+modifier+key` form with key codes such as
// `digit1`, `keyw`, `tab`, e.g. `shift+control+tab`. Matching is
// case-insensitive and modifier order does not matter.

#include <cstddef>
#include <optional>
#include <string_view>

namespace wh::hub
{
    enum class TabActionKind
    {
        close_current,
        pop_out_current,
        next,
        previous,
        activate_index,
    };

    struct TabAction final
    {
        TabActionKind kind{ TabActionKind::next };

        // Zero-based; only used by `activate_index`.
        std::size_t index{ 0 };

        friend bool operator==(const TabAction&, const TabAction&) = default;
    };

    // `alt+digitN` (N = 1..9) activates tab N, `control+keyw` closes,
    // `control+shift+keyo` pops out, `control+tab` / `shift+control+tab`
    // cycle forward and back.
    [[nodiscard]] std::optional<TabAction> parse_chord(std::wstring_view chord);

    // Tab to activate after the active tab at `removed_index` is removed from
    // a strip that now holds `remaining` tabs: the right neighbour, or the
    // left one when the removed tab was last.
    [[nodiscard]] std::optional<std::size_t> neighbour_after_removal(std::size_t removed_index, std::size_t remaining) noexcept;

    // Cyclic successor/predecessor of `current` among `count` tabs.
    [[nodiscard]] std::size_t cycle_index(std::size_t current, std::size_t count, bool forward) noexcept;
}
