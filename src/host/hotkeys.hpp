#pragma once

// Tab hotkeys of the host window.
//
// The host registers these with `RegisterHotKey` while it is the active
// window, turns a WM_HOTKEY back into a chord string and lets
// `hub::parse_chord` decide the tab action.

#include <Windows.h>

#include <array>
#include <optional>
#include <string>

namespace wh::host
{
    struct HotkeyBinding final
    {
        int id{ 0 };
        UINT modifiers{ 0 };
        UINT virtual_key{ 0 };
    };

    inline constexpr std::array<HotkeyBinding, 13> kHotkeyBindings{ {
        { 1, MOD_ALT, '1' },
        { 2, MOD_ALT, '2' },
        { 3, MOD_ALT, '3' },
        { 4, MOD_ALT, '4' },
        { 5, MOD_ALT, '5' },
        { 6, MOD_ALT, '6' },
        { 7, MOD_ALT, '7' },
        { 8, MOD_ALT, '8' },
        { 9, MOD_ALT, '9' },
        { 10, MOD_CONTROL, 'W' },
        { 11, MOD_CONTROL, VK_TAB },
        { 12, MOD_CONTROL | MOD_SHIFT, VK_TAB },
        { 13, MOD_CONTROL | MOD_SHIFT, 'O' },
    } };

    [[nodiscard]] const HotkeyBinding* find_hotkey(int id) noexcept;

    // `shift+control+alt+<key>` with only the modifiers present, keys named
    // `digitN`, `keyX` or `tab`. Other keys have no chord.
    [[nodiscard]] std::optional<std::wstring> chord_text(UINT modifiers, UINT virtual_key);
}
