#include "host/hotkeys.hpp"

#include <algorithm>
#include <cwctype>

namespace wh::host
{
    const HotkeyBinding* find_hotkey(const int id) noexcept
    {
        const auto it = std::find_if(kHotkeyBindings.begin(), kHotkeyBindings.end(), [id](const HotkeyBinding& binding) {
            return binding.id == id;
        });
        return it == kHotkeyBindings.end() ? nullptr : &*it;
    }

    std::optional<std::wstring> chord_text(const UINT modifiers, const UINT virtual_key)
    {
        std::wstring key;
        if (virtual_key >= '0' && virtual_key <= '9')
        {
            key = L"digit";
            key.push_back(static_cast<wchar_t>(virtual_key));
        }
        else if (virtual_key >= 'A' && virtual_key <= 'Z')
        {
            key = L"key";
            key.push_back(static_cast<wchar_t>(std::towlower(static_cast<wint_t>(virtual_key))));
        }
        else if (virtual_key == VK_TAB)
        {
            key = L"tab";
        }
        else
        {
            return std::nullopt;
        }

        std::wstring chord;
        if ((modifiers & MOD_SHIFT) != 0)
        {
            chord.append(L"shift+");
        }
        if ((modifiers & MOD_CONTROL) != 0)
        {
            chord.append(L"control+");
        }
        if ((modifiers & MOD_ALT) != 0)
        {
            chord.append(L"alt+");
        }
        chord.append(key);
        return chord;
    }
}
