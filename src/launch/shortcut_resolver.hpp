#pragma once

// `.lnk` resolution through the shell's `IShellLinkW`.
//
// Launch-and-Capture starts the shortcut's target directly instead of going
// through `cmd /C start`, so the resulting process id is the one whose
// windows are polled.

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>

namespace wh::launch
{
    struct ShortcutError final
    {
        std::wstring context;
        HRESULT result{ E_FAIL };
    };

    struct ResolvedShortcut final
    {
        std::wstring target;
        std::wstring arguments;
        std::wstring working_directory;
    };

    [[nodiscard]] bool is_shortcut_path(std::wstring_view path) noexcept;

    // Initializes COM on the calling thread for the duration of the call.
    [[nodiscard]] std::expected<ResolvedShortcut, ShortcutError> resolve_shortcut(const std::wstring& path) noexcept;
}
