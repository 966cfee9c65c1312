#pragma once

// Style-bit rules for turning an independent top-level window into a child
// pane of the host container.

#include "window/window_system.hpp"

#include <Windows.h>

namespace wh::window
{
    // Chrome and top-level framing removed while embedded. WS_CAPTION is
    // WS_BORDER | WS_DLGFRAME; both halves are listed so a window carrying
    // only one of them is stripped as well.
    inline constexpr DWORD kChromeStyleBits = static_cast<DWORD>(
        WS_CAPTION |
        WS_BORDER |
        WS_DLGFRAME |
        WS_THICKFRAME |
        WS_MINIMIZEBOX |
        WS_MAXIMIZEBOX |
        WS_SYSMENU |
        WS_POPUP);

    inline constexpr DWORD kEmbeddedStyleBits = static_cast<DWORD>(WS_CHILD | WS_VISIBLE);

    // Always-on-top, taskbar presence and framed-edge extended bits.
    inline constexpr DWORD kTopLevelExStyleBits = static_cast<DWORD>(
        WS_EX_TOPMOST |
        WS_EX_APPWINDOW |
        WS_EX_DLGMODALFRAME |
        WS_EX_WINDOWEDGE);

    [[nodiscard]] constexpr WindowStyles embedded_styles(const WindowStyles original) noexcept
    {
        return WindowStyles{
            .style = (original.style & ~kChromeStyleBits) | kEmbeddedStyleBits,
            .ex_style = original.ex_style & ~kTopLevelExStyleBits,
        };
    }

    [[nodiscard]] constexpr bool is_tool_window(const WindowStyles styles) noexcept
    {
        return (styles.ex_style & static_cast<DWORD>(WS_EX_TOOLWINDOW)) != 0;
    }

    [[nodiscard]] constexpr bool clips_children(const WindowStyles styles) noexcept
    {
        return (styles.style & static_cast<DWORD>(WS_CLIPCHILDREN)) != 0;
    }

    [[nodiscard]] constexpr WindowStyles with_clip_children(const WindowStyles styles) noexcept
    {
        return WindowStyles{
            .style = styles.style | static_cast<DWORD>(WS_CLIPCHILDREN),
            .ex_style = styles.ex_style,
        };
    }
}
