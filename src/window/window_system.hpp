#pragma once

// Native window operations used by the hub.
//
// Every window the engine touches belongs to someone else and can disappear
// between two calls. Implementations therefore never assume a handle is
// alive: queries on a dead handle return empty/zero values, mutations return
// the Win32 error (`ERROR_INVALID_WINDOW_HANDLE` once the window is gone).
//
// `Win32WindowSystem` is the production implementation. Engine tests use an
// in-memory fake.

#include "core/window_handle.hpp"

#include <Windows.h>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wh::window
{
    struct WindowStyles final
    {
        DWORD style{ 0 };
        DWORD ex_style{ 0 };

        friend bool operator==(const WindowStyles&, const WindowStyles&) = default;
    };

    // Position and size; screen coordinates for top-level windows, parent
    // client coordinates for children.
    struct PaneRect final
    {
        int x{ 0 };
        int y{ 0 };
        int width{ 0 };
        int height{ 0 };

        friend bool operator==(const PaneRect&, const PaneRect&) = default;
    };

    enum class ShowCommand
    {
        hide,
        show,
        show_no_activate,
        restore,
    };

    // Opaque icon value handed to the UI layer (an HICON owned by the target
    // process or its window class). Zero means "no icon".
    using IconReference = std::uintptr_t;

    class WindowSystem
    {
    public:
        virtual ~WindowSystem() = default;

        [[nodiscard]] virtual std::vector<core::WindowHandle> top_level_windows() = 0;

        [[nodiscard]] virtual bool is_window(core::WindowHandle window) noexcept = 0;
        [[nodiscard]] virtual bool is_visible(core::WindowHandle window) noexcept = 0;
        [[nodiscard]] virtual bool is_minimized(core::WindowHandle window) noexcept = 0;

        // Zero when the window no longer exists.
        [[nodiscard]] virtual DWORD process_id(core::WindowHandle window) noexcept = 0;
        [[nodiscard]] virtual DWORD thread_id(core::WindowHandle window) noexcept = 0;

        [[nodiscard]] virtual std::wstring title(core::WindowHandle window) = 0;
        [[nodiscard]] virtual std::wstring class_name(core::WindowHandle window) = 0;
        [[nodiscard]] virtual std::wstring process_image_path(DWORD process_id) = 0;
        [[nodiscard]] virtual IconReference icon(core::WindowHandle window) noexcept = 0;

        [[nodiscard]] virtual std::optional<PaneRect> bounds(core::WindowHandle window) noexcept = 0;
        [[nodiscard]] virtual std::expected<WindowStyles, DWORD> styles(core::WindowHandle window) noexcept = 0;

        // Empty handle for top-level windows (parented to the desktop).
        [[nodiscard]] virtual core::WindowHandle parent(core::WindowHandle window) noexcept = 0;
        [[nodiscard]] virtual bool is_descendant(core::WindowHandle ancestor, core::WindowHandle window) noexcept = 0;
        [[nodiscard]] virtual core::WindowHandle find_descendant_by_class(core::WindowHandle window, std::wstring_view class_name) = 0;

        [[nodiscard]] virtual DWORD current_process_id() noexcept = 0;
        [[nodiscard]] virtual DWORD current_thread_id() noexcept = 0;

        // Applies both style words and forces a frame recalculation.
        [[nodiscard]] virtual std::expected<void, DWORD> set_styles(core::WindowHandle window, const WindowStyles& styles) noexcept = 0;

        // An empty `parent` returns the window to the desktop.
        [[nodiscard]] virtual std::expected<void, DWORD> set_parent(core::WindowHandle window, core::WindowHandle parent) noexcept = 0;

        // Moves/resizes without activating or changing visibility.
        [[nodiscard]] virtual std::expected<void, DWORD> set_bounds(core::WindowHandle window, const PaneRect& rect) noexcept = 0;

        virtual void bring_to_top(core::WindowHandle window) noexcept = 0;
        virtual void show(core::WindowHandle window, ShowCommand command) noexcept = 0;

        // Invalidate + synchronous update of the whole window, frame and
        // children included. False when the window is gone.
        virtual bool redraw(core::WindowHandle window) noexcept = 0;

        [[nodiscard]] virtual std::expected<void, DWORD> attach_thread_input(DWORD from_thread, DWORD to_thread, bool attach) noexcept = 0;

        // WM_ACTIVATE followed by WM_NCACTIVATE, each bounded by `timeout_ms`.
        virtual bool send_activation(core::WindowHandle window, bool active, DWORD timeout_ms) noexcept = 0;

        virtual void set_focus(core::WindowHandle window) noexcept = 0;
        virtual void set_foreground(core::WindowHandle window) noexcept = 0;
        virtual bool post_close(core::WindowHandle window) noexcept = 0;
    };
}
