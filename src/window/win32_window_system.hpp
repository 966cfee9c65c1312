#pragma once

#include "window/window_system.hpp"

namespace wh::window
{
    class Win32WindowSystem final : public WindowSystem
    {
    public:
        [[nodiscard]] std::vector<core::WindowHandle> top_level_windows() override;

        [[nodiscard]] bool is_window(core::WindowHandle window) noexcept override;
        [[nodiscard]] bool is_visible(core::WindowHandle window) noexcept override;
        [[nodiscard]] bool is_minimized(core::WindowHandle window) noexcept override;

        [[nodiscard]] DWORD process_id(core::WindowHandle window) noexcept override;
        [[nodiscard]] DWORD thread_id(core::WindowHandle window) noexcept override;

        [[nodiscard]] std::wstring title(core::WindowHandle window) override;
        [[nodiscard]] std::wstring class_name(core::WindowHandle window) override;
        [[nodiscard]] std::wstring process_image_path(DWORD process_id) override;
        [[nodiscard]] IconReference icon(core::WindowHandle window) noexcept override;

        [[nodiscard]] std::optional<PaneRect> bounds(core::WindowHandle window) noexcept override;
        [[nodiscard]] std::expected<WindowStyles, DWORD> styles(core::WindowHandle window) noexcept override;

        [[nodiscard]] core::WindowHandle parent(core::WindowHandle window) noexcept override;
        [[nodiscard]] bool is_descendant(core::WindowHandle ancestor, core::WindowHandle window) noexcept override;
        [[nodiscard]] core::WindowHandle find_descendant_by_class(core::WindowHandle window, std::wstring_view class_name) override;

        [[nodiscard]] DWORD current_process_id() noexcept override;
        [[nodiscard]] DWORD current_thread_id() noexcept override;

        [[nodiscard]] std::expected<void, DWORD> set_styles(core::WindowHandle window, const WindowStyles& styles) noexcept override;
        [[nodiscard]] std::expected<void, DWORD> set_parent(core::WindowHandle window, core::WindowHandle parent) noexcept override;
        [[nodiscard]] std::expected<void, DWORD> set_bounds(core::WindowHandle window, const PaneRect& rect) noexcept override;

        void bring_to_top(core::WindowHandle window) noexcept override;
        void show(core::WindowHandle window, ShowCommand command) noexcept override;
        bool redraw(core::WindowHandle window) noexcept override;

        [[nodiscard]] std::expected<void, DWORD> attach_thread_input(DWORD from_thread, DWORD to_thread, bool attach) noexcept override;
        bool send_activation(core::WindowHandle window, bool active, DWORD timeout_ms) noexcept override;

        void set_focus(core::WindowHandle window) noexcept override;
        void set_foreground(core::WindowHandle window) noexcept override;
        bool post_close(core::WindowHandle window) noexcept override;
    };
}
