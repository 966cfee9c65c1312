#include "window/win32_window_system.hpp"

#include "core/win32_handle.hpp"

#include <array>

namespace wh::window
{
    namespace
    {
        // Window-long getters and setters return 0 both for "value is zero" and
        // for failure; the last error disambiguates.
        [[nodiscard]] std::expected<DWORD, DWORD> read_window_long(const HWND hwnd, const int index) noexcept
        {
            ::SetLastError(ERROR_SUCCESS);
            const LONG_PTR value = ::GetWindowLongPtrW(hwnd, index);
            if (value == 0)
            {
                const DWORD error = ::GetLastError();
                if (error != ERROR_SUCCESS)
                {
                    return std::unexpected(error);
                }
            }
            return static_cast<DWORD>(value);
        }

        [[nodiscard]] std::expected<void, DWORD> write_window_long(const HWND hwnd, const int index, const DWORD value) noexcept
        {
            ::SetLastError(ERROR_SUCCESS);
            const LONG_PTR previous = ::SetWindowLongPtrW(hwnd, index, static_cast<LONG_PTR>(static_cast<LONG>(value)));
            if (previous == 0)
            {
                const DWORD error = ::GetLastError();
                if (error != ERROR_SUCCESS)
                {
                    return std::unexpected(error);
                }
            }
            return {};
        }

        [[nodiscard]] DWORD error_or_invalid_window(const DWORD error) noexcept
        {
            return error == ERROR_SUCCESS ? static_cast<DWORD>(ERROR_INVALID_WINDOW_HANDLE) : error;
        }

        struct ClassSearch final
        {
            std::wstring_view class_name;
            HWND found{ nullptr };
        };

        BOOL CALLBACK collect_top_level(const HWND hwnd, const LPARAM lparam) noexcept
        {
            auto* windows = reinterpret_cast<std::vector<core::WindowHandle>*>(lparam);
            try
            {
                windows->emplace_back(hwnd);
            }
            catch (...)
            {
                return FALSE;
            }
            return TRUE;
        }

        BOOL CALLBACK match_child_class(const HWND hwnd, const LPARAM lparam) noexcept
        {
            auto* search = reinterpret_cast<ClassSearch*>(lparam);
            std::array<wchar_t, 256> buffer{};
            const int length = ::GetClassNameW(hwnd, buffer.data(), static_cast<int>(buffer.size()));
            if (length > 0 && std::wstring_view(buffer.data(), static_cast<size_t>(length)) == search->class_name)
            {
                search->found = hwnd;
                return FALSE;
            }
            return TRUE;
        }
    }

    std::vector<core::WindowHandle> Win32WindowSystem::top_level_windows()
    {
        std::vector<core::WindowHandle> windows;
        windows.reserve(256);
        (void)::EnumWindows(&collect_top_level, reinterpret_cast<LPARAM>(&windows));
        return windows;
    }

    bool Win32WindowSystem::is_window(const core::WindowHandle window) noexcept
    {
        return window && ::IsWindow(window.get()) != FALSE;
    }

    bool Win32WindowSystem::is_visible(const core::WindowHandle window) noexcept
    {
        return window && ::IsWindowVisible(window.get()) != FALSE;
    }

    bool Win32WindowSystem::is_minimized(const core::WindowHandle window) noexcept
    {
        return window && ::IsIconic(window.get()) != FALSE;
    }

    DWORD Win32WindowSystem::process_id(const core::WindowHandle window) noexcept
    {
        if (!window)
        {
            return 0;
        }

        DWORD pid = 0;
        if (::GetWindowThreadProcessId(window.get(), &pid) == 0)
        {
            return 0;
        }
        return pid;
    }

    DWORD Win32WindowSystem::thread_id(const core::WindowHandle window) noexcept
    {
        return window ? ::GetWindowThreadProcessId(window.get(), nullptr) : 0;
    }

    std::wstring Win32WindowSystem::title(const core::WindowHandle window)
    {
        const int length = window ? ::GetWindowTextLengthW(window.get()) : 0;
        if (length <= 0)
        {
            return {};
        }

        std::wstring text(static_cast<size_t>(length) + 1, L'\0');
        const int copied = ::GetWindowTextW(window.get(), text.data(), length + 1);
        text.resize(copied > 0 ? static_cast<size_t>(copied) : 0);
        return text;
    }

    std::wstring Win32WindowSystem::class_name(const core::WindowHandle window)
    {
        std::array<wchar_t, 256> buffer{};
        const int length = window ? ::GetClassNameW(window.get(), buffer.data(), static_cast<int>(buffer.size())) : 0;
        if (length <= 0)
        {
            return {};
        }
        return std::wstring(buffer.data(), static_cast<size_t>(length));
    }

    std::wstring Win32WindowSystem::process_image_path(const DWORD process_id)
    {
        auto process = core::open_process_for_query(process_id);
        if (!process)
        {
            return {};
        }

        auto path = core::query_process_image_path(process->get());
        return path ? std::move(path.value()) : std::wstring{};
    }

    IconReference Win32WindowSystem::icon(const core::WindowHandle window) noexcept
    {
        if (!window)
        {
            return 0;
        }

        // WM_GETICON crosses into the owning process; never wait on a hung one.
        DWORD_PTR result = 0;
        if (::SendMessageTimeoutW(
                window.get(),
                WM_GETICON,
                ICON_SMALL2,
                0,
                SMTO_ABORTIFHUNG | SMTO_BLOCK,
                100,
                &result) != 0 &&
            result != 0)
        {
            return static_cast<IconReference>(result);
        }

        const ULONG_PTR class_icon = ::GetClassLongPtrW(window.get(), GCLP_HICONSM);
        if (class_icon != 0)
        {
            return static_cast<IconReference>(class_icon);
        }
        return static_cast<IconReference>(::GetClassLongPtrW(window.get(), GCLP_HICON));
    }

    std::optional<PaneRect> Win32WindowSystem::bounds(const core::WindowHandle window) noexcept
    {
        RECT rect{};
        if (!window || ::GetWindowRect(window.get(), &rect) == FALSE)
        {
            return std::nullopt;
        }

        // Child windows are positioned in their parent's client coordinates.
        const core::WindowHandle owner = parent(window);
        if (owner && (::GetWindowLongPtrW(window.get(), GWL_STYLE) & WS_CHILD) != 0)
        {
            (void)::MapWindowPoints(HWND_DESKTOP, owner.get(), reinterpret_cast<POINT*>(&rect), 2);
        }

        return PaneRect{
            .x = rect.left,
            .y = rect.top,
            .width = rect.right - rect.left,
            .height = rect.bottom - rect.top,
        };
    }

    std::expected<WindowStyles, DWORD> Win32WindowSystem::styles(const core::WindowHandle window) noexcept
    {
        if (!is_window(window))
        {
            return std::unexpected(static_cast<DWORD>(ERROR_INVALID_WINDOW_HANDLE));
        }

        auto style = read_window_long(window.get(), GWL_STYLE);
        if (!style)
        {
            return std::unexpected(style.error());
        }
        auto ex_style = read_window_long(window.get(), GWL_EXSTYLE);
        if (!ex_style)
        {
            return std::unexpected(ex_style.error());
        }

        return WindowStyles{ .style = *style, .ex_style = *ex_style };
    }

    core::WindowHandle Win32WindowSystem::parent(const core::WindowHandle window) noexcept
    {
        if (!window)
        {
            return {};
        }

        // GetParent reports the owner for popups; the structural parent is
        // what embedding changes and what release has to put back.
        const HWND parent_hwnd = ::GetAncestor(window.get(), GA_PARENT);
        if (parent_hwnd == nullptr || parent_hwnd == ::GetDesktopWindow())
        {
            return {};
        }
        return core::WindowHandle(parent_hwnd);
    }

    bool Win32WindowSystem::is_descendant(const core::WindowHandle ancestor, const core::WindowHandle window) noexcept
    {
        return ancestor && window && ::IsChild(ancestor.get(), window.get()) != FALSE;
    }

    core::WindowHandle Win32WindowSystem::find_descendant_by_class(const core::WindowHandle window, const std::wstring_view class_name)
    {
        if (!window)
        {
            return {};
        }

        ClassSearch search{ .class_name = class_name };
        (void)::EnumChildWindows(window.get(), &match_child_class, reinterpret_cast<LPARAM>(&search));
        return core::WindowHandle(search.found);
    }

    DWORD Win32WindowSystem::current_process_id() noexcept
    {
        return ::GetCurrentProcessId();
    }

    DWORD Win32WindowSystem::current_thread_id() noexcept
    {
        return ::GetCurrentThreadId();
    }

    std::expected<void, DWORD> Win32WindowSystem::set_styles(const core::WindowHandle window, const WindowStyles& styles) noexcept
    {
        if (!is_window(window))
        {
            return std::unexpected(static_cast<DWORD>(ERROR_INVALID_WINDOW_HANDLE));
        }

        if (auto written = write_window_long(window.get(), GWL_STYLE, styles.style); !written)
        {
            return written;
        }
        if (auto written = write_window_long(window.get(), GWL_EXSTYLE, styles.ex_style); !written)
        {
            return written;
        }

        ::SetWindowPos(
            window.get(),
            nullptr,
            0,
            0,
            0,
            0,
            SWP_NOMOVE | SWP_NOSIZE | SWP_NOZORDER | SWP_NOACTIVATE | SWP_FRAMECHANGED);
        return {};
    }

    std::expected<void, DWORD> Win32WindowSystem::set_parent(const core::WindowHandle window, const core::WindowHandle parent) noexcept
    {
        if (!is_window(window))
        {
            return std::unexpected(static_cast<DWORD>(ERROR_INVALID_WINDOW_HANDLE));
        }

        ::SetLastError(ERROR_SUCCESS);
        const HWND previous = ::SetParent(window.get(), parent.get());
        if (previous == nullptr)
        {
            const DWORD error = ::GetLastError();
            if (error != ERROR_SUCCESS)
            {
                return std::unexpected(error);
            }
        }
        return {};
    }

    std::expected<void, DWORD> Win32WindowSystem::set_bounds(const core::WindowHandle window, const PaneRect& rect) noexcept
    {
        if (::SetWindowPos(
                window.get(),
                nullptr,
                rect.x,
                rect.y,
                rect.width,
                rect.height,
                SWP_NOZORDER | SWP_NOACTIVATE | SWP_FRAMECHANGED) == FALSE)
        {
            return std::unexpected(error_or_invalid_window(::GetLastError()));
        }
        return {};
    }

    void Win32WindowSystem::bring_to_top(const core::WindowHandle window) noexcept
    {
        (void)::SetWindowPos(window.get(), HWND_TOP, 0, 0, 0, 0, SWP_NOMOVE | SWP_NOSIZE | SWP_SHOWWINDOW);
    }

    void Win32WindowSystem::show(const core::WindowHandle window, const ShowCommand command) noexcept
    {
        int show_command = SW_SHOW;
        switch (command)
        {
        case ShowCommand::hide:
            show_command = SW_HIDE;
            break;
        case ShowCommand::show:
            show_command = SW_SHOW;
            break;
        case ShowCommand::show_no_activate:
            show_command = SW_SHOWNA;
            break;
        case ShowCommand::restore:
            show_command = SW_RESTORE;
            break;
        }
        (void)::ShowWindow(window.get(), show_command);
    }

    bool Win32WindowSystem::redraw(const core::WindowHandle window) noexcept
    {
        if (!is_window(window))
        {
            return false;
        }

        return ::RedrawWindow(
                   window.get(),
                   nullptr,
                   nullptr,
                   RDW_INVALIDATE | RDW_ERASE | RDW_FRAME | RDW_ALLCHILDREN | RDW_UPDATENOW) != FALSE;
    }

    std::expected<void, DWORD> Win32WindowSystem::attach_thread_input(const DWORD from_thread, const DWORD to_thread, const bool attach) noexcept
    {
        if (::AttachThreadInput(from_thread, to_thread, attach ? TRUE : FALSE) == FALSE)
        {
            const DWORD error = ::GetLastError();
            return std::unexpected(error == ERROR_SUCCESS ? static_cast<DWORD>(ERROR_INVALID_PARAMETER) : error);
        }
        return {};
    }

    bool Win32WindowSystem::send_activation(const core::WindowHandle window, const bool active, const DWORD timeout_ms) noexcept
    {
        DWORD_PTR ignored = 0;
        const bool activate_delivered = ::SendMessageTimeoutW(
                                            window.get(),
                                            WM_ACTIVATE,
                                            active ? WA_ACTIVE : WA_INACTIVE,
                                            0,
                                            SMTO_ABORTIFHUNG | SMTO_NORMAL,
                                            timeout_ms,
                                            &ignored) != 0;
        const bool nc_delivered = ::SendMessageTimeoutW(
                                      window.get(),
                                      WM_NCACTIVATE,
                                      active ? TRUE : FALSE,
                                      0,
                                      SMTO_ABORTIFHUNG | SMTO_NORMAL,
                                      timeout_ms,
                                      &ignored) != 0;
        return activate_delivered && nc_delivered;
    }

    void Win32WindowSystem::set_focus(const core::WindowHandle window) noexcept
    {
        (void)::SetFocus(window.get());
    }

    void Win32WindowSystem::set_foreground(const core::WindowHandle window) noexcept
    {
        (void)::SetForegroundWindow(window.get());
    }

    bool Win32WindowSystem::post_close(const core::WindowHandle window) noexcept
    {
        return window && ::PostMessageW(window.get(), WM_CLOSE, 0, 0) != FALSE;
    }
}
