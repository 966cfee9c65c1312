#include "window/win32_window_system.hpp"

#include "window/window_styles.hpp"

namespace
{
    using wh::core::WindowHandle;
    using wh::window::PaneRect;
    using wh::window::Win32WindowSystem;

    constexpr wchar_t kFrameClass[] = L"WindowHubTestFrame";
    constexpr wchar_t kInnerClass[] = L"WindowHubTestInner";

    [[nodiscard]] bool register_test_classes() noexcept
    {
        static const bool registered = [] {
            const HINSTANCE instance = ::GetModuleHandleW(nullptr);
            for (const wchar_t* const name : { kFrameClass, kInnerClass })
            {
                WNDCLASSEXW window_class{};
                window_class.cbSize = sizeof(window_class);
                window_class.lpfnWndProc = ::DefWindowProcW;
                window_class.hInstance = instance;
                window_class.lpszClassName = name;
                if (::RegisterClassExW(&window_class) == 0 && ::GetLastError() != ERROR_CLASS_ALREADY_EXISTS)
                {
                    return false;
                }
            }
            return true;
        }();
        return registered;
    }

    // Owns a real window created on the calling thread.
    class TestWindow final
    {
    public:
        TestWindow(const wchar_t* const class_name, const wchar_t* const title, const DWORD style, const HWND parent = nullptr) noexcept :
            _hwnd(::CreateWindowExW(0, class_name, title, style, 100, 120, 640, 480, parent, nullptr, ::GetModuleHandleW(nullptr), nullptr))
        {
        }

        ~TestWindow() noexcept
        {
            if (_hwnd != nullptr && ::IsWindow(_hwnd) != FALSE)
            {
                (void)::DestroyWindow(_hwnd);
            }
        }

        TestWindow(const TestWindow&) = delete;
        TestWindow& operator=(const TestWindow&) = delete;

        [[nodiscard]] WindowHandle handle() const noexcept
        {
            return WindowHandle(_hwnd);
        }

    private:
        HWND _hwnd{ nullptr };
    };

    bool test_identity_queries()
    {
        if (!register_test_classes())
        {
            return false;
        }

        Win32WindowSystem windows;
        const TestWindow frame(kFrameClass, L"Sample Frame", WS_OVERLAPPEDWINDOW);
        if (!frame.handle())
        {
            return false;
        }

        return windows.is_window(frame.handle()) &&
               !windows.is_visible(frame.handle()) &&
               !windows.is_minimized(frame.handle()) &&
               windows.process_id(frame.handle()) == ::GetCurrentProcessId() &&
               windows.thread_id(frame.handle()) == ::GetCurrentThreadId() &&
               windows.title(frame.handle()) == L"Sample Frame" &&
               windows.class_name(frame.handle()) == kFrameClass &&
               windows.parent(frame.handle()).empty();
    }

    bool test_reparent_and_child_coordinates()
    {
        if (!register_test_classes())
        {
            return false;
        }

        Win32WindowSystem windows;
        const TestWindow container(kFrameClass, L"Container", WS_OVERLAPPEDWINDOW | WS_CLIPCHILDREN);
        const TestWindow target(kInnerClass, L"Target", WS_OVERLAPPEDWINDOW);
        if (!container.handle() || !target.handle())
        {
            return false;
        }

        const auto original = windows.styles(target.handle());
        if (!original)
        {
            return false;
        }

        const auto embedded = wh::window::embedded_styles(*original);
        if (!windows.set_styles(target.handle(), embedded) ||
            !windows.set_parent(target.handle(), container.handle()) ||
            !windows.set_bounds(target.handle(), PaneRect{ .x = 10, .y = 40, .width = 300, .height = 200 }))
        {
            return false;
        }

        const auto applied = windows.styles(target.handle());
        const auto bounds = windows.bounds(target.handle());
        if (!applied ||
            (applied->style & WS_CHILD) == 0 ||
            (applied->style & WS_CAPTION) != 0 ||
            windows.parent(target.handle()) != container.handle() ||
            !windows.is_descendant(container.handle(), target.handle()) ||
            windows.find_descendant_by_class(container.handle(), kInnerClass) != target.handle() ||
            !bounds ||
            *bounds != PaneRect{ .x = 10, .y = 40, .width = 300, .height = 200 })
        {
            return false;
        }

        // Back to the desktop with the captured styles.
        if (!windows.set_parent(target.handle(), WindowHandle{}) || !windows.set_styles(target.handle(), *original))
        {
            return false;
        }

        const auto restored = windows.styles(target.handle());
        return restored &&
               (restored->style & WS_CHILD) == 0 &&
               (restored->style & WS_CAPTION) == WS_CAPTION &&
               windows.parent(target.handle()).empty() &&
               !windows.is_descendant(container.handle(), target.handle());
    }

    bool test_destroyed_window_reports_invalid_handle()
    {
        if (!register_test_classes())
        {
            return false;
        }

        Win32WindowSystem windows;
        WindowHandle stale{};
        {
            const TestWindow doomed(kFrameClass, L"Doomed", WS_OVERLAPPEDWINDOW);
            stale = doomed.handle();
        }

        const auto styles = windows.styles(stale);
        const auto parented = windows.set_parent(stale, WindowHandle{});
        return stale &&
               !windows.is_window(stale) &&
               !styles && styles.error() == ERROR_INVALID_WINDOW_HANDLE &&
               !parented && parented.error() == ERROR_INVALID_WINDOW_HANDLE &&
               !windows.bounds(stale).has_value() &&
               windows.title(stale).empty() &&
               !windows.redraw(stale) &&
               windows.process_id(stale) == 0;
    }

    bool test_top_level_enumeration_sees_new_window()
    {
        if (!register_test_classes())
        {
            return false;
        }

        Win32WindowSystem windows;
        const TestWindow frame(kFrameClass, L"Enumerated", WS_OVERLAPPEDWINDOW);
        const auto all = windows.top_level_windows();
        for (const WindowHandle window : all)
        {
            if (window == frame.handle())
            {
                return true;
            }
        }
        return false;
    }
}

bool run_win32_window_system_tests()
{
    return test_identity_queries() &&
           test_reparent_and_child_coordinates() &&
           test_destroyed_window_reports_invalid_handle() &&
           test_top_level_enumeration_sees_new_window();
}
