#pragma once

// Window Directory: a stateless query over the desktop's top-level windows.
//
// Results are momentary snapshots. A candidate may be gone, minimized or
// retitled by the time the caller acts on it; `WindowDirectory::check_embeddable`
// re-validates a single handle right before use.

#include "window/window_system.hpp"

#include <Windows.h>

#include <string>
#include <string_view>
#include <vector>

namespace wh::window
{
    struct WindowCandidate final
    {
        core::WindowHandle handle{};
        std::wstring title;
        DWORD process_id{ 0 };
        bool is_minimized{ false };
        std::wstring class_name;
        int width{ 0 };
        int height{ 0 };
    };

    struct DirectoryOptions final
    {
        // Windows whose title contains this text are hub windows.
        std::wstring host_title{ L"WindowHub" };
        int min_width{ 100 };
        int min_height{ 100 };
    };

    enum class Embeddability
    {
        embeddable,
        invalid_handle,
        own_process,
        minimized,
        blocked_class,
    };

    class WindowDirectory final
    {
    public:
        WindowDirectory(WindowSystem& windows, DirectoryOptions options);

        [[nodiscard]] std::vector<WindowCandidate> list_candidates() const;
        [[nodiscard]] std::vector<WindowCandidate> list_candidates_for_process(DWORD process_id) const;

        [[nodiscard]] Embeddability check_embeddable(core::WindowHandle window) const;

        // Shell and system surfaces never listed as candidates.
        [[nodiscard]] static bool is_excluded_class(std::wstring_view class_name) noexcept;

        // Classes known to destabilize the desktop when reparented. Superset
        // of the excluded classes.
        [[nodiscard]] static bool is_blocked_class(std::wstring_view class_name) noexcept;

    private:
        [[nodiscard]] bool describe(core::WindowHandle window, WindowCandidate& candidate) const;

        WindowSystem& _windows;
        DirectoryOptions _options;
    };
}
