#include "window/window_directory.hpp"

#include "window/window_styles.hpp"

#include <algorithm>
#include <array>

namespace wh::window
{
    namespace
    {
        constexpr std::array<std::wstring_view, 7> kExcludedClasses{
            L"Progman",
            L"WorkerW",
            L"Shell_TrayWnd",
            L"Shell_SecondaryTrayWnd",
            L"Windows.UI.Core.CoreWindow",
            L"ApplicationFrameWindow",
            L"TaskManagerWindow",
        };

        // File Explorer windows share a process with the shell.
        constexpr std::array<std::wstring_view, 2> kBlockedOnlyClasses{
            L"CabinetWClass",
            L"ExplorerWClass",
        };

        [[nodiscard]] std::wstring file_stem(const std::wstring_view path)
        {
            const size_t separator = path.find_last_of(L"\\/");
            std::wstring_view name = separator == std::wstring_view::npos ? path : path.substr(separator + 1);
            const size_t dot = name.find_last_of(L'.');
            if (dot != std::wstring_view::npos && dot > 0)
            {
                name = name.substr(0, dot);
            }
            return std::wstring(name);
        }
    }

    WindowDirectory::WindowDirectory(WindowSystem& windows, DirectoryOptions options) :
        _windows(windows),
        _options(std::move(options))
    {
    }

    bool WindowDirectory::is_excluded_class(const std::wstring_view class_name) noexcept
    {
        return std::find(kExcludedClasses.begin(), kExcludedClasses.end(), class_name) != kExcludedClasses.end();
    }

    bool WindowDirectory::is_blocked_class(const std::wstring_view class_name) noexcept
    {
        if (is_excluded_class(class_name))
        {
            return true;
        }
        return std::any_of(kBlockedOnlyClasses.begin(), kBlockedOnlyClasses.end(), [class_name](const std::wstring_view blocked) {
            return class_name.find(blocked) != std::wstring_view::npos;
        });
    }

    bool WindowDirectory::describe(const core::WindowHandle window, WindowCandidate& candidate) const
    {
        if (!_windows.is_visible(window))
        {
            return false;
        }

        const auto styles = _windows.styles(window);
        if (!styles || is_tool_window(*styles))
        {
            return false;
        }

        const DWORD process_id = _windows.process_id(window);
        if (process_id == 0 || process_id == _windows.current_process_id())
        {
            return false;
        }

        std::wstring class_name = _windows.class_name(window);
        if (is_excluded_class(class_name))
        {
            return false;
        }

        std::wstring title = _windows.title(window);
        if (title.empty())
        {
            const std::wstring image_path = _windows.process_image_path(process_id);
            if (image_path.empty())
            {
                return false;
            }
            title = file_stem(image_path);
        }
        if (!_options.host_title.empty() && title.find(_options.host_title) != std::wstring::npos)
        {
            return false;
        }

        const bool minimized = _windows.is_minimized(window);
        const auto bounds = _windows.bounds(window);
        if (!bounds)
        {
            return false;
        }

        // A minimized window reports its iconic placeholder size.
        if (!minimized && (bounds->width <= _options.min_width || bounds->height <= _options.min_height))
        {
            return false;
        }

        candidate.handle = window;
        candidate.title = std::move(title);
        candidate.process_id = process_id;
        candidate.is_minimized = minimized;
        candidate.class_name = std::move(class_name);
        candidate.width = bounds->width;
        candidate.height = bounds->height;
        return true;
    }

    std::vector<WindowCandidate> WindowDirectory::list_candidates() const
    {
        std::vector<WindowCandidate> candidates;
        for (const core::WindowHandle window : _windows.top_level_windows())
        {
            WindowCandidate candidate{};
            if (describe(window, candidate))
            {
                candidates.push_back(std::move(candidate));
            }
        }
        return candidates;
    }

    std::vector<WindowCandidate> WindowDirectory::list_candidates_for_process(const DWORD process_id) const
    {
        std::vector<WindowCandidate> candidates;
        for (const core::WindowHandle window : _windows.top_level_windows())
        {
            if (_windows.process_id(window) != process_id)
            {
                continue;
            }

            WindowCandidate candidate{};
            if (describe(window, candidate))
            {
                candidates.push_back(std::move(candidate));
            }
        }
        return candidates;
    }

    Embeddability WindowDirectory::check_embeddable(const core::WindowHandle window) const
    {
        if (!_windows.is_window(window))
        {
            return Embeddability::invalid_handle;
        }

        const DWORD process_id = _windows.process_id(window);
        if (process_id == 0)
        {
            return Embeddability::invalid_handle;
        }
        if (process_id == _windows.current_process_id())
        {
            return Embeddability::own_process;
        }
        if (_windows.is_minimized(window))
        {
            return Embeddability::minimized;
        }
        if (is_blocked_class(_windows.class_name(window)))
        {
            return Embeddability::blocked_class;
        }
        return Embeddability::embeddable;
    }
}
