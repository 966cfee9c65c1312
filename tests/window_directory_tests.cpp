#include "window/window_directory.hpp"

#include "fake_window_system.hpp"

#include <algorithm>

namespace
{
    using wh::tests::FakeWindowState;
    using wh::tests::FakeWindowSystem;
    using wh::window::DirectoryOptions;
    using wh::window::Embeddability;
    using wh::window::WindowCandidate;
    using wh::window::WindowDirectory;

    [[nodiscard]] bool contains(const std::vector<WindowCandidate>& candidates, const wh::core::WindowHandle window)
    {
        return std::any_of(candidates.begin(), candidates.end(), [window](const WindowCandidate& candidate) {
            return candidate.handle == window;
        });
    }

    bool test_filters_apply()
    {
        FakeWindowSystem windows;
        const auto host = windows.add_host_window();
        const auto editor = windows.add_window(FakeWindowState{ .title = L"Editor" });
        const auto hidden = windows.add_window(FakeWindowState{ .title = L"Hidden", .visible = false });
        const auto tool = windows.add_window(FakeWindowState{
            .title = L"Palette",
            .styles = { .style = WS_POPUP | WS_VISIBLE, .ex_style = WS_EX_TOOLWINDOW },
        });
        const auto taskbar = windows.add_window(FakeWindowState{ .title = L"Taskbar", .class_name = L"Shell_TrayWnd" });
        const auto tiny = windows.add_window(FakeWindowState{ .title = L"Tiny", .bounds = { .x = 0, .y = 0, .width = 100, .height = 400 } });
        const auto other_hub = windows.add_window(FakeWindowState{ .title = L"Second WindowHub" });
        const auto minimized = windows.add_window(FakeWindowState{
            .title = L"Iconic",
            .bounds = { .x = -32000, .y = -32000, .width = 160, .height = 28 },
            .minimized = true,
        });

        const WindowDirectory directory(windows, DirectoryOptions{});
        const auto candidates = directory.list_candidates();
        return candidates.size() == 2 &&
               contains(candidates, editor) &&
               contains(candidates, minimized) &&
               !contains(candidates, host) &&
               !contains(candidates, hidden) &&
               !contains(candidates, tool) &&
               !contains(candidates, taskbar) &&
               !contains(candidates, tiny) &&
               !contains(candidates, other_hub);
    }

    bool test_candidate_fields()
    {
        FakeWindowSystem windows;
        const auto editor = windows.add_window(FakeWindowState{ .process_id = 900, .title = L"Editor", .class_name = L"EditorFrame" });
        const auto iconic = windows.add_window(FakeWindowState{ .process_id = 901, .title = L"Iconic", .minimized = true });

        const WindowDirectory directory(windows, DirectoryOptions{});
        const auto candidates = directory.list_candidates();
        if (candidates.size() != 2)
        {
            return false;
        }

        const WindowCandidate& first = candidates[0];
        return first.handle == editor &&
               first.process_id == 900 &&
               first.title == L"Editor" &&
               first.class_name == L"EditorFrame" &&
               first.width == 800 &&
               first.height == 600 &&
               !first.is_minimized &&
               candidates[1].handle == iconic &&
               candidates[1].is_minimized;
    }

    bool test_untitled_window_falls_back_to_executable_name()
    {
        FakeWindowSystem windows;
        const auto untitled = windows.add_window(FakeWindowState{ .process_id = 700, .title = L"" });
        const auto anonymous = windows.add_window(FakeWindowState{ .process_id = 701, .title = L"" });
        windows.set_process_image_path(700, L"C:\\Program Files\\Game\\game.client.exe");

        const WindowDirectory directory(windows, DirectoryOptions{});
        const auto candidates = directory.list_candidates();
        return candidates.size() == 1 &&
               candidates[0].handle == untitled &&
               candidates[0].title == L"game.client" &&
               !contains(candidates, anonymous);
    }

    bool test_options_are_honoured()
    {
        FakeWindowSystem windows;
        const auto small = windows.add_window(FakeWindowState{ .title = L"Small", .bounds = { .x = 0, .y = 0, .width = 60, .height = 60 } });
        const auto titled = windows.add_window(FakeWindowState{ .title = L"Tabs - main" });

        const WindowDirectory directory(windows, DirectoryOptions{ .host_title = L"Tabs", .min_width = 50, .min_height = 50 });
        const auto candidates = directory.list_candidates();
        return candidates.size() == 1 && candidates[0].handle == small && !contains(candidates, titled);
    }

    bool test_process_scoped_listing()
    {
        FakeWindowSystem windows;
        const auto mine = windows.add_window(FakeWindowState{ .process_id = 300, .title = L"Mine" });
        const auto other = windows.add_window(FakeWindowState{ .process_id = 301, .title = L"Other" });

        const WindowDirectory directory(windows, DirectoryOptions{});
        const auto candidates = directory.list_candidates_for_process(300);
        return candidates.size() == 1 && candidates[0].handle == mine && !contains(candidates, other);
    }

    bool test_check_embeddable_verdicts()
    {
        FakeWindowSystem windows;
        const auto normal = windows.add_window(FakeWindowState{});
        const auto own = windows.add_window(FakeWindowState{ .process_id = FakeWindowSystem::hub_process_id });
        const auto iconic = windows.add_window(FakeWindowState{ .minimized = true });
        const auto explorer = windows.add_window(FakeWindowState{ .class_name = L"CabinetWClass" });
        const auto desktop = windows.add_window(FakeWindowState{ .class_name = L"Progman" });
        const auto dead = windows.add_window(FakeWindowState{});
        windows.destroy(dead);

        const WindowDirectory directory(windows, DirectoryOptions{});
        return directory.check_embeddable(normal) == Embeddability::embeddable &&
               directory.check_embeddable(own) == Embeddability::own_process &&
               directory.check_embeddable(iconic) == Embeddability::minimized &&
               directory.check_embeddable(explorer) == Embeddability::blocked_class &&
               directory.check_embeddable(desktop) == Embeddability::blocked_class &&
               directory.check_embeddable(dead) == Embeddability::invalid_handle &&
               directory.check_embeddable(wh::core::WindowHandle{}) == Embeddability::invalid_handle;
    }

    bool test_class_lists()
    {
        return WindowDirectory::is_excluded_class(L"WorkerW") &&
               WindowDirectory::is_excluded_class(L"Windows.UI.Core.CoreWindow") &&
               !WindowDirectory::is_excluded_class(L"CabinetWClass") &&
               WindowDirectory::is_blocked_class(L"CabinetWClass") &&
               WindowDirectory::is_blocked_class(L"Shell_TrayWnd") &&
               !WindowDirectory::is_blocked_class(L"Notepad");
    }
}

bool run_window_directory_tests()
{
    return test_filters_apply() &&
           test_candidate_fields() &&
           test_untitled_window_falls_back_to_executable_name() &&
           test_options_are_honoured() &&
           test_process_scoped_listing() &&
           test_check_embeddable_verdicts() &&
           test_class_lists();
}
