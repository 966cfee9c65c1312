#include "engine_fixture.hpp"

#include "window/window_styles.hpp"

#include <mutex>
#include <thread>
#include <vector>

namespace
{
    using wh::hub::HubErrorCode;
    using wh::tests::EngineFixture;
    using wh::tests::FakeWindowState;
    using wh::tests::kTestPane;
    using wh::tests::MutationKind;

    bool test_embed_then_release_restores_original_state()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();
        const FakeWindowState before = fixture.windows.state(window);

        auto embedded = fixture.controller.embed(window);
        if (!embedded)
        {
            return false;
        }

        const FakeWindowState inside = fixture.windows.state(window);
        if (inside.parent != fixture.host ||
            inside.styles != wh::window::embedded_styles(before.styles) ||
            inside.bounds != kTestPane ||
            !inside.visible)
        {
            return false;
        }

        // The host must clip its children or it paints over the pane.
        if (!wh::window::clips_children(fixture.windows.state(fixture.host).styles))
        {
            return false;
        }

        const auto session = fixture.registry.find(embedded->id);
        if (!session || session->state != wh::hub::EmbeddingState::embedded || session->snapshot.styles != before.styles)
        {
            return false;
        }

        if (!fixture.controller.release(embedded->id))
        {
            return false;
        }

        const FakeWindowState after = fixture.windows.state(window);
        const auto closed = fixture.events.closed();
        return after.parent.empty() &&
               after.styles == before.styles &&
               after.bounds == before.bounds &&
               fixture.windows.foreground() == window &&
               fixture.registry.size() == 0 &&
               !fixture.registry.is_claimed(window) &&
               fixture.events.created().size() == 1 &&
               closed.size() == 1 &&
               closed[0].id == embedded->id &&
               closed[0].reason == wh::hub::CloseReason::released;
    }

    bool test_popup_caption_window_loses_both_bits()
    {
        EngineFixture fixture;
        const auto window = fixture.windows.add_window(FakeWindowState{
            .styles = { .style = WS_POPUP | WS_CAPTION | WS_VISIBLE, .ex_style = WS_EX_TOPMOST },
        });

        if (!fixture.controller.embed(window))
        {
            return false;
        }

        const DWORD style = fixture.windows.state(window).styles.style;
        const DWORD ex_style = fixture.windows.state(window).styles.ex_style;
        return (style & WS_POPUP) == 0 &&
               (style & WS_CAPTION) == 0 &&
               (style & WS_CHILD) != 0 &&
               (ex_style & WS_EX_TOPMOST) == 0;
    }

    bool test_minimized_window_is_not_touched()
    {
        EngineFixture fixture;
        const auto window = fixture.windows.add_window(FakeWindowState{ .minimized = true });
        const FakeWindowState before = fixture.windows.state(window);

        const auto embedded = fixture.controller.embed(window);
        const FakeWindowState after = fixture.windows.state(window);
        return !embedded.has_value() &&
               embedded.error().code == HubErrorCode::not_embeddable &&
               fixture.windows.set_styles_calls(window) == 0 &&
               after.parent == before.parent &&
               after.styles == before.styles &&
               fixture.registry.size() == 0 &&
               !fixture.registry.is_claimed(window) &&
               fixture.events.created().empty();
    }

    bool test_window_minimized_during_embed_is_rolled_back()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();
        const FakeWindowState before = fixture.windows.state(window);

        // Validation passes; the owning process minimizes the window right
        // after the style strip.
        fixture.windows.on_set_styles([&fixture, window](const wh::core::WindowHandle changed) {
            if (changed == window)
            {
                fixture.windows.set_minimized(window, true);
            }
        });
        const auto embedded = fixture.controller.embed(window);
        fixture.windows.on_set_styles({});

        const FakeWindowState after = fixture.windows.state(window);
        const auto changes = fixture.windows.mutations(window);
        return !embedded.has_value() &&
               embedded.error().code == HubErrorCode::not_embeddable &&
               after.styles == before.styles &&
               after.parent == before.parent &&
               after.bounds == before.bounds &&
               changes.size() == 2 &&
               changes[0] == MutationKind::styles &&
               changes[1] == MutationKind::styles &&
               fixture.registry.size() == 0 &&
               !fixture.registry.is_claimed(window) &&
               fixture.events.created().empty();
    }

    bool test_release_reparents_before_restoring_styles()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();
        const auto embedded = fixture.controller.embed(window);
        if (!embedded)
        {
            return false;
        }

        const std::size_t before_release = fixture.windows.mutations(window).size();
        if (!fixture.controller.release(embedded->id))
        {
            return false;
        }

        const auto changes = fixture.windows.mutations(window);
        return changes.size() >= before_release + 3 &&
               changes[before_release] == MutationKind::parent &&
               changes[before_release + 1] == MutationKind::styles &&
               changes[before_release + 2] == MutationKind::bounds;
    }

    bool test_invalid_targets_are_rejected()
    {
        EngineFixture fixture;

        const auto empty = fixture.controller.embed(wh::core::WindowHandle{});
        if (empty || empty.error().code != HubErrorCode::invalid_handle)
        {
            return false;
        }

        const auto dead = fixture.add_target();
        fixture.windows.destroy(dead);
        const auto gone = fixture.controller.embed(dead);
        if (gone || gone.error().code != HubErrorCode::invalid_handle)
        {
            return false;
        }

        const auto host = fixture.controller.embed(fixture.host);
        if (host || host.error().code != HubErrorCode::not_embeddable)
        {
            return false;
        }

        const auto own = fixture.windows.add_window(FakeWindowState{ .process_id = wh::tests::FakeWindowSystem::hub_process_id });
        const auto own_result = fixture.controller.embed(own);
        if (own_result || own_result.error().code != HubErrorCode::not_embeddable)
        {
            return false;
        }

        const auto explorer = fixture.windows.add_window(FakeWindowState{ .class_name = L"CabinetWClass" });
        const auto explorer_result = fixture.controller.embed(explorer);
        return !explorer_result.has_value() &&
               explorer_result.error().code == HubErrorCode::not_embeddable &&
               fixture.windows.set_styles_calls(explorer) == 0;
    }

    bool test_second_embed_of_same_window_fails()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();

        const auto first = fixture.controller.embed(window);
        const auto second = fixture.controller.embed(window);
        return first.has_value() &&
               !second.has_value() &&
               second.error().code == HubErrorCode::already_embedded &&
               fixture.registry.size() == 1;
    }

    bool test_concurrent_embeds_have_one_winner()
    {
        for (int round = 0; round < 20; ++round)
        {
            EngineFixture fixture;
            const auto window = fixture.add_target();

            std::mutex results_mutex;
            int successes = 0;
            int duplicates = 0;
            std::vector<std::thread> racers;
            for (int index = 0; index < 2; ++index)
            {
                racers.emplace_back([&] {
                    const auto result = fixture.controller.embed(window);
                    std::lock_guard lock(results_mutex);
                    if (result)
                    {
                        ++successes;
                    }
                    else if (result.error().code == HubErrorCode::already_embedded)
                    {
                        ++duplicates;
                    }
                });
            }
            for (auto& racer : racers)
            {
                racer.join();
            }

            if (successes != 1 || duplicates != 1 || fixture.registry.size() != 1)
            {
                return false;
            }
        }
        return true;
    }

    bool test_permission_denied_rolls_back()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();
        const FakeWindowState before = fixture.windows.state(window);
        fixture.windows.fail_set_parent(window, ERROR_ACCESS_DENIED);

        const auto embedded = fixture.controller.embed(window);
        const FakeWindowState after = fixture.windows.state(window);
        return !embedded.has_value() &&
               embedded.error().code == HubErrorCode::permission_denied &&
               embedded.error().win32_error == ERROR_ACCESS_DENIED &&
               wh::hub::is_user_visible(embedded.error().code) &&
               after.styles == before.styles &&
               after.parent.empty() &&
               !fixture.registry.is_claimed(window) &&
               fixture.events.created().empty();
    }

    bool test_release_of_dead_window_still_removes_session()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();
        const auto embedded = fixture.controller.embed(window);
        if (!embedded)
        {
            return false;
        }

        fixture.windows.destroy(window);
        if (!fixture.controller.release(embedded->id))
        {
            return false;
        }

        const auto again = fixture.controller.release(embedded->id);
        return !again.has_value() &&
               again.error().code == HubErrorCode::session_not_found &&
               fixture.registry.size() == 0 &&
               fixture.events.closed().size() == 1;
    }

    bool test_close_posts_wm_close_after_restore()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();
        const auto embedded = fixture.controller.embed(window);
        if (!embedded || !fixture.controller.close(embedded->id))
        {
            return false;
        }

        const auto posted = fixture.windows.closes_posted();
        return posted.size() == 1 &&
               posted[0] == window &&
               fixture.windows.state(window).parent.empty();
    }

    bool test_invalidate_reports_invalidated_once()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();
        const auto embedded = fixture.controller.embed(window);
        if (!embedded)
        {
            return false;
        }

        fixture.windows.destroy(window);
        const bool first = fixture.controller.invalidate(embedded->id);
        const bool second = fixture.controller.invalidate(embedded->id);
        const auto closed = fixture.events.closed();
        return first &&
               !second &&
               closed.size() == 1 &&
               closed[0].reason == wh::hub::CloseReason::invalidated;
    }

    bool test_resize_respects_tolerance()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target();
        if (!fixture.controller.embed(window))
        {
            return false;
        }

        const int moves = fixture.windows.set_bounds_calls(window);
        auto nudged = kTestPane;
        nudged.width += 1;
        fixture.controller.resize_panes(nudged);
        if (fixture.windows.set_bounds_calls(window) != moves || fixture.windows.state(window).bounds != kTestPane)
        {
            return false;
        }

        const wh::window::PaneRect grown{ .x = 0, .y = 36, .width = 1600, .height = 900 };
        fixture.controller.resize_panes(grown);
        return fixture.windows.set_bounds_calls(window) == moves + 1 &&
               fixture.windows.state(window).bounds == grown &&
               fixture.controller.pane_rect() == grown &&
               fixture.watchdog.pass_count(wh::hub::RepaintTrigger::resize) == 2;
    }

    bool test_hiding_panes_keeps_only_active_visible()
    {
        EngineFixture fixture;
        const auto first = fixture.add_target(11, L"First");
        const auto second = fixture.add_target(12, L"Second");
        const auto a = fixture.controller.embed(first);
        const auto b = fixture.controller.embed(second);
        if (!a || !b || !fixture.registry.set_active(b->id))
        {
            return false;
        }

        fixture.controller.set_panes_visible(false);
        if (fixture.windows.state(first).visible || fixture.windows.state(second).visible)
        {
            return false;
        }

        fixture.controller.set_panes_visible(true);
        return !fixture.windows.state(first).visible && fixture.windows.state(second).visible;
    }
}

bool run_embedding_controller_tests()
{
    return test_embed_then_release_restores_original_state() &&
           test_popup_caption_window_loses_both_bits() &&
           test_minimized_window_is_not_touched() &&
           test_window_minimized_during_embed_is_rolled_back() &&
           test_release_reparents_before_restoring_styles() &&
           test_invalid_targets_are_rejected() &&
           test_second_embed_of_same_window_fails() &&
           test_concurrent_embeds_have_one_winner() &&
           test_permission_denied_rolls_back() &&
           test_release_of_dead_window_still_removes_session() &&
           test_close_posts_wm_close_after_restore() &&
           test_invalidate_reports_invalidated_once() &&
           test_resize_respects_tolerance() &&
           test_hiding_panes_keeps_only_active_visible();
}
