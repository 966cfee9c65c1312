#include "engine_fixture.hpp"

#include <vector>

namespace
{
    using wh::hub::FocusPolicy;
    using wh::hub::HubErrorCode;
    using wh::tests::AttachCall;
    using wh::tests::EngineFixture;
    using wh::tests::FakeWindowState;
    using wh::tests::FakeWindowSystem;

    constexpr DWORD kHostThread = FakeWindowSystem::hub_thread_id;

    bool test_activation_attaches_and_defers_detach()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target(11);
        const auto session = fixture.controller.embed(window);
        if (!session || !fixture.focus.activate(session->id))
        {
            return false;
        }

        const auto calls = fixture.windows.attach_calls();
        const auto activations = fixture.windows.activation_calls();
        return calls.size() == 1 &&
               calls[0] == AttachCall{ .from_thread = kHostThread, .to_thread = 11, .attach = true } &&
               fixture.windows.attachment_count() == 1 &&
               fixture.focus.has_pending_detach() &&
               fixture.focus.pending_detach_session() == session->id &&
               fixture.registry.active() == session->id &&
               fixture.windows.focused() == window &&
               !activations.empty() &&
               activations.back().window == window &&
               activations.back().active &&
               fixture.watchdog.pass_count(wh::hub::RepaintTrigger::activation) == 1;
    }

    bool test_new_activation_supersedes_pending_detach()
    {
        EngineFixture fixture;
        const auto first = fixture.add_target(11, L"First");
        const auto second = fixture.add_target(12, L"Second");
        const auto a = fixture.controller.embed(first);
        const auto b = fixture.controller.embed(second);
        if (!a || !b || !fixture.focus.activate(a->id) || !fixture.focus.activate(b->id))
        {
            return false;
        }

        const std::vector<AttachCall> expected{
            { .from_thread = kHostThread, .to_thread = 11, .attach = true },
            { .from_thread = kHostThread, .to_thread = 11, .attach = false },
            { .from_thread = kHostThread, .to_thread = 12, .attach = true },
        };
        if (fixture.windows.attach_calls() != expected ||
            fixture.focus.pending_detach_session() != b->id ||
            fixture.focus.scheduled_detach_count() != 2 ||
            fixture.windows.attachment_count() != 1)
        {
            return false;
        }

        // The previous tab was told it lost activation.
        bool deactivated = false;
        for (const auto& call : fixture.windows.activation_calls())
        {
            deactivated = deactivated || (call.window == first && !call.active);
        }
        if (!deactivated)
        {
            return false;
        }

        fixture.focus.flush_pending_detach();
        return !fixture.focus.has_pending_detach() && fixture.windows.attachment_count() == 0;
    }

    bool test_reactivating_same_thread_keeps_attachment()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target(11);
        const auto session = fixture.controller.embed(window);
        if (!session || !fixture.focus.activate(session->id) || !fixture.focus.activate(session->id))
        {
            return false;
        }

        return fixture.windows.attach_calls().size() == 1 &&
               fixture.focus.scheduled_detach_count() == 2 &&
               fixture.focus.pending_detach_session() == session->id &&
               fixture.windows.attachment_count() == 1;
    }

    bool test_deferred_detach_fires()
    {
        EngineFixture fixture(FocusPolicy{ .detach_delay_ms = 20 });
        const auto window = fixture.add_target(11);
        const auto session = fixture.controller.embed(window);
        if (!session || !fixture.focus.activate(session->id))
        {
            return false;
        }

        const bool detached = wh::tests::wait_until([&] {
            return !fixture.focus.has_pending_detach() && fixture.windows.attachment_count() == 0;
        });
        const auto calls = fixture.windows.attach_calls();
        return detached &&
               calls.size() == 2 &&
               calls[1] == AttachCall{ .from_thread = kHostThread, .to_thread = 11, .attach = false };
    }

    bool test_deferred_detach_runs_for_vanished_session()
    {
        EngineFixture fixture(FocusPolicy{ .detach_delay_ms = 20 });
        const auto window = fixture.add_target(11);
        const auto session = fixture.controller.embed(window);
        if (!session || !fixture.focus.activate(session->id))
        {
            return false;
        }

        // The session disappears without `forget` seeing the pending detach.
        if (!fixture.registry.take(session->id))
        {
            return false;
        }

        const bool detached = wh::tests::wait_until([&] {
            return !fixture.focus.has_pending_detach() && fixture.windows.attachment_count() == 0;
        });
        return detached && fixture.windows.failed_detach_count() == 0;
    }

    bool test_reactivation_racing_timer_keeps_attachments_paired()
    {
        EngineFixture fixture(FocusPolicy{ .detach_delay_ms = 1 });
        const auto window = fixture.add_target(11);
        const auto session = fixture.controller.embed(window);
        if (!session)
        {
            return false;
        }

        for (int round = 0; round < 200; ++round)
        {
            if (!fixture.focus.activate(session->id))
            {
                return false;
            }
            ::Sleep(static_cast<DWORD>(round % 3));
        }

        const bool settled = wh::tests::wait_until([&] {
            return !fixture.focus.has_pending_detach() && fixture.windows.attachment_count() == 0;
        });

        // Every detach undid an attachment that was still in place.
        return settled && fixture.windows.failed_detach_count() == 0;
    }

    bool test_rapid_switching_leaves_one_attachment()
    {
        EngineFixture fixture;
        const auto first = fixture.add_target(11, L"First");
        const auto second = fixture.add_target(12, L"Second");
        const auto a = fixture.controller.embed(first);
        const auto b = fixture.controller.embed(second);
        if (!a || !b)
        {
            return false;
        }

        for (int round = 0; round < 10; ++round)
        {
            if (!fixture.focus.activate(round % 2 == 0 ? a->id : b->id))
            {
                return false;
            }
            if (fixture.windows.attachment_count() != 1)
            {
                return false;
            }
        }

        fixture.focus.flush_pending_detach();
        return fixture.focus.scheduled_detach_count() == 10 &&
               fixture.windows.attachment_count() == 0;
    }

    bool test_dead_window_reports_session_gone()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target(11);
        const auto session = fixture.controller.embed(window);
        if (!session)
        {
            return false;
        }

        fixture.windows.destroy(window);
        const auto activated = fixture.focus.activate(session->id);
        return !activated.has_value() &&
               activated.error().code == HubErrorCode::session_gone &&
               fixture.windows.attach_calls().empty() &&
               !fixture.focus.has_pending_detach();
    }

    bool test_unknown_session_is_not_found()
    {
        EngineFixture fixture;
        const auto activated = fixture.focus.activate(static_cast<wh::hub::SessionId>(77));
        return !activated.has_value() && activated.error().code == HubErrorCode::session_not_found;
    }

    bool test_same_thread_target_needs_no_attach()
    {
        EngineFixture fixture;
        const auto window = fixture.windows.add_window(FakeWindowState{ .thread_id = kHostThread });
        const auto session = fixture.controller.embed(window);
        if (!session || !fixture.focus.activate(session->id))
        {
            return false;
        }

        return fixture.windows.attach_calls().empty() &&
               !fixture.focus.has_pending_detach() &&
               fixture.registry.active() == session->id;
    }

    bool test_chromium_render_widget_gets_focus()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target(11, L"Browser");
        const auto widget = fixture.windows.add_window(FakeWindowState{
            .thread_id = 11,
            .class_name = std::wstring(wh::hub::kChromeRenderWidgetClass),
            .parent = window,
        });
        const auto session = fixture.controller.embed(window);
        if (!session || !fixture.focus.activate(session->id))
        {
            return false;
        }
        return fixture.windows.focused() == widget;
    }

    bool test_forget_detaches_removed_session()
    {
        EngineFixture fixture;
        const auto window = fixture.add_target(11);
        const auto session = fixture.controller.embed(window);
        if (!session || !fixture.focus.activate(session->id))
        {
            return false;
        }

        // Removal goes through `forget` before the window is restored.
        if (!fixture.controller.release(session->id))
        {
            return false;
        }
        return !fixture.focus.has_pending_detach() && fixture.windows.attachment_count() == 0;
    }
}

bool run_focus_coordinator_tests()
{
    return test_activation_attaches_and_defers_detach() &&
           test_new_activation_supersedes_pending_detach() &&
           test_reactivating_same_thread_keeps_attachment() &&
           test_deferred_detach_fires() &&
           test_deferred_detach_runs_for_vanished_session() &&
           test_reactivation_racing_timer_keeps_attachments_paired() &&
           test_rapid_switching_leaves_one_attachment() &&
           test_dead_window_reports_session_gone() &&
           test_unknown_session_is_not_found() &&
           test_same_thread_target_needs_no_attach() &&
           test_chromium_render_widget_gets_focus() &&
           test_forget_detaches_removed_session();
}
