#pragma once

// The engine as seen by the UI layer.
//
// `WindowHub` wires the Window Directory, Session Registry, Embedding
// Controller, Focus Coordinator, Repaint Watchdog, External-Change Monitor
// and Launch-and-Capture together and exposes the request surface: embed,
// release, activate, close, launch-and-embed and hotkey-mapped tab actions.
//
// All requests, including `reconcile_now`, are expected on the owner (UI)
// thread. The monitor's worker only reads native state and wakes the owner;
// the deferred focus detach is the one native call made from another thread.

#include "hub/embedding_controller.hpp"
#include "hub/external_change_monitor.hpp"
#include "hub/focus_coordinator.hpp"
#include "hub/hub_error.hpp"
#include "hub/launch_capture.hpp"
#include "hub/repaint_watchdog.hpp"
#include "hub/session_events.hpp"
#include "hub/session_registry.hpp"
#include "hub/tab_actions.hpp"
#include "window/window_directory.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace wh::core
{
    class ProcessStarter;
}

namespace wh::hub
{
    struct HubOptions final
    {
        window::DirectoryOptions directory{};
        FocusPolicy focus{};
        LaunchPolicy launch{};
        DWORD monitor_interval_ms{ kDefaultMonitorIntervalMs };
    };

    class WindowHub final
    {
    public:
        WindowHub(
            window::WindowSystem& windows,
            core::ProcessStarter& starter,
            logging::Logger& logger,
            core::WindowHandle host_container,
            HubOptions options);

        // Stops the monitor and releases every remaining session without
        // notifying the sink.
        ~WindowHub() noexcept;

        WindowHub(const WindowHub&) = delete;
        WindowHub& operator=(const WindowHub&) = delete;

        // Not owned. Receives created/closed/activated/updated notifications.
        void set_event_sink(SessionEventSink* sink) noexcept;

        [[nodiscard]] std::vector<window::WindowCandidate> list_candidates() const;

        // Embeds and activates the new tab.
        [[nodiscard]] std::expected<SessionInfo, HubError> request_embed(core::WindowHandle window);
        [[nodiscard]] std::expected<void, HubError> request_release(SessionId id);
        [[nodiscard]] std::expected<void, HubError> request_activate(SessionId id);
        [[nodiscard]] std::expected<void, HubError> request_close(SessionId id);
        [[nodiscard]] std::expected<SessionInfo, HubError> request_launch_and_embed(const std::wstring& path);

        [[nodiscard]] std::expected<void, HubError> dispatch(const TabAction& action);

        bool move_tab(SessionId id, std::size_t new_index);

        void set_pane_rect(const window::PaneRect& rect);
        void set_panes_visible(bool visible);

        // `wake` runs on the monitor thread and must lead to `reconcile_now`
        // on the owner thread.
        [[nodiscard]] std::expected<void, MonitorError> start_monitor(ExternalChangeMonitor::WakeHandler wake) noexcept;
        void stop_monitor() noexcept;
        ReconcileReport reconcile_now();

        // Releases all sessions in tab order. Idempotent.
        void shutdown();

        [[nodiscard]] std::vector<Session> sessions() const;
        [[nodiscard]] std::optional<SessionId> active() const;

        [[nodiscard]] const RepaintWatchdog& watchdog() const noexcept
        {
            return _watchdog;
        }

        [[nodiscard]] const FocusCoordinator& focus() const noexcept
        {
            return _focus;
        }

    private:
        using Removal = std::expected<void, HubError> (EmbeddingController::*)(SessionId);

        [[nodiscard]] std::expected<void, HubError> remove_and_refocus(SessionId id, Removal removal);
        [[nodiscard]] std::expected<void, HubError> activate_index(std::size_t index);
        [[nodiscard]] std::expected<void, HubError> require_active(SessionId& id) const;

        window::WindowSystem& _windows;
        logging::Logger& _logger;
        SessionEventSink* _sink{ nullptr };

        window::WindowDirectory _directory;
        SessionRegistry _registry;
        RepaintWatchdog _watchdog;
        FocusCoordinator _focus;
        EmbeddingController _controller;
        LaunchCapture _launch;

        // Declared last so its thread is joined before anything it touches
        // is destroyed.
        ExternalChangeMonitor _monitor;
    };
}
