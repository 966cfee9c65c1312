#pragma once

// Embed/release state machine for foreign top-level windows.
//
//   embed:   validate -> claim -> snapshot -> strip chrome -> reparent
//            -> fit pane -> repaint -> register
//   release: unregister -> restore styles/parent/bounds -> repaint
//
// A failed embed leaves no trace: the window is restored to its snapshot and
// the registry claim is dropped. Every removal, whether requested by the user
// or discovered by the External-Change Monitor, goes through `remove`, which
// takes the session out of the registry atomically so restoration and the
// `session_closed` notification happen exactly once.

#include "hub/hub_error.hpp"
#include "hub/session.hpp"
#include "hub/session_events.hpp"
#include "window/window_system.hpp"

#include <Windows.h>

#include <expected>
#include <mutex>
#include <optional>

namespace wh::logging
{
    class Logger;
}

namespace wh::window
{
    class WindowDirectory;
}

namespace wh::hub
{
    class FocusCoordinator;
    class RepaintWatchdog;
    class SessionRegistry;

    // Resizes smaller than this are ignored to avoid layout feedback loops.
    inline constexpr int kPaneResizeTolerancePx = 1;

    class EmbeddingController final
    {
    public:
        EmbeddingController(
            window::WindowSystem& windows,
            const window::WindowDirectory& directory,
            SessionRegistry& registry,
            RepaintWatchdog& watchdog,
            FocusCoordinator& focus,
            logging::Logger& logger,
            core::WindowHandle host_container);

        EmbeddingController(const EmbeddingController&) = delete;
        EmbeddingController& operator=(const EmbeddingController&) = delete;

        // Not owned; may be null. Set before the monitor starts.
        void set_event_sink(SessionEventSink* sink) noexcept;

        [[nodiscard]] std::expected<SessionInfo, HubError> embed(core::WindowHandle window);

        // A dead window is still removed; the failed restore is logged only.
        [[nodiscard]] std::expected<void, HubError> release(SessionId id);

        // Release, then ask the window to close.
        [[nodiscard]] std::expected<void, HubError> close(SessionId id);

        // Removal for windows that died or left the container on their own.
        // False when another path already removed the session.
        bool invalidate(SessionId id);

        // Reports a title change observed outside the engine.
        void notify_updated(SessionId id);

        void resize_panes(const window::PaneRect& rect);
        void set_panes_visible(bool visible);

        [[nodiscard]] window::PaneRect pane_rect() const;
        [[nodiscard]] core::WindowHandle host_container() const noexcept
        {
            return _host;
        }

    private:
        [[nodiscard]] std::expected<Session, HubError> embed_claimed(SessionId id, core::WindowHandle window);
        [[nodiscard]] HubError classify(DWORD win32_error, core::WindowHandle window, std::wstring context);
        void ensure_host_clips_children();
        void revert_styles(const Session& session);
        void restore(const Session& session, CloseReason reason);
        bool remove(SessionId id, CloseReason reason, core::WindowHandle* released_window);
        [[nodiscard]] SessionEventSink* sink() const;

        window::WindowSystem& _windows;
        const window::WindowDirectory& _directory;
        SessionRegistry& _registry;
        RepaintWatchdog& _watchdog;
        FocusCoordinator& _focus;
        logging::Logger& _logger;
        core::WindowHandle _host;

        mutable std::mutex _state_mutex;
        window::PaneRect _pane{};
        SessionEventSink* _sink{ nullptr };
        bool _host_clips_children{ false };
    };
}
