#pragma once

// Top-level container window of `windowhub.exe`.
//
// The window is the host container the engine reparents foreign windows
// into. Its top strip shows one tab per session (plain GDI, click to
// activate, middle-click to close); the client area below it is the pane
// every embedded window is fitted to.
//
// Sink callbacks only post a refresh message; the tab strip is rebuilt from
// the registry once the current engine request has returned. The
// External-Change Monitor wakes the window through `request_reconcile`, and
// the reconciliation itself runs here on the UI thread.
//
// While active, the window owns the tab hotkeys (see host/hotkeys.hpp).

#include "core/exception.hpp"
#include "hub/session.hpp"
#include "hub/session_events.hpp"
#include "window/window_system.hpp"

#include <Windows.h>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wh::logging
{
    class Logger;
}

namespace wh::hub
{
    class WindowHub;
}

namespace wh::host
{
    struct HostWindowConfig final
    {
        std::wstring title{ L"WindowHub" };
        int initial_width_px{ 1280 };
        int initial_height_px{ 800 };
        int tab_bar_height_px{ 36 };
        int show_command{ SW_SHOWDEFAULT };
    };

    class HostWindow final : public hub::SessionEventSink
    {
    public:
        [[nodiscard]] static std::expected<std::unique_ptr<HostWindow>, core::Win32Error> create(
            HostWindowConfig config,
            logging::Logger& logger) noexcept;

        HostWindow(const HostWindow&) = delete;
        HostWindow& operator=(const HostWindow&) = delete;
        HostWindow(HostWindow&&) = delete;
        HostWindow& operator=(HostWindow&&) = delete;

        ~HostWindow() noexcept override;

        // Routes sizing, tab clicks and focus to `hub` and registers this
        // window as its event sink. Pass null to detach.
        void attach_hub(hub::WindowHub* hub);

        // Runs the message pump until the window is closed.
        [[nodiscard]] int run() noexcept;

        void request_close() noexcept;

        // Safe from any thread.
        void request_reconcile() noexcept;

        [[nodiscard]] HWND hwnd() const noexcept;

        // Pane area in client coordinates.
        [[nodiscard]] window::PaneRect pane_rect() const noexcept;

        void session_created(const hub::SessionInfo& session) noexcept override;
        void session_closed(const hub::SessionInfo& session, hub::CloseReason reason) noexcept override;
        void session_activated(const hub::SessionInfo& session) noexcept override;
        void session_updated(const hub::SessionInfo& session) noexcept override;

        [[nodiscard]] static LRESULT CALLBACK window_proc(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam) noexcept;

    private:
        struct Tab final
        {
            hub::SessionId id{ hub::SessionId::none };
            std::wstring title;
        };

        HostWindow(HostWindowConfig config, logging::Logger& logger) noexcept;

        [[nodiscard]] bool create_window() noexcept;
        [[nodiscard]] LRESULT handle_message(UINT msg, WPARAM wparam, LPARAM lparam) noexcept;

        void post_refresh() noexcept;
        void refresh_tabs();
        void handle_paint() noexcept;
        void handle_resize();
        void handle_tab_click(int x, int y, bool close);
        void handle_hotkey(int id);
        void register_hotkeys() noexcept;
        void unregister_hotkeys() noexcept;
        [[nodiscard]] std::optional<std::size_t> tab_at(int x, int y) const noexcept;
        [[nodiscard]] int tab_width() const noexcept;

        HostWindowConfig _config;
        logging::Logger& _logger;
        HWND _hwnd{};
        hub::WindowHub* _hub{ nullptr };

        bool _hotkeys_registered{ false };

        std::vector<Tab> _tabs;
        std::optional<hub::SessionId> _active;
    };
}
