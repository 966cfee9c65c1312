#include "hub/embedding_controller.hpp"

#include "hub/focus_coordinator.hpp"
#include "hub/repaint_watchdog.hpp"
#include "hub/session_registry.hpp"
#include "logging/logger.hpp"
#include "window/window_directory.hpp"
#include "window/window_styles.hpp"

#include <cstdlib>
#include <format>

namespace wh::hub
{
    namespace
    {
        [[nodiscard]] std::wstring_view describe_verdict(const window::Embeddability verdict) noexcept
        {
            switch (verdict)
            {
            case window::Embeddability::embeddable:
                return L"embeddable";
            case window::Embeddability::invalid_handle:
                return L"window does not exist";
            case window::Embeddability::own_process:
                return L"window belongs to the hub";
            case window::Embeddability::minimized:
                return L"window is minimized";
            case window::Embeddability::blocked_class:
                return L"window class cannot be hosted";
            }
            return L"unknown";
        }

        [[nodiscard]] bool within_tolerance(const window::PaneRect& current, const window::PaneRect& wanted) noexcept
        {
            return std::abs(current.x - wanted.x) <= kPaneResizeTolerancePx &&
                   std::abs(current.y - wanted.y) <= kPaneResizeTolerancePx &&
                   std::abs(current.width - wanted.width) <= kPaneResizeTolerancePx &&
                   std::abs(current.height - wanted.height) <= kPaneResizeTolerancePx;
        }

        [[nodiscard]] FILETIME now() noexcept
        {
            FILETIME value{};
            ::GetSystemTimeAsFileTime(&value);
            return value;
        }
    }

    EmbeddingController::EmbeddingController(
        window::WindowSystem& windows,
        const window::WindowDirectory& directory,
        SessionRegistry& registry,
        RepaintWatchdog& watchdog,
        FocusCoordinator& focus,
        logging::Logger& logger,
        const core::WindowHandle host_container) :
        _windows(windows),
        _directory(directory),
        _registry(registry),
        _watchdog(watchdog),
        _focus(focus),
        _logger(logger),
        _host(host_container)
    {
    }

    void EmbeddingController::set_event_sink(SessionEventSink* const sink) noexcept
    {
        std::lock_guard lock(_state_mutex);
        _sink = sink;
    }

    SessionEventSink* EmbeddingController::sink() const
    {
        std::lock_guard lock(_state_mutex);
        return _sink;
    }

    window::PaneRect EmbeddingController::pane_rect() const
    {
        std::lock_guard lock(_state_mutex);
        return _pane;
    }

    HubError EmbeddingController::classify(const DWORD win32_error, const core::WindowHandle window, std::wstring context)
    {
        if (win32_error == ERROR_ACCESS_DENIED)
        {
            return make_error(HubErrorCode::permission_denied, std::move(context), win32_error);
        }
        if (win32_error == ERROR_INVALID_WINDOW_HANDLE || !_windows.is_window(window))
        {
            return make_error(HubErrorCode::invalid_handle, std::move(context), win32_error);
        }
        return make_error(HubErrorCode::not_embeddable, std::move(context), win32_error);
    }

    void EmbeddingController::ensure_host_clips_children()
    {
        {
            std::lock_guard lock(_state_mutex);
            if (_host_clips_children)
            {
                return;
            }
        }

        auto host_styles = _windows.styles(_host);
        if (!host_styles)
        {
            _logger.log(logging::LogLevel::warning, L"Host container styles unavailable (error={})", host_styles.error());
            return;
        }

        if (!window::clips_children(*host_styles))
        {
            // Without it the host paints over the embedded panes.
            auto applied = _windows.set_styles(_host, window::with_clip_children(*host_styles));
            if (!applied)
            {
                _logger.log(logging::LogLevel::warning, L"Failed to set WS_CLIPCHILDREN on host container (error={})", applied.error());
                return;
            }
        }

        std::lock_guard lock(_state_mutex);
        _host_clips_children = true;
    }

    std::expected<SessionInfo, HubError> EmbeddingController::embed(const core::WindowHandle window)
    {
        if (window.empty() || !_windows.is_window(window))
        {
            return std::unexpected(make_error(HubErrorCode::invalid_handle, L"Embed: window does not exist", ERROR_INVALID_WINDOW_HANDLE));
        }
        if (window == _host)
        {
            return std::unexpected(make_error(HubErrorCode::not_embeddable, L"Embed: cannot embed the host container"));
        }

        auto reserved = _registry.reserve(window);
        if (!reserved)
        {
            _logger.log(logging::LogLevel::debug, L"Embed rejected for hwnd=0x{:X}: already embedded", window.as_uintptr());
            return std::unexpected(std::move(reserved.error()));
        }

        auto session = embed_claimed(*reserved, window);
        _registry.release_reservation(window);
        if (!session)
        {
            _logger.log(
                is_user_visible(session.error().code) ? logging::LogLevel::error : logging::LogLevel::info,
                L"Embed failed for hwnd=0x{:X}: {} ({}, error={})",
                window.as_uintptr(),
                to_string(session.error().code),
                session.error().context,
                session.error().win32_error);
            return std::unexpected(std::move(session.error()));
        }

        SessionInfo info = describe(*session);
        if (SessionEventSink* const events = sink())
        {
            events->session_created(info);
        }
        return info;
    }

    void EmbeddingController::revert_styles(const Session& session)
    {
        if (auto reverted = _windows.set_styles(session.window, session.snapshot.styles); !reverted)
        {
            _logger.log(logging::LogLevel::debug, L"Embed rollback: style restore failed for hwnd=0x{:X} (error={})", session.window.as_uintptr(), reverted.error());
        }
    }

    std::expected<Session, HubError> EmbeddingController::embed_claimed(const SessionId id, const core::WindowHandle window)
    {
        const window::Embeddability verdict = _directory.check_embeddable(window);
        if (verdict != window::Embeddability::embeddable)
        {
            const HubErrorCode code = verdict == window::Embeddability::invalid_handle ? HubErrorCode::invalid_handle : HubErrorCode::not_embeddable;
            return std::unexpected(make_error(code, std::format(L"Embed: {}", describe_verdict(verdict))));
        }

        Session session{};
        session.id = id;
        session.window = window;
        session.state = EmbeddingState::embedding;
        session.process_id = _windows.process_id(window);
        session.title = _windows.title(window);
        session.icon = _windows.icon(window);
        session.created_at = now();

        auto original_styles = _windows.styles(window);
        if (!original_styles)
        {
            return std::unexpected(classify(original_styles.error(), window, L"Embed: reading window styles failed"));
        }
        session.snapshot.styles = *original_styles;
        session.snapshot.parent = _windows.parent(window);
        if (const auto bounds = _windows.bounds(window))
        {
            session.snapshot.bounds = *bounds;
            session.snapshot.has_bounds = true;
        }

        ensure_host_clips_children();

        auto stripped = _windows.set_styles(window, window::embedded_styles(session.snapshot.styles));
        if (!stripped)
        {
            return std::unexpected(classify(stripped.error(), window, L"Embed: SetWindowLongPtr failed"));
        }

        // The window may have been minimized since validation; never reparent
        // an iconic window.
        if (_windows.is_minimized(window))
        {
            revert_styles(session);
            return std::unexpected(make_error(HubErrorCode::not_embeddable, L"Embed: window was minimized before reparenting"));
        }

        auto reparented = _windows.set_parent(window, _host);
        if (!reparented)
        {
            revert_styles(session);
            return std::unexpected(classify(reparented.error(), window, L"Embed: SetParent failed"));
        }

        auto fitted = _windows.set_bounds(window, pane_rect());
        if (!fitted)
        {
            if (!_windows.is_window(window))
            {
                return std::unexpected(make_error(HubErrorCode::invalid_handle, L"Embed: window died while reparenting", fitted.error()));
            }
            _logger.log(logging::LogLevel::debug, L"Embed: initial pane fit failed for hwnd=0x{:X} (error={})", window.as_uintptr(), fitted.error());
        }

        _windows.show(window, window::ShowCommand::show_no_activate);
        _watchdog.force_repaint(window, RepaintTrigger::embed);

        session.state = EmbeddingState::embedded;
        _registry.commit(session);

        _logger.log(
            logging::LogLevel::info,
            L"Embedded session {} (hwnd=0x{:X}, pid={}, style=0x{:08X}->0x{:08X}, title=\"{}\")",
            to_value(id),
            window.as_uintptr(),
            session.process_id,
            session.snapshot.styles.style,
            window::embedded_styles(session.snapshot.styles).style,
            session.title);
        return session;
    }

    void EmbeddingController::restore(const Session& session, const CloseReason reason)
    {
        const core::WindowHandle window = session.window;
        if (!_windows.is_window(window))
        {
            _logger.log(logging::LogLevel::debug, L"Session {} restore skipped: window already gone", to_value(session.id));
            return;
        }

        const StyleSnapshot& snapshot = session.snapshot;
        bool gone = false;

        // Reparent first: WS_CHILD may only be cleared once the window has
        // left the container.
        if (auto reparented = _windows.set_parent(window, snapshot.parent); !reparented)
        {
            gone = reparented.error() == ERROR_INVALID_WINDOW_HANDLE;
            _logger.log(logging::LogLevel::debug, L"Session {} parent restore failed (error={})", to_value(session.id), reparented.error());
        }

        if (!gone)
        {
            if (auto styled = _windows.set_styles(window, snapshot.styles); !styled)
            {
                gone = styled.error() == ERROR_INVALID_WINDOW_HANDLE;
                _logger.log(logging::LogLevel::debug, L"Session {} style restore failed (error={})", to_value(session.id), styled.error());
            }
        }

        // Snapshot bounds are screen coordinates; only meaningful on the desktop.
        if (!gone && snapshot.has_bounds && snapshot.parent.empty())
        {
            if (auto moved = _windows.set_bounds(window, snapshot.bounds); !moved)
            {
                gone = moved.error() == ERROR_INVALID_WINDOW_HANDLE;
                _logger.log(logging::LogLevel::debug, L"Session {} bounds restore failed (error={})", to_value(session.id), moved.error());
            }
        }

        if (gone)
        {
            _logger.log(logging::LogLevel::debug, L"Session {} window disappeared during restore", to_value(session.id));
            return;
        }

        if (reason == CloseReason::released && snapshot.parent.empty())
        {
            _windows.show(window, window::ShowCommand::restore);
            _windows.set_foreground(window);
        }
    }

    bool EmbeddingController::remove(const SessionId id, const CloseReason reason, core::WindowHandle* const released_window)
    {
        std::optional<Session> session = _registry.take(id);
        if (!session)
        {
            return false;
        }

        session->state = EmbeddingState::releasing;
        _focus.forget(id);
        restore(*session, reason);
        _watchdog.force_repaint(session->window, RepaintTrigger::release);

        session->state = reason == CloseReason::released ? EmbeddingState::released : EmbeddingState::invalidated;
        _registry.release_reservation(session->window);

        _logger.log(
            logging::LogLevel::info,
            L"Session {} {} (hwnd=0x{:X})",
            to_value(id),
            to_string(session->state),
            session->window.as_uintptr());

        if (released_window != nullptr)
        {
            *released_window = session->window;
        }

        if (SessionEventSink* const events = sink())
        {
            events->session_closed(describe(*session), reason);
        }
        return true;
    }

    std::expected<void, HubError> EmbeddingController::release(const SessionId id)
    {
        if (!remove(id, CloseReason::released, nullptr))
        {
            return std::unexpected(make_error(HubErrorCode::session_not_found, L"Release: no such session"));
        }
        return {};
    }

    std::expected<void, HubError> EmbeddingController::close(const SessionId id)
    {
        core::WindowHandle window{};
        if (!remove(id, CloseReason::released, &window))
        {
            return std::unexpected(make_error(HubErrorCode::session_not_found, L"Close: no such session"));
        }

        if (!_windows.post_close(window))
        {
            _logger.log(logging::LogLevel::debug, L"WM_CLOSE not posted to hwnd=0x{:X}: window already gone", window.as_uintptr());
        }
        return {};
    }

    bool EmbeddingController::invalidate(const SessionId id)
    {
        return remove(id, CloseReason::invalidated, nullptr);
    }

    void EmbeddingController::notify_updated(const SessionId id)
    {
        const std::optional<Session> session = _registry.find(id);
        if (!session)
        {
            return;
        }
        if (SessionEventSink* const events = sink())
        {
            events->session_updated(describe(*session));
        }
    }

    void EmbeddingController::resize_panes(const window::PaneRect& rect)
    {
        {
            std::lock_guard lock(_state_mutex);
            _pane = rect;
        }

        for (const Session& session : _registry.sessions())
        {
            const auto current = _windows.bounds(session.window);
            if (!current)
            {
                continue;
            }
            if (!within_tolerance(*current, rect))
            {
                if (auto moved = _windows.set_bounds(session.window, rect); !moved)
                {
                    _logger.log(logging::LogLevel::debug, L"Pane resize failed for session {} (error={})", to_value(session.id), moved.error());
                    continue;
                }
            }
            _watchdog.force_repaint(session.window, RepaintTrigger::resize);
        }
    }

    void EmbeddingController::set_panes_visible(const bool visible)
    {
        // Only the active tab is ever shown; the others stay hidden.
        const std::optional<SessionId> active = _registry.active();
        for (const Session& session : _registry.sessions())
        {
            if (visible && active && *active == session.id)
            {
                _windows.show(session.window, window::ShowCommand::show_no_activate);
                _windows.bring_to_top(session.window);
                _watchdog.force_repaint(session.window, RepaintTrigger::resize);
            }
            else
            {
                _windows.show(session.window, window::ShowCommand::hide);
            }
        }
    }
}
