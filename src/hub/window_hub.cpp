#include "hub/window_hub.hpp"

#include "logging/logger.hpp"

#include <exception>

namespace wh::hub
{
    WindowHub::WindowHub(
        window::WindowSystem& windows,
        core::ProcessStarter& starter,
        logging::Logger& logger,
        const core::WindowHandle host_container,
        HubOptions options) :
        _windows(windows),
        _logger(logger),
        _directory(windows, std::move(options.directory)),
        _registry(),
        _watchdog(windows, logger),
        _focus(windows, _registry, _watchdog, logger, options.focus),
        _controller(windows, _directory, _registry, _watchdog, _focus, logger, host_container),
        _launch(starter, _directory, _registry, _controller, logger, options.launch),
        _monitor(windows, _registry, _controller, logger, options.monitor_interval_ms)
    {
    }

    WindowHub::~WindowHub() noexcept
    {
        // The sink may already be gone at this point.
        set_event_sink(nullptr);
        try
        {
            shutdown();
        }
        catch (const std::exception&)
        {
            // Sessions not yet released stay parented to the dying container.
            ::OutputDebugStringW(L"[windowhub] hub shutdown failed during destruction\n");
        }
    }

    void WindowHub::set_event_sink(SessionEventSink* const sink) noexcept
    {
        _sink = sink;
        _controller.set_event_sink(sink);
    }

    std::vector<window::WindowCandidate> WindowHub::list_candidates() const
    {
        return _directory.list_candidates();
    }

    std::expected<SessionInfo, HubError> WindowHub::request_embed(const core::WindowHandle window)
    {
        auto session = _controller.embed(window);
        if (!session)
        {
            return session;
        }

        if (auto activated = request_activate(session->id); !activated)
        {
            // The tab exists; focus is the only thing that failed.
            _logger.log(logging::LogLevel::debug, L"New session {} could not be activated: {}", to_value(session->id), to_string(activated.error().code));
        }
        return session;
    }

    std::expected<void, HubError> WindowHub::request_activate(const SessionId id)
    {
        const std::optional<Session> target = _registry.find(id);
        if (!target)
        {
            return std::unexpected(make_error(HubErrorCode::session_not_found, L"Activate: no such session"));
        }
        const std::optional<SessionId> previous = _registry.active();

        _windows.show(target->window, window::ShowCommand::show_no_activate);
        auto activated = _focus.activate(id);
        if (!activated)
        {
            if (activated.error().code == HubErrorCode::session_gone)
            {
                _logger.log(logging::LogLevel::info, L"Session {} is gone; dropping it", to_value(id));
                _controller.invalidate(id);
            }
            return activated;
        }

        if (previous && *previous != id)
        {
            if (const std::optional<Session> hidden = _registry.find(*previous))
            {
                _windows.show(hidden->window, window::ShowCommand::hide);
            }
        }

        if (_sink != nullptr)
        {
            if (const std::optional<Session> current = _registry.find(id))
            {
                _sink->session_activated(describe(*current));
            }
        }
        return {};
    }

    std::expected<void, HubError> WindowHub::remove_and_refocus(const SessionId id, const Removal removal)
    {
        const std::optional<std::size_t> index = _registry.index_of(id);
        const std::optional<SessionId> active = _registry.active();
        const bool was_active = active && *active == id;

        auto removed = (_controller.*removal)(id);
        if (!removed)
        {
            return removed;
        }

        if (was_active && index)
        {
            if (const auto next_index = neighbour_after_removal(*index, _registry.size()))
            {
                if (auto refocused = activate_index(*next_index); !refocused)
                {
                    _logger.log(logging::LogLevel::debug, L"Neighbour activation failed: {}", to_string(refocused.error().code));
                }
            }
        }
        return {};
    }

    std::expected<void, HubError> WindowHub::request_release(const SessionId id)
    {
        return remove_and_refocus(id, &EmbeddingController::release);
    }

    std::expected<void, HubError> WindowHub::request_close(const SessionId id)
    {
        return remove_and_refocus(id, &EmbeddingController::close);
    }

    std::expected<SessionInfo, HubError> WindowHub::request_launch_and_embed(const std::wstring& path)
    {
        auto session = _launch.launch_and_embed(path);
        if (!session)
        {
            return session;
        }

        if (auto activated = request_activate(session->id); !activated)
        {
            _logger.log(logging::LogLevel::debug, L"Launched session {} could not be activated: {}", to_value(session->id), to_string(activated.error().code));
        }
        return session;
    }

    std::expected<void, HubError> WindowHub::activate_index(const std::size_t index)
    {
        const std::optional<SessionId> id = _registry.at(index);
        if (!id)
        {
            return std::unexpected(make_error(HubErrorCode::session_not_found, L"No tab at that position"));
        }
        return request_activate(*id);
    }

    std::expected<void, HubError> WindowHub::require_active(SessionId& id) const
    {
        const std::optional<SessionId> active = _registry.active();
        if (!active)
        {
            return std::unexpected(make_error(HubErrorCode::session_not_found, L"No active tab"));
        }
        id = *active;
        return {};
    }

    std::expected<void, HubError> WindowHub::dispatch(const TabAction& action)
    {
        switch (action.kind)
        {
        case TabActionKind::activate_index:
            return activate_index(action.index);

        case TabActionKind::next:
        case TabActionKind::previous:
        {
            const std::size_t count = _registry.size();
            if (count == 0)
            {
                return std::unexpected(make_error(HubErrorCode::session_not_found, L"No tabs"));
            }

            std::size_t current = 0;
            if (const std::optional<SessionId> active = _registry.active())
            {
                current = _registry.index_of(*active).value_or(0);
            }
            else
            {
                // Nothing active yet: next selects the first tab, previous the last.
                return activate_index(action.kind == TabActionKind::next ? 0 : count - 1);
            }
            return activate_index(cycle_index(current, count, action.kind == TabActionKind::next));
        }

        case TabActionKind::close_current:
        case TabActionKind::pop_out_current:
        {
            SessionId id = SessionId::none;
            if (auto found = require_active(id); !found)
            {
                return found;
            }
            return action.kind == TabActionKind::close_current ? request_close(id) : request_release(id);
        }
        }
        return std::unexpected(make_error(HubErrorCode::session_not_found, L"Unknown tab action"));
    }

    bool WindowHub::move_tab(const SessionId id, const std::size_t new_index)
    {
        return _registry.move(id, new_index);
    }

    void WindowHub::set_pane_rect(const window::PaneRect& rect)
    {
        _controller.resize_panes(rect);
    }

    void WindowHub::set_panes_visible(const bool visible)
    {
        _controller.set_panes_visible(visible);
    }

    std::expected<void, MonitorError> WindowHub::start_monitor(ExternalChangeMonitor::WakeHandler wake) noexcept
    {
        return _monitor.start(std::move(wake));
    }

    void WindowHub::stop_monitor() noexcept
    {
        _monitor.stop_and_join();
    }

    ReconcileReport WindowHub::reconcile_now()
    {
        return _monitor.reconcile_once();
    }

    void WindowHub::shutdown()
    {
        _monitor.stop_and_join();
        _focus.flush_pending_detach();

        for (const Session& session : _registry.sessions())
        {
            if (auto released = _controller.release(session.id); !released)
            {
                _logger.log(logging::LogLevel::debug, L"Shutdown release of session {}: {}", to_value(session.id), to_string(released.error().code));
            }
        }
    }

    std::vector<Session> WindowHub::sessions() const
    {
        return _registry.sessions();
    }

    std::optional<SessionId> WindowHub::active() const
    {
        return _registry.active();
    }
}
