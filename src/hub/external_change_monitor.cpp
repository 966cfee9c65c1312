#include "hub/external_change_monitor.hpp"

#include "core/win32_handle.hpp"
#include "hub/embedding_controller.hpp"
#include "hub/session_registry.hpp"
#include "logging/logger.hpp"
#include "window/window_system.hpp"

#include <exception>

namespace wh::hub
{
    ExternalChangeMonitor::ExternalChangeMonitor(
        window::WindowSystem& windows,
        SessionRegistry& registry,
        EmbeddingController& controller,
        logging::Logger& logger,
        const DWORD interval_ms) noexcept :
        _windows(windows),
        _registry(registry),
        _controller(controller),
        _logger(logger),
        _interval_ms(interval_ms == 0 ? kDefaultMonitorIntervalMs : interval_ms)
    {
    }

    DWORD WINAPI ExternalChangeMonitor::thread_proc(void* param) noexcept
    {
        auto* monitor = static_cast<ExternalChangeMonitor*>(param);
        if (monitor == nullptr || !monitor->_stop_event.valid())
        {
            return 0;
        }

        for (;;)
        {
            const DWORD wait = ::WaitForSingleObject(monitor->_stop_event.get(), monitor->_interval_ms);
            if (wait != WAIT_TIMEOUT)
            {
                return 0;
            }

            try
            {
                if (monitor->has_external_changes() && !monitor->_wake_pending.exchange(true))
                {
                    monitor->_wake();
                }
            }
            catch (const std::exception&)
            {
                // The next tick scans again.
                ::OutputDebugStringW(L"[windowhub] external change scan failed\n");
            }
        }
    }

    std::expected<void, MonitorError> ExternalChangeMonitor::start(WakeHandler wake) noexcept
    {
        if (_thread.valid())
        {
            return {};
        }
        if (!wake)
        {
            return std::unexpected(MonitorError{ .context = L"External change monitor needs a wake handler", .win32_error = ERROR_INVALID_PARAMETER });
        }
        _wake.swap(wake);
        _wake_pending.store(false);

        auto stop_event = core::create_event(true, false);
        if (!stop_event)
        {
            return std::unexpected(MonitorError{ .context = L"CreateEventW failed for monitor stop event", .win32_error = stop_event.error() });
        }
        _stop_event = std::move(stop_event.value());

        core::UniqueHandle thread(::CreateThread(
            nullptr,
            0,
            &ExternalChangeMonitor::thread_proc,
            this,
            0,
            nullptr));
        if (!thread.valid())
        {
            const DWORD error = ::GetLastError();
            _stop_event.reset();
            _wake = nullptr;
            return std::unexpected(MonitorError{ .context = L"CreateThread failed for external change monitor", .win32_error = error });
        }

        _thread = std::move(thread);
        return {};
    }

    void ExternalChangeMonitor::stop_and_join() noexcept
    {
        if (_thread.valid())
        {
            (void)::SetEvent(_stop_event.get());
            (void)::WaitForSingleObject(_thread.get(), INFINITE);
            _thread.reset();
        }
        _stop_event.reset();
        _wake = nullptr;
    }

    bool ExternalChangeMonitor::has_external_changes()
    {
        const core::WindowHandle container = _controller.host_container();
        for (const Session& session : _registry.sessions())
        {
            const core::WindowHandle window = session.window;
            if (!_windows.is_window(window) ||
                !_windows.is_descendant(container, window) ||
                _windows.is_minimized(window))
            {
                return true;
            }

            const std::wstring title = _windows.title(window);
            if (!title.empty() && title != session.title)
            {
                return true;
            }
        }
        return false;
    }

    ReconcileReport ExternalChangeMonitor::reconcile_once()
    {
        _wake_pending.store(false);

        ReconcileReport report{};
        const core::WindowHandle container = _controller.host_container();

        for (const Session& session : _registry.sessions())
        {
            ++report.checked;
            const core::WindowHandle window = session.window;

            if (!_windows.is_window(window))
            {
                _logger.log(logging::LogLevel::info, L"Session {} window was destroyed", to_value(session.id));
                if (_controller.invalidate(session.id))
                {
                    ++report.invalidated;
                }
                continue;
            }

            if (!_windows.is_descendant(container, window))
            {
                _logger.log(logging::LogLevel::info, L"Session {} window left the host container", to_value(session.id));
                if (_controller.invalidate(session.id))
                {
                    ++report.invalidated;
                }
                continue;
            }

            if (_windows.is_minimized(window))
            {
                // A child minimized by its own process collapses to an icon
                // inside the container.
                _windows.show(window, window::ShowCommand::restore);
                if (auto fitted = _windows.set_bounds(window, _controller.pane_rect()); !fitted)
                {
                    _logger.log(logging::LogLevel::debug, L"Session {} refit after restore failed (error={})", to_value(session.id), fitted.error());
                }
                ++report.restored;
            }

            std::wstring title = _windows.title(window);
            if (!title.empty() && _registry.update_title(session.id, std::move(title)))
            {
                ++report.retitled;
                _controller.notify_updated(session.id);
            }
        }

        if (report.invalidated != 0 || report.retitled != 0 || report.restored != 0)
        {
            _logger.log(
                logging::LogLevel::debug,
                L"Reconciled {} sessions: {} invalidated, {} retitled, {} restored",
                report.checked,
                report.invalidated,
                report.retitled,
                report.restored);
        }
        return report;
    }
}
