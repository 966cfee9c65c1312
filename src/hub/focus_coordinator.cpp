#include "hub/focus_coordinator.hpp"

#include "hub/repaint_watchdog.hpp"
#include "hub/session_registry.hpp"
#include "logging/logger.hpp"
#include "window/window_system.hpp"

#include <exception>

namespace wh::hub
{
    namespace
    {
        // Relative due time in 100ns units, negative per SetThreadpoolTimer.
        [[nodiscard]] FILETIME relative_due_time(const DWORD delay_ms) noexcept
        {
            ULARGE_INTEGER due{};
            due.QuadPart = static_cast<ULONGLONG>(-(static_cast<LONGLONG>(delay_ms) * 10'000));

            FILETIME result{};
            result.dwLowDateTime = due.LowPart;
            result.dwHighDateTime = due.HighPart;
            return result;
        }
    }

    FocusCoordinator::FocusCoordinator(
        window::WindowSystem& windows,
        SessionRegistry& registry,
        RepaintWatchdog& watchdog,
        logging::Logger& logger,
        const FocusPolicy policy) noexcept :
        _windows(windows),
        _registry(registry),
        _watchdog(watchdog),
        _logger(logger),
        _policy(policy)
    {
    }

    FocusCoordinator::~FocusCoordinator() noexcept
    {
        flush_pending_detach();
        _timer.reset();
    }

    void CALLBACK FocusCoordinator::timer_callback(PTP_CALLBACK_INSTANCE /*instance*/, void* context, PTP_TIMER /*timer*/) noexcept
    {
        try
        {
            static_cast<FocusCoordinator*>(context)->on_timer();
        }
        catch (const std::exception&)
        {
            // The detach itself ran under the lock; only reporting failed.
            ::OutputDebugStringW(L"[windowhub] deferred detach report failed\n");
        }
    }

    std::optional<FocusCoordinator::PendingDetach> FocusCoordinator::take_pending()
    {
        std::lock_guard lock(_mutex);
        std::optional<PendingDetach> pending = std::move(_pending);
        _pending.reset();
        if (pending && _timer.valid())
        {
            // A callback already past this point finds nothing to do.
            ::SetThreadpoolTimer(_timer.get(), nullptr, 0, 0);
        }
        return pending;
    }

    std::expected<void, DWORD> FocusCoordinator::unlink(const PendingDetach& pending) noexcept
    {
        return _windows.attach_thread_input(pending.host_thread, pending.target_thread, false);
    }

    void FocusCoordinator::report_detach(const PendingDetach& pending, const std::wstring_view reason, const std::expected<void, DWORD>& result)
    {
        if (!result)
        {
            // The target thread exiting breaks the attachment on its own.
            _logger.log(
                logging::LogLevel::debug,
                L"Thread input detach ({}) for session {} failed (error={})",
                reason,
                to_value(pending.session),
                result.error());
            return;
        }

        _logger.log(
            logging::LogLevel::trace,
            L"Thread input detached ({}) for session {} (thread {} -> {})",
            reason,
            to_value(pending.session),
            pending.host_thread,
            pending.target_thread);
    }

    void FocusCoordinator::detach(const PendingDetach& pending, const std::wstring_view reason)
    {
        report_detach(pending, reason, unlink(pending));
    }

    void FocusCoordinator::schedule_detach(const PendingDetach& pending)
    {
        std::unique_lock lock(_mutex);
        if (!_timer.valid())
        {
            _timer.reset(::CreateThreadpoolTimer(&FocusCoordinator::timer_callback, this, nullptr));
        }

        if (!_timer.valid())
        {
            const DWORD error = ::GetLastError();
            lock.unlock();
            _logger.log(
                logging::LogLevel::warning,
                L"CreateThreadpoolTimer failed (error={}); detaching session {} immediately",
                error,
                to_value(pending.session));
            detach(pending, L"no timer");
            return;
        }

        _pending = pending;
        ++_scheduled;
        FILETIME due = relative_due_time(_policy.detach_delay_ms);
        ::SetThreadpoolTimer(_timer.get(), &due, 0, 0);
    }

    void FocusCoordinator::on_timer()
    {
        std::optional<PendingDetach> pending;
        std::expected<void, DWORD> detached{};
        {
            std::lock_guard lock(_mutex);
            if (!_pending)
            {
                return;
            }
            pending = std::move(_pending);
            _pending.reset();

            // Removal of the session does not matter here: `forget` normally
            // clears the pending detach first, and when it did not the
            // linkage must still be undone.
            detached = unlink(*pending);
        }
        report_detach(*pending, L"deferred", detached);
    }

    void FocusCoordinator::deactivate_previous(const SessionId next)
    {
        const std::optional<SessionId> previous_id = _registry.active();
        if (!previous_id || *previous_id == next)
        {
            return;
        }

        const std::optional<Session> previous = _registry.find(*previous_id);
        if (!previous || !_windows.is_window(previous->window))
        {
            return;
        }

        if (!_windows.send_activation(previous->window, false, _policy.activation_message_timeout_ms))
        {
            _logger.log(logging::LogLevel::debug, L"Deactivate signals for session {} were not delivered", to_value(*previous_id));
        }
    }

    std::expected<void, HubError> FocusCoordinator::activate(const SessionId id)
    {
        const std::optional<Session> session = _registry.find(id);
        if (!session)
        {
            return std::unexpected(make_error(HubErrorCode::session_not_found, L"Activate: no such session"));
        }

        const core::WindowHandle window = session->window;
        const DWORD target_thread = _windows.is_window(window) ? _windows.thread_id(window) : 0;
        if (target_thread == 0)
        {
            return std::unexpected(make_error(HubErrorCode::session_gone, L"Activate: window is gone", ERROR_INVALID_WINDOW_HANDLE));
        }
        const DWORD host_thread = _windows.current_thread_id();

        deactivate_previous(id);

        // Supersede the pending detach. When it already targets this thread
        // the attachment is kept and only the deadline moves.
        bool attached = false;
        if (std::optional<PendingDetach> superseded = take_pending())
        {
            if (superseded->host_thread == host_thread && superseded->target_thread == target_thread)
            {
                attached = true;
            }
            else
            {
                detach(*superseded, L"superseded");
            }
        }

        if (!attached && target_thread != host_thread)
        {
            auto attach = _windows.attach_thread_input(host_thread, target_thread, true);
            if (attach)
            {
                attached = true;
            }
            else
            {
                // Focus may still land through the foreground path.
                _logger.log(
                    logging::LogLevel::debug,
                    L"AttachThreadInput to thread {} failed for session {} (error={})",
                    target_thread,
                    to_value(id),
                    attach.error());
            }
        }

        const PendingDetach linkage{
            .session = id,
            .host_thread = host_thread,
            .target_thread = target_thread,
        };

        _windows.bring_to_top(window);
        if (!_windows.send_activation(window, true, _policy.activation_message_timeout_ms) && !_windows.is_window(window))
        {
            if (attached)
            {
                detach(linkage, L"target died");
            }
            return std::unexpected(make_error(HubErrorCode::session_gone, L"Activate: window died during activation", ERROR_INVALID_WINDOW_HANDLE));
        }

        core::WindowHandle focus_target = _windows.find_descendant_by_class(window, kChromeRenderWidgetClass);
        if (!focus_target)
        {
            focus_target = window;
        }
        _windows.set_focus(focus_target);

        if (!_registry.set_active(id))
        {
            // Removed while the activation messages were being delivered.
            if (attached)
            {
                detach(linkage, L"session removed");
            }
            return std::unexpected(make_error(HubErrorCode::session_gone, L"Activate: session was removed"));
        }

        if (attached)
        {
            schedule_detach(linkage);
        }

        _watchdog.force_repaint(window, RepaintTrigger::activation);

        _logger.log(
            logging::LogLevel::debug,
            L"Activated session {} (hwnd=0x{:X}, thread={}, attached={})",
            to_value(id),
            window.as_uintptr(),
            target_thread,
            attached);
        return {};
    }

    void FocusCoordinator::forget(const SessionId id)
    {
        std::optional<PendingDetach> pending;
        {
            std::lock_guard lock(_mutex);
            if (!_pending || _pending->session != id)
            {
                return;
            }
            pending = std::move(_pending);
            _pending.reset();
            if (_timer.valid())
            {
                ::SetThreadpoolTimer(_timer.get(), nullptr, 0, 0);
            }
        }
        detach(*pending, L"session removed");
    }

    void FocusCoordinator::flush_pending_detach()
    {
        if (std::optional<PendingDetach> pending = take_pending())
        {
            detach(*pending, L"flush");
        }
    }

    bool FocusCoordinator::has_pending_detach() const
    {
        std::lock_guard lock(_mutex);
        return _pending.has_value();
    }

    std::optional<SessionId> FocusCoordinator::pending_detach_session() const
    {
        std::lock_guard lock(_mutex);
        if (!_pending)
        {
            return std::nullopt;
        }
        return _pending->session;
    }

    std::uint64_t FocusCoordinator::scheduled_detach_count() const
    {
        std::lock_guard lock(_mutex);
        return _scheduled;
    }
}
