#pragma once

// Cross-process keyboard focus for the active tab.
//
// An embedded window lives on a foreign thread, so `SetFocus` from the host
// thread is refused unless both input queues are attached. Activation
// attaches the host thread to the target thread, sends WM_ACTIVATE and
// WM_NCACTIVATE (some applications only repaint their active state on the
// non-client message), focuses the target and then detaches after a delay.
//
// The detach is deferred because input method editors resolve their
// composition context through the attached queue; detaching immediately
// drops keystrokes. At most one detach is pending per hub. A new activation
// cancels the pending one and detaches the superseded thread right away,
// then schedules exactly one detach for the new target.
//
// The timer callback detaches while holding the coordinator lock, so an
// activation that races it re-attaches only after the old linkage is gone.

#include "hub/hub_error.hpp"
#include "hub/session.hpp"

#include "core/unique_handle.hpp"

#include <Windows.h>

#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string_view>

namespace wh::logging
{
    class Logger;
}

namespace wh::window
{
    class WindowSystem;
}

namespace wh::hub
{
    class RepaintWatchdog;
    class SessionRegistry;

    // Input method editors need the attached queue for roughly this long.
    inline constexpr DWORD kDefaultDetachDelayMs = 200;

    // Bound for each activation message sent to a possibly hung target.
    inline constexpr DWORD kDefaultActivationMessageTimeoutMs = 500;

    // Chromium and Electron windows take keyboard input on this child.
    inline constexpr std::wstring_view kChromeRenderWidgetClass = L"Chrome_RenderWidgetHostHWND";

    struct FocusPolicy final
    {
        DWORD detach_delay_ms{ kDefaultDetachDelayMs };
        DWORD activation_message_timeout_ms{ kDefaultActivationMessageTimeoutMs };
    };

    class FocusCoordinator final
    {
    public:
        FocusCoordinator(
            window::WindowSystem& windows,
            SessionRegistry& registry,
            RepaintWatchdog& watchdog,
            logging::Logger& logger,
            FocusPolicy policy) noexcept;

        // Detaches whatever is still attached.
        ~FocusCoordinator() noexcept;

        FocusCoordinator(const FocusCoordinator&) = delete;
        FocusCoordinator& operator=(const FocusCoordinator&) = delete;

        [[nodiscard]] std::expected<void, HubError> activate(SessionId id);

        // Called by the removal path before a session's window is restored.
        // Detaches immediately if the pending detach belongs to `id`.
        void forget(SessionId id);

        // Runs the pending detach now, if any.
        void flush_pending_detach();

        [[nodiscard]] bool has_pending_detach() const;
        [[nodiscard]] std::optional<SessionId> pending_detach_session() const;

        // Number of detaches scheduled so far.
        [[nodiscard]] std::uint64_t scheduled_detach_count() const;

        [[nodiscard]] const FocusPolicy& policy() const noexcept
        {
            return _policy;
        }

    private:
        struct PendingDetach final
        {
            SessionId session{ SessionId::none };
            DWORD host_thread{ 0 };
            DWORD target_thread{ 0 };
        };

        static void CALLBACK timer_callback(PTP_CALLBACK_INSTANCE instance, void* context, PTP_TIMER timer) noexcept;

        [[nodiscard]] std::optional<PendingDetach> take_pending();
        [[nodiscard]] std::expected<void, DWORD> unlink(const PendingDetach& pending) noexcept;
        void report_detach(const PendingDetach& pending, std::wstring_view reason, const std::expected<void, DWORD>& result);
        void detach(const PendingDetach& pending, std::wstring_view reason);
        void schedule_detach(const PendingDetach& pending);
        void on_timer();
        void deactivate_previous(SessionId next);

        window::WindowSystem& _windows;
        SessionRegistry& _registry;
        RepaintWatchdog& _watchdog;
        logging::Logger& _logger;
        FocusPolicy _policy;

        mutable std::mutex _mutex;
        std::optional<PendingDetach> _pending;
        std::uint64_t _scheduled{ 0 };

        // Declared last: closing it drains in-flight callbacks before the
        // members above go away.
        core::UniqueThreadpoolTimer _timer;
    };
}
