#pragma once

// Notifications from the hub to the UI layer (tab strip).
//
// Callbacks arrive on the owner thread while a hub request is still running.
// Implementations must not re-enter the hub from a callback; post to the UI
// thread instead.

#include "hub/session.hpp"

namespace wh::hub
{
    enum class CloseReason
    {
        // `release`/`close` requested by the user or a hotkey.
        released,
        // The window was destroyed or detached without the hub's involvement.
        invalidated,
    };

    class SessionEventSink
    {
    public:
        virtual ~SessionEventSink() = default;

        virtual void session_created(const SessionInfo& session) noexcept = 0;
        virtual void session_closed(const SessionInfo& session, CloseReason reason) noexcept = 0;
        virtual void session_activated(const SessionInfo& session) noexcept = 0;

        // Title (or icon) changed behind the hub's back.
        virtual void session_updated(const SessionInfo& session) noexcept = 0;
    };
}
