#pragma once

// Ordered collection of embedded sessions (the tabs).
//
// Invariants:
// - at most one session per window handle, counting in-flight embeds and
//   removals that are still restoring the window;
// - at most one active session;
// - order is tab order and only changes through `commit` (append), `take`
//   and `move`.
//
// The registry owns no OS resources. The owner thread mutates it; the
// External-Change Monitor thread and concurrent embed attempts read and
// reserve through the same lock.

#include "hub/hub_error.hpp"
#include "hub/session.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace wh::hub
{
    class SessionRegistry final
    {
    public:
        SessionRegistry() = default;

        SessionRegistry(const SessionRegistry&) = delete;
        SessionRegistry& operator=(const SessionRegistry&) = delete;

        // Claims `window` for an embed and hands out the future session id.
        // Fails with `already_embedded` if the window is tracked or another
        // embed/removal holds it.
        [[nodiscard]] std::expected<SessionId, HubError> reserve(core::WindowHandle window);

        // Ends a claim taken by `reserve` or left behind by `take`.
        void release_reservation(core::WindowHandle window);

        // Appends a reserved session at the end of the tab order.
        void commit(Session session);

        // Removes the session. Exactly one caller gets the value for a given
        // id; the window stays claimed until `release_reservation`.
        [[nodiscard]] std::optional<Session> take(SessionId id);

        [[nodiscard]] std::optional<Session> find(SessionId id) const;
        [[nodiscard]] std::optional<Session> find_by_window(core::WindowHandle window) const;
        [[nodiscard]] bool is_claimed(core::WindowHandle window) const;

        [[nodiscard]] std::vector<Session> sessions() const;
        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] std::optional<std::size_t> index_of(SessionId id) const;
        [[nodiscard]] std::optional<SessionId> at(std::size_t index) const;

        // Reorders a tab; `new_index` is clamped to the last position.
        bool move(SessionId id, std::size_t new_index);

        bool set_active(SessionId id);
        void clear_active();
        [[nodiscard]] std::optional<SessionId> active() const;

        // True when the stored title actually changed.
        bool update_title(SessionId id, std::wstring title);

    private:
        [[nodiscard]] std::vector<Session>::iterator locate(SessionId id);
        [[nodiscard]] std::vector<Session>::const_iterator locate(SessionId id) const;

        mutable std::mutex _mutex;
        std::vector<Session> _sessions;
        std::unordered_set<core::WindowHandle> _claimed;
        SessionId _active{ SessionId::none };
        std::uint64_t _next_id{ 1 };
    };
}
