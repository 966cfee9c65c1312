#include "hub/session_registry.hpp"

#include "core/assert.hpp"

#include <algorithm>

namespace wh::hub
{
    std::vector<Session>::iterator SessionRegistry::locate(const SessionId id)
    {
        return std::find_if(_sessions.begin(), _sessions.end(), [id](const Session& session) {
            return session.id == id;
        });
    }

    std::vector<Session>::const_iterator SessionRegistry::locate(const SessionId id) const
    {
        return std::find_if(_sessions.cbegin(), _sessions.cend(), [id](const Session& session) {
            return session.id == id;
        });
    }

    std::expected<SessionId, HubError> SessionRegistry::reserve(const core::WindowHandle window)
    {
        std::lock_guard lock(_mutex);
        if (!_claimed.insert(window).second)
        {
            return std::unexpected(make_error(HubErrorCode::already_embedded, L"Window is already embedded or being embedded"));
        }
        return static_cast<SessionId>(_next_id++);
    }

    void SessionRegistry::release_reservation(const core::WindowHandle window)
    {
        std::lock_guard lock(_mutex);
        const bool tracked = std::any_of(_sessions.cbegin(), _sessions.cend(), [window](const Session& session) {
            return session.window == window;
        });
        if (!tracked)
        {
            _claimed.erase(window);
        }
    }

    void SessionRegistry::commit(Session session)
    {
        std::lock_guard lock(_mutex);
        WH_ASSERT(session.id != SessionId::none);
        WH_ASSERT(_claimed.contains(session.window));
        _sessions.push_back(std::move(session));
    }

    std::optional<Session> SessionRegistry::take(const SessionId id)
    {
        std::lock_guard lock(_mutex);
        const auto it = locate(id);
        if (it == _sessions.end())
        {
            return std::nullopt;
        }

        Session removed = std::move(*it);
        _sessions.erase(it);
        if (_active == id)
        {
            _active = SessionId::none;
        }
        return removed;
    }

    std::optional<Session> SessionRegistry::find(const SessionId id) const
    {
        std::lock_guard lock(_mutex);
        const auto it = locate(id);
        if (it == _sessions.cend())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<Session> SessionRegistry::find_by_window(const core::WindowHandle window) const
    {
        std::lock_guard lock(_mutex);
        const auto it = std::find_if(_sessions.cbegin(), _sessions.cend(), [window](const Session& session) {
            return session.window == window;
        });
        if (it == _sessions.cend())
        {
            return std::nullopt;
        }
        return *it;
    }

    bool SessionRegistry::is_claimed(const core::WindowHandle window) const
    {
        std::lock_guard lock(_mutex);
        return _claimed.contains(window);
    }

    std::vector<Session> SessionRegistry::sessions() const
    {
        std::lock_guard lock(_mutex);
        return _sessions;
    }

    std::size_t SessionRegistry::size() const
    {
        std::lock_guard lock(_mutex);
        return _sessions.size();
    }

    std::optional<std::size_t> SessionRegistry::index_of(const SessionId id) const
    {
        std::lock_guard lock(_mutex);
        const auto it = locate(id);
        if (it == _sessions.cend())
        {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - _sessions.cbegin());
    }

    std::optional<SessionId> SessionRegistry::at(const std::size_t index) const
    {
        std::lock_guard lock(_mutex);
        if (index >= _sessions.size())
        {
            return std::nullopt;
        }
        return _sessions[index].id;
    }

    bool SessionRegistry::move(const SessionId id, std::size_t new_index)
    {
        std::lock_guard lock(_mutex);
        const auto it = locate(id);
        if (it == _sessions.end())
        {
            return false;
        }

        const std::size_t old_index = static_cast<std::size_t>(it - _sessions.begin());
        new_index = std::min(new_index, _sessions.size() - 1);
        if (old_index < new_index)
        {
            std::rotate(it, it + 1, _sessions.begin() + static_cast<std::ptrdiff_t>(new_index) + 1);
        }
        else if (old_index > new_index)
        {
            std::rotate(_sessions.begin() + static_cast<std::ptrdiff_t>(new_index), it, it + 1);
        }
        return true;
    }

    bool SessionRegistry::set_active(const SessionId id)
    {
        std::lock_guard lock(_mutex);
        if (locate(id) == _sessions.cend())
        {
            return false;
        }
        _active = id;
        return true;
    }

    void SessionRegistry::clear_active()
    {
        std::lock_guard lock(_mutex);
        _active = SessionId::none;
    }

    std::optional<SessionId> SessionRegistry::active() const
    {
        std::lock_guard lock(_mutex);
        if (_active == SessionId::none)
        {
            return std::nullopt;
        }
        return _active;
    }

    bool SessionRegistry::update_title(const SessionId id, std::wstring title)
    {
        std::lock_guard lock(_mutex);
        const auto it = locate(id);
        if (it == _sessions.end() || it->title == title)
        {
            return false;
        }
        it->title = std::move(title);
        return true;
    }
}
