#include "hub/session_registry.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace
{
    using wh::core::WindowHandle;
    using wh::hub::Session;
    using wh::hub::SessionId;
    using wh::hub::SessionRegistry;

    [[nodiscard]] WindowHandle handle(const std::uintptr_t value) noexcept
    {
        return WindowHandle::from_uintptr(value);
    }

    [[nodiscard]] SessionId add(SessionRegistry& registry, const WindowHandle window, std::wstring title = L"tab")
    {
        auto id = registry.reserve(window);
        if (!id)
        {
            return SessionId::none;
        }

        Session session{};
        session.id = *id;
        session.window = window;
        session.title = std::move(title);
        session.state = wh::hub::EmbeddingState::embedded;
        registry.commit(std::move(session));
        registry.release_reservation(window);
        return *id;
    }

    bool test_ids_are_unique_and_ordered()
    {
        SessionRegistry registry;
        const SessionId first = add(registry, handle(0x100));
        const SessionId second = add(registry, handle(0x200));

        const auto sessions = registry.sessions();
        return first != SessionId::none &&
               second != SessionId::none &&
               wh::hub::to_value(second) > wh::hub::to_value(first) &&
               sessions.size() == 2 &&
               sessions[0].id == first &&
               sessions[1].id == second &&
               registry.find_by_window(handle(0x200)).has_value() &&
               registry.find_by_window(handle(0x200))->id == second;
    }

    bool test_duplicate_window_is_rejected()
    {
        SessionRegistry registry;
        const SessionId first = add(registry, handle(0x100));
        if (first == SessionId::none)
        {
            return false;
        }

        const auto again = registry.reserve(handle(0x100));
        return !again.has_value() &&
               again.error().code == wh::hub::HubErrorCode::already_embedded &&
               registry.size() == 1;
    }

    bool test_reservation_blocks_until_released()
    {
        SessionRegistry registry;
        const auto reserved = registry.reserve(handle(0x300));
        if (!reserved || !registry.is_claimed(handle(0x300)))
        {
            return false;
        }
        if (registry.reserve(handle(0x300)).has_value())
        {
            return false;
        }

        registry.release_reservation(handle(0x300));
        const auto retried = registry.reserve(handle(0x300));

        // A failed embed never hands its id back.
        return retried.has_value() && *retried != *reserved;
    }

    bool test_take_is_exactly_once()
    {
        SessionRegistry registry;
        const SessionId id = add(registry, handle(0x100));
        if (!registry.set_active(id))
        {
            return false;
        }

        auto taken = registry.take(id);
        if (!taken || taken->window != handle(0x100))
        {
            return false;
        }

        // Still claimed while the window is being restored.
        if (!registry.is_claimed(handle(0x100)) || registry.take(id).has_value())
        {
            return false;
        }

        registry.release_reservation(handle(0x100));
        return !registry.is_claimed(handle(0x100)) &&
               !registry.active().has_value() &&
               registry.size() == 0;
    }

    bool test_concurrent_take_has_one_winner()
    {
        for (int round = 0; round < 50; ++round)
        {
            SessionRegistry registry;
            const SessionId id = add(registry, handle(0x100));

            int winners = 0;
            std::mutex winners_mutex;
            std::vector<std::thread> racers;
            for (int index = 0; index < 4; ++index)
            {
                racers.emplace_back([&] {
                    if (registry.take(id))
                    {
                        std::lock_guard lock(winners_mutex);
                        ++winners;
                    }
                });
            }
            for (auto& racer : racers)
            {
                racer.join();
            }

            if (winners != 1)
            {
                return false;
            }
        }
        return true;
    }

    bool test_move_and_index()
    {
        SessionRegistry registry;
        const SessionId a = add(registry, handle(0x100));
        const SessionId b = add(registry, handle(0x200));
        const SessionId c = add(registry, handle(0x300));

        if (!registry.move(a, 2) || registry.at(2) != a || registry.at(0) != b)
        {
            return false;
        }

        // Clamped to the last slot.
        if (!registry.move(b, 99) || registry.at(2) != b || registry.index_of(c) != 0u)
        {
            return false;
        }

        if (!registry.move(b, 0) || registry.at(0) != b)
        {
            return false;
        }

        return !registry.move(static_cast<SessionId>(999), 0) &&
               !registry.at(3).has_value() &&
               !registry.index_of(static_cast<SessionId>(999)).has_value();
    }

    bool test_single_active_session()
    {
        SessionRegistry registry;
        const SessionId a = add(registry, handle(0x100));
        const SessionId b = add(registry, handle(0x200));

        if (!registry.set_active(a) || !registry.set_active(b) || registry.active() != b)
        {
            return false;
        }
        if (registry.set_active(static_cast<SessionId>(999)) || registry.active() != b)
        {
            return false;
        }

        registry.clear_active();
        return !registry.active().has_value();
    }

    bool test_update_title_reports_change()
    {
        SessionRegistry registry;
        const SessionId id = add(registry, handle(0x100), L"Untitled - Notepad");

        return !registry.update_title(id, L"Untitled - Notepad") &&
               registry.update_title(id, L"notes.txt - Notepad") &&
               registry.find(id).has_value() &&
               registry.find(id)->title == L"notes.txt - Notepad" &&
               !registry.update_title(static_cast<SessionId>(999), L"x");
    }
}

bool run_session_registry_tests()
{
    return test_ids_are_unique_and_ordered() &&
           test_duplicate_window_is_rejected() &&
           test_reservation_blocks_until_released() &&
           test_take_is_exactly_once() &&
           test_concurrent_take_has_one_winner() &&
           test_move_and_index() &&
           test_single_active_session() &&
           test_update_title_reports_change();
}
