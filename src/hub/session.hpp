#pragma once

#include "core/window_handle.hpp"
#include "window/window_system.hpp"

#include <Windows.h>

#include <cstdint>
#include <string>

namespace wh::hub
{
    // Host-generated tab identity. Never reused within one hub instance.
    enum class SessionId : std::uint64_t
    {
        none = 0,
    };

    [[nodiscard]] constexpr std::uint64_t to_value(const SessionId id) noexcept
    {
        return static_cast<std::uint64_t>(id);
    }

    //   free -> embedding -> embedded -> releasing -> released
    //               |                       |
    //               +-----> invalidated <---+
    enum class EmbeddingState
    {
        free,
        embedding,
        embedded,
        releasing,
        released,
        invalidated,
    };

    [[nodiscard]] constexpr std::wstring_view to_string(const EmbeddingState state) noexcept
    {
        switch (state)
        {
        case EmbeddingState::free:
            return L"free";
        case EmbeddingState::embedding:
            return L"embedding";
        case EmbeddingState::embedded:
            return L"embedded";
        case EmbeddingState::releasing:
            return L"releasing";
        case EmbeddingState::released:
            return L"released";
        case EmbeddingState::invalidated:
            return L"invalidated";
        }
        return L"unknown";
    }

    // Everything needed to undo an embed exactly.
    struct StyleSnapshot final
    {
        window::WindowStyles styles{};
        core::WindowHandle parent{};
        window::PaneRect bounds{};
        bool has_bounds{ false };
    };

    struct Session final
    {
        SessionId id{ SessionId::none };
        core::WindowHandle window{};
        DWORD process_id{ 0 };
        std::wstring title;
        window::IconReference icon{ 0 };
        EmbeddingState state{ EmbeddingState::free };
        StyleSnapshot snapshot{};
        FILETIME created_at{};
    };

    // The public subset carried by UI events.
    struct SessionInfo final
    {
        SessionId id{ SessionId::none };
        std::wstring title;
        window::IconReference icon{ 0 };
        DWORD process_id{ 0 };
    };

    [[nodiscard]] inline SessionInfo describe(const Session& session)
    {
        return SessionInfo{
            .id = session.id,
            .title = session.title,
            .icon = session.icon,
            .process_id = session.process_id,
        };
    }
}
