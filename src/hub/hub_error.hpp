#pragma once

#include <Windows.h>

#include <string>
#include <string_view>

namespace wh::hub
{
    enum class HubErrorCode
    {
        // The handle does not (or no longer) name a window.
        invalid_handle,
        // The window exists but cannot be hosted: minimized, owned by the hub
        // itself, or of a shell/system class. Same family as `invalid_handle`.
        not_embeddable,
        already_embedded,
        session_not_found,
        // The session's window died in the middle of the operation.
        session_gone,
        // Cross-integrity-level window; the OS refused the reparent.
        permission_denied,
        launch_failed,
        timeout,
    };

    struct HubError final
    {
        HubErrorCode code{ HubErrorCode::invalid_handle };
        std::wstring context;
        DWORD win32_error{ ERROR_SUCCESS };
    };

    [[nodiscard]] constexpr std::wstring_view to_string(const HubErrorCode code) noexcept
    {
        switch (code)
        {
        case HubErrorCode::invalid_handle:
            return L"InvalidHandle";
        case HubErrorCode::not_embeddable:
            return L"NotEmbeddable";
        case HubErrorCode::already_embedded:
            return L"AlreadyEmbedded";
        case HubErrorCode::session_not_found:
            return L"SessionNotFound";
        case HubErrorCode::session_gone:
            return L"SessionGone";
        case HubErrorCode::permission_denied:
            return L"PermissionDenied";
        case HubErrorCode::launch_failed:
            return L"LaunchFailed";
        case HubErrorCode::timeout:
            return L"Timeout";
        }
        return L"Unknown";
    }

    [[nodiscard]] constexpr bool is_handle_failure(const HubErrorCode code) noexcept
    {
        return code == HubErrorCode::invalid_handle ||
               code == HubErrorCode::not_embeddable ||
               code == HubErrorCode::session_gone;
    }

    // Failures the UI layer shows to the user. Everything else is recovered
    // locally (stale handles fall through to cleanup).
    [[nodiscard]] constexpr bool is_user_visible(const HubErrorCode code) noexcept
    {
        return code == HubErrorCode::permission_denied ||
               code == HubErrorCode::launch_failed ||
               code == HubErrorCode::timeout ||
               code == HubErrorCode::not_embeddable;
    }

    [[nodiscard]] inline HubError make_error(const HubErrorCode code, std::wstring context, const DWORD win32_error = ERROR_SUCCESS)
    {
        return HubError{
            .code = code,
            .context = std::move(context),
            .win32_error = win32_error,
        };
    }
}
