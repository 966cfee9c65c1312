#pragma once

// Start a process and embed its main window once it is ready.
//
// The poll accepts a window only when the same handle is observed on two
// consecutive polls, which filters out splash screens that appear and vanish
// between polls. Launcher stubs (the started process exits and hands off to
// another one) fall back to "any new candidate that did not exist before the
// launch". On timeout the process handle is closed and the process is left
// running; the user may still embed its window by hand later.

#include "hub/hub_error.hpp"
#include "hub/session.hpp"

#include "core/process_launcher.hpp"
#include "core/window_handle.hpp"

#include <Windows.h>

#include <expected>
#include <optional>
#include <string>
#include <unordered_set>

namespace wh::logging
{
    class Logger;
}

namespace wh::window
{
    class WindowDirectory;
}

namespace wh::hub
{
    class EmbeddingController;
    class SessionRegistry;

    inline constexpr DWORD kDefaultLaunchTimeoutMs = 10'000;
    inline constexpr DWORD kDefaultLaunchPollIntervalMs = 100;

    struct LaunchPolicy final
    {
        DWORD timeout_ms{ kDefaultLaunchTimeoutMs };
        DWORD poll_interval_ms{ kDefaultLaunchPollIntervalMs };
    };

    class LaunchCapture final
    {
    public:
        LaunchCapture(
            core::ProcessStarter& starter,
            const window::WindowDirectory& directory,
            SessionRegistry& registry,
            EmbeddingController& controller,
            logging::Logger& logger,
            LaunchPolicy policy) noexcept;

        LaunchCapture(const LaunchCapture&) = delete;
        LaunchCapture& operator=(const LaunchCapture&) = delete;

        // Blocks the calling thread for at most `timeout_ms` plus one poll.
        [[nodiscard]] std::expected<SessionInfo, HubError> launch_and_embed(const std::wstring& path);

        [[nodiscard]] const LaunchPolicy& policy() const noexcept
        {
            return _policy;
        }

    private:
        [[nodiscard]] std::expected<core::LaunchRequest, HubError> prepare(const std::wstring& path) const;
        [[nodiscard]] std::unordered_set<core::WindowHandle> snapshot_candidates() const;
        [[nodiscard]] std::optional<core::WindowHandle> poll_once(
            const core::LaunchedProcess& process,
            const std::unordered_set<core::WindowHandle>& before) const;

        core::ProcessStarter& _starter;
        const window::WindowDirectory& _directory;
        SessionRegistry& _registry;
        EmbeddingController& _controller;
        logging::Logger& _logger;
        LaunchPolicy _policy;
    };
}
