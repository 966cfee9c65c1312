#include "hub/launch_capture.hpp"

#include "core/win32_handle.hpp"
#include "hub/embedding_controller.hpp"
#include "hub/session_registry.hpp"
#include "launch/shortcut_resolver.hpp"
#include "logging/logger.hpp"
#include "window/window_directory.hpp"

#include <format>

namespace wh::hub
{
    LaunchCapture::LaunchCapture(
        core::ProcessStarter& starter,
        const window::WindowDirectory& directory,
        SessionRegistry& registry,
        EmbeddingController& controller,
        logging::Logger& logger,
        const LaunchPolicy policy) noexcept :
        _starter(starter),
        _directory(directory),
        _registry(registry),
        _controller(controller),
        _logger(logger),
        _policy(policy)
    {
    }

    std::expected<core::LaunchRequest, HubError> LaunchCapture::prepare(const std::wstring& path) const
    {
        if (path.empty())
        {
            return std::unexpected(make_error(HubErrorCode::launch_failed, L"Launch: empty path", ERROR_INVALID_PARAMETER));
        }

        if (!launch::is_shortcut_path(path))
        {
            return core::LaunchRequest{ .application = path };
        }

        auto resolved = launch::resolve_shortcut(path);
        if (!resolved)
        {
            return std::unexpected(make_error(
                HubErrorCode::launch_failed,
                std::format(L"Launch: {} (hr=0x{:08X})", resolved.error().context, static_cast<unsigned long>(resolved.error().result)),
                static_cast<DWORD>(HRESULT_CODE(resolved.error().result))));
        }

        _logger.log(logging::LogLevel::debug, L"Resolved shortcut {} -> {}", path, resolved->target);
        return core::LaunchRequest{
            .application = std::move(resolved->target),
            .arguments = std::move(resolved->arguments),
            .working_directory = std::move(resolved->working_directory),
        };
    }

    std::unordered_set<core::WindowHandle> LaunchCapture::snapshot_candidates() const
    {
        std::unordered_set<core::WindowHandle> handles;
        for (const window::WindowCandidate& candidate : _directory.list_candidates())
        {
            handles.insert(candidate.handle);
        }
        return handles;
    }

    std::optional<core::WindowHandle> LaunchCapture::poll_once(
        const core::LaunchedProcess& process,
        const std::unordered_set<core::WindowHandle>& before) const
    {
        const auto usable = [this](const window::WindowCandidate& candidate) {
            return !candidate.is_minimized && !_registry.is_claimed(candidate.handle);
        };

        for (const window::WindowCandidate& candidate : _directory.list_candidates_for_process(process.process_id))
        {
            if (usable(candidate))
            {
                return candidate.handle;
            }
        }

        // Launcher stubs exit after starting the real application.
        if (core::process_has_exited(process.process.get()))
        {
            for (const window::WindowCandidate& candidate : _directory.list_candidates())
            {
                if (!before.contains(candidate.handle) && usable(candidate))
                {
                    return candidate.handle;
                }
            }
        }
        return std::nullopt;
    }

    std::expected<SessionInfo, HubError> LaunchCapture::launch_and_embed(const std::wstring& path)
    {
        auto request = prepare(path);
        if (!request)
        {
            _logger.log(logging::LogLevel::error, L"{}", request.error().context);
            return std::unexpected(std::move(request.error()));
        }

        const std::unordered_set<core::WindowHandle> before = snapshot_candidates();

        auto process = _starter.start(*request);
        if (!process)
        {
            _logger.log(logging::LogLevel::error, L"Launch failed for {}: {} (error={})", path, process.error().context, process.error().win32_error);
            return std::unexpected(make_error(
                HubErrorCode::launch_failed,
                std::format(L"Launch: {}", process.error().context),
                process.error().win32_error));
        }

        _logger.log(logging::LogLevel::info, L"Launched {} (pid={}); waiting for its window", request->application, process->process_id);

        const ULONGLONG started = ::GetTickCount64();
        std::optional<core::WindowHandle> previous;
        for (;;)
        {
            const ULONGLONG elapsed = ::GetTickCount64() - started;
            if (elapsed >= _policy.timeout_ms)
            {
                break;
            }

            const DWORD remaining = static_cast<DWORD>(_policy.timeout_ms - elapsed);
            ::Sleep(remaining < _policy.poll_interval_ms ? remaining : _policy.poll_interval_ms);

            const std::optional<core::WindowHandle> current = poll_once(*process, before);
            if (current && previous && *current == *previous)
            {
                _logger.log(
                    logging::LogLevel::debug,
                    L"Window hwnd=0x{:X} of pid={} stable after {}ms",
                    current->as_uintptr(),
                    process->process_id,
                    ::GetTickCount64() - started);
                return _controller.embed(*current);
            }
            previous = current;
        }

        _logger.log(
            logging::LogLevel::warning,
            L"No window from pid={} within {}ms; process left running",
            process->process_id,
            _policy.timeout_ms);
        return std::unexpected(make_error(
            HubErrorCode::timeout,
            std::format(L"Launch: no window appeared within {}ms", _policy.timeout_ms),
            ERROR_TIMEOUT));
    }
}
