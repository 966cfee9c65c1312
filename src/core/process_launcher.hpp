#pragma once

// Process start helper used by Launch-and-Capture.
//
// The hub only needs "start a process and keep a handle to observe it":
// - `CreateProcessW` without handle inheritance (the targets are GUI apps),
// - the primary thread handle is closed immediately,
// - the process handle is returned so callers can detect launcher stubs that
//   exit before their real window appears.
//
// `ProcessStarter` is the seam tests replace; `ProcessLauncher` is the
// production implementation.

#include "core/unique_handle.hpp"

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>

namespace wh::core
{
    struct ProcessLaunchError final
    {
        DWORD win32_error{ ERROR_SUCCESS };
        std::wstring context;
    };

    struct LaunchRequest final
    {
        std::wstring application;
        std::wstring arguments;
        std::wstring working_directory;
    };

    struct LaunchedProcess final
    {
        UniqueHandle process;
        DWORD process_id{ 0 };
    };

    class ProcessStarter
    {
    public:
        virtual ~ProcessStarter() = default;

        [[nodiscard]] virtual std::expected<LaunchedProcess, ProcessLaunchError> start(const LaunchRequest& request) noexcept = 0;
    };

    class ProcessLauncher final : public ProcessStarter
    {
    public:
        [[nodiscard]] std::expected<LaunchedProcess, ProcessLaunchError> start(const LaunchRequest& request) noexcept override;

        // Quotes `application` when needed and appends `arguments` verbatim.
        [[nodiscard]] static std::wstring build_command_line(std::wstring_view application, std::wstring_view arguments);
    };
}
