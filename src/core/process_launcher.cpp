#include "core/process_launcher.hpp"

#include "core/assert.hpp"

#include <vector>

// `CreateProcessW` requires a mutable command line buffer when `lpCommandLine`
// is non-null, so the command line is materialized into a writable
// NUL-terminated buffer first.

namespace wh::core
{
    std::wstring ProcessLauncher::build_command_line(const std::wstring_view application, const std::wstring_view arguments)
    {
        std::wstring command_line;
        const bool needs_quotes =
            !application.empty() &&
            application.front() != L'"' &&
            application.find_first_of(L" \t") != std::wstring_view::npos;

        if (needs_quotes)
        {
            command_line.push_back(L'"');
            command_line.append(application);
            command_line.push_back(L'"');
        }
        else
        {
            command_line.append(application);
        }

        if (!arguments.empty())
        {
            command_line.push_back(L' ');
            command_line.append(arguments);
        }

        return command_line;
    }

    std::expected<LaunchedProcess, ProcessLaunchError> ProcessLauncher::start(const LaunchRequest& request) noexcept
    {
        if (request.application.empty())
        {
            return std::unexpected(ProcessLaunchError{
                .win32_error = ERROR_INVALID_PARAMETER,
                .context = L"Empty application path",
            });
        }

        std::vector<wchar_t> mutable_command_line;
        try
        {
            const std::wstring command_line = build_command_line(request.application, request.arguments);
            mutable_command_line.reserve(command_line.size() + 1);
            mutable_command_line.insert(mutable_command_line.end(), command_line.begin(), command_line.end());
            mutable_command_line.push_back(L'\0');
        }
        catch (...)
        {
            return std::unexpected(ProcessLaunchError{
                .win32_error = ERROR_OUTOFMEMORY,
                .context = L"Failed to build command line",
            });
        }

        STARTUPINFOW startup_info{};
        startup_info.cb = sizeof(startup_info);

        PROCESS_INFORMATION process_info{};
        const BOOL create_result = ::CreateProcessW(
            nullptr,
            mutable_command_line.data(),
            nullptr,
            nullptr,
            FALSE,
            0,
            nullptr,
            request.working_directory.empty() ? nullptr : request.working_directory.c_str(),
            &startup_info,
            &process_info);
        if (create_result == FALSE)
        {
            return std::unexpected(ProcessLaunchError{
                .win32_error = ::GetLastError(),
                .context = L"CreateProcessW failed",
            });
        }

        UniqueHandle thread_handle(process_info.hThread);
        LaunchedProcess launched{};
        launched.process.reset(process_info.hProcess);
        launched.process_id = process_info.dwProcessId;
        WH_ASSERT(launched.process.valid());
        return launched;
    }
}
