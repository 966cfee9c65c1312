#pragma once

#include "core/unique_handle.hpp"
#include "core/utf8.hpp"

#include <string_view>

namespace wh::core
{
    // `windowhub.exe` is a GUI-subsystem binary. Borrow the launching
    // console, if any, so `--list`/`--apps` and fatal errors stay visible.
    inline void attach_parent_console() noexcept
    {
        static const bool attached = ::AttachConsole(ATTACH_PARENT_PROCESS) != FALSE;
        (void)attached;
    }

    // Console output is written as UTF-16; redirected output (a pipe or a
    // file) as UTF-8 so `windowhub --list > windows.txt` stays readable.
    inline void write_console_line(const std::wstring_view message)
    {
        attach_parent_console();

        HANDLE stream = ::GetStdHandle(STD_OUTPUT_HANDLE);
        UniqueHandle console_output;
        if (!KernelHandleTraits::valid(stream))
        {
            console_output.reset(::CreateFileW(L"CONOUT$", GENERIC_WRITE, FILE_SHARE_WRITE, nullptr, OPEN_EXISTING, 0, nullptr));
            stream = console_output.get();
        }
        if (!KernelHandleTraits::valid(stream))
        {
            return;
        }

        DWORD written = 0;
        DWORD mode = 0;
        if (::GetConsoleMode(stream, &mode) != FALSE)
        {
            (void)::WriteConsoleW(stream, message.data(), static_cast<DWORD>(message.size()), &written, nullptr);
            (void)::WriteConsoleW(stream, L"\r\n", 2, &written, nullptr);
            return;
        }

        const auto utf8 = to_utf8(message);
        if (!utf8)
        {
            return;
        }
        (void)::WriteFile(stream, utf8->data(), static_cast<DWORD>(utf8->size()), &written, nullptr);
        (void)::WriteFile(stream, "\r\n", 2, &written, nullptr);
    }
}
