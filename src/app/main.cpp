#include "app/application.hpp"

#include "core/console_writer.hpp"
#include "core/exception.hpp"

#include <Windows.h>

#include <exception>
#include <new>

namespace
{
    // Fatal errors go to the launching console when there is one and to a
    // message box otherwise, since the host is usually started from a shortcut.
    void report_fatal(const wchar_t* const text) noexcept
    {
        try
        {
            wh::core::write_console_line(text);
        }
        catch (const std::bad_alloc&)
        {
            ::OutputDebugStringW(text);
        }
        (void)::MessageBoxW(nullptr, text, L"WindowHub", MB_OK | MB_ICONERROR);
    }
}

int WINAPI wWinMain(HINSTANCE /*instance*/, HINSTANCE /*prev_instance*/, PWSTR /*command_line*/, int /*show_command*/)
{
    try
    {
        wh::app::Application application;
        return application.run();
    }
    catch (const wh::core::AppException& error)
    {
        report_fatal(error.message().c_str());
        return static_cast<int>(error.exit_code());
    }
    catch (const std::bad_alloc&)
    {
        report_fatal(L"Out of memory");
        return static_cast<int>(ERROR_OUTOFMEMORY);
    }
    catch (const std::exception&)
    {
        report_fatal(L"Unhandled exception");
        return static_cast<int>(ERROR_UNHANDLED_EXCEPTION);
    }
}
