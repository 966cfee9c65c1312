#pragma once

#include "core/unique_handle.hpp"

#include <Windows.h>

#include <format>
#include <string>
#include <string_view>

namespace wh::core
{
    // Win32 error code as a distinct type, so `std::expected<T, Win32Error>`
    // is not confused with a count or an id.
    enum class Win32Error : DWORD
    {
        success = ERROR_SUCCESS,
    };

    [[nodiscard]] constexpr DWORD to_dword(const Win32Error error) noexcept
    {
        return static_cast<DWORD>(error);
    }

    [[nodiscard]] constexpr Win32Error from_dword(const DWORD error) noexcept
    {
        return static_cast<Win32Error>(error);
    }

    // "Access is denied. (error=5)"; the bare number when the system has no
    // text for the code.
    [[nodiscard]] inline std::wstring describe_win32_error(const DWORD error)
    {
        UniqueLocalPtr buffer;
        const DWORD length = ::FormatMessageW(
            FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
            nullptr,
            error,
            0,
            reinterpret_cast<LPWSTR>(buffer.put()),
            0,
            nullptr);
        if (length == 0 || !buffer.valid())
        {
            return std::format(L"error={}", error);
        }

        std::wstring_view text(buffer.as<wchar_t>(), length);
        while (!text.empty() && (text.back() == L'\r' || text.back() == L'\n' || text.back() == L' '))
        {
            text.remove_suffix(1);
        }
        return std::format(L"{} (error={})", text, error);
    }

    // Fatal startup failure. Thrown by `Application` only; `wWinMain` reports
    // the message and exits with `exit_code`. Engine code never throws it.
    class AppException final
    {
    public:
        AppException(std::wstring message, const DWORD exit_code) :
            _message(std::move(message)),
            _exit_code(exit_code == ERROR_SUCCESS ? static_cast<DWORD>(ERROR_GEN_FAILURE) : exit_code)
        {
        }

        [[nodiscard]] const std::wstring& message() const noexcept
        {
            return _message;
        }

        [[nodiscard]] DWORD exit_code() const noexcept
        {
            return _exit_code;
        }

    private:
        std::wstring _message;
        DWORD _exit_code{ ERROR_GEN_FAILURE };
    };
}
