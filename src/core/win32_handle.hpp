#pragma once

// Event and process helpers. Creation returns owners; queries borrow a raw
// HANDLE the caller keeps alive.

#include "core/unique_handle.hpp"

#include <Windows.h>

#include <expected>
#include <new>
#include <string>

namespace wh::core
{
    [[nodiscard]] inline std::expected<UniqueHandle, DWORD> create_event(
        const bool manual_reset,
        const bool initial_state,
        const wchar_t* const name = nullptr) noexcept
    {
        UniqueHandle event(::CreateEventW(nullptr, manual_reset ? TRUE : FALSE, initial_state ? TRUE : FALSE, name));
        if (!event.valid())
        {
            return std::unexpected(::GetLastError());
        }
        return std::move(event);
    }

    [[nodiscard]] inline std::expected<UniqueHandle, DWORD> open_process_for_query(const DWORD process_id) noexcept
    {
        UniqueHandle process(::OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, process_id));
        if (!process.valid())
        {
            return std::unexpected(::GetLastError());
        }
        return std::move(process);
    }

    [[nodiscard]] inline std::expected<std::wstring, DWORD> query_process_image_path(const HANDLE process) noexcept
    {
        if (!KernelHandleTraits::valid(process))
        {
            return std::unexpected(ERROR_INVALID_HANDLE);
        }

        std::wstring path;
        DWORD capacity = MAX_PATH;
        for (int attempt = 0; attempt < 4; ++attempt)
        {
            try
            {
                path.assign(capacity, L'\0');
            }
            catch (const std::bad_alloc&)
            {
                return std::unexpected(ERROR_OUTOFMEMORY);
            }

            DWORD length = capacity;
            if (::QueryFullProcessImageNameW(process, 0, path.data(), &length) != FALSE)
            {
                path.resize(length);
                return path;
            }

            const DWORD error = ::GetLastError();
            if (error != ERROR_INSUFFICIENT_BUFFER)
            {
                return std::unexpected(error);
            }
            capacity *= 2;
        }

        return std::unexpected(ERROR_INSUFFICIENT_BUFFER);
    }

    // A handle that cannot be waited on counts as still running; launch
    // capture then keeps polling by process id only.
    [[nodiscard]] inline bool process_has_exited(const HANDLE process) noexcept
    {
        return KernelHandleTraits::valid(process) && ::WaitForSingleObject(process, 0) == WAIT_OBJECT_0;
    }
}
