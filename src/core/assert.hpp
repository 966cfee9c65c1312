#pragma once

// Fail-fast check for programming errors (a null sink, a lost process
// handle). Runtime failures of foreign windows are never asserted; they
// travel as `HubError`.

#include <Windows.h>

#include <cwchar>
#include <source_location>

namespace wh::core
{
    [[noreturn]] inline void invariant_failed(const wchar_t* const expression, const std::source_location location) noexcept
    {
        wchar_t buffer[768]{};
        _snwprintf_s(
            buffer,
            _TRUNCATE,
            L"[windowhub] invariant violated: %ls in %hs (%hs:%u)\n",
            expression,
            location.function_name(),
            location.file_name(),
            static_cast<unsigned>(location.line()));
        ::OutputDebugStringW(buffer);
        __fastfail(FAST_FAIL_FATAL_APP_EXIT);
    }
}

#define WH_WIDEN_INNER(value) L##value
#define WH_WIDEN(value) WH_WIDEN_INNER(value)
#define WH_ASSERT(expr) \
    ((expr) ? static_cast<void>(0) : ::wh::core::invariant_failed(WH_WIDEN(#expr), std::source_location::current()))
