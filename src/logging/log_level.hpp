#pragma once

#include <optional>
#include <string_view>

namespace wh::logging
{
    enum class LogLevel
    {
        trace = 0,
        debug = 1,
        info = 2,
        warning = 3,
        error = 4,
    };

    // Column text used in every log line.
    [[nodiscard]] constexpr std::wstring_view to_string(const LogLevel level) noexcept
    {
        switch (level)
        {
        case LogLevel::trace:
            return L"TRACE";
        case LogLevel::debug:
            return L"DEBUG";
        case LogLevel::info:
            return L"INFO";
        case LogLevel::warning:
            return L"WARN";
        case LogLevel::error:
            return L"ERROR";
        }
        return L"UNKNOWN";
    }

    // Accepts the config spellings `trace`, `debug`, `info`, `warn`/`warning`
    // and `error` in any case.
    [[nodiscard]] inline std::optional<LogLevel> parse_log_level(const std::wstring_view text) noexcept
    {
        const auto equals = [text](const std::wstring_view name) noexcept {
            if (text.size() != name.size())
            {
                return false;
            }
            for (size_t index = 0; index < text.size(); ++index)
            {
                const wchar_t ch = text[index];
                const wchar_t lowered = (ch >= L'A' && ch <= L'Z') ? static_cast<wchar_t>(ch - L'A' + L'a') : ch;
                if (lowered != name[index])
                {
                    return false;
                }
            }
            return true;
        };

        if (equals(L"trace"))
        {
            return LogLevel::trace;
        }
        if (equals(L"debug"))
        {
            return LogLevel::debug;
        }
        if (equals(L"info"))
        {
            return LogLevel::info;
        }
        if (equals(L"warn") || equals(L"warning"))
        {
            return LogLevel::warning;
        }
        if (equals(L"error"))
        {
            return LogLevel::error;
        }
        return std::nullopt;
    }
}
