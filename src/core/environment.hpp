#pragma once

// Process environment and path helpers shared by config, logging and the
// application catalog.

#include <Windows.h>

#include <optional>
#include <string>
#include <string_view>

namespace wh::core
{
    [[nodiscard]] inline std::optional<std::wstring> read_environment_variable(const std::wstring& name)
    {
        const DWORD required = ::GetEnvironmentVariableW(name.c_str(), nullptr, 0);
        if (required == 0)
        {
            return std::nullopt;
        }

        std::wstring value(required, L'\0');
        const DWORD written = ::GetEnvironmentVariableW(name.c_str(), value.data(), required);
        if (written >= required)
        {
            return std::nullopt;
        }
        value.resize(written);
        return value;
    }

    [[nodiscard]] inline std::wstring append_path_component(std::wstring base, const std::wstring_view component)
    {
        if (!base.empty() && base.back() != L'\\' && base.back() != L'/')
        {
            base.push_back(L'\\');
        }
        base.append(component);
        return base;
    }

    // `%TEMP%`, falling back to `%TMP%`.
    [[nodiscard]] inline std::optional<std::wstring> temp_directory()
    {
        for (const wchar_t* const name : { L"TEMP", L"TMP" })
        {
            auto value = read_environment_variable(name);
            if (value && !value->empty())
            {
                return value;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] inline bool is_directory(const std::wstring& path) noexcept
    {
        const DWORD attributes = ::GetFileAttributesW(path.c_str());
        return attributes != INVALID_FILE_ATTRIBUTES && (attributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
    }
}
