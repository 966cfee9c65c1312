#pragma once

// UTF-8 <-> UTF-16 conversion for log files and config files.

#include <Windows.h>

#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace wh::core
{
    [[nodiscard]] inline std::expected<std::string, DWORD> to_utf8(const std::wstring_view text)
    {
        if (text.empty())
        {
            return std::string{};
        }

        const int size = ::WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0, nullptr, nullptr);
        if (size <= 0)
        {
            return std::unexpected(::GetLastError());
        }

        std::string utf8(static_cast<size_t>(size), '\0');
        if (::WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), utf8.data(), size, nullptr, nullptr) != size)
        {
            return std::unexpected(::GetLastError());
        }
        return utf8;
    }

    // Invalid sequences are an error rather than U+FFFD.
    [[nodiscard]] inline std::expected<std::wstring, DWORD> from_utf8(const std::string_view text)
    {
        if (text.empty())
        {
            return std::wstring{};
        }

        const int size = ::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, text.data(), static_cast<int>(text.size()), nullptr, 0);
        if (size <= 0)
        {
            return std::unexpected(::GetLastError());
        }

        std::wstring wide(static_cast<size_t>(size), L'\0');
        if (::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, text.data(), static_cast<int>(text.size()), wide.data(), size) != size)
        {
            return std::unexpected(::GetLastError());
        }
        return wide;
    }

    // UTF-16LE with BOM, otherwise UTF-8 with or without BOM.
    [[nodiscard]] inline std::expected<std::wstring, DWORD> decode_text(const std::span<const char> bytes)
    {
        const auto byte_at = [&](const size_t index) {
            return static_cast<unsigned char>(bytes[index]);
        };

        if (bytes.size() >= 2 && byte_at(0) == 0xFF && byte_at(1) == 0xFE)
        {
            const size_t count = (bytes.size() - 2) / sizeof(wchar_t);
            std::wstring wide(count, L'\0');
            std::memcpy(wide.data(), bytes.data() + 2, count * sizeof(wchar_t));
            return wide;
        }

        size_t offset = 0;
        if (bytes.size() >= 3 && byte_at(0) == 0xEF && byte_at(1) == 0xBB && byte_at(2) == 0xBF)
        {
            offset = 3;
        }
        return from_utf8(std::string_view(bytes.data() + offset, bytes.size() - offset));
    }
}
