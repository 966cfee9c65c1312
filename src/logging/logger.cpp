#include "logging/logger.hpp"

#include "core/assert.hpp"
#include "core/environment.hpp"
#include "core/utf8.hpp"

#include <new>

namespace wh::logging
{
    namespace
    {
        // Creation time of this process as FILETIME ticks; together with the
        // pid it keeps log names unique across pid reuse.
        [[nodiscard]] std::expected<ULONGLONG, DWORD> process_start_ticks() noexcept
        {
            FILETIME created{};
            FILETIME exited{};
            FILETIME kernel{};
            FILETIME user{};
            if (::GetProcessTimes(::GetCurrentProcess(), &created, &exited, &kernel, &user) == FALSE)
            {
                return std::unexpected(::GetLastError());
            }

            ULARGE_INTEGER ticks{};
            ticks.LowPart = created.dwLowDateTime;
            ticks.HighPart = created.dwHighDateTime;
            return ticks.QuadPart;
        }

        [[nodiscard]] std::expected<void, DWORD> ensure_directory(const std::wstring& path) noexcept
        {
            if (::CreateDirectoryW(path.c_str(), nullptr) != FALSE)
            {
                return {};
            }

            const DWORD error = ::GetLastError();
            if (error != ERROR_ALREADY_EXISTS)
            {
                return std::unexpected(error);
            }
            if (!core::is_directory(path))
            {
                return std::unexpected(static_cast<DWORD>(ERROR_DIRECTORY));
            }
            return {};
        }
    }

    void DebugOutputSink::write(const std::wstring& line) noexcept
    {
        ::OutputDebugStringW(line.c_str());
        ::OutputDebugStringW(L"\n");
    }

    FileLogSink::FileLogSink(core::UniqueHandle file_handle) noexcept :
        _file_handle(std::move(file_handle))
    {
    }

    std::expected<std::shared_ptr<FileLogSink>, DWORD> FileLogSink::create(const std::wstring& path) noexcept
    {
        core::UniqueHandle file(::CreateFileW(
            path.c_str(),
            FILE_APPEND_DATA,
            FILE_SHARE_READ,
            nullptr,
            OPEN_ALWAYS,
            FILE_ATTRIBUTE_NORMAL,
            nullptr));
        if (!file.valid())
        {
            return std::unexpected(::GetLastError());
        }

        // A fresh file starts with a BOM so Notepad picks UTF-8 for the
        // Chinese localized lines; an existing file is appended to as is.
        LARGE_INTEGER size{};
        if (::GetFileSizeEx(file.get(), &size) != FALSE && size.QuadPart == 0)
        {
            static constexpr char utf8_bom[] = { '\xEF', '\xBB', '\xBF' };
            DWORD written = 0;
            if (::WriteFile(file.get(), utf8_bom, static_cast<DWORD>(sizeof(utf8_bom)), &written, nullptr) == FALSE)
            {
                return std::unexpected(::GetLastError());
            }
        }

        try
        {
            return std::shared_ptr<FileLogSink>(new FileLogSink(std::move(file)));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    std::expected<std::wstring, DWORD> FileLogSink::resolve_log_path(const std::wstring& directory_path) noexcept
    {
        if (directory_path.empty())
        {
            return std::unexpected(static_cast<DWORD>(ERROR_INVALID_PARAMETER));
        }

        if (auto ensured = ensure_directory(directory_path); !ensured)
        {
            return std::unexpected(ensured.error());
        }

        const auto started = process_start_ticks();
        if (!started)
        {
            return std::unexpected(started.error());
        }

        try
        {
            return core::append_path_component(
                directory_path,
                std::format(L"windowhub_{}_{}.log", ::GetCurrentProcessId(), *started));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    std::expected<std::wstring, DWORD> FileLogSink::resolve_default_log_path() noexcept
    {
        try
        {
            const auto temp = core::temp_directory();
            if (!temp)
            {
                return std::unexpected(static_cast<DWORD>(ERROR_ENVVAR_NOT_FOUND));
            }
            return resolve_log_path(core::append_path_component(*temp, L"windowhub"));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    void FileLogSink::write(const std::wstring& line) noexcept
    {
        try
        {
            auto utf8 = core::to_utf8(line);
            if (!utf8)
            {
                return;
            }
            utf8->append("\r\n");

            DWORD written = 0;
            (void)::WriteFile(_file_handle.get(), utf8->data(), static_cast<DWORD>(utf8->size()), &written, nullptr);
        }
        catch (const std::bad_alloc&)
        {
            ::OutputDebugStringW(L"[windowhub] log line dropped: out of memory\n");
        }
    }

    Logger::Logger(const LogLevel minimum_level) :
        _minimum_level(minimum_level)
    {
    }

    void Logger::add_sink(std::shared_ptr<ILogSink> sink)
    {
        WH_ASSERT(sink != nullptr);
        std::lock_guard lock(_sink_mutex);
        _sinks.push_back(std::move(sink));
    }

    void Logger::set_minimum_level(const LogLevel level) noexcept
    {
        _minimum_level.store(level, std::memory_order_relaxed);
    }

    LogLevel Logger::minimum_level() const noexcept
    {
        return _minimum_level.load(std::memory_order_relaxed);
    }

    bool Logger::enabled(const LogLevel level) const noexcept
    {
        return level >= _minimum_level.load(std::memory_order_relaxed);
    }

    void Logger::log_preformatted(const LogLevel level, const std::wstring_view body)
    {
        if (!enabled(level))
        {
            return;
        }

        SYSTEMTIME now{};
        ::GetLocalTime(&now);
        const std::wstring line = std::format(
            L"{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} [{}] [tid={}] {}",
            now.wYear,
            now.wMonth,
            now.wDay,
            now.wHour,
            now.wMinute,
            now.wSecond,
            now.wMilliseconds,
            to_string(level),
            ::GetCurrentThreadId(),
            body);

        std::lock_guard lock(_sink_mutex);
        for (const auto& sink : _sinks)
        {
            sink->write(line);
        }
    }
}
