#pragma once

#include "core/unique_handle.hpp"
#include "logging/log_level.hpp"

#include <Windows.h>

#include <atomic>
#include <expected>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace wh::logging
{
    // Receives complete lines without a trailing newline. Calls are
    // serialized by the owning `Logger`.
    class ILogSink
    {
    public:
        virtual ~ILogSink() = default;
        virtual void write(const std::wstring& line) noexcept = 0;
    };

    class DebugOutputSink final : public ILogSink
    {
    public:
        void write(const std::wstring& line) noexcept override;
    };

    // UTF-8, append-only. Several hub instances can share a directory because
    // every file name carries the pid and the process start time.
    class FileLogSink final : public ILogSink
    {
    public:
        [[nodiscard]] static std::expected<std::shared_ptr<FileLogSink>, DWORD> create(const std::wstring& path) noexcept;

        // `<directory>\windowhub_<pid>_<process start time>.log`, creating the
        // directory if needed.
        [[nodiscard]] static std::expected<std::wstring, DWORD> resolve_log_path(const std::wstring& directory_path) noexcept;

        // `resolve_log_path` under `%TEMP%\windowhub`.
        [[nodiscard]] static std::expected<std::wstring, DWORD> resolve_default_log_path() noexcept;

        void write(const std::wstring& line) noexcept override;

    private:
        explicit FileLogSink(core::UniqueHandle file_handle) noexcept;

        core::UniqueHandle _file_handle;
    };

    // The owner thread and thread-pool timer callbacks (deferred focus
    // detachment) log through one instance.
    //
    // Line shape: `2024-05-01 09:30:12.345 [INFO] [tid=4812] <body>`.
    class Logger final
    {
    public:
        explicit Logger(LogLevel minimum_level);

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void add_sink(std::shared_ptr<ILogSink> sink);
        void set_minimum_level(LogLevel level) noexcept;
        [[nodiscard]] LogLevel minimum_level() const noexcept;
        [[nodiscard]] bool enabled(LogLevel level) const noexcept;

        // Formatting is skipped entirely below the threshold.
        template<typename... Args>
        void log(const LogLevel level, const std::wformat_string<Args...> format_text, Args&&... args)
        {
            if (!enabled(level))
            {
                return;
            }
            log_preformatted(level, std::format(format_text, std::forward<Args>(args)...));
        }

        void log_preformatted(LogLevel level, std::wstring_view body);

    private:
        std::atomic<LogLevel> _minimum_level;
        std::mutex _sink_mutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };
}
