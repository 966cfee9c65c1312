#pragma once

#include "logging/log_level.hpp"

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>

namespace wh::config
{
    struct ConfigError final
    {
        std::wstring message;
        DWORD win32_error{ ERROR_SUCCESS };
    };

    // Durations are milliseconds. The two polling intervals never go below
    // 10 ms whatever the source says.
    struct AppConfig final
    {
        wh::logging::LogLevel minimum_log_level{ wh::logging::LogLevel::info };
        std::wstring locale_override;
        bool dry_run{ false };
        bool enable_debug_sink{ true };
        bool enable_file_logging{ false };
        std::wstring log_directory_path;

        // Title of the host container; candidate windows whose title
        // contains it are never offered for embedding.
        std::wstring host_title{ L"WindowHub" };

        DWORD monitor_interval_ms{ 1'000 };
        DWORD focus_detach_delay_ms{ 200 };
        DWORD activation_message_timeout_ms{ 500 };
        DWORD launch_timeout_ms{ 10'000 };
        DWORD launch_poll_interval_ms{ 100 };
        DWORD min_candidate_width{ 100 };
        DWORD min_candidate_height{ 100 };
    };

    // Precedence, lowest first: built-in defaults, the `key = value` file
    // named by WINDOWHUB_CONFIG, WINDOWHUB_* environment variables.
    class ConfigLoader final
    {
    public:
        // A WINDOWHUB_CONFIG that names a missing or unreadable file is an
        // error, not a silent fallback to defaults.
        [[nodiscard]] static std::expected<AppConfig, ConfigError> load() noexcept;

        // `#` and `;` start comment lines. Unknown keys are ignored, a line
        // without `=` fails with ERROR_BAD_FORMAT.
        [[nodiscard]] static std::expected<AppConfig, ConfigError> parse_text(std::wstring_view text) noexcept;
    };
}
