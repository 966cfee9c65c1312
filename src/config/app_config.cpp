#include "config/app_config.hpp"

#include "core/environment.hpp"
#include "core/unique_handle.hpp"
#include "core/utf8.hpp"
#include "serialization/fast_number.hpp"

#include <Windows.h>

#include <algorithm>
#include <array>
#include <format>
#include <new>
#include <optional>
#include <vector>

namespace wh::config
{
    namespace
    {
        constexpr std::wstring_view kConfigPathEnv = L"WINDOWHUB_CONFIG";

        // Intervals of zero would spin the monitor or the launch poll.
        constexpr DWORD kMinimumIntervalMs = 10;
        constexpr LONGLONG kMaximumConfigBytes = 256 * 1024;

        [[nodiscard]] std::wstring_view trim(std::wstring_view value) noexcept
        {
            constexpr std::wstring_view whitespace = L" \t\r\n";
            const size_t first = value.find_first_not_of(whitespace);
            if (first == std::wstring_view::npos)
            {
                return {};
            }
            const size_t last = value.find_last_not_of(whitespace);
            return value.substr(first, last - first + 1);
        }

        [[nodiscard]] bool parse_bool(const std::wstring_view text) noexcept
        {
            return text == L"1" || text == L"true" || text == L"TRUE" || text == L"on" || text == L"ON";
        }

        // Malformed numbers leave the current value in place.
        void assign_dword(DWORD& target, const std::wstring_view text) noexcept
        {
            if (const auto parsed = serialization::parse_u32(text))
            {
                target = *parsed;
            }
        }

        void assign_interval(DWORD& target, const std::wstring_view text) noexcept
        {
            assign_dword(target, text);
            target = std::max(kMinimumIntervalMs, target);
        }

        // One row per key. `environment` is empty for file-only keys.
        struct Setting final
        {
            std::wstring_view key;
            std::wstring_view environment;
            void (*apply)(AppConfig& config, std::wstring_view value);
        };

        constexpr std::array kSettings{
            Setting{ L"locale", L"WINDOWHUB_LOCALE", [](AppConfig& config, const std::wstring_view value) {
                        config.locale_override.assign(value);
                    } },
            Setting{ L"dry_run", L"WINDOWHUB_DRY_RUN", [](AppConfig& config, const std::wstring_view value) {
                        config.dry_run = parse_bool(value);
                    } },
            Setting{ L"log_level", L"WINDOWHUB_LOG_LEVEL", [](AppConfig& config, const std::wstring_view value) {
                        config.minimum_log_level = logging::parse_log_level(value).value_or(config.minimum_log_level);
                    } },
            Setting{ L"log_directory", L"WINDOWHUB_LOG_DIRECTORY", [](AppConfig& config, const std::wstring_view value) {
                        config.log_directory_path.assign(value);
                    } },
            Setting{ L"file_logging", L"WINDOWHUB_FILE_LOGGING", [](AppConfig& config, const std::wstring_view value) {
                        config.enable_file_logging = parse_bool(value);
                    } },
            Setting{ L"debug_sink", L"WINDOWHUB_DEBUG_SINK", [](AppConfig& config, const std::wstring_view value) {
                        config.enable_debug_sink = parse_bool(value);
                    } },
            Setting{ L"host_title", L"", [](AppConfig& config, const std::wstring_view value) {
                        if (!value.empty())
                        {
                            config.host_title.assign(value);
                        }
                    } },
            Setting{ L"monitor_interval_ms", L"WINDOWHUB_MONITOR_INTERVAL_MS", [](AppConfig& config, const std::wstring_view value) {
                        assign_interval(config.monitor_interval_ms, value);
                    } },
            Setting{ L"focus_detach_delay_ms", L"WINDOWHUB_FOCUS_DETACH_DELAY_MS", [](AppConfig& config, const std::wstring_view value) {
                        assign_dword(config.focus_detach_delay_ms, value);
                    } },
            Setting{ L"activation_message_timeout_ms", L"", [](AppConfig& config, const std::wstring_view value) {
                        assign_dword(config.activation_message_timeout_ms, value);
                    } },
            Setting{ L"launch_timeout_ms", L"WINDOWHUB_LAUNCH_TIMEOUT_MS", [](AppConfig& config, const std::wstring_view value) {
                        assign_dword(config.launch_timeout_ms, value);
                    } },
            Setting{ L"launch_poll_interval_ms", L"", [](AppConfig& config, const std::wstring_view value) {
                        assign_interval(config.launch_poll_interval_ms, value);
                    } },
            Setting{ L"min_candidate_width", L"", [](AppConfig& config, const std::wstring_view value) {
                        assign_dword(config.min_candidate_width, value);
                    } },
            Setting{ L"min_candidate_height", L"", [](AppConfig& config, const std::wstring_view value) {
                        assign_dword(config.min_candidate_height, value);
                    } },
        };

        [[nodiscard]] std::unexpected<ConfigError> failure(std::wstring message, const DWORD error)
        {
            return std::unexpected(ConfigError{ .message = std::move(message), .win32_error = error });
        }

        [[nodiscard]] std::expected<std::wstring, ConfigError> read_config_file(const std::wstring& path)
        {
            core::UniqueHandle file(::CreateFileW(
                path.c_str(),
                GENERIC_READ,
                FILE_SHARE_READ,
                nullptr,
                OPEN_EXISTING,
                FILE_ATTRIBUTE_NORMAL,
                nullptr));
            if (!file.valid())
            {
                return failure(std::format(L"Cannot open config file {}", path), ::GetLastError());
            }

            LARGE_INTEGER size{};
            if (::GetFileSizeEx(file.get(), &size) == FALSE)
            {
                return failure(L"GetFileSizeEx failed for config file", ::GetLastError());
            }
            if (size.QuadPart > kMaximumConfigBytes)
            {
                return failure(L"Config file is larger than 256 KiB", ERROR_FILE_TOO_LARGE);
            }

            std::vector<char> bytes(static_cast<size_t>(size.QuadPart));
            DWORD read = 0;
            if (!bytes.empty() &&
                (::ReadFile(file.get(), bytes.data(), static_cast<DWORD>(bytes.size()), &read, nullptr) == FALSE || read != bytes.size()))
            {
                return failure(L"ReadFile failed for config file", ::GetLastError());
            }

            auto text = core::decode_text(bytes);
            if (!text)
            {
                return failure(L"Config file is not UTF-8 or UTF-16LE text", text.error());
            }
            return std::move(text.value());
        }

        void apply_environment_overrides(AppConfig& config)
        {
            for (const Setting& setting : kSettings)
            {
                if (setting.environment.empty())
                {
                    continue;
                }
                if (const auto value = core::read_environment_variable(std::wstring(setting.environment)))
                {
                    setting.apply(config, trim(*value));
                }
            }
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::load() noexcept
    {
        try
        {
            AppConfig config{};
            if (const auto config_path = core::read_environment_variable(std::wstring(kConfigPathEnv)))
            {
                auto text = read_config_file(*config_path);
                if (!text)
                {
                    return std::unexpected(std::move(text.error()));
                }

                auto parsed = parse_text(*text);
                if (!parsed)
                {
                    return std::unexpected(std::move(parsed.error()));
                }
                config = std::move(parsed.value());
            }

            apply_environment_overrides(config);
            return config;
        }
        catch (const std::bad_alloc&)
        {
            return failure(L"Out of memory while loading configuration", ERROR_OUTOFMEMORY);
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::parse_text(const std::wstring_view text) noexcept
    {
        try
        {
            AppConfig config{};
            size_t line_number = 0;
            size_t begin = 0;
            while (begin <= text.size())
            {
                const size_t end = std::min(text.find(L'\n', begin), text.size());
                const std::wstring_view line = trim(text.substr(begin, end - begin));
                ++line_number;
                begin = end + 1;

                if (line.empty() || line.front() == L'#' || line.front() == L';')
                {
                    continue;
                }

                const size_t equals = line.find(L'=');
                if (equals == std::wstring_view::npos)
                {
                    return failure(std::format(L"Config line {} has no '='", line_number), ERROR_BAD_FORMAT);
                }

                const std::wstring_view key = trim(line.substr(0, equals));
                const auto setting = std::find_if(kSettings.begin(), kSettings.end(), [key](const Setting& candidate) {
                    return candidate.key == key;
                });
                // Unknown keys are tolerated so newer config files still load.
                if (setting != kSettings.end())
                {
                    setting->apply(config, trim(line.substr(equals + 1)));
                }
            }
            return config;
        }
        catch (const std::bad_alloc&)
        {
            return failure(L"Out of memory while parsing configuration", ERROR_OUTOFMEMORY);
        }
    }
}
