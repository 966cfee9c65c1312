#include "config/app_config.hpp"
#include "core/environment.hpp"
#include "core/unique_handle.hpp"
#include "core/utf8.hpp"

#include <Windows.h>

#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace
{
    class ScopedEnvironmentVariable final
    {
    public:
        ScopedEnvironmentVariable(std::wstring name, std::optional<std::wstring> value) :
            _name(std::move(name))
        {
            const DWORD required = ::GetEnvironmentVariableW(_name.c_str(), nullptr, 0);
            if (required != 0)
            {
                std::wstring buffer(required, L'\0');
                const DWORD written = ::GetEnvironmentVariableW(_name.c_str(), buffer.data(), required);
                if (written != 0)
                {
                    buffer.resize(written);
                    _previous_value = std::move(buffer);
                    _had_previous = true;
                }
            }

            if (value.has_value())
            {
                (void)::SetEnvironmentVariableW(_name.c_str(), value->c_str());
            }
            else
            {
                (void)::SetEnvironmentVariableW(_name.c_str(), nullptr);
            }
        }

        ~ScopedEnvironmentVariable()
        {
            if (_had_previous)
            {
                (void)::SetEnvironmentVariableW(_name.c_str(), _previous_value.c_str());
            }
            else
            {
                (void)::SetEnvironmentVariableW(_name.c_str(), nullptr);
            }
        }

        ScopedEnvironmentVariable(const ScopedEnvironmentVariable&) = delete;
        ScopedEnvironmentVariable& operator=(const ScopedEnvironmentVariable&) = delete;

    private:
        std::wstring _name;
        std::wstring _previous_value;
        bool _had_previous{ false };
    };

    using wh::core::append_path_component;

    [[nodiscard]] std::optional<std::wstring> create_test_directory()
    {
        const auto base = wh::core::temp_directory();
        if (!base)
        {
            return std::nullopt;
        }

        const std::wstring path = std::format(
            L"{}_{}_{}",
            append_path_component(*base, L"windowhub_config_tests"),
            ::GetCurrentProcessId(),
            ::GetTickCount64());
        if (::CreateDirectoryW(path.c_str(), nullptr) == FALSE)
        {
            return std::nullopt;
        }
        return path;
    }

    [[nodiscard]] bool write_file(const std::wstring& path, const std::string_view bytes)
    {
        wh::core::UniqueHandle file(::CreateFileW(
            path.c_str(),
            GENERIC_WRITE,
            0,
            nullptr,
            CREATE_ALWAYS,
            FILE_ATTRIBUTE_NORMAL,
            nullptr));
        if (!file.valid())
        {
            return false;
        }

        DWORD written = 0;
        return bytes.empty() ||
               (::WriteFile(file.get(), bytes.data(), static_cast<DWORD>(bytes.size()), &written, nullptr) != FALSE &&
                written == bytes.size());
    }

    [[nodiscard]] bool write_utf8_file(const std::wstring& path, const std::wstring_view text)
    {
        const auto utf8 = wh::core::to_utf8(text);
        return utf8.has_value() && write_file(path, *utf8);
    }

    class ScopedTestDirectory final
    {
    public:
        explicit ScopedTestDirectory(std::wstring path) :
            _path(std::move(path))
        {
        }

        ~ScopedTestDirectory()
        {
            if (_path.empty())
            {
                return;
            }

            (void)::DeleteFileW(append_path_component(_path, L"windowhub.conf").c_str());
            (void)::RemoveDirectoryW(_path.c_str());
        }

        [[nodiscard]] const std::wstring& path() const noexcept
        {
            return _path;
        }

    private:
        std::wstring _path;
    };

    bool test_parse_text()
    {
        const auto parsed = wh::config::ConfigLoader::parse_text(
            L"# comment\n"
            L"log_level=debug\n"
            L"locale=zh-CN\n"
            L"dry_run=true\n"
            L"log_directory=C:\\temp\\logs\n"
            L"file_logging=1\n"
            L"debug_sink=0\n"
            L"; another comment\n"
            L"host_title = Hub Under Test \n"
            L"monitor_interval_ms=250\n"
            L"focus_detach_delay_ms=50\n"
            L"activation_message_timeout_ms=750\n"
            L"launch_timeout_ms=4000\n"
            L"launch_poll_interval_ms=20\n"
            L"min_candidate_width=64\n"
            L"min_candidate_height=48\n");
        if (!parsed)
        {
            return false;
        }

        return parsed->minimum_log_level == wh::logging::LogLevel::debug &&
               parsed->locale_override == L"zh-CN" &&
               parsed->dry_run &&
               parsed->log_directory_path == L"C:\\temp\\logs" &&
               parsed->enable_file_logging &&
               !parsed->enable_debug_sink &&
               parsed->host_title == L"Hub Under Test" &&
               parsed->monitor_interval_ms == 250 &&
               parsed->focus_detach_delay_ms == 50 &&
               parsed->activation_message_timeout_ms == 750 &&
               parsed->launch_timeout_ms == 4000 &&
               parsed->launch_poll_interval_ms == 20 &&
               parsed->min_candidate_width == 64 &&
               parsed->min_candidate_height == 48;
    }

    bool test_defaults_match_documented_values()
    {
        const auto parsed = wh::config::ConfigLoader::parse_text(L"");
        if (!parsed)
        {
            return false;
        }

        return parsed->minimum_log_level == wh::logging::LogLevel::info &&
               !parsed->dry_run &&
               parsed->host_title == L"WindowHub" &&
               parsed->monitor_interval_ms == 1000 &&
               parsed->focus_detach_delay_ms == 200 &&
               parsed->activation_message_timeout_ms == 500 &&
               parsed->launch_timeout_ms == 10000 &&
               parsed->launch_poll_interval_ms == 100 &&
               parsed->min_candidate_width == 100 &&
               parsed->min_candidate_height == 100;
    }

    bool test_intervals_are_clamped_and_bad_numbers_ignored()
    {
        const auto parsed = wh::config::ConfigLoader::parse_text(
            L"monitor_interval_ms=0\n"
            L"launch_poll_interval_ms=1\n"
            L"launch_timeout_ms=soon\n"
            L"host_title=\n");
        if (!parsed)
        {
            return false;
        }

        return parsed->monitor_interval_ms == 10 &&
               parsed->launch_poll_interval_ms == 10 &&
               parsed->launch_timeout_ms == 10000 &&
               parsed->host_title == L"WindowHub";
    }

    bool test_environment_overrides()
    {
        const ScopedEnvironmentVariable config_path(L"WINDOWHUB_CONFIG", std::nullopt);
        const ScopedEnvironmentVariable log_level(L"WINDOWHUB_LOG_LEVEL", std::optional<std::wstring>(L"error"));
        const ScopedEnvironmentVariable dry_run(L"WINDOWHUB_DRY_RUN", std::optional<std::wstring>(L"1"));
        const ScopedEnvironmentVariable locale(L"WINDOWHUB_LOCALE", std::optional<std::wstring>(L"en-US"));
        const ScopedEnvironmentVariable log_dir(L"WINDOWHUB_LOG_DIRECTORY", std::optional<std::wstring>(L"C:\\temp\\logs"));
        const ScopedEnvironmentVariable file_logging(L"WINDOWHUB_FILE_LOGGING", std::optional<std::wstring>(L"1"));
        const ScopedEnvironmentVariable debug_sink(L"WINDOWHUB_DEBUG_SINK", std::optional<std::wstring>(L"false"));
        const ScopedEnvironmentVariable monitor(L"WINDOWHUB_MONITOR_INTERVAL_MS", std::optional<std::wstring>(L"300"));
        const ScopedEnvironmentVariable detach(L"WINDOWHUB_FOCUS_DETACH_DELAY_MS", std::optional<std::wstring>(L"75"));
        const ScopedEnvironmentVariable launch(L"WINDOWHUB_LAUNCH_TIMEOUT_MS", std::optional<std::wstring>(L"2200"));

        const auto loaded = wh::config::ConfigLoader::load();
        if (!loaded)
        {
            return false;
        }

        return loaded->minimum_log_level == wh::logging::LogLevel::error &&
               loaded->dry_run &&
               loaded->locale_override == L"en-US" &&
               loaded->log_directory_path == L"C:\\temp\\logs" &&
               loaded->enable_file_logging &&
               !loaded->enable_debug_sink &&
               loaded->monitor_interval_ms == 300 &&
               loaded->focus_detach_delay_ms == 75 &&
               loaded->launch_timeout_ms == 2200;
    }

    bool test_parse_text_invalid_line_fails()
    {
        const auto parsed = wh::config::ConfigLoader::parse_text(L"log_level=info\nthis-is-invalid-line");
        return !parsed.has_value() &&
               parsed.error().win32_error == ERROR_BAD_FORMAT &&
               parsed.error().message.find(L"line 2") != std::wstring::npos;
    }

    bool test_unknown_keys_and_level_spellings()
    {
        const auto parsed = wh::config::ConfigLoader::parse_text(
            L"  ; legacy comment\r\n"
            L"tab_colour = blue\r\n"
            L"log_level = WARN\r\n");
        const auto bogus_level = wh::config::ConfigLoader::parse_text(L"log_level=loud\n");
        return parsed.has_value() &&
               parsed->minimum_log_level == wh::logging::LogLevel::warning &&
               bogus_level.has_value() &&
               bogus_level->minimum_log_level == wh::logging::LogLevel::info;
    }

    bool test_utf16_config_file_is_decoded()
    {
        const auto created = create_test_directory();
        if (!created)
        {
            return false;
        }

        ScopedTestDirectory directory(*created);
        const std::wstring file_path = append_path_component(directory.path(), L"windowhub.conf");
        const std::wstring_view text = L"host_title=窗口集线器\n";
        std::string bytes("\xFF\xFE", 2);
        bytes.append(reinterpret_cast<const char*>(text.data()), text.size() * sizeof(wchar_t));
        if (!write_file(file_path, bytes))
        {
            return false;
        }

        const ScopedEnvironmentVariable config_path_env(L"WINDOWHUB_CONFIG", file_path);
        const auto loaded = wh::config::ConfigLoader::load();
        return loaded.has_value() && loaded->host_title == L"窗口集线器";
    }

    bool test_config_file_is_loaded_and_environment_wins()
    {
        const auto created = create_test_directory();
        if (!created)
        {
            return false;
        }

        ScopedTestDirectory directory(*created);
        const std::wstring file_path = append_path_component(directory.path(), L"windowhub.conf");
        if (!write_utf8_file(
                file_path,
                L"log_level=debug\n"
                L"locale=fr-FR\n"
                L"host_title=Tabs\n"
                L"launch_timeout_ms=3000\n"))
        {
            return false;
        }

        const ScopedEnvironmentVariable config_path_env(L"WINDOWHUB_CONFIG", file_path);
        const ScopedEnvironmentVariable log_level_env(L"WINDOWHUB_LOG_LEVEL", std::nullopt);
        const ScopedEnvironmentVariable locale_env(L"WINDOWHUB_LOCALE", std::optional<std::wstring>(L"ja-JP"));
        const ScopedEnvironmentVariable launch_env(L"WINDOWHUB_LAUNCH_TIMEOUT_MS", std::nullopt);

        const auto loaded = wh::config::ConfigLoader::load();
        if (!loaded)
        {
            return false;
        }

        return loaded->minimum_log_level == wh::logging::LogLevel::debug &&
               loaded->locale_override == L"ja-JP" &&
               loaded->host_title == L"Tabs" &&
               loaded->launch_timeout_ms == 3000;
    }

    bool test_missing_config_file_fails()
    {
        const auto created = create_test_directory();
        if (!created)
        {
            return false;
        }

        ScopedTestDirectory directory(*created);
        const ScopedEnvironmentVariable config_path_env(
            L"WINDOWHUB_CONFIG",
            append_path_component(directory.path(), L"windowhub.conf"));

        const auto loaded = wh::config::ConfigLoader::load();
        return !loaded.has_value() && loaded.error().win32_error == ERROR_FILE_NOT_FOUND;
    }
}

bool run_config_tests()
{
    return test_parse_text() &&
           test_defaults_match_documented_values() &&
           test_intervals_are_clamped_and_bad_numbers_ignored() &&
           test_environment_overrides() &&
           test_parse_text_invalid_line_fails() &&
           test_unknown_keys_and_level_spellings() &&
           test_utf16_config_file_is_decoded() &&
           test_config_file_is_loaded_and_environment_wins() &&
           test_missing_config_file_fails();
}
