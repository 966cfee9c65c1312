#include "app/application.hpp"

#include "cli/host_arguments.hpp"
#include "config/app_config.hpp"
#include "core/console_writer.hpp"
#include "core/exception.hpp"
#include "core/process_launcher.hpp"
#include "host/host_window.hpp"
#include "hub/window_hub.hpp"
#include "launch/app_catalog.hpp"
#include "localization/localizer.hpp"
#include "logging/logger.hpp"
#include "window/win32_window_system.hpp"
#include "window/window_directory.hpp"

#include <Windows.h>

#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <string>

// Startup order is fixed: config -> localization -> logging -> CLI parse.
// The listing modes exit before any window is created; the run mode creates
// the host container, wires the hub to it, embeds/launches what the command
// line asked for and pumps messages until the container is closed.

namespace wh::app
{
    namespace
    {
        void write_localized_error(const localization::Localizer& localizer, const localization::StringId id, const std::wstring_view detail)
        {
            std::wstring message(localizer.text(id));
            message.append(L": ");
            message.append(detail);
            core::write_console_line(message);
        }

        void configure_logging(logging::Logger& logger, const config::AppConfig& config)
        {
            if (config.enable_debug_sink)
            {
                logger.add_sink(std::make_shared<logging::DebugOutputSink>());
            }
            if (!config.enable_file_logging)
            {
                return;
            }

            std::expected<std::wstring, DWORD> resolved_path = config.log_directory_path.empty()
                ? logging::FileLogSink::resolve_default_log_path()
                : logging::FileLogSink::resolve_log_path(config.log_directory_path);
            if (!resolved_path)
            {
                logger.log(logging::LogLevel::warning, L"File logging disabled; path resolution failed with error={}", resolved_path.error());
                return;
            }

            auto file_sink = logging::FileLogSink::create(resolved_path.value());
            if (!file_sink)
            {
                logger.log(logging::LogLevel::warning, L"File logging disabled; CreateFileW error={}", file_sink.error());
                return;
            }

            logger.add_sink(file_sink.value());
            logger.log(logging::LogLevel::info, L"File logging enabled at {}", resolved_path.value());
        }

        [[nodiscard]] std::optional<localization::StringId> user_message_for(const hub::HubErrorCode code) noexcept
        {
            switch (code)
            {
            case hub::HubErrorCode::permission_denied:
                return localization::StringId::embed_permission_denied;
            case hub::HubErrorCode::not_embeddable:
                return localization::StringId::embed_not_embeddable;
            case hub::HubErrorCode::launch_failed:
                return localization::StringId::launch_failed;
            case hub::HubErrorCode::timeout:
                return localization::StringId::launch_timeout;
            default:
                return std::nullopt;
            }
        }

        void report_failure(
            const localization::Localizer& localizer,
            const HWND owner,
            const hub::HubError& error,
            const std::wstring_view subject)
        {
            if (!hub::is_user_visible(error.code))
            {
                return;
            }
            const std::optional<localization::StringId> id = user_message_for(error.code);
            if (!id)
            {
                return;
            }

            const std::wstring text = std::format(L"{}\n\n{}", localizer.text(*id), subject);
            const std::wstring caption(localizer.text(localization::StringId::error_caption));
            (void)::MessageBoxW(owner, text.c_str(), caption.c_str(), MB_OK | MB_ICONWARNING);
        }

        [[nodiscard]] hub::HubOptions make_hub_options(const config::AppConfig& config, const std::wstring& host_title)
        {
            return hub::HubOptions{
                .directory = window::DirectoryOptions{
                    .host_title = host_title,
                    .min_width = static_cast<int>(config.min_candidate_width),
                    .min_height = static_cast<int>(config.min_candidate_height),
                },
                .focus = hub::FocusPolicy{
                    .detach_delay_ms = config.focus_detach_delay_ms,
                    .activation_message_timeout_ms = config.activation_message_timeout_ms,
                },
                .launch = hub::LaunchPolicy{
                    .timeout_ms = config.launch_timeout_ms,
                    .poll_interval_ms = config.launch_poll_interval_ms,
                },
                .monitor_interval_ms = config.monitor_interval_ms,
            };
        }

        int list_candidates(const config::AppConfig& config, const localization::Localizer& localizer)
        {
            window::Win32WindowSystem windows;
            const window::WindowDirectory directory(windows, make_hub_options(config, config.host_title).directory);

            const auto candidates = directory.list_candidates();
            if (candidates.empty())
            {
                core::write_console_line(localizer.text(localization::StringId::no_candidates));
                return 0;
            }

            for (const window::WindowCandidate& candidate : candidates)
            {
                core::write_console_line(std::format(
                    L"0x{:X}\t{}\t{}x{}\t{}{}",
                    candidate.handle.as_uintptr(),
                    candidate.process_id,
                    candidate.width,
                    candidate.height,
                    candidate.title,
                    candidate.is_minimized ? L" (minimized)" : L""));
            }
            return 0;
        }

        int list_apps(const localization::Localizer& localizer)
        {
            const auto apps = launch::AppCatalog::enumerate();
            if (apps.empty())
            {
                core::write_console_line(localizer.text(localization::StringId::no_apps));
                return 0;
            }

            for (const launch::AppEntry& app : apps)
            {
                core::write_console_line(std::format(L"{}\t{}", app.name, app.path));
            }
            return 0;
        }
    }

    int Application::run()
    {
        auto config_result = config::ConfigLoader::load();
        if (!config_result)
        {
            localization::Localizer fallback_localizer(L"en-US");
            write_localized_error(fallback_localizer, localization::StringId::config_failed, config_result.error().message);
            return static_cast<int>(ERROR_BAD_CONFIGURATION);
        }

        const config::AppConfig config = std::move(config_result.value());
        std::wstring locale = config.locale_override.empty() ? localization::Localizer::detect_user_locale() : config.locale_override;
        const localization::Localizer localizer(std::move(locale));

        logging::Logger logger(config.minimum_log_level);
        configure_logging(logger, config);

        const std::wstring startup_command_line = ::GetCommandLineW();
        logger.log(logging::LogLevel::info, L"Startup context: pid={}, command_line={}", ::GetCurrentProcessId(), startup_command_line);
        logger.log(logging::LogLevel::info, L"{}", localizer.text(localization::StringId::startup));
        logger.log(logging::LogLevel::debug, L"Locale selected: {}", localizer.locale());

        auto parsed_args = cli::HostArguments::parse(startup_command_line);
        if (!parsed_args)
        {
            logger.log(logging::LogLevel::error, L"Parse error: {}", parsed_args.error().message);
            write_localized_error(localizer, localization::StringId::parse_failed, parsed_args.error().message);
            core::write_console_line(localizer.text(localization::StringId::usage));
            return static_cast<int>(ERROR_INVALID_PARAMETER);
        }
        const cli::HostArguments args = std::move(parsed_args.value());

        switch (args.mode())
        {
        case cli::HostMode::help:
            core::write_console_line(localizer.text(localization::StringId::usage));
            return 0;
        case cli::HostMode::list_candidates:
            return list_candidates(config, localizer);
        case cli::HostMode::list_apps:
            return list_apps(localizer);
        case cli::HostMode::run:
            break;
        }

        // The container title must keep the configured host title so the
        // directory never offers the hub itself as a candidate.
        const std::wstring host_title = args.title().empty() ? config.host_title : args.title();

        auto host = host::HostWindow::create(
            host::HostWindowConfig{
                .title = host_title,
                .initial_width_px = args.width(),
                .initial_height_px = args.height(),
                .tab_bar_height_px = args.tab_bar_height(),
            },
            logger);
        if (!host)
        {
            const DWORD error = core::to_dword(host.error());
            logger.log(logging::LogLevel::error, L"Host window creation failed (error={})", error);
            throw core::AppException(
                std::format(L"{}: {}", localizer.text(localization::StringId::host_window_failed), core::describe_win32_error(error)),
                error);
        }

        window::Win32WindowSystem windows;
        core::ProcessLauncher launcher;
        hub::WindowHub hub(
            windows,
            launcher,
            logger,
            core::WindowHandle((*host)->hwnd()),
            make_hub_options(config, host_title));
        (*host)->attach_hub(&hub);

        if (config.dry_run)
        {
            logger.log(logging::LogLevel::info, L"{}", localizer.text(localization::StringId::dry_run_notice));
        }
        else
        {
            for (const core::WindowHandle target : args.embed_targets())
            {
                auto session = hub.request_embed(target);
                if (!session)
                {
                    report_failure(localizer, (*host)->hwnd(), session.error(), std::format(L"0x{:X}", target.as_uintptr()));
                }
            }

            for (const std::wstring& path : args.launch_targets())
            {
                auto session = hub.request_launch_and_embed(path);
                if (!session)
                {
                    report_failure(localizer, (*host)->hwnd(), session.error(), path);
                }
            }
        }

        host::HostWindow* const host_window = host->get();
        if (auto monitor = hub.start_monitor([host_window] { host_window->request_reconcile(); }); !monitor)
        {
            logger.log(
                logging::LogLevel::warning,
                L"External change monitor not started: {} (error={})",
                monitor.error().context,
                monitor.error().win32_error);
        }

        const int exit_code = (*host)->run();

        hub.shutdown();
        (*host)->attach_hub(nullptr);
        logger.log(logging::LogLevel::info, L"Host window closed (exit={})", exit_code);
        return exit_code;
    }
}
