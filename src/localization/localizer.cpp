#include "localization/localizer.hpp"

namespace wh::localization
{
    Localizer::Localizer(std::wstring locale) :
        _locale(std::move(locale))
    {
        if (_locale.empty())
        {
            _locale = detect_user_locale();
        }

        _use_simplified_chinese = _locale.starts_with(L"zh");
    }

    const std::wstring& Localizer::locale() const noexcept
    {
        return _locale;
    }

    std::wstring_view Localizer::text(const StringId id) const noexcept
    {
        if (_use_simplified_chinese)
        {
            switch (id)
            {
            case StringId::startup:
                return L"WindowHub 启动";
            case StringId::parse_failed:
                return L"命令行参数解析失败";
            case StringId::config_failed:
                return L"配置加载失败";
            case StringId::usage:
                return L"用法: windowhub [--embed 0x<窗口句柄>]... [--launch <路径>]... [--title <标题>] [--width <宽>] [--height <高>] [--tab-bar-height <高>] [--list] [--apps]";
            case StringId::dry_run_notice:
                return L"dry-run 已启用，跳过窗口嵌入与进程启动";
            case StringId::host_window_failed:
                return L"无法创建宿主窗口";
            case StringId::error_caption:
                return L"WindowHub 错误";
            case StringId::embed_permission_denied:
                return L"无法嵌入该窗口：目标以更高权限运行（例如管理员权限）";
            case StringId::embed_not_embeddable:
                return L"该窗口无法嵌入（已最小化、属于系统外壳或属于 WindowHub 本身）";
            case StringId::launch_failed:
                return L"启动失败";
            case StringId::launch_timeout:
                return L"应用已启动，但未检测到新窗口";
            case StringId::no_candidates:
                return L"没有可嵌入的窗口";
            case StringId::no_apps:
                return L"未在开始菜单中找到应用";
            default:
                return L"未知消息";
            }
        }

        switch (id)
        {
        case StringId::startup:
            return L"WindowHub starting";
        case StringId::parse_failed:
            return L"Command line parsing failed";
        case StringId::config_failed:
            return L"Configuration loading failed";
        case StringId::usage:
            return L"Usage: windowhub [--embed 0x<hwnd>]... [--launch <path>]... [--title <text>] [--width <n>] [--height <n>] [--tab-bar-height <n>] [--list] [--apps]";
        case StringId::dry_run_notice:
            return L"Dry-run enabled; embedding and process launch skipped";
        case StringId::host_window_failed:
            return L"Failed to create the host window";
        case StringId::error_caption:
            return L"WindowHub error";
        case StringId::embed_permission_denied:
            return L"This window cannot be embedded: it runs at a higher privilege level (for example as administrator)";
        case StringId::embed_not_embeddable:
            return L"This window cannot be embedded (minimized, part of the shell, or owned by WindowHub)";
        case StringId::launch_failed:
            return L"Failed to start the application";
        case StringId::launch_timeout:
            return L"The application started, but no new window was detected";
        case StringId::no_candidates:
            return L"No embeddable windows found";
        case StringId::no_apps:
            return L"No applications found in the Start Menu";
        default:
            return L"Unknown message";
        }
    }

    std::wstring Localizer::detect_user_locale()
    {
        wchar_t locale_buffer[LOCALE_NAME_MAX_LENGTH]{};
        const int size = ::GetUserDefaultLocaleName(locale_buffer, LOCALE_NAME_MAX_LENGTH);
        if (size <= 0)
        {
            return L"en-US";
        }
        return std::wstring(locale_buffer, locale_buffer + size - 1);
    }
}
