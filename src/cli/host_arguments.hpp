#pragma once

// CLI parser for `windowhub.exe`.
//
// Tokenization follows `CommandLineToArgvW`; switches are consumed left to
// right and anything unknown is an error. Parsing is pure: no window or
// process is touched here.

#include "core/window_handle.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace wh::cli
{
    struct ParseError final
    {
        std::wstring message;
    };

    enum class HostMode
    {
        // Create the host container and run until closed.
        run,
        // Print the embeddable windows and exit.
        list_candidates,
        // Print the Start Menu application catalog and exit.
        list_apps,
        help,
    };

    class HostArguments final
    {
    public:
        static constexpr std::wstring_view embed_arg = L"--embed";
        static constexpr std::wstring_view launch_arg = L"--launch";
        static constexpr std::wstring_view list_arg = L"--list";
        static constexpr std::wstring_view apps_arg = L"--apps";
        static constexpr std::wstring_view title_arg = L"--title";
        static constexpr std::wstring_view width_arg = L"--width";
        static constexpr std::wstring_view height_arg = L"--height";
        static constexpr std::wstring_view tab_bar_height_arg = L"--tab-bar-height";
        static constexpr std::wstring_view help_arg = L"--help";
        static constexpr std::wstring_view short_help_arg = L"-?";

        static constexpr int default_width = 1280;
        static constexpr int default_height = 800;
        static constexpr int default_tab_bar_height = 36;

        // `command_line` is the full process command line, program name
        // first.
        [[nodiscard]] static std::expected<HostArguments, ParseError> parse(std::wstring_view command_line) noexcept;

        [[nodiscard]] HostMode mode() const noexcept
        {
            return _mode;
        }

        [[nodiscard]] const std::vector<core::WindowHandle>& embed_targets() const noexcept
        {
            return _embed_targets;
        }

        [[nodiscard]] const std::vector<std::wstring>& launch_targets() const noexcept
        {
            return _launch_targets;
        }

        // Empty unless `--title` was given; the configured title applies then.
        [[nodiscard]] const std::wstring& title() const noexcept
        {
            return _title;
        }

        [[nodiscard]] int width() const noexcept
        {
            return _width;
        }

        [[nodiscard]] int height() const noexcept
        {
            return _height;
        }

        [[nodiscard]] int tab_bar_height() const noexcept
        {
            return _tab_bar_height;
        }

    private:
        HostArguments() = default;

        [[nodiscard]] std::expected<void, ParseError> parse_tokens(const std::vector<std::wstring>& args);
        [[nodiscard]] static std::expected<std::wstring, ParseError> get_string_argument(const std::vector<std::wstring>& args, size_t& index);
        [[nodiscard]] static std::expected<int, ParseError> get_size_argument(const std::vector<std::wstring>& args, size_t& index, int minimum);
        [[nodiscard]] static std::expected<core::WindowHandle, ParseError> parse_window_handle(std::wstring_view text);

        HostMode _mode{ HostMode::run };
        std::vector<core::WindowHandle> _embed_targets;
        std::vector<std::wstring> _launch_targets;
        std::wstring _title;
        int _width{ default_width };
        int _height{ default_height };
        int _tab_bar_height{ default_tab_bar_height };
    };
}
