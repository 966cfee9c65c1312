#include "cli/host_arguments.hpp"

#include "core/unique_handle.hpp"
#include "serialization/fast_number.hpp"

#include <Windows.h>
#include <shellapi.h>

#include <format>
#include <cstdint>
#include <limits>
#include <new>

namespace wh::cli
{
    std::expected<HostArguments, ParseError> HostArguments::parse(const std::wstring_view command_line) noexcept
    {
        HostArguments result{};
        if (command_line.empty())
        {
            return result;
        }

        try
        {
            const std::wstring mutable_command_line(command_line);
            int argc = 0;
            core::UniqueLocalPtr argv(::CommandLineToArgvW(mutable_command_line.c_str(), &argc));
            if (!argv.valid())
            {
                return std::unexpected(ParseError{ .message = L"CommandLineToArgvW failed" });
            }

            std::vector<std::wstring> args;
            args.reserve(argc > 0 ? static_cast<size_t>(argc) - 1 : 0);

            auto** argv_values = argv.as<wchar_t*>();
            for (int index = 1; index < argc; ++index)
            {
                args.emplace_back(argv_values[index]);
            }

            if (auto parsed = result.parse_tokens(args); !parsed)
            {
                return std::unexpected(parsed.error());
            }
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ParseError{ .message = L"Out of memory while parsing the command line" });
        }

        return result;
    }

    std::expected<void, ParseError> HostArguments::parse_tokens(const std::vector<std::wstring>& args)
    {
        for (size_t index = 0; index < args.size();)
        {
            const std::wstring& arg = args[index];

            if (arg == embed_arg)
            {
                auto value = get_string_argument(args, index);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                auto handle = parse_window_handle(value.value());
                if (!handle)
                {
                    return std::unexpected(handle.error());
                }
                _embed_targets.push_back(handle.value());
                continue;
            }

            if (arg == launch_arg)
            {
                auto value = get_string_argument(args, index);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                _launch_targets.push_back(std::move(value.value()));
                continue;
            }

            if (arg == title_arg)
            {
                auto value = get_string_argument(args, index);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                _title = std::move(value.value());
                continue;
            }

            if (arg == width_arg || arg == height_arg)
            {
                auto value = get_size_argument(args, index, 200);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                (arg == width_arg ? _width : _height) = value.value();
                continue;
            }

            if (arg == tab_bar_height_arg)
            {
                auto value = get_size_argument(args, index, 0);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                _tab_bar_height = value.value();
                continue;
            }

            if (arg == list_arg)
            {
                _mode = HostMode::list_candidates;
                ++index;
                continue;
            }

            if (arg == apps_arg)
            {
                _mode = HostMode::list_apps;
                ++index;
                continue;
            }

            if (arg == help_arg || arg == short_help_arg)
            {
                _mode = HostMode::help;
                ++index;
                continue;
            }

            return std::unexpected(ParseError{ .message = std::format(L"Unknown argument: {}", arg) });
        }

        return {};
    }

    std::expected<std::wstring, ParseError> HostArguments::get_string_argument(const std::vector<std::wstring>& args, size_t& index)
    {
        if (index + 1 >= args.size())
        {
            return std::unexpected(ParseError{ .message = std::format(L"Expected value after {}", args[index]) });
        }

        std::wstring value = args[index + 1];
        index += 2;
        return value;
    }

    std::expected<int, ParseError> HostArguments::get_size_argument(const std::vector<std::wstring>& args, size_t& index, const int minimum)
    {
        const std::wstring name = args[index];
        auto text = get_string_argument(args, index);
        if (!text)
        {
            return std::unexpected(text.error());
        }

        auto value = serialization::parse_i32(text.value());
        if (!value || value.value() < minimum)
        {
            return std::unexpected(ParseError{ .message = std::format(L"Invalid value for {}: {}", name, text.value()) });
        }
        return value.value();
    }

    std::expected<core::WindowHandle, ParseError> HostArguments::parse_window_handle(const std::wstring_view text)
    {
        auto value = serialization::parse_hex_u64(text, true);
        if (!value || value.value() == 0 || value.value() > std::numeric_limits<std::uintptr_t>::max())
        {
            return std::unexpected(ParseError{ .message = std::format(L"Invalid window handle: {}", text) });
        }
        return core::WindowHandle::from_uintptr(static_cast<std::uintptr_t>(value.value()));
    }
}
