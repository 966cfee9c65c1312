#pragma once

#include <Windows.h>

#include <string>
#include <string_view>

namespace wh::localization
{
    enum class StringId
    {
        startup,
        parse_failed,
        config_failed,
        usage,
        dry_run_notice,
        host_window_failed,
        error_caption,
        embed_permission_denied,
        embed_not_embeddable,
        launch_failed,
        launch_timeout,
        no_candidates,
        no_apps,
    };

    class Localizer final
    {
    public:
        explicit Localizer(std::wstring locale);

        [[nodiscard]] const std::wstring& locale() const noexcept;
        [[nodiscard]] std::wstring_view text(StringId id) const noexcept;
        [[nodiscard]] static std::wstring detect_user_locale();

    private:
        bool _use_simplified_chinese{ false };
        std::wstring _locale;
    };
}
