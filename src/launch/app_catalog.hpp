#pragma once

// Launchable applications found in the Start Menu.
//
// Feeds the search/launch palette; the entries are paths accepted by
// `LaunchCapture::launch_and_embed`.

#include <string>
#include <string_view>
#include <vector>

namespace wh::launch
{
    struct AppEntry final
    {
        // File name without extension.
        std::wstring name;
        std::wstring path;
    };

    class AppCatalog final
    {
    public:
        static constexpr int default_max_depth = 3;

        // Per-user (`%APPDATA%`) and all-users (`%ProgramData%`) Start Menu
        // `Programs` folders that exist on this machine.
        [[nodiscard]] static std::vector<std::wstring> default_roots();

        [[nodiscard]] static std::vector<AppEntry> enumerate();

        // `.lnk` and `.exe` files up to `max_depth` levels below each root,
        // uninstallers skipped, sorted and de-duplicated by name ignoring case.
        [[nodiscard]] static std::vector<AppEntry> enumerate(const std::vector<std::wstring>& roots, int max_depth = default_max_depth);

        [[nodiscard]] static bool is_uninstaller(std::wstring_view name) noexcept;
    };
}
