#include "launch/app_catalog.hpp"

#include "core/environment.hpp"
#include "core/unique_handle.hpp"

#include <Windows.h>

#include <algorithm>

namespace wh::launch
{
    namespace
    {
        constexpr std::wstring_view kProgramsSuffix = L"\\Microsoft\\Windows\\Start Menu\\Programs";

        [[nodiscard]] bool ends_with_ignore_case(const std::wstring_view text, const std::wstring_view suffix) noexcept
        {
            if (text.size() < suffix.size())
            {
                return false;
            }
            const std::wstring_view tail = text.substr(text.size() - suffix.size());
            return ::CompareStringOrdinal(
                       tail.data(),
                       static_cast<int>(tail.size()),
                       suffix.data(),
                       static_cast<int>(suffix.size()),
                       TRUE) == CSTR_EQUAL;
        }

        [[nodiscard]] int compare_ignore_case(const std::wstring& left, const std::wstring& right) noexcept
        {
            return ::CompareStringOrdinal(
                left.c_str(),
                static_cast<int>(left.size()),
                right.c_str(),
                static_cast<int>(right.size()),
                TRUE);
        }

        void scan_directory(const std::wstring& directory, const int depth, const int max_depth, std::vector<AppEntry>& apps)
        {
            if (depth > max_depth)
            {
                return;
            }

            const std::wstring pattern = directory + L"\\*";
            WIN32_FIND_DATAW data{};
            core::UniqueFindHandle search(::FindFirstFileExW(
                pattern.c_str(),
                FindExInfoBasic,
                &data,
                FindExSearchNameMatch,
                nullptr,
                FIND_FIRST_EX_LARGE_FETCH));
            if (!search.valid())
            {
                return;
            }

            do
            {
                const std::wstring_view name = data.cFileName;
                if (name == L"." || name == L"..")
                {
                    continue;
                }

                std::wstring full_path = directory + L"\\" + data.cFileName;
                if ((data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0)
                {
                    // Junctions in the Start Menu point back at known folders.
                    if ((data.dwFileAttributes & FILE_ATTRIBUTE_REPARSE_POINT) == 0)
                    {
                        scan_directory(full_path, depth + 1, max_depth, apps);
                    }
                    continue;
                }

                if (!ends_with_ignore_case(name, L".lnk") && !ends_with_ignore_case(name, L".exe"))
                {
                    continue;
                }

                std::wstring stem(name.substr(0, name.size() - 4));
                if (stem.empty() || AppCatalog::is_uninstaller(stem))
                {
                    continue;
                }

                apps.push_back(AppEntry{ .name = std::move(stem), .path = std::move(full_path) });
            } while (::FindNextFileW(search.get(), &data) != FALSE);
        }
    }

    bool AppCatalog::is_uninstaller(const std::wstring_view name) noexcept
    {
        return name.find(L"Uninstall") != std::wstring_view::npos ||
               name.find(L"卸载") != std::wstring_view::npos;
    }

    std::vector<std::wstring> AppCatalog::default_roots()
    {
        std::vector<std::wstring> roots;
        for (const wchar_t* const variable : { L"APPDATA", L"ProgramData" })
        {
            auto base = core::read_environment_variable(variable);
            if (!base || base->empty())
            {
                continue;
            }

            base->append(kProgramsSuffix);
            if (core::is_directory(*base))
            {
                roots.push_back(std::move(*base));
            }
        }
        return roots;
    }

    std::vector<AppEntry> AppCatalog::enumerate()
    {
        return enumerate(default_roots());
    }

    std::vector<AppEntry> AppCatalog::enumerate(const std::vector<std::wstring>& roots, const int max_depth)
    {
        std::vector<AppEntry> apps;
        for (const std::wstring& root : roots)
        {
            scan_directory(root, 1, max_depth, apps);
        }

        std::stable_sort(apps.begin(), apps.end(), [](const AppEntry& left, const AppEntry& right) {
            return compare_ignore_case(left.name, right.name) == CSTR_LESS_THAN;
        });

        const auto duplicate = std::unique(apps.begin(), apps.end(), [](const AppEntry& left, const AppEntry& right) {
            return compare_ignore_case(left.name, right.name) == CSTR_EQUAL;
        });
        apps.erase(duplicate, apps.end());
        return apps;
    }
}
