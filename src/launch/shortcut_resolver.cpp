#include "launch/shortcut_resolver.hpp"

#include <ShObjIdl.h>
#include <winrt/base.h>

#include <array>
#include <cwctype>

namespace wh::launch
{
    namespace
    {
        class CoInitScope final
        {
        public:
            explicit CoInitScope(const HRESULT result) noexcept :
                _result(result)
            {
            }

            ~CoInitScope() noexcept
            {
                if (SUCCEEDED(_result))
                {
                    ::CoUninitialize();
                }
            }

            CoInitScope(const CoInitScope&) = delete;
            CoInitScope& operator=(const CoInitScope&) = delete;

            // A thread already initialized for the other apartment model can
            // still use the shell link object.
            [[nodiscard]] bool usable() const noexcept
            {
                return SUCCEEDED(_result) || _result == RPC_E_CHANGED_MODE;
            }

            [[nodiscard]] HRESULT result() const noexcept
            {
                return _result;
            }

        private:
            HRESULT _result{ E_FAIL };
        };

        [[nodiscard]] std::unexpected<ShortcutError> failure(const wchar_t* const context, const HRESULT result) noexcept
        {
            return std::unexpected(ShortcutError{ .context = context, .result = result });
        }
    }

    bool is_shortcut_path(const std::wstring_view path) noexcept
    {
        constexpr std::wstring_view extension = L".lnk";
        if (path.size() < extension.size())
        {
            return false;
        }

        const std::wstring_view tail = path.substr(path.size() - extension.size());
        for (size_t index = 0; index < extension.size(); ++index)
        {
            if (std::towlower(tail[index]) != extension[index])
            {
                return false;
            }
        }
        return true;
    }

    std::expected<ResolvedShortcut, ShortcutError> resolve_shortcut(const std::wstring& path) noexcept
    {
        const CoInitScope coinit(::CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED | COINIT_DISABLE_OLE1DDE));
        if (!coinit.usable())
        {
            return failure(L"CoInitializeEx failed for shortcut resolution", coinit.result());
        }

        winrt::com_ptr<IShellLinkW> link;
        HRESULT hr = ::CoCreateInstance(CLSID_ShellLink, nullptr, CLSCTX_INPROC_SERVER, IID_PPV_ARGS(link.put()));
        if (FAILED(hr))
        {
            return failure(L"CoCreateInstance(CLSID_ShellLink) failed", hr);
        }

        winrt::com_ptr<IPersistFile> file = link.try_as<IPersistFile>();
        if (!file)
        {
            return failure(L"IShellLinkW does not expose IPersistFile", E_NOINTERFACE);
        }

        hr = file->Load(path.c_str(), STGM_READ);
        if (FAILED(hr))
        {
            return failure(L"IPersistFile::Load failed for shortcut", hr);
        }

        std::array<wchar_t, 4096> buffer{};
        hr = link->GetPath(buffer.data(), static_cast<int>(buffer.size()), nullptr, SLGP_RAWPATH);
        if (FAILED(hr) || hr == S_FALSE || buffer[0] == L'\0')
        {
            // Advertised (MSI) and shell-item shortcuts have no file target.
            return failure(L"Shortcut has no file system target", FAILED(hr) ? hr : E_INVALIDARG);
        }

        ResolvedShortcut resolved{};
        try
        {
            std::array<wchar_t, 4096> expanded{};
            const DWORD length = ::ExpandEnvironmentStringsW(buffer.data(), expanded.data(), static_cast<DWORD>(expanded.size()));
            resolved.target = (length != 0 && length <= expanded.size()) ? std::wstring(expanded.data()) : std::wstring(buffer.data());

            buffer.fill(L'\0');
            if (SUCCEEDED(link->GetArguments(buffer.data(), static_cast<int>(buffer.size()))))
            {
                resolved.arguments = buffer.data();
            }

            buffer.fill(L'\0');
            if (SUCCEEDED(link->GetWorkingDirectory(buffer.data(), static_cast<int>(buffer.size()))))
            {
                resolved.working_directory = buffer.data();
            }
        }
        catch (...)
        {
            return failure(L"Out of memory while reading shortcut", E_OUTOFMEMORY);
        }

        return resolved;
    }
}
