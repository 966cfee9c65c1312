#include "host/host_window.hpp"

#include "host/hotkeys.hpp"
#include "hub/tab_actions.hpp"
#include "hub/window_hub.hpp"
#include "logging/logger.hpp"

#include <windowsx.h>

#include <algorithm>
#include <exception>
#include <format>

namespace wh::host
{
    namespace
    {
        constexpr wchar_t k_window_class_name[] = L"WindowHubHost";
        constexpr UINT k_msg_refresh_tabs = WM_APP + 1;
        constexpr UINT k_msg_reconcile = WM_APP + 2;

        constexpr int k_max_tab_width_px = 220;
        constexpr int k_tab_padding_px = 8;

        [[nodiscard]] ATOM register_window_class() noexcept
        {
            WNDCLASSEXW wc{};
            wc.cbSize = sizeof(wc);
            wc.style = CS_HREDRAW | CS_VREDRAW;
            wc.lpfnWndProc = &HostWindow::window_proc;
            wc.hInstance = ::GetModuleHandleW(nullptr);
            wc.hCursor = ::LoadCursorW(nullptr, IDC_ARROW);
            wc.hbrBackground = reinterpret_cast<HBRUSH>(COLOR_APPWORKSPACE + 1);
            wc.lpszClassName = k_window_class_name;

            return ::RegisterClassExW(&wc);
        }
    }

    HostWindow::HostWindow(HostWindowConfig config, logging::Logger& logger) noexcept :
        _config(std::move(config)),
        _logger(logger)
    {
    }

    HostWindow::~HostWindow() noexcept
    {
        _hub = nullptr;
        if (_hwnd != nullptr)
        {
            ::DestroyWindow(_hwnd);
            _hwnd = nullptr;
        }
    }

    std::expected<std::unique_ptr<HostWindow>, core::Win32Error> HostWindow::create(
        HostWindowConfig config,
        logging::Logger& logger) noexcept
    {
        if (config.title.empty())
        {
            config.title = L"WindowHub";
        }

        std::unique_ptr<HostWindow> host;
        try
        {
            host = std::unique_ptr<HostWindow>(new HostWindow(std::move(config), logger));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(core::from_dword(ERROR_OUTOFMEMORY));
        }

        if (!host->create_window())
        {
            return std::unexpected(core::from_dword(::GetLastError()));
        }
        return host;
    }

    bool HostWindow::create_window() noexcept
    {
        static ATOM atom = 0;
        if (atom == 0)
        {
            atom = register_window_class();
            if (atom == 0 && ::GetLastError() == ERROR_CLASS_ALREADY_EXISTS)
            {
                atom = 1;
            }
        }

        if (atom == 0)
        {
            return false;
        }

        // WS_CLIPCHILDREN keeps the container from painting over the panes.
        _hwnd = ::CreateWindowExW(
            0,
            k_window_class_name,
            _config.title.c_str(),
            WS_OVERLAPPEDWINDOW | WS_CLIPCHILDREN,
            CW_USEDEFAULT,
            CW_USEDEFAULT,
            std::max(1, _config.initial_width_px),
            std::max(1, _config.initial_height_px),
            nullptr,
            nullptr,
            ::GetModuleHandleW(nullptr),
            this);
        if (_hwnd == nullptr)
        {
            return false;
        }

        ::ShowWindow(_hwnd, _config.show_command);
        ::UpdateWindow(_hwnd);
        return true;
    }

    void HostWindow::attach_hub(hub::WindowHub* const hub)
    {
        if (_hub != nullptr)
        {
            _hub->set_event_sink(nullptr);
        }

        _hub = hub;
        if (_hub != nullptr)
        {
            _hub->set_event_sink(this);
            handle_resize();
        }
        post_refresh();
    }

    int HostWindow::run() noexcept
    {
        if (_hwnd == nullptr)
        {
            return static_cast<int>(ERROR_INVALID_WINDOW_HANDLE);
        }

        MSG msg{};
        while (true)
        {
            const BOOL result = ::GetMessageW(&msg, nullptr, 0, 0);
            if (result == 0)
            {
                break;
            }
            if (result == -1)
            {
                return static_cast<int>(::GetLastError());
            }

            ::TranslateMessage(&msg);
            ::DispatchMessageW(&msg);
        }

        return static_cast<int>(msg.wParam);
    }

    void HostWindow::request_close() noexcept
    {
        if (_hwnd != nullptr)
        {
            (void)::PostMessageW(_hwnd, WM_CLOSE, 0, 0);
        }
    }

    void HostWindow::request_reconcile() noexcept
    {
        if (_hwnd != nullptr)
        {
            (void)::PostMessageW(_hwnd, k_msg_reconcile, 0, 0);
        }
    }

    HWND HostWindow::hwnd() const noexcept
    {
        return _hwnd;
    }

    window::PaneRect HostWindow::pane_rect() const noexcept
    {
        RECT client{};
        if (_hwnd == nullptr || ::GetClientRect(_hwnd, &client) == FALSE)
        {
            return {};
        }

        const int top = std::min(_config.tab_bar_height_px, static_cast<int>(client.bottom));
        return window::PaneRect{
            .x = 0,
            .y = top,
            .width = client.right,
            .height = client.bottom - top,
        };
    }

    void HostWindow::post_refresh() noexcept
    {
        if (_hwnd != nullptr)
        {
            (void)::PostMessageW(_hwnd, k_msg_refresh_tabs, 0, 0);
        }
    }

    void HostWindow::session_created(const hub::SessionInfo& /*session*/) noexcept
    {
        post_refresh();
    }

    void HostWindow::session_closed(const hub::SessionInfo& /*session*/, const hub::CloseReason /*reason*/) noexcept
    {
        post_refresh();
    }

    void HostWindow::session_activated(const hub::SessionInfo& /*session*/) noexcept
    {
        post_refresh();
    }

    void HostWindow::session_updated(const hub::SessionInfo& /*session*/) noexcept
    {
        post_refresh();
    }

    LRESULT CALLBACK HostWindow::window_proc(const HWND hwnd, const UINT msg, const WPARAM wparam, const LPARAM lparam) noexcept
    {
        if (msg == WM_NCCREATE)
        {
            const auto* create = reinterpret_cast<const CREATESTRUCTW*>(lparam);
            auto* self = static_cast<HostWindow*>(create->lpCreateParams);
            ::SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
            self->_hwnd = hwnd;
        }

        auto* self = reinterpret_cast<HostWindow*>(::GetWindowLongPtrW(hwnd, GWLP_USERDATA));
        if (self != nullptr)
        {
            return self->handle_message(msg, wparam, lparam);
        }

        return ::DefWindowProcW(hwnd, msg, wparam, lparam);
    }

    LRESULT HostWindow::handle_message(const UINT msg, const WPARAM wparam, const LPARAM lparam) noexcept
    {
        try
        {
            switch (msg)
            {
            case k_msg_refresh_tabs:
                refresh_tabs();
                return 0;
            case k_msg_reconcile:
                if (_hub != nullptr)
                {
                    (void)_hub->reconcile_now();
                }
                return 0;
            case WM_ACTIVATE:
                if (LOWORD(wparam) == WA_INACTIVE)
                {
                    unregister_hotkeys();
                }
                else
                {
                    register_hotkeys();
                }
                break;
            case WM_HOTKEY:
                handle_hotkey(static_cast<int>(wparam));
                return 0;
            case WM_SIZE:
                handle_resize();
                return 0;
            case WM_PAINT:
                handle_paint();
                return 0;
            case WM_LBUTTONDOWN:
                handle_tab_click(GET_X_LPARAM(lparam), GET_Y_LPARAM(lparam), false);
                return 0;
            case WM_MBUTTONUP:
                handle_tab_click(GET_X_LPARAM(lparam), GET_Y_LPARAM(lparam), true);
                return 0;
            case WM_SETFOCUS:
                // Keyboard input belongs to the active tab.
                if (_hub != nullptr && _active)
                {
                    if (auto activated = _hub->request_activate(*_active); !activated)
                    {
                        _logger.log(logging::LogLevel::debug, L"Refocusing session {} failed: {}", hub::to_value(*_active), hub::to_string(activated.error().code));
                    }
                }
                return 0;
            case WM_CLOSE:
                if (_hub != nullptr)
                {
                    // Every embedded window goes back to the desktop before
                    // the container is destroyed.
                    _hub->shutdown();
                }
                ::DestroyWindow(_hwnd);
                return 0;
            case WM_DESTROY:
                unregister_hotkeys();
                if (_hub != nullptr)
                {
                    _hub->set_event_sink(nullptr);
                    _hub = nullptr;
                }
                _hwnd = nullptr;
                ::PostQuitMessage(0);
                return 0;
            default:
                break;
            }
        }
        catch (const std::exception&)
        {
            ::OutputDebugStringW(L"[windowhub] host window message handler failed\n");
            return 0;
        }

        return ::DefWindowProcW(_hwnd, msg, wparam, lparam);
    }

    void HostWindow::refresh_tabs()
    {
        _tabs.clear();
        _active.reset();

        std::wstring caption = _config.title;
        if (_hub != nullptr)
        {
            for (const hub::Session& session : _hub->sessions())
            {
                _tabs.push_back(Tab{ .id = session.id, .title = session.title });
            }
            _active = _hub->active();

            const auto active_tab = std::find_if(_tabs.begin(), _tabs.end(), [this](const Tab& tab) {
                return _active && tab.id == *_active;
            });
            if (active_tab != _tabs.end() && !active_tab->title.empty())
            {
                caption = std::format(L"{} - {}", _config.title, active_tab->title);
            }
        }

        if (_hwnd != nullptr)
        {
            (void)::SetWindowTextW(_hwnd, caption.c_str());
            RECT strip{ 0, 0, 0, _config.tab_bar_height_px };
            RECT client{};
            if (::GetClientRect(_hwnd, &client) != FALSE)
            {
                strip.right = client.right;
            }
            (void)::InvalidateRect(_hwnd, &strip, TRUE);
        }
    }

    void HostWindow::handle_resize()
    {
        if (_hub == nullptr || _hwnd == nullptr || ::IsIconic(_hwnd) != FALSE)
        {
            return;
        }
        _hub->set_pane_rect(pane_rect());
    }

    int HostWindow::tab_width() const noexcept
    {
        RECT client{};
        if (_tabs.empty() || _hwnd == nullptr || ::GetClientRect(_hwnd, &client) == FALSE)
        {
            return 0;
        }
        return std::min(k_max_tab_width_px, static_cast<int>(client.right) / static_cast<int>(_tabs.size()));
    }

    std::optional<std::size_t> HostWindow::tab_at(const int x, const int y) const noexcept
    {
        const int width = tab_width();
        if (width <= 0 || y < 0 || y >= _config.tab_bar_height_px || x < 0)
        {
            return std::nullopt;
        }

        const auto index = static_cast<std::size_t>(x / width);
        if (index >= _tabs.size())
        {
            return std::nullopt;
        }
        return index;
    }

    void HostWindow::handle_tab_click(const int x, const int y, const bool close)
    {
        const std::optional<std::size_t> index = tab_at(x, y);
        if (!index || _hub == nullptr)
        {
            return;
        }

        const hub::SessionId id = _tabs[*index].id;
        auto result = close ? _hub->request_close(id) : _hub->request_activate(id);
        if (!result)
        {
            _logger.log(logging::LogLevel::debug, L"Tab request for session {} failed: {}", hub::to_value(id), hub::to_string(result.error().code));
        }
        post_refresh();
    }

    void HostWindow::register_hotkeys() noexcept
    {
        if (_hotkeys_registered || _hwnd == nullptr)
        {
            return;
        }

        for (const HotkeyBinding& binding : kHotkeyBindings)
        {
            if (::RegisterHotKey(_hwnd, binding.id, binding.modifiers | MOD_NOREPEAT, binding.virtual_key) == FALSE)
            {
                // Another application owns the combination; the rest still work.
                const DWORD error = ::GetLastError();
                try
                {
                    _logger.log(logging::LogLevel::warning, L"RegisterHotKey {} failed (error={})", binding.id, error);
                }
                catch (const std::exception&)
                {
                    ::OutputDebugStringW(L"[windowhub] hotkey registration failure not logged\n");
                }
            }
        }
        _hotkeys_registered = true;
    }

    void HostWindow::unregister_hotkeys() noexcept
    {
        if (!_hotkeys_registered || _hwnd == nullptr)
        {
            return;
        }

        for (const HotkeyBinding& binding : kHotkeyBindings)
        {
            // Bindings whose registration failed report ERROR_HOTKEY_NOT_REGISTERED.
            (void)::UnregisterHotKey(_hwnd, binding.id);
        }
        _hotkeys_registered = false;
    }

    void HostWindow::handle_hotkey(const int id)
    {
        const HotkeyBinding* const binding = find_hotkey(id);
        if (binding == nullptr || _hub == nullptr)
        {
            return;
        }

        const std::optional<std::wstring> chord = chord_text(binding->modifiers, binding->virtual_key);
        const std::optional<hub::TabAction> action = chord ? hub::parse_chord(*chord) : std::nullopt;
        if (!action)
        {
            _logger.log(logging::LogLevel::warning, L"Hotkey {} has no tab action", id);
            return;
        }

        if (auto dispatched = _hub->dispatch(*action); !dispatched)
        {
            _logger.log(logging::LogLevel::debug, L"Hotkey {} ({}) failed: {}", id, *chord, hub::to_string(dispatched.error().code));
        }
        post_refresh();
    }

    void HostWindow::handle_paint() noexcept
    {
        PAINTSTRUCT ps{};
        const HDC dc = ::BeginPaint(_hwnd, &ps);
        if (dc == nullptr)
        {
            return;
        }

        RECT client{};
        (void)::GetClientRect(_hwnd, &client);
        RECT strip{ 0, 0, client.right, _config.tab_bar_height_px };
        (void)::FillRect(dc, &strip, ::GetSysColorBrush(COLOR_BTNFACE));

        const int width = tab_width();
        (void)::SetBkMode(dc, TRANSPARENT);
        for (std::size_t index = 0; index < _tabs.size() && width > 0; ++index)
        {
            const Tab& tab = _tabs[index];
            RECT cell{
                static_cast<LONG>(index) * width,
                0,
                static_cast<LONG>(index + 1) * width,
                _config.tab_bar_height_px,
            };

            const bool active = _active && tab.id == *_active;
            if (active)
            {
                (void)::FillRect(dc, &cell, ::GetSysColorBrush(COLOR_WINDOW));
            }
            (void)::DrawEdge(dc, &cell, EDGE_ETCHED, BF_RIGHT);

            RECT text = cell;
            text.left += k_tab_padding_px;
            text.right -= k_tab_padding_px;
            (void)::SetTextColor(dc, ::GetSysColor(active ? COLOR_WINDOWTEXT : COLOR_GRAYTEXT));
            (void)::DrawTextW(
                dc,
                tab.title.c_str(),
                static_cast<int>(tab.title.size()),
                &text,
                DT_SINGLELINE | DT_VCENTER | DT_END_ELLIPSIS | DT_NOPREFIX);
        }

        ::EndPaint(_hwnd, &ps);
    }
}
