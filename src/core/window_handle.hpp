#pragma once

// A borrowed reference to a window owned by some process, possibly another
// one.
//
// The hub never owns a window: there is nothing to destroy and copies are
// free. The value may go stale at any moment, so every consumer re-validates
// (`WindowSystem::is_window`) before acting on it.

#include <Windows.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>

namespace wh::core
{
    class WindowHandle final
    {
    public:
        constexpr WindowHandle() noexcept = default;

        explicit constexpr WindowHandle(const HWND value) noexcept :
            _value(value)
        {
        }

        [[nodiscard]] static WindowHandle from_uintptr(const std::uintptr_t value) noexcept
        {
            return WindowHandle(reinterpret_cast<HWND>(value));
        }

        [[nodiscard]] constexpr HWND get() const noexcept
        {
            return _value;
        }

        [[nodiscard]] std::uintptr_t as_uintptr() const noexcept
        {
            return reinterpret_cast<std::uintptr_t>(_value);
        }

        [[nodiscard]] constexpr bool empty() const noexcept
        {
            return _value == nullptr;
        }

        [[nodiscard]] explicit constexpr operator bool() const noexcept
        {
            return _value != nullptr;
        }

        friend constexpr bool operator==(WindowHandle, WindowHandle) noexcept = default;

    private:
        HWND _value{ nullptr };
    };

    static_assert(sizeof(WindowHandle) == sizeof(HWND), "WindowHandle must remain layout-compatible with HWND");
    static_assert(std::is_trivially_copyable_v<WindowHandle>, "WindowHandle must remain trivially copyable");
}

template<>
struct std::hash<wh::core::WindowHandle>
{
    [[nodiscard]] std::size_t operator()(const wh::core::WindowHandle handle) const noexcept
    {
        return std::hash<std::uintptr_t>{}(handle.as_uintptr());
    }
};
