#pragma once

// Forced invalidate + synchronous redraw after structural window changes.
//
// Swap-chain based windows (browsers, Electron, games) do not reliably repaint
// after a reparent or resize because the compositor drops the paint messages
// across the process boundary. Every trigger point issues one unconditional
// pass; the pass is idempotent and a dead handle makes it a no-op.

#include "core/window_handle.hpp"
#include "window/window_system.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace wh::logging
{
    class Logger;
}

namespace wh::hub
{
    enum class RepaintTrigger : std::uint8_t
    {
        embed,
        release,
        resize,
        activation,
    };

    inline constexpr std::size_t kRepaintTriggerCount = 4;

    [[nodiscard]] constexpr std::wstring_view to_string(const RepaintTrigger trigger) noexcept
    {
        switch (trigger)
        {
        case RepaintTrigger::embed:
            return L"embed";
        case RepaintTrigger::release:
            return L"release";
        case RepaintTrigger::resize:
            return L"resize";
        case RepaintTrigger::activation:
            return L"activation";
        }
        return L"unknown";
    }

    class RepaintWatchdog final
    {
    public:
        RepaintWatchdog(window::WindowSystem& windows, logging::Logger& logger) noexcept;

        RepaintWatchdog(const RepaintWatchdog&) = delete;
        RepaintWatchdog& operator=(const RepaintWatchdog&) = delete;

        // Returns false when the window was already gone.
        bool force_repaint(core::WindowHandle window, RepaintTrigger trigger);

        // Passes issued for `trigger`, dead handles included.
        [[nodiscard]] std::uint64_t pass_count(RepaintTrigger trigger) const noexcept;

    private:
        window::WindowSystem& _windows;
        logging::Logger& _logger;
        std::array<std::atomic<std::uint64_t>, kRepaintTriggerCount> _passes{};
    };
}
