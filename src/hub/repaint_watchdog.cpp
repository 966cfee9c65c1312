#include "hub/repaint_watchdog.hpp"

#include "logging/logger.hpp"

namespace wh::hub
{
    RepaintWatchdog::RepaintWatchdog(window::WindowSystem& windows, logging::Logger& logger) noexcept :
        _windows(windows),
        _logger(logger)
    {
    }

    bool RepaintWatchdog::force_repaint(const core::WindowHandle window, const RepaintTrigger trigger)
    {
        _passes[static_cast<std::size_t>(trigger)].fetch_add(1, std::memory_order_relaxed);

        if (window.empty() || !_windows.redraw(window))
        {
            _logger.log(
                logging::LogLevel::trace,
                L"Repaint skipped after {} (hwnd=0x{:X}): window is gone",
                to_string(trigger),
                window.as_uintptr());
            return false;
        }
        return true;
    }

    std::uint64_t RepaintWatchdog::pass_count(const RepaintTrigger trigger) const noexcept
    {
        return _passes[static_cast<std::size_t>(trigger)].load(std::memory_order_relaxed);
    }
}
