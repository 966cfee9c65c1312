#pragma once

// Periodic reconciliation of the Session Registry against the desktop.
//
// No cross-process notification exists for "a foreign window was destroyed,
// detached or retitled", so a worker thread wakes every `interval_ms` and
// checks each session. The worker only reads native state. When something
// changed it calls the wake handler, which must get the owner thread to call
// `reconcile_once()`; all removals, refits and notifications happen there,
// through `EmbeddingController::invalidate`, the same path as user releases.

#include "core/unique_handle.hpp"

#include <Windows.h>

#include <atomic>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>

namespace wh::logging
{
    class Logger;
}

namespace wh::window
{
    class WindowSystem;
}

namespace wh::hub
{
    class EmbeddingController;
    class SessionRegistry;

    inline constexpr DWORD kDefaultMonitorIntervalMs = 1000;

    struct MonitorError final
    {
        std::wstring context;
        DWORD win32_error{ ERROR_GEN_FAILURE };
    };

    struct ReconcileReport final
    {
        std::size_t checked{ 0 };
        std::size_t invalidated{ 0 };
        std::size_t retitled{ 0 };
        std::size_t restored{ 0 };
    };

    class ExternalChangeMonitor final
    {
    public:
        ExternalChangeMonitor(
            window::WindowSystem& windows,
            SessionRegistry& registry,
            EmbeddingController& controller,
            logging::Logger& logger,
            DWORD interval_ms) noexcept;

        ~ExternalChangeMonitor() noexcept
        {
            stop_and_join();
        }

        ExternalChangeMonitor(const ExternalChangeMonitor&) = delete;
        ExternalChangeMonitor& operator=(const ExternalChangeMonitor&) = delete;

        // Called on the worker thread; typically posts a message to the owner.
        using WakeHandler = std::function<void()>;

        [[nodiscard]] std::expected<void, MonitorError> start(WakeHandler wake) noexcept;
        void stop_and_join() noexcept;

        [[nodiscard]] bool running() const noexcept
        {
            return _thread.valid();
        }

        [[nodiscard]] DWORD interval_ms() const noexcept
        {
            return _interval_ms;
        }

        // Read-only: true when some session needs `reconcile_once`.
        [[nodiscard]] bool has_external_changes();

        // One reconciliation pass. Owner thread only.
        ReconcileReport reconcile_once();

    private:
        static DWORD WINAPI thread_proc(void* param) noexcept;

        window::WindowSystem& _windows;
        SessionRegistry& _registry;
        EmbeddingController& _controller;
        logging::Logger& _logger;
        DWORD _interval_ms;

        WakeHandler _wake;
        // Set when a wake is in flight; cleared by `reconcile_once`.
        std::atomic<bool> _wake_pending{ false };

        core::UniqueHandle _stop_event;
        core::UniqueHandle _thread;
    };
}
