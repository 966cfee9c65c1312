#pragma once

// Move-only owners for the handful of Win32 resource kinds the hub holds:
// kernel handles (launched processes, monitor threads, stop events),
// thread-pool timers (deferred focus detachment), directory searches (the
// application catalog) and LocalAlloc blocks (`CommandLineToArgvW` results).

#include <Windows.h>

#include <type_traits>

namespace wh::core
{
    struct KernelHandleTraits final
    {
        using pointer = HANDLE;

        [[nodiscard]] static bool valid(const HANDLE value) noexcept
        {
            return value != nullptr && value != INVALID_HANDLE_VALUE;
        }

        static void close(const HANDLE value) noexcept
        {
            ::CloseHandle(value);
        }
    };

    struct ThreadpoolTimerTraits final
    {
        using pointer = PTP_TIMER;

        [[nodiscard]] static bool valid(const PTP_TIMER value) noexcept
        {
            return value != nullptr;
        }

        static void close(const PTP_TIMER value) noexcept
        {
            // Cancel, drain in-flight callbacks, then free.
            ::SetThreadpoolTimer(value, nullptr, 0, 0);
            ::WaitForThreadpoolTimerCallbacks(value, TRUE);
            ::CloseThreadpoolTimer(value);
        }
    };

    struct FindFileTraits final
    {
        using pointer = HANDLE;

        [[nodiscard]] static bool valid(const HANDLE value) noexcept
        {
            return value != nullptr && value != INVALID_HANDLE_VALUE;
        }

        static void close(const HANDLE value) noexcept
        {
            ::FindClose(value);
        }
    };

    struct LocalMemoryTraits final
    {
        using pointer = void*;

        [[nodiscard]] static bool valid(void* const value) noexcept
        {
            return value != nullptr;
        }

        static void close(void* const value) noexcept
        {
            ::LocalFree(value);
        }
    };

    template<typename Traits>
    class UniqueResource final
    {
    public:
        using pointer = typename Traits::pointer;

        UniqueResource() noexcept = default;

        explicit UniqueResource(pointer value) noexcept :
            _value(value)
        {
        }

        ~UniqueResource() noexcept
        {
            reset();
        }

        UniqueResource(const UniqueResource&) = delete;
        UniqueResource& operator=(const UniqueResource&) = delete;

        UniqueResource(UniqueResource&& other) noexcept :
            _value(other.release())
        {
        }

        UniqueResource& operator=(UniqueResource&& other) noexcept
        {
            if (this != &other)
            {
                reset(other.release());
            }
            return *this;
        }

        [[nodiscard]] pointer get() const noexcept
        {
            return _value;
        }

        template<typename T>
        [[nodiscard]] T* as() const noexcept
            requires std::is_same_v<pointer, void*>
        {
            return static_cast<T*>(_value);
        }

        [[nodiscard]] pointer* put() noexcept
        {
            reset();
            return &_value;
        }

        [[nodiscard]] bool valid() const noexcept
        {
            return Traits::valid(_value);
        }

        pointer release() noexcept
        {
            pointer detached = _value;
            _value = nullptr;
            return detached;
        }

        void reset(pointer replacement = nullptr) noexcept
        {
            if (Traits::valid(_value))
            {
                Traits::close(_value);
            }
            _value = replacement;
        }

    private:
        pointer _value{ nullptr };
    };

    using UniqueHandle = UniqueResource<KernelHandleTraits>;
    using UniqueThreadpoolTimer = UniqueResource<ThreadpoolTimerTraits>;
    using UniqueFindHandle = UniqueResource<FindFileTraits>;
    using UniqueLocalPtr = UniqueResource<LocalMemoryTraits>;
}
