#pragma once

namespace wh::app
{
    // Top-level orchestration of `windowhub.exe`:
    // config -> localization -> logging -> CLI parse -> mode dispatch.
    class Application final
    {
    public:
        [[nodiscard]] int run();
    };
}
