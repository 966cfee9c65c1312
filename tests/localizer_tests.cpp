#include "localization/localizer.hpp"

namespace
{
    using wh::localization::Localizer;
    using wh::localization::StringId;

    bool test_english_catalog()
    {
        const Localizer localizer(L"en-US");
        return localizer.locale() == L"en-US" &&
               localizer.text(StringId::launch_timeout) == L"The application started, but no new window was detected" &&
               localizer.text(StringId::error_caption) == L"WindowHub error";
    }

    bool test_simplified_chinese_catalog()
    {
        const Localizer localizer(L"zh-CN");
        return localizer.text(StringId::launch_failed) == L"启动失败" &&
               localizer.text(StringId::no_candidates) == L"没有可嵌入的窗口";
    }

    bool test_unknown_locale_falls_back_to_english()
    {
        const Localizer localizer(L"fr-FR");
        return localizer.text(StringId::launch_failed) == L"Failed to start the application";
    }

    bool test_detected_locale_is_not_empty()
    {
        return !Localizer::detect_user_locale().empty();
    }
}

bool run_localizer_tests()
{
    return test_english_catalog() &&
           test_simplified_chinese_catalog() &&
           test_unknown_locale_falls_back_to_english() &&
           test_detected_locale_is_not_empty();
}
