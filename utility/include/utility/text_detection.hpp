#pragma once

#include <string_view>

namespace Utility
{
    /**
     * @brief Checks that data is well formed UTF-8 (no overlong forms, no surrogates, nothing above U+10FFFF).
     */
    bool isValidUtf8(std::string_view data);

    /**
     * @brief Best effort guess whether file content is text. Text means valid UTF-8 without NUL bytes.
     */
    bool looksLikeText(std::string_view data);
}
