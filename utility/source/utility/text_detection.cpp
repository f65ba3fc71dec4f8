#include <utility/text_detection.hpp>

#include <algorithm>
#include <cstdint>

namespace Utility
{
    bool isValidUtf8(std::string_view data)
    {
        std::size_t i = 0;
        while (i < data.size())
        {
            const auto lead = static_cast<std::uint8_t>(data[i]);
            if (lead < 0x80)
            {
                ++i;
                continue;
            }

            std::size_t length = 0;
            std::uint32_t codePoint = 0;
            if ((lead & 0xE0) == 0xC0)
            {
                length = 2;
                codePoint = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length = 3;
                codePoint = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length = 4;
                codePoint = lead & 0x07;
            }
            else
                return false;

            if (i + length > data.size())
                return false;

            for (std::size_t j = 1; j < length; ++j)
            {
                const auto continuation = static_cast<std::uint8_t>(data[i + j]);
                if ((continuation & 0xC0) != 0x80)
                    return false;
                codePoint = (codePoint << 6) | (continuation & 0x3F);
            }

            // Overlong encodings:
            if ((length == 2 && codePoint < 0x80) || (length == 3 && codePoint < 0x800) ||
                (length == 4 && codePoint < 0x10000))
                return false;
            if (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
                return false;

            i += length;
        }
        return true;
    }

    bool looksLikeText(std::string_view data)
    {
        if (std::find(data.begin(), data.end(), '\0') != data.end())
            return false;
        return isValidUtf8(data);
    }
}
