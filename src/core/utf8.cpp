#include "core/utf8.h"

#include <cstdint>

namespace rubric::utf8
{
bool DecodeOne(const char* data, std::size_t len, std::size_t& i, char32_t& out_cp)
{
    out_cp = U'\0';
    if (i >= len)
        return false;

    const std::uint8_t c = (std::uint8_t)data[i];
    if ((c & 0x80u) == 0)
    {
        out_cp = (char32_t)c;
        i += 1;
        return true;
    }

    std::size_t remaining = 0;
    char32_t cp = 0;
    if ((c & 0xE0u) == 0xC0u) { cp = c & 0x1Fu; remaining = 1; }
    else if ((c & 0xF0u) == 0xE0u) { cp = c & 0x0Fu; remaining = 2; }
    else if ((c & 0xF8u) == 0xF0u) { cp = c & 0x07u; remaining = 3; }
    else
    {
        i += 1;
        return false;
    }

    if (i + remaining >= len)
    {
        i += 1;
        return false;
    }

    for (std::size_t j = 0; j < remaining; ++j)
    {
        const std::uint8_t cc = (std::uint8_t)data[i + 1 + j];
        if ((cc & 0xC0u) != 0x80u)
        {
            i += 1;
            return false;
        }
        cp = (cp << 6) | (cc & 0x3Fu);
    }

    // Overlong forms, surrogates and out of range scalars are malformed input.
    static constexpr char32_t kMinForLength[4] = {0, 0x80u, 0x800u, 0x10000u};
    if (cp < kMinForLength[remaining] || (cp >= 0xD800u && cp <= 0xDFFFu) || cp > 0x10FFFFu)
    {
        i += 1;
        return false;
    }

    i += 1 + remaining;
    out_cp = cp;
    return true;
}
} // namespace rubric::utf8
