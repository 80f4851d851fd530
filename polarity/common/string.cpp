/*******************************************************************************
 * polarity/common/string.cpp
 *
 * Some string helper functions
 *
 * Part of Project Polarity
 *
 * Copyright (C) 2015 Timo Bingmann <tb@panthema.net>
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/common/string.hpp>

#include <cstdint>
#include <vector>

namespace polarity {
namespace common {

std::string str_snprintf(size_t max_size, const char* fmt, ...) {
    std::vector<char> s(max_size + 1);

    va_list args;
    va_start(args, fmt);

    int len = std::vsnprintf(s.data(), s.size(), fmt, args);

    va_end(args);

    if (len < 0) return std::string();
    if (static_cast<size_t>(len) > max_size) len = static_cast<int>(max_size);

    return std::string(s.data(), s.data() + len);
}

std::string FormatFixed2(double value) {
    // doubles of any magnitude fit into 340 digits plus sign and fraction
    return str_snprintf(350, "%.2f", value);
}

bool IsValidUtf8(const char* data, size_t size) {
    const uint8_t* s = reinterpret_cast<const uint8_t*>(data);
    const uint8_t* end = s + size;

    while (s < end) {
        uint8_t c = *s;

        if (c < 0x80) {
            ++s;
            continue;
        }

        size_t len;
        uint32_t cp;

        if ((c & 0xE0) == 0xC0) {
            len = 2, cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0) {
            len = 3, cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0) {
            len = 4, cp = c & 0x07;
        }
        else {
            // continuation byte without lead or invalid lead byte
            return false;
        }

        if (static_cast<size_t>(end - s) < len) return false;

        for (size_t i = 1; i < len; ++i) {
            if ((s[i] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i] & 0x3F);
        }

        // overlong encodings
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000))
            return false;

        // UTF-16 surrogates and beyond the Unicode range
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;

        s += len;
    }

    return true;
}

} // namespace common
} // namespace polarity

/******************************************************************************/
