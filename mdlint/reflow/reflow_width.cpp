// reflow_width.cpp - Visible length of text

#include "reflow_width.hpp"
#include "../../lib/utf.h"
#include <utf8proc.h>

namespace mdlint {

int codepoint_width(uint32_t codepoint) {
    if (codepoint < 0x80) return 1;
    if (codepoint > 0x10FFFF) return 1;
    int width = utf8proc_charwidth((utf8proc_int32_t)codepoint);
    return width < 0 ? 0 : width;
}

size_t measure_width(const char* text, size_t len, LengthMode mode) {
    if (!text || len == 0) return 0;
    if (mode == LengthMode::Bytes) return len;

    size_t width = 0;
    size_t pos = 0;
    while (pos < len) {
        unsigned char c = (unsigned char)text[pos];
        if (c < 0x80) {
            width++;
            pos++;
            continue;
        }
        uint32_t cp;
        int n = utf8_decode(text + pos, len - pos, &cp);
        width += mode == LengthMode::Chars ? 1 : (size_t)codepoint_width(cp);
        pos += (size_t)n;
    }
    return width;
}

} // namespace mdlint
