#include "utf.h"
#include <utf8proc.h>

int utf8_decode(const char* str, size_t len, uint32_t* codepoint) {
    if (!str || len == 0) {
        if (codepoint) *codepoint = 0;
        return 0;
    }
    unsigned char lead = (unsigned char)str[0];
    if (lead < 0x80) {
        if (codepoint) *codepoint = lead;
        return 1;
    }
    utf8proc_int32_t cp = 0;
    utf8proc_ssize_t n = utf8proc_iterate((const utf8proc_uint8_t*)str, (utf8proc_ssize_t)len, &cp);
    if (n <= 0 || cp < 0) {
        if (codepoint) *codepoint = 0xFFFD;
        return 1;
    }
    if (codepoint) *codepoint = (uint32_t)cp;
    return (int)n;
}

size_t utf8_prev_offset(const char* str, size_t pos) {
    if (!str || pos == 0) return 0;
    size_t start = pos - 1;
    // back over at most three continuation bytes
    int steps = 0;
    while (start > 0 && steps < 3 && ((unsigned char)str[start] & 0xC0) == 0x80) {
        start--;
        steps++;
    }
    uint32_t cp;
    int n = utf8_decode(str + start, pos - start, &cp);
    // a malformed tail decodes one byte at a time
    if ((size_t)n != pos - start) return pos - 1;
    return start;
}
