#pragma once
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Decode the scalar value starting at str. Malformed sequences decode as
// U+FFFD and consume one byte. Returns the bytes consumed, 0 only when len is 0.
int utf8_decode(const char* str, size_t len, uint32_t* codepoint);
// Byte offset of the scalar that ends right before pos (0 when pos is 0).
size_t utf8_prev_offset(const char* str, size_t pos);

#ifdef __cplusplus
}
#endif
