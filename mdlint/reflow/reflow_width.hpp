// reflow_width.hpp - Visible Length of Text
//
// Measures a span of UTF-8 text under one of the three length modes.
// Visual widths follow utf8proc's East Asian Width and emoji-presentation
// tables: wide and fullwidth characters take 2 columns, combining and
// other zero-width characters take none.

#ifndef MDLINT_REFLOW_WIDTH_HPP
#define MDLINT_REFLOW_WIDTH_HPP

#include "reflow_options.hpp"
#include <stddef.h>
#include <stdint.h>
#include <string>

namespace mdlint {

// Columns taken by one scalar value in Visual mode: 0, 1 or 2.
int codepoint_width(uint32_t codepoint);

// Never fails: malformed bytes count as one unit each.
size_t measure_width(const char* text, size_t len, LengthMode mode);

inline size_t measure_width(const std::string& text, LengthMode mode) {
    return measure_width(text.data(), text.size(), mode);
}

} // namespace mdlint

#endif // MDLINT_REFLOW_WIDTH_HPP
