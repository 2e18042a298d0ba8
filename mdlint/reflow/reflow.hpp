// reflow.hpp - Markdown Reflow Engine
//
// Re-wraps the prose of a Markdown document to a target width, or to one
// sentence per line, without breaking inline constructs and without
// touching code, tables, headings, HTML or front matter.
//
// Pipeline per document:
//   classify_blocks -> (eligible blocks) scan_spans -> sentence split and
//   emphasis continuation -> tokenize -> pack_tokens -> measure_width
//
// The result is stable: reflowing the output again returns it unchanged.
// All functions are pure; they may be called from several threads at once.

#ifndef MDLINT_REFLOW_HPP
#define MDLINT_REFLOW_HPP

#include "reflow_options.hpp"
#include <stddef.h>
#include <string>
#include <vector>

namespace mdlint {

// Rewrapped paragraph and the bytes of the source it replaces.
struct ParagraphReflow {
    size_t start_byte;
    size_t end_byte;            // exclusive, line ending included
    std::string reflowed_text;  // ends with a newline when the source paragraph did
};

// Reflow every eligible block of a document; the rest is copied verbatim.
std::string reflow_markdown(const std::string& text, const ReflowOptions& options);

// Reflow one logical line or paragraph in isolation. Returns the output
// lines without line endings.
std::vector<std::string> reflow_line(const std::string& text, const ReflowOptions& options);

// Reflow the paragraph containing the 1-based line_number with default
// options at line_length. Returns false when that line is not part of a
// paragraph (code, heading, table, blank line, out of range).
bool reflow_paragraph_at_line(const std::string& content, size_t line_number, size_t line_length,
                              ParagraphReflow* out);

} // namespace mdlint

#endif // MDLINT_REFLOW_HPP
