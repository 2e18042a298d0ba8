// reflow_options.hpp - Reflow Engine Configuration
//
// Options consumed by the reflow engine, and the mapping from the
// line-length rule's resolved settings (line-length, reflow-mode,
// length-mode, abbreviations) onto them. Options are plain values built
// once per invocation; the engine never mutates them.

#ifndef MDLINT_REFLOW_OPTIONS_HPP
#define MDLINT_REFLOW_OPTIONS_HPP

#include "../../lib/log.h"
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace mdlint {

// ============================================================================
// Constants
// ============================================================================

constexpr size_t DEFAULT_LINE_LENGTH = 80;

// ============================================================================
// Modes
// ============================================================================

enum class LengthMode : uint8_t {
    Chars,      // Unicode scalar values
    Visual,     // terminal columns: wide CJK and emoji count 2, combining marks 0
    Bytes,      // UTF-8 encoded length
};

enum class ReflowMode : uint8_t {
    Default,          // rewrap paragraphs that exceed the limit
    Normalize,        // rewrap every paragraph to the full width
    SentencePerLine,  // one sentence per line
};

// ============================================================================
// Options
// ============================================================================

struct ReflowOptions {
    size_t line_length;                      // target width, 0 = unlimited
    bool break_on_sentences;                 // start a sentence on a fresh line when it would not fit
    bool preserve_breaks;                    // reflow every source line on its own
    bool sentence_per_line;                  // one sentence per output line
    bool semantic_line_breaks;               // one sentence per line, long sentences wrapped
    std::vector<std::string> abbreviations;  // merged with the built-in table
    LengthMode length_mode;                  // how line width is measured

    static ReflowOptions defaults() {
        return ReflowOptions{
            .line_length = DEFAULT_LINE_LENGTH,
            .break_on_sentences = false,
            .preserve_breaks = false,
            .sentence_per_line = false,
            .semantic_line_breaks = false,
            .abbreviations = {},
            .length_mode = LengthMode::Chars,
        };
    }

    bool splits_sentences() const { return sentence_per_line || semantic_line_breaks; }
};

// Line-length rule settings as resolved by the configuration loader.
struct ReflowConfig {
    size_t line_length;                      // line-length, default 80
    bool reflow;                             // autofix enabled; checked by the caller, not by the mapping
    ReflowMode reflow_mode;
    LengthMode length_mode;
    std::vector<std::string> abbreviations;  // extra abbreviations, periods optional

    static ReflowConfig defaults() {
        return ReflowConfig{
            .line_length = DEFAULT_LINE_LENGTH,
            .reflow = false,
            .reflow_mode = ReflowMode::Default,
            .length_mode = LengthMode::Chars,
            .abbreviations = {},
        };
    }
};

// ============================================================================
// API
// ============================================================================

// Parse a user-facing mode name. Returns false and leaves *out untouched
// for an unknown name.
bool parse_length_mode(const char* name, LengthMode* out);
bool parse_reflow_mode(const char* name, ReflowMode* out);

const char* length_mode_name(LengthMode mode);
const char* reflow_mode_name(ReflowMode mode);

// Default keeps source line breaks and Normalize joins them; both break
// on sentence ends. The `reflow` flag is not consulted: callers skip the
// engine entirely when autofix is off.
ReflowOptions reflow_options_from_config(const ReflowConfig& config);

// Log category shared by the reflow sources ("mdlint.reflow").
log_category_t* reflow_log();

} // namespace mdlint

#endif // MDLINT_REFLOW_OPTIONS_HPP
