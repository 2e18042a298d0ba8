// reflow_options.cpp - Reflow configuration helpers

#include "reflow_options.hpp"
#include <string.h>
#include <strings.h>

namespace mdlint {

log_category_t* reflow_log() {
    static log_category_t* category = log_get_category("mdlint.reflow");
    return category;
}

bool parse_length_mode(const char* name, LengthMode* out) {
    if (!name || !out) return false;
    if (strcasecmp(name, "chars") == 0 || strcasecmp(name, "characters") == 0) {
        *out = LengthMode::Chars;
        return true;
    }
    if (strcasecmp(name, "visual") == 0 || strcasecmp(name, "display") == 0 ||
        strcasecmp(name, "visual_width") == 0 || strcasecmp(name, "visual-width") == 0) {
        *out = LengthMode::Visual;
        return true;
    }
    if (strcasecmp(name, "bytes") == 0) {
        *out = LengthMode::Bytes;
        return true;
    }
    clog_warn(reflow_log(), "unknown length mode '%s'", name);
    return false;
}

bool parse_reflow_mode(const char* name, ReflowMode* out) {
    if (!name || !out) return false;
    if (strcasecmp(name, "default") == 0) {
        *out = ReflowMode::Default;
        return true;
    }
    if (strcasecmp(name, "normalize") == 0) {
        *out = ReflowMode::Normalize;
        return true;
    }
    if (strcasecmp(name, "sentence-per-line") == 0 || strcasecmp(name, "sentence_per_line") == 0) {
        *out = ReflowMode::SentencePerLine;
        return true;
    }
    clog_warn(reflow_log(), "unknown reflow mode '%s'", name);
    return false;
}

const char* length_mode_name(LengthMode mode) {
    switch (mode) {
        case LengthMode::Chars: return "chars";
        case LengthMode::Visual: return "visual";
        case LengthMode::Bytes: return "bytes";
    }
    return "chars";
}

const char* reflow_mode_name(ReflowMode mode) {
    switch (mode) {
        case ReflowMode::Default: return "default";
        case ReflowMode::Normalize: return "normalize";
        case ReflowMode::SentencePerLine: return "sentence-per-line";
    }
    return "default";
}

ReflowOptions reflow_options_from_config(const ReflowConfig& config) {
    ReflowOptions options = ReflowOptions::defaults();
    options.line_length = config.line_length;
    options.length_mode = config.length_mode;
    options.sentence_per_line = config.reflow_mode == ReflowMode::SentencePerLine;
    options.break_on_sentences = true;
    // only normalize mode joins the source lines of a paragraph
    options.preserve_breaks = config.reflow_mode != ReflowMode::Normalize;
    for (const std::string& abbr : config.abbreviations) {
        if (!abbr.empty()) options.abbreviations.push_back(abbr);
    }
    clog_debug(reflow_log(), "options: line_length=%zu mode=%s length=%s preserve_breaks=%d abbreviations=%zu",
               options.line_length, reflow_mode_name(config.reflow_mode),
               length_mode_name(options.length_mode), options.preserve_breaks ? 1 : 0,
               options.abbreviations.size());
    return options;
}

} // namespace mdlint
