// reflow_sentence.cpp - Sentence boundary detection

#include "reflow_sentence.hpp"
#include "../../lib/utf.h"
#include <utf8proc.h>
#include <ctype.h>
#include <string.h>

namespace mdlint {

static const char* const BUILTIN_ABBREVIATIONS[] = {
    "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "i.e", "e.g",
};

static std::string normalize_abbreviation(const char* word, size_t len) {
    while (len > 0 && isspace((unsigned char)word[len - 1])) len--;
    while (len > 0 && isspace((unsigned char)*word)) { word++; len--; }
    while (len > 0 && word[len - 1] == '.') len--;
    std::string key(word, len);
    for (char& c : key) c = (char)tolower((unsigned char)c);
    return key;
}

AbbreviationSet::AbbreviationSet() {
    for (const char* abbr : BUILTIN_ABBREVIATIONS) entries_.insert(abbr);
}

AbbreviationSet::AbbreviationSet(const std::vector<std::string>& extra) : AbbreviationSet() {
    for (const std::string& abbr : extra) add(abbr);
}

void AbbreviationSet::add(const std::string& abbreviation) {
    std::string key = normalize_abbreviation(abbreviation.data(), abbreviation.size());
    if (!key.empty()) entries_.insert(std::move(key));
}

bool AbbreviationSet::contains(const char* word, size_t len) const {
    if (!word || len == 0) return false;
    return entries_.count(normalize_abbreviation(word, len)) > 0;
}

// ============================================================================
// Character classes
// ============================================================================

bool is_cjk_char(uint32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) ||   // CJK unified ideographs
           (cp >= 0x3400 && cp <= 0x4DBF) ||   // extension A
           (cp >= 0x3040 && cp <= 0x309F) ||   // hiragana
           (cp >= 0x30A0 && cp <= 0x30FF) ||   // katakana
           (cp >= 0xAC00 && cp <= 0xD7AF);     // hangul syllables
}

bool is_cjk_sentence_ending(uint32_t cp) {
    return cp == 0x3002 || cp == 0xFF01 || cp == 0xFF1F;
}

bool is_closing_quote(uint32_t cp) {
    return cp == '"' || cp == '\'' || cp == 0x201D || cp == 0x2019 || cp == 0x00BB || cp == 0x203A;
}

bool is_opening_quote(uint32_t cp) {
    return cp == '"' || cp == '\'' || cp == 0x201C || cp == 0x2018 || cp == 0x00AB || cp == 0x2039;
}

// ============================================================================
// Scanning helpers
// ============================================================================

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static bool is_terminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

static bool is_marker_char(char c) {
    return c == '*' || c == '_' || c == '~';
}

static uint32_t decode_at(const char* text, size_t pos, size_t end, int* bytes) {
    uint32_t cp = 0;
    int n = utf8_decode(text + pos, end - pos, &cp);
    if (bytes) *bytes = n > 0 ? n : 1;
    return cp;
}

static size_t skip_spaces(const char* text, size_t pos, size_t end) {
    while (pos < end && is_space(text[pos])) pos++;
    return pos;
}

static size_t skip_closers(const char* text, size_t pos, size_t end) {
    while (pos < end) {
        if (is_marker_char(text[pos])) {
            pos++;
            continue;
        }
        int n;
        if (!is_closing_quote(decode_at(text, pos, end, &n))) break;
        pos += n;
    }
    return pos;
}

static size_t skip_openers(const char* text, size_t pos, size_t end) {
    while (pos < end) {
        if (is_marker_char(text[pos])) {
            pos++;
            continue;
        }
        int n;
        if (!is_opening_quote(decode_at(text, pos, end, &n))) break;
        pos += n;
    }
    return pos;
}

static bool starts_sentence(const char* text, size_t pos, size_t end) {
    if (pos >= end) return false;
    unsigned char c = (unsigned char)text[pos];
    if (c < 0x80) return isupper(c);
    uint32_t cp = decode_at(text, pos, end, NULL);
    if (is_cjk_char(cp)) return true;
    utf8proc_category_t category = utf8proc_category((utf8proc_int32_t)cp);
    return category == UTF8PROC_CATEGORY_LU || category == UTF8PROC_CATEGORY_LT;
}

// Is the whitespace-delimited word ending at the '.' at dot an abbreviation?
// Leading punctuation such as "(" is not part of the word.
static bool ends_with_abbreviation(const char* text, size_t floor, size_t dot,
                                   const AbbreviationSet& abbreviations) {
    size_t word_end = dot;
    while (word_end > floor && text[word_end - 1] == '.') word_end--;
    size_t word_start = word_end;
    while (word_start > floor && !is_space(text[word_start - 1])) word_start--;
    while (word_start < word_end && (unsigned char)text[word_start] < 0x80 &&
           !isalnum((unsigned char)text[word_start])) {
        word_start++;
    }
    if (word_start >= word_end) return false;
    return abbreviations.contains(text + word_start, word_end - word_start);
}

// ============================================================================
// Splitting
// ============================================================================

std::vector<ByteRange> split_sentence_ranges(const char* text, size_t begin, size_t end,
                                             const AbbreviationSet& abbreviations,
                                             const std::vector<ByteRange>* opaque) {
    std::vector<ByteRange> out;
    if (!text || begin >= end) return out;

    size_t start = skip_spaces(text, begin, end);
    size_t next_opaque = 0;
    size_t i = start;
    while (i < end) {
        if (opaque) {
            while (next_opaque < opaque->size() && (*opaque)[next_opaque].end <= i) next_opaque++;
            if (next_opaque < opaque->size() && (*opaque)[next_opaque].begin <= i) {
                i = (*opaque)[next_opaque].end;
                continue;
            }
        }

        char c = text[i];
        if (c == '\\') {
            i += 2;
            continue;
        }

        size_t term_end;
        bool latin = is_terminator(c);
        if (latin) {
            term_end = i;
            while (term_end < end && is_terminator(text[term_end])) term_end++;
        } else if ((unsigned char)c >= 0x80) {
            int n;
            uint32_t cp = decode_at(text, i, end, &n);
            if (!is_cjk_sentence_ending(cp)) {
                i += n;
                continue;
            }
            term_end = i + n;
        } else {
            i++;
            continue;
        }

        size_t after = skip_closers(text, term_end, end);
        size_t next = skip_spaces(text, after, end);
        bool boundary;
        if (latin) {
            // a lone '.' after an abbreviation does not end the sentence;
            // runs like "..." and "?!" are judged by what follows
            boundary = next > after && starts_sentence(text, skip_openers(text, next, end), end) &&
                       !(term_end - i == 1 && c == '.' &&
                         ends_with_abbreviation(text, start, i, abbreviations));
        } else {
            boundary = skip_openers(text, next, end) < end;
        }

        if (!boundary) {
            i = term_end;
            continue;
        }
        out.push_back({start, after});
        start = next;
        i = next;
    }

    size_t last = end;
    while (last > start && is_space(text[last - 1])) last--;
    if (start < last) out.push_back({start, last});
    return out;
}

void collect_opaque_ranges(const char* text, const SpanMap& map,
                           const std::vector<uint32_t>& indices, std::vector<ByteRange>* out) {
    for (uint32_t idx : indices) {
        const ProtectedSpan& span = map.spans[idx];
        if (span.is_leaf()) {
            out->push_back({span.start, span.end});
            continue;
        }

        size_t floor = span.inner_start();
        size_t pos = span.inner_end();
        while (pos > floor) {
            size_t prev = utf8_prev_offset(text, pos);
            if (prev < floor || !is_closing_quote(decode_at(text, prev, pos, NULL))) break;
            pos = prev;
        }

        size_t term = 0;
        if (pos > floor) {
            size_t prev = utf8_prev_offset(text, pos);
            if (prev >= floor) {
                if (is_terminator(text[prev])) {
                    term = prev;
                } else if (is_cjk_sentence_ending(decode_at(text, prev, pos, NULL))) {
                    term = prev;
                }
            }
        }
        if (term > span.start) {
            out->push_back({span.start, term});
        } else {
            out->push_back({span.start, span.end});
        }
    }
}

std::vector<std::string> split_into_sentences(const std::string& text,
                                              const AbbreviationSet& abbreviations) {
    SpanMap map = scan_spans(text);
    std::vector<ByteRange> opaque;
    collect_opaque_ranges(text.data(), map, map.roots, &opaque);

    std::vector<std::string> sentences;
    for (const ByteRange& range :
         split_sentence_ranges(text.data(), 0, text.size(), abbreviations, &opaque)) {
        sentences.emplace_back(text, range.begin, range.end - range.begin);
    }
    return sentences;
}

// ============================================================================
// Backward checks
// ============================================================================

bool text_ends_with_abbreviation(const std::string& text, const AbbreviationSet& abbreviations) {
    size_t end = text.size();
    while (end > 0 && is_space(text[end - 1])) end--;
    if (end == 0 || text[end - 1] != '.') return false;
    return ends_with_abbreviation(text.data(), 0, end - 1, abbreviations);
}

bool line_ends_sentence(const char* text, size_t len, const AbbreviationSet& abbreviations) {
    size_t pos = len;
    while (pos > 0 && is_space(text[pos - 1])) pos--;
    while (pos > 0) {
        if (is_marker_char(text[pos - 1])) {
            pos--;
            continue;
        }
        size_t prev = utf8_prev_offset(text, pos);
        if (!is_closing_quote(decode_at(text, prev, pos, NULL))) break;
        pos = prev;
    }
    if (pos == 0) return false;

    char c = text[pos - 1];
    if (c == '!' || c == '?') return true;
    if (c == '.') {
        if (pos >= 2 && is_terminator(text[pos - 2])) return true;
        return !ends_with_abbreviation(text, 0, pos - 1, abbreviations);
    }
    size_t prev = utf8_prev_offset(text, pos);
    return is_cjk_sentence_ending(decode_at(text, prev, pos, NULL));
}

bool is_after_sentence_ending(const char* text, size_t len, size_t pos,
                              const AbbreviationSet& abbreviations) {
    if (!text || pos == 0 || pos > len) return false;

    size_t i = pos;
    while (i > 0 && is_space(text[i - 1])) i--;
    bool spaced = i < pos;

    while (i > 0) {
        char c = text[i - 1];
        if (c == ')' || c == ']' || c == '}') {
            i--;
            continue;
        }
        size_t prev = utf8_prev_offset(text, i);
        if (!is_closing_quote(decode_at(text, prev, i, NULL))) break;
        i = prev;
    }
    if (i == 0) return false;

    size_t prev = utf8_prev_offset(text, i);
    uint32_t cp = decode_at(text, prev, i, NULL);
    if (is_cjk_sentence_ending(cp)) return true;
    if (!spaced) return false;
    if (cp == '!' || cp == '?') return true;
    if (cp != '.') return false;

    size_t dot = prev;
    if (dot == 0) return false;
    if (text[dot - 1] == '.') return true;  // ellipsis
    if (ends_with_abbreviation(text, 0, dot, abbreviations)) return false;

    // "J. Smith": a single capital is an initial
    unsigned char b = (unsigned char)text[dot - 1];
    if (isupper(b) && (dot == 1 || is_space(text[dot - 2]))) return false;

    size_t before = utf8_prev_offset(text, dot);
    uint32_t bc = decode_at(text, before, dot, NULL);
    if (bc > 0 && bc < 0x80) {
        return isalnum((int)bc) || strchr(")]`*_~=^\"'", (int)bc) != NULL;
    }
    return is_closing_quote(bc) || is_cjk_char(bc);
}

} // namespace mdlint
