// reflow_sentence.hpp - Sentence Boundaries
//
// Splits prose into sentences on '.', '!', '?' and the fullwidth CJK
// terminators. A Latin terminator ends a sentence only when whitespace and
// an uppercase (or CJK) letter follow and, for '.', when the word before
// it is not a known abbreviation. CJK terminators need no following space.
//
// Ranges listed as opaque (protected spans) are never searched for
// terminators. Every function is a single forward scan.

#ifndef MDLINT_REFLOW_SENTENCE_HPP
#define MDLINT_REFLOW_SENTENCE_HPP

#include "reflow_span.hpp"
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <unordered_set>
#include <vector>

namespace mdlint {

struct ByteRange {
    size_t begin;
    size_t end;
};

// Abbreviations that do not end a sentence when followed by '.'.
// Entries are stored lowercase without trailing periods, so "Dr", "dr."
// and "DR" are the same entry.
class AbbreviationSet {
public:
    AbbreviationSet();  // built-ins only
    explicit AbbreviationSet(const std::vector<std::string>& extra);

    void add(const std::string& abbreviation);
    bool contains(const char* word, size_t len) const;
    bool contains(const std::string& word) const { return contains(word.data(), word.size()); }
    size_t size() const { return entries_.size(); }

private:
    std::unordered_set<std::string> entries_;
};

// ============================================================================
// Character classes
// ============================================================================

bool is_cjk_char(uint32_t codepoint);
bool is_cjk_sentence_ending(uint32_t codepoint);   // 。 ！ ？
bool is_closing_quote(uint32_t codepoint);         // " ' ” ’ » ›
bool is_opening_quote(uint32_t codepoint);         // " ' “ ‘ « ‹

// ============================================================================
// API
// ============================================================================

// Sentences of text[begin, end). Ranges are trimmed of surrounding
// whitespace, in order, and cover every non-blank byte. opaque must be
// sorted by begin and may be null.
std::vector<ByteRange> split_sentence_ranges(const char* text, size_t begin, size_t end,
                                             const AbbreviationSet& abbreviations,
                                             const std::vector<ByteRange>* opaque);

// Opaque ranges for the spans listed in indices: a leaf is opaque whole; an
// emphasis is opaque up to the terminator that ends its interior, so the
// sentence may end right after its closing markers.
void collect_opaque_ranges(const char* text, const SpanMap& map,
                           const std::vector<uint32_t>& indices, std::vector<ByteRange>* out);

// Sentences of a Markdown fragment, with its protected spans kept whole.
std::vector<std::string> split_into_sentences(const std::string& text,
                                              const AbbreviationSet& abbreviations);

bool text_ends_with_abbreviation(const std::string& text, const AbbreviationSet& abbreviations);

// True when the (trimmed) line ends with a sentence terminator, optionally
// followed by closing quotes or emphasis markers.
bool line_ends_sentence(const char* text, size_t len, const AbbreviationSet& abbreviations);

// True when the character at pos starts a new sentence, judged only by the
// text before it.
bool is_after_sentence_ending(const char* text, size_t len, size_t pos,
                              const AbbreviationSet& abbreviations);

} // namespace mdlint

#endif // MDLINT_REFLOW_SENTENCE_HPP
