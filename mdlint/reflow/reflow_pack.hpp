// reflow_pack.hpp - Tokenizer and Line Packer
//
// Inline text becomes a stream of tokens: maximal runs of non-blank text,
// where a protected span is swallowed whole even if it holds spaces. The
// packer fills lines greedily. A lone punctuation token (",", ")", ...)
// is glued to the token before it, and a lone opening bracket to a span
// that follows it, so neither can begin a line.
//
// The packer knows nothing about Markdown blocks. The caller may pass a
// predicate that flags tokens which would open a block when placed at the
// start of a line; the packer then avoids starting a line with them.

#ifndef MDLINT_REFLOW_PACK_HPP
#define MDLINT_REFLOW_PACK_HPP

#include "reflow_options.hpp"
#include "reflow_sentence.hpp"
#include "reflow_span.hpp"
#include <stddef.h>
#include <string>
#include <vector>

namespace mdlint {

struct Token {
    std::string text;        // line breaks inside spans become spaces
    size_t width;            // measured in the packing length mode
    size_t start;            // source byte range
    size_t end;
    bool atomic;             // holds at least one protected span
    bool starts_with_span;
    bool ends_sentence;
};

typedef bool (*LeadHazardFn)(const char* token, size_t len);

struct PackParams {
    size_t width;                // 0 = unlimited
    size_t first_offset;         // columns already taken on the first line
    std::string indent;          // starts every line after the first; counts toward width
    LengthMode length_mode;
    bool break_on_sentences;
    LeadHazardFn starts_block;   // optional
};

// Tokens of text[0, len). map must come from scanning the same text.
std::vector<Token> tokenize(const char* text, size_t len, const SpanMap& map, LengthMode mode);

// Flag the tokens that end one of the given sentences.
void mark_sentence_ends(const std::vector<ByteRange>& sentences, std::vector<Token>* tokens);

// Lines without a trailing newline. The first line carries no indent.
std::vector<std::string> pack_tokens(const std::vector<Token>& tokens, const PackParams& params);

bool is_trailing_punctuation(const std::string& text);
bool is_opening_bracket(const std::string& text);

} // namespace mdlint

#endif // MDLINT_REFLOW_PACK_HPP
