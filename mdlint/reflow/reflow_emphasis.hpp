// reflow_emphasis.hpp - Emphasis Continuation
//
// When the interior of an emphasis span holds several sentences, each
// sentence is wrapped in its own copy of the span's markers so that every
// output line stays balanced:
//
//   *One. Two.*   ->   *One.*  /  *Two.*
//
// The marker character and its count are taken from the source span, so
// underscores stay underscores. Spans nested in the emphasis are never
// split.

#ifndef MDLINT_REFLOW_EMPHASIS_HPP
#define MDLINT_REFLOW_EMPHASIS_HPP

#include "reflow_sentence.hpp"
#include "reflow_span.hpp"
#include <string>
#include <vector>

namespace mdlint {

// The marker string on each side of an emphasis span: "*", "__", "***" ...
std::string emphasis_marker(const ProtectedSpan& span);

// Sentences of the interior of the emphasis span at index idx, each
// re-wrapped with the span's markers. A span with a single sentence comes
// back as one piece equal to its source text.
std::vector<std::string> continue_emphasis(const char* text, const SpanMap& map, uint32_t idx,
                                           const AbbreviationSet& abbreviations);

} // namespace mdlint

#endif // MDLINT_REFLOW_EMPHASIS_HPP
