// reflow_emphasis.cpp - Emphasis continuation across sentences

#include "reflow_emphasis.hpp"
#include "reflow_options.hpp"

namespace mdlint {

std::string emphasis_marker(const ProtectedSpan& span) {
    if (span.is_leaf()) return std::string();
    return std::string(span.marker_len, span.marker);
}

std::vector<std::string> continue_emphasis(const char* text, const SpanMap& map, uint32_t idx,
                                           const AbbreviationSet& abbreviations) {
    std::vector<std::string> pieces;
    if (idx >= map.spans.size()) return pieces;

    const ProtectedSpan& span = map.spans[idx];
    std::string source(text + span.start, span.end - span.start);
    if (span.is_leaf()) {
        pieces.push_back(std::move(source));
        return pieces;
    }

    std::vector<ByteRange> opaque;
    collect_opaque_ranges(text, map, span.children, &opaque);
    std::vector<ByteRange> sentences =
        split_sentence_ranges(text, span.inner_start(), span.inner_end(), abbreviations, &opaque);
    if (sentences.size() < 2) {
        pieces.push_back(std::move(source));
        return pieces;
    }

    std::string marker = emphasis_marker(span);
    clog_debug(reflow_log(), "emphasis: '%s' span at %zu continued over %zu sentences",
               marker.c_str(), span.start, sentences.size());
    pieces.reserve(sentences.size());
    for (const ByteRange& sentence : sentences) {
        std::string piece;
        piece.reserve(sentence.end - sentence.begin + 2 * marker.size());
        piece += marker;
        piece.append(text + sentence.begin, sentence.end - sentence.begin);
        piece += marker;
        pieces.push_back(std::move(piece));
    }
    return pieces;
}

} // namespace mdlint
