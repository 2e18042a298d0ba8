// reflow_span.hpp - Atomic Span Scanner
//
// Finds the inline Markdown constructs that must never be split across a
// line boundary: code spans, linked-image badges, links and images,
// footnotes, template shortcodes, math, raw HTML and entities, and the
// emphasis family. Spans are kept in an arena ordered by start offset;
// an emphasis span lists the spans nested inside it by index.
//
// Recognition runs in two linear passes. The first finds leaf spans left
// to right using precomputed code-span, bracket and parenthesis matches.
// The second pairs emphasis delimiter runs outside the leaves.

#ifndef MDLINT_REFLOW_SPAN_HPP
#define MDLINT_REFLOW_SPAN_HPP

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace mdlint {

// ============================================================================
// Span Types
// ============================================================================

enum class SpanKind : uint8_t {
    InlineCode,       // `code`, ``co`de``
    Link,             // [text](url), [text][ref], [text][], <scheme:...>, <user@host>
    Image,            // ![alt](src), ![alt][ref]
    LinkedImage,      // badge: image wrapped in a link
    Footnote,         // ^[inline], [^1], [^name]
    Shortcode,        // {{< ... >}}, {{% ... %}}, {% ... %}, {{ ... }}
    WikiLink,         // [[Page]]
    Math,             // $x$, $$x$$
    HtmlTag,          // <tag ...>, </tag>, <!-- ... -->
    HtmlEntity,       // &amp; &#123; &#x1F;
    EmojiShortcode,   // :smile:
    Emphasis,         // *_ ** __ *** ___ ~~ ~ ^ ==
};

enum class LinkedImageForm : uint8_t {
    None,
    InlineImageInlineLink,  // [![alt](img)](link)
    RefImageInlineLink,     // [![alt][img]](link)
    InlineImageRefLink,     // [![alt](img)][link]
    RefImageRefLink,        // [![alt][img]][link]
};

enum class FootnoteForm : uint8_t {
    None,
    Inline,     // ^[text]
    Numeric,    // [^1]
    Named,      // [^note]
};

enum class EmphasisWeight : uint8_t {
    Italic = 1,
    Bold = 2,
    BoldItalic = 3,
};

struct ProtectedSpan {
    size_t start;                    // byte offset of the first byte
    size_t end;                      // byte offset past the last byte
    SpanKind kind;
    char marker;                     // emphasis marker character, 0 for leaves
    uint8_t marker_len;              // markers on each side of an emphasis
    LinkedImageForm badge;           // LinkedImage sub-pattern
    FootnoteForm footnote;           // Footnote sub-pattern
    std::vector<uint32_t> children;  // spans nested in an emphasis, by index

    bool is_leaf() const { return kind != SpanKind::Emphasis; }
    size_t inner_start() const { return start + marker_len; }
    size_t inner_end() const { return end - marker_len; }
    EmphasisWeight weight() const;
};

// Arena of the spans found in one text.
struct SpanMap {
    std::vector<ProtectedSpan> spans;  // ordered by start offset
    std::vector<uint32_t> roots;       // spans not nested in an emphasis

    const ProtectedSpan& root(size_t i) const { return spans[roots[i]]; }
};

// ============================================================================
// API
// ============================================================================

SpanMap scan_spans(const char* text, size_t len);

inline SpanMap scan_spans(const std::string& text) {
    return scan_spans(text.data(), text.size());
}

const char* span_kind_name(SpanKind kind);

} // namespace mdlint

#endif // MDLINT_REFLOW_SPAN_HPP
