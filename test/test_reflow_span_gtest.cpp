// test_reflow_span_gtest.cpp - Atomic span scanner

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

#include "../mdlint/reflow/reflow_span.hpp"

using namespace mdlint;

// ============================================================================
// Helpers
// ============================================================================

class SpanScannerTest : public ::testing::Test {
protected:
    SpanMap scan(const std::string& input) {
        text = input;
        return scan_spans(text);
    }

    std::string span_text(const SpanMap& map, size_t i) {
        const ProtectedSpan& span = map.spans[i];
        return text.substr(span.start, span.end - span.start);
    }

    // the only root span must be of this kind and cover the given text
    void expect_single(const std::string& input, SpanKind kind, const std::string& covered) {
        SpanMap map = scan(input);
        ASSERT_EQ(map.roots.size(), 1u) << input;
        EXPECT_EQ(map.root(0).kind, kind) << input << " -> " << span_kind_name(map.root(0).kind);
        EXPECT_EQ(span_text(map, map.roots[0]), covered);
    }

    std::string text;
};

// ============================================================================
// Code spans
// ============================================================================

TEST_F(SpanScannerTest, InlineCode) {
    expect_single("run `make all` now", SpanKind::InlineCode, "`make all`");
    expect_single("``co`de`` x", SpanKind::InlineCode, "``co`de``");
}

TEST_F(SpanScannerTest, CodeContentIsNeverReinterpreted) {
    expect_single("`*not emphasis* [nor](link)`", SpanKind::InlineCode, "`*not emphasis* [nor](link)`");
}

TEST_F(SpanScannerTest, UnmatchedBacktickIsText) {
    SpanMap map = scan("a stray ` backtick and *real emphasis*");
    ASSERT_EQ(map.roots.size(), 1u);
    EXPECT_EQ(map.root(0).kind, SpanKind::Emphasis);

    EXPECT_TRUE(scan("``` only one run").spans.empty());
}

// ============================================================================
// Links, images and badges
// ============================================================================

TEST_F(SpanScannerTest, LinkedImageForms) {
    struct Case {
        const char* input;
        LinkedImageForm form;
    } cases[] = {
        {"[![alt](img.png)](https://x.org)", LinkedImageForm::InlineImageInlineLink},
        {"[![alt][img]](https://x.org)", LinkedImageForm::RefImageInlineLink},
        {"[![alt](img.png)][link]", LinkedImageForm::InlineImageRefLink},
        {"[![alt][img]][link]", LinkedImageForm::RefImageRefLink},
    };
    for (const Case& c : cases) {
        SpanMap map = scan(std::string("see ") + c.input + " here");
        ASSERT_EQ(map.spans.size(), 1u) << c.input;
        EXPECT_EQ(map.spans[0].kind, SpanKind::LinkedImage) << c.input;
        EXPECT_EQ(map.spans[0].badge, c.form) << c.input;
        EXPECT_EQ(span_text(map, 0), c.input);
    }
}

TEST_F(SpanScannerTest, Links) {
    expect_single("a [text](https://example.com \"Title\") b", SpanKind::Link,
                  "[text](https://example.com \"Title\")");
    expect_single("a [text][ref] b", SpanKind::Link, "[text][ref]");
    expect_single("a [text][] b", SpanKind::Link, "[text][]");
    expect_single("a [outer [nested] text](u) b", SpanKind::Link, "[outer [nested] text](u)");
    expect_single("a [wiki](https://en.wikipedia.org/wiki/Foo_(bar)) b", SpanKind::Link,
                  "[wiki](https://en.wikipedia.org/wiki/Foo_(bar))");
}

TEST_F(SpanScannerTest, Images) {
    expect_single("look ![a cat](cat.png) there", SpanKind::Image, "![a cat](cat.png)");
    expect_single("look ![a cat][cat] there", SpanKind::Image, "![a cat][cat]");
}

TEST_F(SpanScannerTest, Autolinks) {
    expect_single("go to <https://example.com/a?b=c> now", SpanKind::Link, "<https://example.com/a?b=c>");
    expect_single("mail <user.name@example.com> now", SpanKind::Link, "<user.name@example.com>");
}

TEST_F(SpanScannerTest, BareBracketsAreText) {
    EXPECT_TRUE(scan("an [aside] here").spans.empty());
    EXPECT_TRUE(scan("unclosed [bracket (paren").spans.empty());
}

// ============================================================================
// Footnotes, shortcodes and the extra leaf kinds
// ============================================================================

TEST_F(SpanScannerTest, Footnotes) {
    SpanMap map = scan("text^[an inline note] more");
    ASSERT_EQ(map.spans.size(), 1u);
    EXPECT_EQ(map.spans[0].kind, SpanKind::Footnote);
    EXPECT_EQ(map.spans[0].footnote, FootnoteForm::Inline);
    EXPECT_EQ(span_text(map, 0), "^[an inline note]");

    map = scan("claim[^12] more");
    ASSERT_EQ(map.spans.size(), 1u);
    EXPECT_EQ(map.spans[0].footnote, FootnoteForm::Numeric);

    map = scan("claim[^source-a] more");
    ASSERT_EQ(map.spans.size(), 1u);
    EXPECT_EQ(map.spans[0].footnote, FootnoteForm::Named);

    EXPECT_TRUE(scan("not [^a note] here").spans.empty());
}

TEST_F(SpanScannerTest, LinkWinsOverFootnote) {
    expect_single("x [^1](url) y", SpanKind::Link, "[^1](url)");
}

TEST_F(SpanScannerTest, Shortcodes) {
    expect_single("a {{< figure src=\"a.png\" caption=\"One. Two.\" >}} b", SpanKind::Shortcode,
                  "{{< figure src=\"a.png\" caption=\"One. Two.\" >}}");
    expect_single("a {{% notice info %}} b", SpanKind::Shortcode, "{{% notice info %}}");
    expect_single("a {% include note.html %} b", SpanKind::Shortcode, "{% include note.html %}");
    expect_single("a {{ page.title }} b", SpanKind::Shortcode, "{{ page.title }}");
    EXPECT_TRUE(scan("a {{< never closed").spans.empty());
}

TEST_F(SpanScannerTest, WikiLinks) {
    expect_single("see [[Main Page]] now", SpanKind::WikiLink, "[[Main Page]]");
}

TEST_F(SpanScannerTest, Math) {
    expect_single("where $x^2 + y$ holds", SpanKind::Math, "$x^2 + y$");
    expect_single("block $$E = mc^2$$ here", SpanKind::Math, "$$E = mc^2$$");
    EXPECT_TRUE(scan("costs $5 and $10 today").spans.empty());
    EXPECT_TRUE(scan("from $ 1 to 2 $ here").spans.empty());
}

TEST_F(SpanScannerTest, HtmlTagsAndEntities) {
    expect_single("a <span class=\"x y\"> b", SpanKind::HtmlTag, "<span class=\"x y\">");
    expect_single("a </span> b", SpanKind::HtmlTag, "</span>");
    expect_single("a <!-- note. Note. --> b", SpanKind::HtmlTag, "<!-- note. Note. -->");
    expect_single("fish &amp; chips", SpanKind::HtmlEntity, "&amp;");
    expect_single("x &#123; y", SpanKind::HtmlEntity, "&#123;");
    expect_single("x &#x1F600; y", SpanKind::HtmlEntity, "&#x1F600;");
    EXPECT_TRUE(scan("1 < 2 > 0").spans.empty());
    EXPECT_TRUE(scan("AT&T rocks").spans.empty());
}

TEST_F(SpanScannerTest, EmojiShortcodes) {
    expect_single("nice :thumbs_up: work", SpanKind::EmojiShortcode, ":thumbs_up:");
    EXPECT_TRUE(scan("at 10:30:45 sharp").spans.empty());
}

// ============================================================================
// Emphasis
// ============================================================================

TEST_F(SpanScannerTest, EmphasisMarkers) {
    struct Case {
        const char* input;
        char marker;
        int len;
    } cases[] = {
        {"a *it* b", '*', 1},     {"a _it_ b", '_', 1},   {"a **bold** b", '*', 2},
        {"a __bold__ b", '_', 2}, {"a ***bi*** b", '*', 3}, {"a ~~del~~ b", '~', 2},
        {"a ~sub~ b", '~', 1},    {"a ^sup^ b", '^', 1},  {"a ==mark== b", '=', 2},
    };
    for (const Case& c : cases) {
        SpanMap map = scan(c.input);
        ASSERT_EQ(map.spans.size(), 1u) << c.input;
        EXPECT_EQ(map.spans[0].kind, SpanKind::Emphasis) << c.input;
        EXPECT_EQ(map.spans[0].marker, c.marker) << c.input;
        EXPECT_EQ(map.spans[0].marker_len, c.len) << c.input;
    }
}

TEST_F(SpanScannerTest, EmphasisWeight) {
    EXPECT_EQ(scan("*a*").spans[0].weight(), EmphasisWeight::Italic);
    EXPECT_EQ(scan("__a__").spans[0].weight(), EmphasisWeight::Bold);
    EXPECT_EQ(scan("***a***").spans[0].weight(), EmphasisWeight::BoldItalic);
}

TEST_F(SpanScannerTest, IntrawordUnderscoreIsText) {
    EXPECT_TRUE(scan("call snake_case_name here").spans.empty());
    EXPECT_TRUE(scan("2 * 3 * 4").spans.empty());
    EXPECT_TRUE(scan("an *unclosed marker").spans.empty());
    EXPECT_TRUE(scan("escaped \\*stars\\* here").spans.empty());
}

TEST_F(SpanScannerTest, EmphasisHoldsChildren) {
    SpanMap map = scan("**bold with `code` and [a link](u)** after");
    ASSERT_EQ(map.roots.size(), 1u);
    const ProtectedSpan& root = map.root(0);
    EXPECT_EQ(root.kind, SpanKind::Emphasis);
    ASSERT_EQ(root.children.size(), 2u);
    EXPECT_EQ(map.spans[root.children[0]].kind, SpanKind::InlineCode);
    EXPECT_EQ(map.spans[root.children[1]].kind, SpanKind::Link);
    EXPECT_EQ(root.inner_start(), 2u);
}

TEST_F(SpanScannerTest, NestedEmphasis) {
    SpanMap map = scan("*outer **inner** text*");
    ASSERT_EQ(map.roots.size(), 1u);
    const ProtectedSpan& outer = map.root(0);
    EXPECT_EQ(outer.marker_len, 1);
    EXPECT_EQ(outer.end, text.size());
    ASSERT_EQ(outer.children.size(), 1u);
    const ProtectedSpan& inner = map.spans[outer.children[0]];
    EXPECT_EQ(inner.marker_len, 2);
    EXPECT_EQ(span_text(map, outer.children[0]), "**inner**");
}

TEST_F(SpanScannerTest, RootsAreOrderedAndDisjoint) {
    SpanMap map = scan("`a` then *b* then [c](d) then &amp; then :smile: then $e$");
    ASSERT_EQ(map.roots.size(), 6u);
    for (size_t i = 1; i < map.roots.size(); i++) {
        EXPECT_LE(map.root(i - 1).end, map.root(i).start);
    }
}

// ============================================================================
// Linear time
// ============================================================================

TEST_F(SpanScannerTest, AdversarialInputsFinishQuickly) {
    const size_t n = 50000;
    std::vector<std::string> inputs = {
        std::string(n, '`'),
        std::string(n, '['),
        std::string(n, '[') + std::string(n, ']'),
        std::string(n, '*'),
        std::string(n, '$'),
        std::string(n, '<'),
        std::string(n, '{'),
        std::string(n, ':'),
    };
    std::string mixed;
    for (size_t i = 0; i < n / 5; i++) mixed += "[![`*_";
    inputs.push_back(mixed);
    std::string alternating;
    for (size_t i = 0; i < n / 2; i++) alternating += "*a";
    inputs.push_back(alternating);
    std::string wiki;
    for (size_t i = 0; i < n / 4; i++) wiki += "[[ab";
    inputs.push_back(wiki);

    for (const std::string& input : inputs) {
        auto start = std::chrono::steady_clock::now();
        SpanMap map = scan_spans(input);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        EXPECT_LT(elapsed.count(), 2000) << input.substr(0, 16);
        EXPECT_LE(map.spans.size(), input.size());
    }
}
