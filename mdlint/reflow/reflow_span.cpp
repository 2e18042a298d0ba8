// reflow_span.cpp - Atomic span scanner
//
// Pass 1 walks the text once and claims leaf spans in priority order at
// each start position. Code spans, bracket pairs and parenthesis pairs are
// matched up front so every lookup is O(1); closers of fixed delimiters
// (shortcodes, math, comments) are found with forward-only searches.
// Pass 2 pairs emphasis delimiter runs that lie outside the leaves.

#include "reflow_span.hpp"
#include "reflow_options.hpp"
#include <re2/re2.h>
#include <ctype.h>
#include <string.h>
#include <algorithm>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace mdlint {

static const size_t NO_MATCH = (size_t)-1;

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// ASCII alphanumeric or any byte of a multi-byte scalar
static bool is_word_byte(char c) {
    unsigned char u = (unsigned char)c;
    return u >= 0x80 || isalnum(u);
}

EmphasisWeight ProtectedSpan::weight() const {
    if (marker_len >= 3) return EmphasisWeight::BoldItalic;
    if (marker_len == 2) return EmphasisWeight::Bold;
    return EmphasisWeight::Italic;
}

const char* span_kind_name(SpanKind kind) {
    switch (kind) {
        case SpanKind::InlineCode: return "inline-code";
        case SpanKind::Link: return "link";
        case SpanKind::Image: return "image";
        case SpanKind::LinkedImage: return "linked-image";
        case SpanKind::Footnote: return "footnote";
        case SpanKind::Shortcode: return "shortcode";
        case SpanKind::WikiLink: return "wiki-link";
        case SpanKind::Math: return "math";
        case SpanKind::HtmlTag: return "html-tag";
        case SpanKind::HtmlEntity: return "html-entity";
        case SpanKind::EmojiShortcode: return "emoji";
        case SpanKind::Emphasis: return "emphasis";
    }
    return "unknown";
}

// ============================================================================
// Patterns
// ============================================================================

static const RE2& autolink_pattern() {
    static const RE2 pattern("[A-Za-z][A-Za-z0-9+.\\-]{1,31}:[^\\s<>]*");
    return pattern;
}

static const RE2& email_pattern() {
    static const RE2 pattern(
        "[A-Za-z0-9.!#$%&'*+/=?^_`{|}~\\-]+@[A-Za-z0-9](?:[A-Za-z0-9\\-]{0,61}[A-Za-z0-9])?"
        "(?:\\.[A-Za-z0-9](?:[A-Za-z0-9\\-]{0,61}[A-Za-z0-9])?)*");
    return pattern;
}

// ============================================================================
// Forward search
// ============================================================================

// Finds a fixed needle for lookups whose start only moves forward. The last
// answer is remembered, so a run of failed lookups never rescans text.
class ForwardFinder {
public:
    ForwardFinder(const char* text, size_t len, const char* needle)
        : text_(text, len), needle_(needle), from_(NO_MATCH), hit_(NO_MATCH) {}

    size_t find(size_t from) {
        if (from_ != NO_MATCH && from >= from_ && (hit_ == NO_MATCH || hit_ >= from)) {
            return hit_;
        }
        size_t hit = text_.find(needle_, from);
        from_ = from;
        hit_ = hit == std::string_view::npos ? NO_MATCH : hit;
        return hit_;
    }

private:
    std::string_view text_;
    std::string_view needle_;
    size_t from_;   // start of the remembered lookup
    size_t hit_;    // first occurrence at or after from_
};

// ============================================================================
// Scanner
// ============================================================================

struct DelimiterRun {
    size_t pos;
    uint8_t len;
    char ch;
    bool can_open;
    bool can_close;
    bool active;
};

// stack slot per marker character and run length
static int delimiter_slot(char ch, size_t len) {
    switch (ch) {
        case '*': return len >= 1 && len <= 3 ? (int)len - 1 : -1;
        case '_': return len >= 1 && len <= 3 ? 3 + (int)len - 1 : -1;
        case '~': return len >= 1 && len <= 2 ? 6 + (int)len - 1 : -1;
        case '^': return len == 1 ? 8 : -1;
        case '=': return len == 2 ? 9 : -1;
        default: return -1;
    }
}

constexpr int DELIMITER_SLOTS = 10;

class SpanScanner {
public:
    SpanScanner(const char* text, size_t len)
        : text_(text), len_(len),
          wiki_close_(text, len, "]]"),
          display_math_close_(text, len, "$$"),
          dollar_(text, len, "$"),
          comment_close_(text, len, "-->"),
          hugo_angle_close_(text, len, ">}}"),
          hugo_percent_close_(text, len, "%}}"),
          liquid_close_(text, len, "%}"),
          mustache_close_(text, len, "}}") {}

    SpanMap scan();

private:
    void find_code_spans();
    void match_brackets();
    void scan_leaves();
    void scan_emphasis(std::vector<ProtectedSpan>* out);
    SpanMap build_tree(std::vector<ProtectedSpan>&& spans);

    size_t link_tail_end(size_t close) const;
    size_t link_end(size_t open) const;
    size_t linked_image_end(size_t open, LinkedImageForm* form) const;
    size_t footnote_ref_end(size_t open, FootnoteForm* form) const;
    size_t wiki_link_end(size_t open);
    size_t shortcode_end(size_t open);
    size_t math_end(size_t open);
    size_t angle_end(size_t open, SpanKind* kind);
    size_t entity_end(size_t open) const;
    size_t emoji_end(size_t open) const;
    bool is_html_tag(size_t begin, size_t end) const;
    bool starts_with(size_t pos, const char* prefix) const;

    void add_leaf(size_t start, size_t end, SpanKind kind, LinkedImageForm badge, FootnoteForm footnote);

    const char* text_;
    size_t len_;
    std::vector<std::pair<size_t, size_t>> code_spans_;  // [start, end) in order
    std::vector<size_t> bracket_match_;                  // partner of each '[' and ']'
    std::vector<size_t> paren_match_;                    // partner of each '(' and ')'
    std::vector<ProtectedSpan> leaves_;
    ForwardFinder wiki_close_;
    ForwardFinder display_math_close_;
    ForwardFinder dollar_;
    ForwardFinder comment_close_;
    ForwardFinder hugo_angle_close_;
    ForwardFinder hugo_percent_close_;
    ForwardFinder liquid_close_;
    ForwardFinder mustache_close_;
};

bool SpanScanner::starts_with(size_t pos, const char* prefix) const {
    size_t n = strlen(prefix);
    return pos + n <= len_ && memcmp(text_ + pos, prefix, n) == 0;
}

void SpanScanner::add_leaf(size_t start, size_t end, SpanKind kind, LinkedImageForm badge,
                           FootnoteForm footnote) {
    ProtectedSpan span;
    span.start = start;
    span.end = end;
    span.kind = kind;
    span.marker = 0;
    span.marker_len = 0;
    span.badge = badge;
    span.footnote = footnote;
    leaves_.push_back(std::move(span));
}

// Pair backtick runs of equal length. A run with no later partner of the
// same length is literal text.
void SpanScanner::find_code_spans() {
    struct Run { size_t start; size_t len; };
    std::vector<Run> runs;
    for (size_t i = 0; i < len_;) {
        if (text_[i] != '`') {
            i++;
            continue;
        }
        size_t start = i;
        while (i < len_ && text_[i] == '`') i++;
        runs.push_back({start, i - start});
    }
    if (runs.empty()) return;

    std::vector<size_t> next_same(runs.size(), NO_MATCH);
    std::unordered_map<size_t, size_t> last_by_len;
    for (size_t r = runs.size(); r-- > 0;) {
        auto it = last_by_len.find(runs[r].len);
        if (it != last_by_len.end()) next_same[r] = it->second;
        last_by_len[runs[r].len] = r;
    }

    for (size_t r = 0; r < runs.size();) {
        size_t close = next_same[r];
        if (close == NO_MATCH) {
            r++;
            continue;
        }
        code_spans_.push_back({runs[r].start, runs[close].start + runs[close].len});
        r = close + 1;
    }
}

void SpanScanner::match_brackets() {
    bracket_match_.assign(len_, NO_MATCH);
    paren_match_.assign(len_, NO_MATCH);
    std::vector<size_t> brackets;
    std::vector<size_t> parens;
    size_t code = 0;
    for (size_t i = 0; i < len_; i++) {
        if (code < code_spans_.size() && code_spans_[code].first == i) {
            i = code_spans_[code].second - 1;
            code++;
            continue;
        }
        switch (text_[i]) {
            case '\\':
                i++;
                break;
            case '[':
                brackets.push_back(i);
                break;
            case ']':
                if (!brackets.empty()) {
                    bracket_match_[brackets.back()] = i;
                    bracket_match_[i] = brackets.back();
                    brackets.pop_back();
                }
                break;
            case '(':
                parens.push_back(i);
                break;
            case ')':
                if (!parens.empty()) {
                    paren_match_[parens.back()] = i;
                    paren_match_[i] = parens.back();
                    parens.pop_back();
                }
                break;
            default:
                break;
        }
    }
}

// After the ']' closing link text: an inline destination "(...)" or a
// reference label "[...]". Returns the end offset, 0 when neither follows.
size_t SpanScanner::link_tail_end(size_t close) const {
    size_t after = close + 1;
    if (after >= len_) return 0;
    if (text_[after] == '(') {
        size_t p = paren_match_[after];
        return p != NO_MATCH && p > after ? p + 1 : 0;
    }
    if (text_[after] == '[') {
        size_t b = bracket_match_[after];
        return b != NO_MATCH && b > after ? b + 1 : 0;
    }
    return 0;
}

size_t SpanScanner::link_end(size_t open) const {
    size_t close = bracket_match_[open];
    if (close == NO_MATCH || close < open) return 0;
    return link_tail_end(close);
}

size_t SpanScanner::linked_image_end(size_t open, LinkedImageForm* form) const {
    if (open + 2 >= len_ || text_[open + 1] != '!' || text_[open + 2] != '[') return 0;
    size_t outer = bracket_match_[open];
    if (outer == NO_MATCH || outer < open) return 0;
    size_t alt_close = bracket_match_[open + 2];
    if (alt_close == NO_MATCH || alt_close < open + 2 || alt_close >= outer) return 0;

    // the image must fill the link text exactly
    bool image_inline = text_[alt_close + 1] == '(';
    if (link_tail_end(alt_close) != outer) return 0;

    bool link_inline = outer + 1 < len_ && text_[outer + 1] == '(';
    size_t end = link_tail_end(outer);
    if (!end) return 0;

    if (image_inline) {
        *form = link_inline ? LinkedImageForm::InlineImageInlineLink : LinkedImageForm::InlineImageRefLink;
    } else {
        *form = link_inline ? LinkedImageForm::RefImageInlineLink : LinkedImageForm::RefImageRefLink;
    }
    return end;
}

size_t SpanScanner::footnote_ref_end(size_t open, FootnoteForm* form) const {
    if (open + 1 >= len_ || text_[open + 1] != '^') return 0;
    size_t close = bracket_match_[open];
    if (close == NO_MATCH || close < open || close == open + 2) return 0;
    bool numeric = true;
    for (size_t i = open + 2; i < close; i++) {
        char c = text_[i];
        if (is_space(c) || c == '[') return 0;
        if (!isdigit((unsigned char)c)) numeric = false;
    }
    *form = numeric ? FootnoteForm::Numeric : FootnoteForm::Named;
    return close + 1;
}

size_t SpanScanner::wiki_link_end(size_t open) {
    if (open + 1 >= len_ || text_[open + 1] != '[') return 0;
    size_t close = wiki_close_.find(open + 2);
    if (close == NO_MATCH || close == open + 2) return 0;
    for (size_t i = open + 2; i < close; i++) {
        if (text_[i] == '[' || text_[i] == '\n') return 0;
    }
    return close + 2;
}

size_t SpanScanner::shortcode_end(size_t open) {
    size_t close;
    if (starts_with(open, "{{<")) {
        close = hugo_angle_close_.find(open + 3);
        return close == NO_MATCH ? 0 : close + 3;
    }
    if (starts_with(open, "{{%")) {
        close = hugo_percent_close_.find(open + 3);
        return close == NO_MATCH ? 0 : close + 3;
    }
    if (starts_with(open, "{{")) {
        close = mustache_close_.find(open + 2);
        return close == NO_MATCH ? 0 : close + 2;
    }
    if (starts_with(open, "{%")) {
        close = liquid_close_.find(open + 2);
        return close == NO_MATCH ? 0 : close + 2;
    }
    return 0;
}

size_t SpanScanner::math_end(size_t open) {
    if (open + 1 < len_ && text_[open + 1] == '$') {
        size_t close = display_math_close_.find(open + 2);
        if (close == NO_MATCH || close == open + 2) return 0;
        return close + 2;
    }
    size_t close = dollar_.find(open + 1);
    if (close == NO_MATCH || close == open + 1) return 0;
    // "$5 and $10" is prices, not math
    if (is_space(text_[open + 1]) || is_space(text_[close - 1])) return 0;
    if (close + 1 < len_ && isdigit((unsigned char)text_[close + 1])) return 0;
    if (memchr(text_ + open + 1, '\n', close - open - 1)) return 0;
    return close + 1;
}

// <tag ...>, </tag>: a letter-led name followed by the end, a space or '/'
bool SpanScanner::is_html_tag(size_t begin, size_t end) const {
    size_t i = begin;
    if (i < end && text_[i] == '/') i++;
    if (i >= end || !isalpha((unsigned char)text_[i])) return false;
    while (i < end && (isalnum((unsigned char)text_[i]) || text_[i] == '-')) i++;
    return i == end || is_space(text_[i]) || text_[i] == '/';
}

size_t SpanScanner::angle_end(size_t open, SpanKind* kind) {
    if (starts_with(open, "<!--")) {
        size_t close = comment_close_.find(open + 4);
        if (close == NO_MATCH) return 0;
        *kind = SpanKind::HtmlTag;
        return close + 3;
    }

    size_t close = NO_MATCH;
    for (size_t i = open + 1; i < len_; i++) {
        char c = text_[i];
        if (c == '>') {
            close = i;
            break;
        }
        if (c == '<' || c == '\n') break;
    }
    if (close == NO_MATCH || close == open + 1) return 0;

    re2::StringPiece content(text_ + open + 1, close - open - 1);
    if (RE2::FullMatch(content, autolink_pattern()) || RE2::FullMatch(content, email_pattern())) {
        *kind = SpanKind::Link;
        return close + 1;
    }
    if (is_html_tag(open + 1, close)) {
        *kind = SpanKind::HtmlTag;
        return close + 1;
    }
    return 0;
}

size_t SpanScanner::entity_end(size_t open) const {
    size_t i = open + 1;
    if (i < len_ && text_[i] == '#') {
        i++;
        bool hex = i < len_ && (text_[i] == 'x' || text_[i] == 'X');
        if (hex) i++;
        size_t limit = hex ? 6 : 7;
        size_t digits = 0;
        while (i < len_ && digits < limit &&
               (hex ? isxdigit((unsigned char)text_[i]) : isdigit((unsigned char)text_[i]))) {
            i++;
            digits++;
        }
        if (!digits || i >= len_ || text_[i] != ';') return 0;
        return i + 1;
    }
    if (i >= len_ || !isalpha((unsigned char)text_[i])) return 0;
    size_t n = 0;
    while (i < len_ && n < 32 && isalnum((unsigned char)text_[i])) {
        i++;
        n++;
    }
    if (n < 2 || i >= len_ || text_[i] != ';') return 0;
    return i + 1;
}

size_t SpanScanner::emoji_end(size_t open) const {
    // "10:30:45" is a time
    if (open > 0 && is_word_byte(text_[open - 1])) return 0;
    size_t i = open + 1;
    size_t n = 0;
    bool letter = false;
    while (i < len_ && n < 64) {
        char c = text_[i];
        if (islower((unsigned char)c)) {
            letter = true;
        } else if (!isdigit((unsigned char)c) && c != '_' && c != '+' && c != '-') {
            break;
        }
        i++;
        n++;
    }
    if (!letter || i >= len_ || text_[i] != ':') return 0;
    return i + 1;
}

void SpanScanner::scan_leaves() {
    size_t code = 0;
    size_t i = 0;
    while (i < len_) {
        while (code < code_spans_.size() && code_spans_[code].first < i) code++;

        char c = text_[i];
        if (c == '\\') {
            i += 2;
            continue;
        }

        size_t end = 0;
        SpanKind kind = SpanKind::Link;
        LinkedImageForm badge = LinkedImageForm::None;
        FootnoteForm footnote = FootnoteForm::None;

        switch (c) {
            case '`':
                if (code < code_spans_.size() && code_spans_[code].first == i) {
                    end = code_spans_[code].second;
                    kind = SpanKind::InlineCode;
                } else {
                    size_t run = i;
                    while (run < len_ && text_[run] == '`') run++;
                    clog_debug(reflow_log(), "span: unmatched backtick run at %zu kept as text", i);
                    i = run;
                    continue;
                }
                break;
            case '[':
                if ((end = linked_image_end(i, &badge))) {
                    kind = SpanKind::LinkedImage;
                } else if ((end = wiki_link_end(i))) {
                    kind = SpanKind::WikiLink;
                } else if ((end = link_end(i))) {
                    kind = SpanKind::Link;
                } else if ((end = footnote_ref_end(i, &footnote))) {
                    kind = SpanKind::Footnote;
                }
                break;
            case '!':
                if (i + 1 < len_ && text_[i + 1] == '[' && (end = link_end(i + 1))) {
                    kind = SpanKind::Image;
                }
                break;
            case '^':
                if (i + 1 < len_ && text_[i + 1] == '[') {
                    size_t close = bracket_match_[i + 1];
                    if (close != NO_MATCH && close > i + 1) {
                        end = close + 1;
                        kind = SpanKind::Footnote;
                        footnote = FootnoteForm::Inline;
                    }
                }
                break;
            case '{':
                if ((end = shortcode_end(i))) kind = SpanKind::Shortcode;
                break;
            case '$':
                if ((end = math_end(i))) kind = SpanKind::Math;
                break;
            case '<':
                end = angle_end(i, &kind);
                break;
            case '&':
                if ((end = entity_end(i))) kind = SpanKind::HtmlEntity;
                break;
            case ':':
                if ((end = emoji_end(i))) kind = SpanKind::EmojiShortcode;
                break;
            default:
                break;
        }

        if (end > i) {
            add_leaf(i, end, kind, badge, footnote);
            i = end;
            continue;
        }
        i++;
    }
}

void SpanScanner::scan_emphasis(std::vector<ProtectedSpan>* out) {
    std::vector<DelimiterRun> runs;
    size_t leaf = 0;
    size_t i = 0;
    while (i < len_) {
        if (leaf < leaves_.size() && leaves_[leaf].start <= i) {
            if (leaves_[leaf].start == i) i = leaves_[leaf].end;
            leaf++;
            continue;
        }
        char c = text_[i];
        if (c == '\\') {
            i += 2;
            continue;
        }
        if (c != '*' && c != '_' && c != '~' && c != '^' && c != '=') {
            i++;
            continue;
        }

        size_t start = i;
        size_t stop = leaf < leaves_.size() ? leaves_[leaf].start : len_;
        while (i < stop && text_[i] == c) i++;
        size_t run_len = i - start;
        if (delimiter_slot(c, run_len) < 0) continue;

        char before = start > 0 ? text_[start - 1] : ' ';
        char after = i < len_ ? text_[i] : ' ';
        DelimiterRun run;
        run.pos = start;
        run.len = (uint8_t)run_len;
        run.ch = c;
        run.can_open = !is_space(after);
        run.can_close = !is_space(before);
        run.active = true;
        if (c == '_') {
            // snake_case_words are not emphasis
            run.can_open = run.can_open && !is_word_byte(before);
            run.can_close = run.can_close && !is_word_byte(after);
        }
        runs.push_back(run);
    }

    std::vector<size_t> openers;                      // active openers, innermost last
    std::vector<size_t> slot_stack[DELIMITER_SLOTS];  // per marker, lazily pruned
    for (size_t r = 0; r < runs.size(); r++) {
        DelimiterRun& run = runs[r];
        int slot = delimiter_slot(run.ch, run.len);
        if (run.can_close) {
            std::vector<size_t>& stack = slot_stack[slot];
            while (!stack.empty() && !runs[stack.back()].active) stack.pop_back();
            if (!stack.empty()) {
                size_t o = stack.back();
                stack.pop_back();
                // openers between the pair can no longer close anything
                while (!openers.empty() && openers.back() != o) {
                    runs[openers.back()].active = false;
                    openers.pop_back();
                }
                if (!openers.empty()) openers.pop_back();
                runs[o].active = false;

                ProtectedSpan span;
                span.start = runs[o].pos;
                span.end = run.pos + run.len;
                span.kind = SpanKind::Emphasis;
                span.marker = run.ch;
                span.marker_len = run.len;
                span.badge = LinkedImageForm::None;
                span.footnote = FootnoteForm::None;
                out->push_back(std::move(span));
                continue;
            }
        }
        if (run.can_open) {
            openers.push_back(r);
            slot_stack[slot].push_back(r);
        }
    }
}

SpanMap SpanScanner::build_tree(std::vector<ProtectedSpan>&& spans) {
    std::sort(spans.begin(), spans.end(), [](const ProtectedSpan& a, const ProtectedSpan& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end > b.end;
    });

    SpanMap map;
    map.spans = std::move(spans);
    std::vector<uint32_t> open;  // emphasis spans enclosing the current start
    for (uint32_t i = 0; i < (uint32_t)map.spans.size(); i++) {
        size_t start = map.spans[i].start;
        while (!open.empty() && map.spans[open.back()].end <= start) open.pop_back();
        if (open.empty()) {
            map.roots.push_back(i);
        } else {
            map.spans[open.back()].children.push_back(i);
        }
        if (!map.spans[i].is_leaf()) open.push_back(i);
    }
    return map;
}

SpanMap SpanScanner::scan() {
    if (!text_ || len_ == 0) return SpanMap();
    find_code_spans();
    match_brackets();
    scan_leaves();

    std::vector<ProtectedSpan> spans;
    scan_emphasis(&spans);
    for (ProtectedSpan& leaf : leaves_) spans.push_back(std::move(leaf));
    leaves_.clear();
    return build_tree(std::move(spans));
}

// ============================================================================
// API
// ============================================================================

SpanMap scan_spans(const char* text, size_t len) {
    SpanScanner scanner(text, len);
    return scanner.scan();
}

} // namespace mdlint
