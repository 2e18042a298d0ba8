// reflow_block.cpp - Line-oriented block classification

#include "reflow_block.hpp"
#include "reflow_options.hpp"
#include <ctype.h>
#include <string.h>

namespace mdlint {

bool Block::eligible() const {
    if (verbatim || is_term) return false;
    return kind == BlockKind::Paragraph || kind == BlockKind::ListItem ||
           kind == BlockKind::BlockquoteLine || kind == BlockKind::DefinitionEntry;
}

const char* block_kind_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::Blank: return "blank";
        case BlockKind::Paragraph: return "paragraph";
        case BlockKind::ListItem: return "list-item";
        case BlockKind::BlockquoteLine: return "blockquote";
        case BlockKind::DefinitionEntry: return "definition";
        case BlockKind::Heading: return "heading";
        case BlockKind::CodeBlock: return "code";
        case BlockKind::MathBlock: return "math";
        case BlockKind::Table: return "table";
        case BlockKind::HtmlBlock: return "html";
        case BlockKind::FrontMatter: return "front-matter";
        case BlockKind::ThematicBreak: return "thematic-break";
        case BlockKind::LinkDefinition: return "link-definition";
    }
    return "unknown";
}

// ============================================================================
// Line predicates
//
// Each takes one line without its line ending. Predicates named for a
// construct expect the line's indentation to be stripped already.
// ============================================================================

// Indentation in columns (tab counts as 4); *bytes receives its length.
static size_t get_indentation(const char* line, size_t len, size_t* bytes) {
    size_t cols = 0, i = 0;
    while (i < len && (line[i] == ' ' || line[i] == '\t')) {
        cols += line[i] == '\t' ? 4 : 1;
        i++;
    }
    if (bytes) *bytes = i;
    return cols;
}

static size_t text_columns(const std::string& text) {
    size_t cols = 0;
    for (char c : text) cols += c == '\t' ? 4 : 1;
    return cols;
}

static bool is_blank_line(const char* line, size_t len) {
    for (size_t i = 0; i < len; i++) {
        if (!isspace((unsigned char)line[i])) return false;
    }
    return true;
}

static bool is_line_end(const char* line, size_t len, size_t pos) {
    return pos >= len || line[pos] == ' ' || line[pos] == '\t';
}

static int get_header_level(const char* line, size_t len) {
    int level = 0;
    while ((size_t)level < len && line[level] == '#' && level < 7) level++;
    if (level == 0 || level > 6) return 0;
    return is_line_end(line, len, (size_t)level) ? level : 0;
}

// Length of the opening fence run, 0 when the line is not a fence.
static size_t get_fence_length(const char* line, size_t len, char* fence_char) {
    if (len < 3 || (line[0] != '`' && line[0] != '~')) return 0;
    char ch = line[0];
    size_t run = 0;
    while (run < len && line[run] == ch) run++;
    if (run < 3) return 0;
    // a backtick fence's info string cannot hold backticks
    if (ch == '`' && memchr(line + run, '`', len - run)) return 0;
    if (fence_char) *fence_char = ch;
    return run;
}

static bool is_closing_fence(const char* line, size_t len, char ch, size_t open_len) {
    size_t run = 0;
    while (run < len && line[run] == ch) run++;
    return run >= open_len && is_blank_line(line + run, len - run);
}

static bool is_math_fence(const char* line, size_t len) {
    return len >= 2 && line[0] == '$' && line[1] == '$';
}

static bool is_thematic_break(const char* line, size_t len) {
    if (len == 0 || (line[0] != '-' && line[0] != '*' && line[0] != '_')) return false;
    char marker = line[0];
    int count = 0;
    for (size_t i = 0; i < len; i++) {
        if (line[i] == marker) count++;
        else if (line[i] != ' ' && line[i] != '\t') return false;
    }
    return count >= 3;
}

// Bytes taken by a list marker ("-", "12.", "3)") followed by a space, a
// tab or the end of the line; 0 when there is none.
static size_t get_list_marker_length(const char* line, size_t len) {
    if (len == 0) return 0;
    if (line[0] == '-' || line[0] == '*' || line[0] == '+') {
        return is_line_end(line, len, 1) ? 1 : 0;
    }
    size_t digits = 0;
    while (digits < len && isdigit((unsigned char)line[digits])) digits++;
    if (digits == 0 || digits > 9 || digits >= len) return 0;
    if (line[digits] != '.' && line[digits] != ')') return 0;
    return is_line_end(line, len, digits + 1) ? digits + 1 : 0;
}

static bool is_definition_line(const char* line, size_t len) {
    return len >= 1 && line[0] == ':' && (len == 1 || line[1] == ' ' || line[1] == '\t');
}

static bool is_link_definition(const char* line, size_t len) {
    if (len < 4 || line[0] != '[') return false;
    for (size_t i = 1; i + 1 < len; i++) {
        if (line[i] == ']') return line[i + 1] == ':';
    }
    return false;
}

static bool is_html_start(const char* line, size_t len) {
    if (len < 2 || line[0] != '<') return false;
    char c = line[1];
    if (c == '!' || c == '?') return true;
    size_t i = c == '/' ? 2 : 1;
    if (i >= len || !isalpha((unsigned char)line[i])) return false;
    while (i < len && (isalnum((unsigned char)line[i]) || line[i] == '-')) i++;
    return i >= len || line[i] == ' ' || line[i] == '\t' || line[i] == '>' ||
           (line[i] == '/' && i + 1 < len && line[i + 1] == '>');
}

static bool is_setext_underline(const char* line, size_t len) {
    size_t bytes;
    if (get_indentation(line, len, &bytes) >= 4) return false;
    line += bytes;
    len -= bytes;
    if (len == 0 || (line[0] != '=' && line[0] != '-')) return false;
    size_t run = 0;
    while (run < len && line[run] == line[0]) run++;
    return is_blank_line(line + run, len - run);
}

static bool is_table_delimiter(const char* line, size_t len) {
    bool dash = false, pipe = false;
    for (size_t i = 0; i < len; i++) {
        char c = line[i];
        if (c == '-') dash = true;
        else if (c == '|') pipe = true;
        else if (c != ':' && c != ' ' && c != '\t') return false;
    }
    return dash && pipe;
}

bool is_block_start(const char* line, size_t len) {
    size_t bytes;
    if (get_indentation(line, len, &bytes) >= 4) return false;
    const char* p = line + bytes;
    size_t n = len - bytes;
    if (n == 0) return false;
    return get_header_level(p, n) > 0 || get_fence_length(p, n, NULL) > 0 || is_math_fence(p, n) ||
           is_thematic_break(p, n) || p[0] == '>' || get_list_marker_length(p, n) > 0 ||
           is_definition_line(p, n) || p[0] == '|' || is_html_start(p, n);
}

bool token_starts_block(const char* token, size_t len) {
    if (len == 0) return false;
    // a lone run of '=' or '-' would turn the lines above into a heading
    bool underline = token[0] == '=' || token[0] == '-';
    for (size_t i = 1; underline && i < len; i++) underline = token[i] == token[0];
    if (underline) return true;
    // "|---|" would turn the line above into a table header
    if (is_table_delimiter(token, len)) return true;

    std::string line(token, len);
    line += " x";
    return is_block_start(line.data(), line.size());
}

// ============================================================================
// Classifier
// ============================================================================

struct LineInfo {
    size_t start;
    size_t end;    // line ending excluded
    size_t next;   // start of the following line
};

class BlockClassifier {
public:
    BlockClassifier(const char* text, size_t len) : text_(text), len_(len) { split_lines(); }

    std::vector<Block> classify();

private:
    void split_lines();
    const char* line_ptr(size_t i) const { return text_ + lines_[i].start; }
    size_t line_len(size_t i) const { return lines_[i].end - lines_[i].start; }
    bool blank(size_t i) const { return is_blank_line(line_ptr(i), line_len(i)); }
    bool starts_table(size_t i) const;
    bool starts_definition(size_t i) const;
    bool interrupts_container(size_t i) const;

    Block& push(BlockKind kind, size_t first, size_t count);
    void push_paragraph(size_t first, size_t count);
    ByteRange trimmed_content(size_t i) const;

    size_t front_matter();
    size_t blank_lines(size_t first);
    size_t indented_code(size_t first);
    size_t fenced_code(size_t first, char ch, size_t open_len, size_t open_cols);
    size_t math_block(size_t first);
    size_t table(size_t first);
    size_t html_block(size_t first);
    size_t blockquote(size_t first);
    size_t list_item(size_t first);
    size_t definition(size_t first);
    size_t paragraph(size_t first);
    size_t classify_at(size_t first);

    const char* text_;
    size_t len_;
    std::vector<LineInfo> lines_;
    std::vector<Block> blocks_;
    size_t list_indent_ = 0;   // content column of the innermost open list item, 0 outside lists
};

void BlockClassifier::split_lines() {
    size_t start = 0;
    while (start < len_) {
        const char* nl = (const char*)memchr(text_ + start, '\n', len_ - start);
        size_t stop = nl ? (size_t)(nl - text_) : len_;
        size_t end = stop;
        if (end > start && text_[end - 1] == '\r') end--;
        lines_.push_back({start, end, nl ? stop + 1 : len_});
        start = nl ? stop + 1 : len_;
    }
}

bool BlockClassifier::starts_table(size_t i) const {
    if (!memchr(line_ptr(i), '|', line_len(i))) return false;
    return i + 1 < lines_.size() && is_table_delimiter(line_ptr(i + 1), line_len(i + 1));
}

bool BlockClassifier::starts_definition(size_t i) const {
    size_t bytes;
    if (get_indentation(line_ptr(i), line_len(i), &bytes) >= 4) return false;
    return is_definition_line(line_ptr(i) + bytes, line_len(i) - bytes);
}

// Does line i end the list item or definition above it? Markers are
// checked on the line with all of its indentation removed, so nested
// items, fences and quotes end the container at any depth.
bool BlockClassifier::interrupts_container(size_t i) const {
    size_t bytes;
    get_indentation(line_ptr(i), line_len(i), &bytes);
    const char* p = line_ptr(i) + bytes;
    size_t n = line_len(i) - bytes;
    return is_block_start(p, n) || is_setext_underline(p, n) || starts_table(i);
}

Block& BlockClassifier::push(BlockKind kind, size_t first, size_t count) {
    Block block;
    block.kind = kind;
    block.start = lines_[first].start;
    block.end = lines_[first + count - 1].next;
    block.first_line = first;
    block.line_count = count;
    block.depth = 0;
    block.is_term = false;
    block.verbatim = false;
    blocks_.push_back(std::move(block));
    return blocks_.back();
}

ByteRange BlockClassifier::trimmed_content(size_t i) const {
    size_t bytes;
    get_indentation(line_ptr(i), line_len(i), &bytes);
    return {lines_[i].start + bytes, lines_[i].end};
}

void BlockClassifier::push_paragraph(size_t first, size_t count) {
    Block& block = push(BlockKind::Paragraph, first, count);
    size_t bytes;
    get_indentation(line_ptr(first), line_len(first), &bytes);
    block.prefix.assign(line_ptr(first), bytes);
    block.continuation_indent = block.prefix;
    for (size_t i = first; i < first + count; i++) block.lines.push_back(trimmed_content(i));
}

size_t BlockClassifier::front_matter() {
    if (lines_.empty()) return 0;
    const char* p = line_ptr(0);
    size_t n = line_len(0);
    while (n > 0 && (p[n - 1] == ' ' || p[n - 1] == '\t')) n--;
    const char* close_a;
    const char* close_b;
    if (n == 3 && memcmp(p, "---", 3) == 0) {
        close_a = "---";
        close_b = "...";
    } else if (n == 3 && memcmp(p, "+++", 3) == 0) {
        close_a = close_b = "+++";
    } else {
        return 0;
    }
    for (size_t i = 1; i < lines_.size(); i++) {
        const char* q = line_ptr(i);
        size_t m = line_len(i);
        while (m > 0 && (q[m - 1] == ' ' || q[m - 1] == '\t')) m--;
        if (m == 3 && (memcmp(q, close_a, 3) == 0 || memcmp(q, close_b, 3) == 0)) {
            push(BlockKind::FrontMatter, 0, i + 1);
            return i + 1;
        }
    }
    return 0;
}

size_t BlockClassifier::blank_lines(size_t first) {
    size_t i = first;
    while (i < lines_.size() && blank(i)) i++;
    push(BlockKind::Blank, first, i - first);
    return i;
}

size_t BlockClassifier::indented_code(size_t first) {
    size_t last = first;
    for (size_t i = first + 1; i < lines_.size(); i++) {
        if (blank(i)) continue;
        if (get_indentation(line_ptr(i), line_len(i), NULL) < 4) break;
        last = i;
    }
    // trailing blank lines belong to what follows
    push(BlockKind::CodeBlock, first, last - first + 1);
    return last + 1;
}

size_t BlockClassifier::fenced_code(size_t first, char ch, size_t open_len, size_t open_cols) {
    for (size_t i = first + 1; i < lines_.size(); i++) {
        size_t bytes;
        if (get_indentation(line_ptr(i), line_len(i), &bytes) >= open_cols + 4) continue;
        if (is_closing_fence(line_ptr(i) + bytes, line_len(i) - bytes, ch, open_len)) {
            push(BlockKind::CodeBlock, first, i - first + 1);
            return i + 1;
        }
    }
    clog_debug(reflow_log(), "block: unclosed fence at line %zu runs to the end", first + 1);
    push(BlockKind::CodeBlock, first, lines_.size() - first);
    return lines_.size();
}

size_t BlockClassifier::math_block(size_t first) {
    ByteRange content = trimmed_content(first);
    size_t n = content.end - content.begin;
    const char* p = text_ + content.begin;
    while (n > 0 && (p[n - 1] == ' ' || p[n - 1] == '\t')) n--;
    // $$ x $$ on one line
    if (n >= 4 && p[n - 1] == '$' && p[n - 2] == '$') {
        push(BlockKind::MathBlock, first, 1);
        return first + 1;
    }
    for (size_t i = first + 1; i < lines_.size(); i++) {
        const char* q = line_ptr(i);
        size_t m = line_len(i);
        while (m > 0 && (q[m - 1] == ' ' || q[m - 1] == '\t')) m--;
        if (m >= 2 && q[m - 1] == '$' && q[m - 2] == '$') {
            push(BlockKind::MathBlock, first, i - first + 1);
            return i + 1;
        }
    }
    push(BlockKind::MathBlock, first, 1);
    return first + 1;
}

size_t BlockClassifier::table(size_t first) {
    size_t i = first + 1;
    while (i < lines_.size() && !blank(i) && memchr(line_ptr(i), '|', line_len(i))) i++;
    push(BlockKind::Table, first, i - first);
    return i;
}

size_t BlockClassifier::html_block(size_t first) {
    size_t i = first + 1;
    while (i < lines_.size() && !blank(i)) i++;
    push(BlockKind::HtmlBlock, first, i - first);
    return i;
}

// Quote markers of one line: depth, and the offset where content starts.
static int get_quote_depth(const char* line, size_t len, size_t* content) {
    int depth = 0;
    size_t i = 0;
    while (true) {
        size_t j = i, spaces = 0;
        while (j < len && line[j] == ' ' && spaces < 3) {
            j++;
            spaces++;
        }
        if (j >= len || line[j] != '>') break;
        depth++;
        i = j + 1;
        if (i < len && line[i] == ' ') i++;
    }
    *content = i;
    return depth;
}

size_t BlockClassifier::blockquote(size_t first) {
    size_t indent_bytes;
    get_indentation(line_ptr(first), line_len(first), &indent_bytes);
    std::string indent(line_ptr(first), indent_bytes);
    size_t base_cols = get_indentation(line_ptr(first), line_len(first), NULL);

    char fence_char = 0;
    size_t fence_len = 0;
    size_t i = first;
    size_t group_start = first;
    int group_depth = 0;
    std::vector<ByteRange> group;

    auto flush_group = [&]() {
        if (group.empty()) return;
        Block& block = push(BlockKind::BlockquoteLine, group_start, group.size());
        block.depth = group_depth;
        block.prefix = indent;
        for (int d = 0; d < group_depth; d++) block.prefix += "> ";
        block.continuation_indent = block.prefix;
        block.lines = std::move(group);
        group.clear();
    };

    while (i < lines_.size()) {
        const char* p = line_ptr(i);
        size_t n = line_len(i);
        size_t bytes;
        if (blank(i) || get_indentation(p, n, &bytes) >= base_cols + 4 || bytes >= n || p[bytes] != '>') break;

        size_t offset;
        int depth = get_quote_depth(p + bytes, n - bytes, &offset);
        const char* content = p + bytes + offset;
        size_t content_len = n - bytes - offset;

        bool verbatim = false;
        if (fence_len) {
            verbatim = true;
            size_t cb;
            get_indentation(content, content_len, &cb);
            if (is_closing_fence(content + cb, content_len - cb, fence_char, fence_len)) fence_len = 0;
        } else if (is_blank_line(content, content_len) || is_block_start(content, content_len) ||
                   content[0] == ' ' || content[0] == '\t') {
            verbatim = true;
            size_t cb;
            if (get_indentation(content, content_len, &cb) < 4) {
                char ch;
                size_t run = get_fence_length(content + cb, content_len - cb, &ch);
                if (run) {
                    fence_char = ch;
                    fence_len = run;
                }
            }
        }

        if (verbatim || depth != group_depth || bytes != indent_bytes) flush_group();
        if (verbatim) {
            Block& block = push(BlockKind::BlockquoteLine, i, 1);
            block.depth = depth;
            block.verbatim = true;
        } else {
            if (group.empty()) {
                group_start = i;
                group_depth = depth;
                indent.assign(p, bytes);
                indent_bytes = bytes;
            }
            group.push_back({lines_[i].start + bytes + offset, lines_[i].end});
        }
        i++;
    }
    flush_group();
    return i;
}

size_t BlockClassifier::list_item(size_t first) {
    const char* p = line_ptr(first);
    size_t n = line_len(first);
    size_t bytes;
    get_indentation(p, n, &bytes);
    size_t marker_len = get_list_marker_length(p + bytes, n - bytes);

    size_t content = bytes + marker_len;
    size_t spaces = 0;
    while (content + spaces < n && (p[content + spaces] == ' ' || p[content + spaces] == '\t')) spaces++;
    if (content + spaces >= n) spaces = 0;    // empty item
    else if (spaces > 4) spaces = 1;          // indented code after the marker
    content += spaces;

    size_t last = first;
    for (size_t i = first + 1; i < lines_.size(); i++) {
        if (blank(i) || interrupts_container(i)) break;
        last = i;
    }

    Block& block = push(BlockKind::ListItem, first, last - first + 1);
    block.marker.assign(p + bytes, marker_len);
    block.prefix.assign(p, content);
    if (spaces == 0) block.prefix += ' ';
    block.continuation_indent.assign(text_columns(block.prefix), ' ');
    block.lines.push_back({lines_[first].start + content, lines_[first].end});
    for (size_t i = first + 1; i <= last; i++) block.lines.push_back(trimmed_content(i));
    block.verbatim = is_blank_line(p + content, n - content);
    list_indent_ = text_columns(block.prefix);
    return last + 1;
}

size_t BlockClassifier::definition(size_t first) {
    const char* p = line_ptr(first);
    size_t n = line_len(first);
    size_t bytes;
    get_indentation(p, n, &bytes);
    size_t content = bytes + 1;
    while (content < n && (p[content] == ' ' || p[content] == '\t')) content++;

    size_t last = first;
    for (size_t i = first + 1; i < lines_.size(); i++) {
        if (blank(i) || interrupts_container(i)) break;
        if (get_indentation(line_ptr(i), line_len(i), NULL) == 0) break;
        last = i;
    }

    Block& block = push(BlockKind::DefinitionEntry, first, last - first + 1);
    block.prefix.assign(p, content);
    if (content == bytes + 1) block.prefix += ' ';
    block.continuation_indent.assign(text_columns(block.prefix), ' ');
    block.lines.push_back({lines_[first].start + content, lines_[first].end});
    for (size_t i = first + 1; i <= last; i++) block.lines.push_back(trimmed_content(i));
    block.verbatim = content >= n;
    return last + 1;
}

size_t BlockClassifier::paragraph(size_t first) {
    size_t last = first;
    for (size_t i = first + 1; i < lines_.size(); i++) {
        const char* p = line_ptr(i);
        size_t n = line_len(i);
        if (blank(i)) break;
        if (is_setext_underline(p, n)) {
            push(BlockKind::Heading, first, i - first + 1);
            return i + 1;
        }
        if (list_indent_ ? interrupts_container(i) : is_block_start(p, n) || starts_table(i)) break;
        last = i;
    }

    // the line right before ": definition" is its term
    if (last + 1 < lines_.size() && starts_definition(last + 1)) {
        if (last > first) push_paragraph(first, last - first);
        Block& term = push(BlockKind::DefinitionEntry, last, 1);
        term.is_term = true;
        term.verbatim = true;
        term.lines.push_back(trimmed_content(last));
        return last + 1;
    }
    push_paragraph(first, last - first + 1);
    return last + 1;
}

size_t BlockClassifier::classify_at(size_t first) {
    if (blank(first)) return blank_lines(first);

    const char* line = line_ptr(first);
    size_t len = line_len(first);
    size_t bytes;
    size_t cols = get_indentation(line, len, &bytes);
    const char* p = line + bytes;
    size_t n = len - bytes;
    // a line left of the open item's content column closes the list
    if (cols < list_indent_ && !get_list_marker_length(p, n)) list_indent_ = cols;
    if (cols >= 4 && !(list_indent_ && cols < list_indent_ + 4)) return indented_code(first);

    char fence_char;
    size_t fence_len = get_fence_length(p, n, &fence_char);
    if (fence_len) return fenced_code(first, fence_char, fence_len, cols);
    if (is_math_fence(p, n)) return math_block(first);
    if (get_header_level(p, n)) {
        push(BlockKind::Heading, first, 1);
        return first + 1;
    }
    // before lists: "* * *" is a rule, not an item
    if (is_thematic_break(p, n)) {
        push(BlockKind::ThematicBreak, first, 1);
        return first + 1;
    }
    if (p[0] == '>') return blockquote(first);
    if (get_list_marker_length(p, n)) return list_item(first);
    if (is_definition_line(p, n)) return definition(first);
    if (is_link_definition(p, n)) {
        push(BlockKind::LinkDefinition, first, 1);
        return first + 1;
    }
    if (p[0] == '|' || starts_table(first)) return table(first);
    if (is_html_start(p, n)) return html_block(first);
    return paragraph(first);
}

std::vector<Block> BlockClassifier::classify() {
    size_t i = front_matter();
    while (i < lines_.size()) i = classify_at(i);
    clog_debug(reflow_log(), "block: %zu lines classified into %zu blocks", lines_.size(), blocks_.size());
    return std::move(blocks_);
}

std::vector<Block> classify_blocks(const char* text, size_t len) {
    if (!text || len == 0) return std::vector<Block>();
    BlockClassifier classifier(text, len);
    return classifier.classify();
}

} // namespace mdlint
