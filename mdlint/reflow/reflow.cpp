// reflow.cpp - Reflow orchestration
//
// An eligible block's content lines are cut into parts at hard breaks
// (and, in sentence mode, after lines that already end a sentence). Each
// part is reflowed on its own: its first line continues where the block
// prefix or the previous part left off, every other line starts with the
// block's continuation indent.

#include "reflow.hpp"
#include "reflow_block.hpp"
#include "reflow_emphasis.hpp"
#include "reflow_pack.hpp"
#include "reflow_sentence.hpp"
#include "reflow_span.hpp"
#include "reflow_width.hpp"
#include <string.h>

namespace mdlint {

namespace {

// Built once per call and passed down.
struct ReflowContext {
    const ReflowOptions& options;
    AbbreviationSet abbreviations;

    explicit ReflowContext(const ReflowOptions& opts)
        : options(opts), abbreviations(opts.abbreviations) {}
};

struct Part {
    std::string text;     // content lines joined by '\n'
    const char* marker;   // hard break written after the part: "", "  " or "\\"
};

} // namespace

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Strip the line's trailing blanks and detect a hard break. *body_len
// receives the length of the text that is kept.
static const char* take_hard_break(const char* line, size_t len, size_t* body_len) {
    size_t spaces = 0;
    while (spaces < len && line[len - 1 - spaces] == ' ') spaces++;
    if (spaces >= 2) {
        size_t n = len - spaces;
        while (n > 0 && is_space(line[n - 1])) n--;
        *body_len = n;
        return n > 0 ? "  " : "";
    }

    size_t n = len;
    while (n > 0 && is_space(line[n - 1])) n--;
    size_t slashes = 0;
    while (slashes < n && line[n - 1 - slashes] == '\\') slashes++;
    if (slashes % 2 == 1) {
        size_t body = n - 1;
        while (body > 0 && is_space(line[body - 1])) body--;
        *body_len = body;
        return "\\";
    }
    *body_len = n;
    return "";
}

static std::vector<Part> split_parts(const char* text, const std::vector<ByteRange>& lines,
                                     const ReflowContext& ctx, bool sentence_mode) {
    std::vector<Part> parts;
    Part current{std::string(), ""};
    bool open = false;
    for (size_t k = 0; k < lines.size(); k++) {
        const char* line = text + lines[k].begin;
        size_t len = lines[k].end - lines[k].begin;
        while (len > 0 && is_space(*line)) {
            line++;
            len--;
        }
        size_t body;
        const char* marker = take_hard_break(line, len, &body);

        if (open && body > 0) current.text += '\n';
        current.text.append(line, body);
        open = open || body > 0;

        bool last = k + 1 == lines.size();
        bool cut = marker[0] || ctx.options.preserve_breaks ||
                   (sentence_mode && line_ends_sentence(line, body, ctx.abbreviations));
        if (cut || last) {
            current.marker = marker;
            parts.push_back(std::move(current));
            current = Part{std::string(), ""};
            open = false;
        }
    }
    return parts;
}

static std::vector<std::string> pack_text(const std::string& text, const ReflowContext& ctx,
                                          size_t width, size_t first_offset, const std::string& indent,
                                          bool mark_sentences) {
    const ReflowOptions& options = ctx.options;
    SpanMap map = scan_spans(text);
    std::vector<Token> tokens = tokenize(text.data(), text.size(), map, options.length_mode);
    if (mark_sentences) {
        std::vector<ByteRange> opaque;
        collect_opaque_ranges(text.data(), map, map.roots, &opaque);
        mark_sentence_ends(split_sentence_ranges(text.data(), 0, text.size(), ctx.abbreviations, &opaque),
                           &tokens);
    }

    PackParams params;
    params.width = width;
    params.first_offset = first_offset;
    params.indent = indent;
    params.length_mode = options.length_mode;
    params.break_on_sentences = mark_sentences;
    params.starts_block = token_starts_block;
    return pack_tokens(tokens, params);
}

static void push_sentence(std::vector<std::string>* sentences, std::string text) {
    size_t begin = 0, end = text.size();
    while (begin < end && is_space(text[begin])) begin++;
    while (end > begin && is_space(text[end - 1])) end--;
    if (begin == end) return;
    std::string sentence = text.substr(begin, end - begin);

    // a sentence that would open a block on its own line stays with the one before
    size_t lead = 0;
    while (lead < sentence.size() && !is_space(sentence[lead])) lead++;
    if (!sentences->empty() && token_starts_block(sentence.data(), lead)) {
        sentences->back() += ' ';
        sentences->back() += sentence;
        return;
    }
    sentences->push_back(std::move(sentence));
}

// Sentences of one part, emphasis spans continued across their sentences.
static std::vector<std::string> part_sentences(const std::string& text, const ReflowContext& ctx) {
    SpanMap map = scan_spans(text);
    std::vector<ByteRange> opaque;
    collect_opaque_ranges(text.data(), map, map.roots, &opaque);
    std::vector<ByteRange> ranges =
        split_sentence_ranges(text.data(), 0, text.size(), ctx.abbreviations, &opaque);

    std::vector<std::string> sentences;
    size_t root = 0;
    for (const ByteRange& range : ranges) {
        std::string current;
        size_t pos = range.begin;
        while (root < map.roots.size() && map.root(root).start < range.begin) root++;
        for (; root < map.roots.size() && map.root(root).start < range.end; root++) {
            const ProtectedSpan& span = map.root(root);
            if (span.end > range.end) break;
            if (span.is_leaf()) continue;
            std::vector<std::string> pieces = continue_emphasis(text.data(), map, map.roots[root],
                                                                ctx.abbreviations);
            if (pieces.size() < 2) continue;

            current.append(text, pos, span.start - pos);
            current += pieces[0];
            push_sentence(&sentences, std::move(current));
            for (size_t k = 1; k + 1 < pieces.size(); k++) push_sentence(&sentences, pieces[k]);
            current = pieces.back();
            pos = span.end;
        }
        current.append(text, pos, range.end - pos);
        push_sentence(&sentences, std::move(current));
    }
    return sentences;
}

static std::vector<std::string> reflow_part(const std::string& text, const ReflowContext& ctx,
                                            bool sentence_mode, size_t first_offset,
                                            const std::string& indent) {
    const ReflowOptions& options = ctx.options;
    if (!sentence_mode) {
        return pack_text(text, ctx, options.line_length, first_offset, indent, options.break_on_sentences);
    }

    size_t width = options.semantic_line_breaks ? options.line_length : 0;
    size_t indent_width = measure_width(indent, options.length_mode);
    std::vector<std::string> lines;
    for (const std::string& sentence : part_sentences(text, ctx)) {
        bool first = lines.empty();
        std::vector<std::string> packed =
            pack_text(sentence, ctx, width, first ? first_offset : indent_width, indent, false);
        if (packed.empty()) continue;
        if (!first) packed[0] = indent + packed[0];
        for (std::string& line : packed) lines.push_back(std::move(line));
    }
    return lines;
}

// Output lines for the content lines of a block, prefix applied.
static std::vector<std::string> reflow_content(const char* text, const std::vector<ByteRange>& content,
                                               const ReflowContext& ctx, bool sentence_mode,
                                               const std::string& prefix, const std::string& indent) {
    LengthMode mode = ctx.options.length_mode;
    size_t indent_width = measure_width(indent, mode);
    std::vector<std::string> out;
    for (Part& part : split_parts(text, content, ctx, sentence_mode)) {
        bool first = out.empty();
        std::vector<std::string> lines = reflow_part(
            part.text, ctx, sentence_mode, first ? measure_width(prefix, mode) : indent_width, indent);
        if (lines.empty()) lines.push_back(std::string());
        if (!first) lines[0] = indent + lines[0];
        lines.back() += part.marker;
        for (std::string& line : lines) out.push_back(std::move(line));
    }
    if (!out.empty()) out[0] = prefix + out[0];
    return out;
}

// Append the reflowed block to *out. Returns false, writing nothing, when
// the block is kept as is.
static bool reflow_block(const std::string& text, const Block& block, const ReflowContext& ctx,
                         const char* eol, std::string* out) {
    const ReflowOptions& options = ctx.options;
    // definition bodies are wrapped, never split into sentences
    bool sentence_mode = options.splits_sentences() && block.kind != BlockKind::DefinitionEntry;

    size_t raw_end = block.end;
    bool ends_with_newline = raw_end > block.start && text[raw_end - 1] == '\n';
    if (ends_with_newline) raw_end--;
    if (raw_end > block.start && text[raw_end - 1] == '\r') raw_end--;

    if (!sentence_mode && block.lines.size() == 1) {
        size_t width = measure_width(text.data() + block.start, raw_end - block.start, options.length_mode);
        if (options.line_length == 0 || width <= options.line_length) return false;
    }

    std::vector<std::string> lines = reflow_content(text.data(), block.lines, ctx, sentence_mode,
                                                    block.prefix, block.continuation_indent);
    if (lines.empty()) return false;

    for (size_t k = 0; k < lines.size(); k++) {
        if (k) *out += eol;
        *out += lines[k];
    }
    if (ends_with_newline) *out += eol;
    clog_debug(reflow_log(), "reflow: %s block at line %zu, %zu lines in, %zu out",
               block_kind_name(block.kind), block.first_line + 1, block.line_count, lines.size());
    return true;
}

static const char* detect_eol(const std::string& text) {
    size_t nl = text.find('\n');
    return nl != std::string::npos && nl > 0 && text[nl - 1] == '\r' ? "\r\n" : "\n";
}

// ============================================================================
// API
// ============================================================================

std::string reflow_markdown(const std::string& text, const ReflowOptions& options) {
    if (text.empty()) return text;
    ReflowContext ctx(options);
    const char* eol = detect_eol(text);

    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (const Block& block : classify_blocks(text)) {
        if (block.eligible() && reflow_block(text, block, ctx, eol, &out)) continue;
        out.append(text, block.start, block.end - block.start);
    }
    return out;
}

std::vector<std::string> reflow_line(const std::string& text, const ReflowOptions& options) {
    ReflowContext ctx(options);
    bool sentence_mode = options.splits_sentences();
    if (!sentence_mode) {
        bool single = text.find('\n') == std::string::npos;
        if (options.line_length == 0 ||
            (single && measure_width(text, options.length_mode) <= options.line_length)) {
            return std::vector<std::string>{text};
        }
    }

    std::vector<ByteRange> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        size_t stop = nl == std::string::npos ? text.size() : nl;
        size_t end = stop;
        if (end > start && text[end - 1] == '\r') end--;
        lines.push_back({start, end});
        if (nl == std::string::npos) break;
        start = nl + 1;
    }

    std::vector<std::string> out = reflow_content(text.data(), lines, ctx, sentence_mode,
                                                  std::string(), std::string());
    if (out.empty()) out.push_back(std::string());
    return out;
}

bool reflow_paragraph_at_line(const std::string& content, size_t line_number, size_t line_length,
                              ParagraphReflow* out) {
    if (!out || line_number == 0) return false;
    size_t line = line_number - 1;
    for (const Block& block : classify_blocks(content)) {
        if (line < block.first_line || line >= block.first_line + block.line_count) continue;
        if (block.kind != BlockKind::Paragraph) {
            clog_debug(reflow_log(), "reflow: line %zu is in a %s block", line_number,
                       block_kind_name(block.kind));
            return false;
        }

        ReflowOptions options = ReflowOptions::defaults();
        options.line_length = line_length;
        ReflowContext ctx(options);
        std::string reflowed;
        if (!reflow_block(content, block, ctx, detect_eol(content), &reflowed)) {
            reflowed = content.substr(block.start, block.end - block.start);
        }
        out->start_byte = block.start;
        out->end_byte = block.end;
        out->reflowed_text = std::move(reflowed);
        return true;
    }
    return false;
}

} // namespace mdlint
