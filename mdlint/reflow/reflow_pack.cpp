// reflow_pack.cpp - Tokenizing and greedy line filling

#include "reflow_pack.hpp"
#include "reflow_width.hpp"
#include <string.h>

namespace mdlint {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static bool consists_of(const std::string& text, const char* set) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!strchr(set, c) || c == '\0') return false;
    }
    return true;
}

bool is_trailing_punctuation(const std::string& text) {
    return consists_of(text, ",.):;");
}

bool is_opening_bracket(const std::string& text) {
    return consists_of(text, "([{");
}

// ============================================================================
// Tokenizer
// ============================================================================

std::vector<Token> tokenize(const char* text, size_t len, const SpanMap& map, LengthMode mode) {
    std::vector<Token> tokens;
    size_t root = 0;
    size_t i = 0;
    while (i < len) {
        while (i < len && is_space(text[i])) i++;
        if (i >= len) break;

        Token token;
        token.start = i;
        token.atomic = false;
        token.starts_with_span = false;
        token.ends_sentence = false;
        while (i < len && !is_space(text[i])) {
            while (root < map.roots.size() && map.root(root).start < i) root++;
            if (root < map.roots.size() && map.root(root).start == i) {
                if (i == token.start) token.starts_with_span = true;
                token.atomic = true;
                i = map.root(root).end;
                root++;
                continue;
            }
            i++;
        }
        token.end = i;

        token.text.reserve(token.end - token.start);
        for (size_t j = token.start; j < token.end; j++) {
            char c = text[j];
            if (c == '\r') continue;
            token.text += c == '\n' || c == '\t' ? ' ' : c;
        }
        token.width = measure_width(token.text, mode);
        tokens.push_back(std::move(token));
    }
    return tokens;
}

void mark_sentence_ends(const std::vector<ByteRange>& sentences, std::vector<Token>* tokens) {
    size_t s = 0;
    for (Token& token : *tokens) {
        while (s < sentences.size() && sentences[s].end < token.end) s++;
        if (s < sentences.size() && sentences[s].end == token.end) token.ends_sentence = true;
    }
}

// ============================================================================
// Packer
// ============================================================================

namespace {

// Tokens glued together; a unit is never broken.
struct Unit {
    std::string text;
    size_t width;
    bool ends_sentence;
};

class LinePacker {
public:
    LinePacker(const PackParams& params)
        : params_(params), indent_width_(measure_width(params.indent, params.length_mode)) {}

    std::vector<std::string> pack(const std::vector<Token>& tokens);

private:
    void build_units(const std::vector<Token>& tokens);
    bool hazardous(size_t u) const;
    void flush(size_t keep);
    size_t line_width(const std::vector<size_t>& line, bool first) const;

    const PackParams& params_;
    size_t indent_width_;
    std::vector<Unit> units_;
    std::vector<size_t> rest_;         // width from a unit to the end of its sentence
    std::vector<size_t> line_;         // units on the line being filled
    size_t width_ = 0;                 // columns used by line_, offset or indent included
    std::vector<std::string> out_;
};

void LinePacker::build_units(const std::vector<Token>& tokens) {
    bool glue_next = false;
    for (size_t t = 0; t < tokens.size(); t++) {
        const Token& token = tokens[t];
        if (!units_.empty() && (glue_next || is_trailing_punctuation(token.text))) {
            Unit& prev = units_.back();
            prev.text += token.text;
            prev.width += token.width;
            prev.ends_sentence = token.ends_sentence;
            glue_next = false;
            continue;
        }
        units_.push_back({token.text, token.width, token.ends_sentence});
        glue_next = is_opening_bracket(token.text) && t + 1 < tokens.size() &&
                    tokens[t + 1].starts_with_span;
    }

    rest_.assign(units_.size(), 0);
    for (size_t u = units_.size(); u-- > 0;) {
        bool last = units_[u].ends_sentence || u + 1 == units_.size();
        rest_[u] = units_[u].width + (last ? 0 : 1 + rest_[u + 1]);
    }
}

bool LinePacker::hazardous(size_t u) const {
    return params_.starts_block && params_.starts_block(units_[u].text.data(), units_[u].text.size());
}

size_t LinePacker::line_width(const std::vector<size_t>& line, bool first) const {
    size_t width = first ? params_.first_offset : indent_width_;
    for (size_t k = 0; k < line.size(); k++) width += units_[line[k]].width + (k ? 1 : 0);
    return width;
}

// Emit the first `keep` units of the current line; the rest start the next.
void LinePacker::flush(size_t keep) {
    std::string text = out_.empty() ? std::string() : params_.indent;
    for (size_t k = 0; k < keep; k++) {
        if (k) text += ' ';
        text += units_[line_[k]].text;
    }
    out_.push_back(std::move(text));
    line_.erase(line_.begin(), line_.begin() + (ptrdiff_t)keep);
    width_ = line_width(line_, false);
}

std::vector<std::string> LinePacker::pack(const std::vector<Token>& tokens) {
    build_units(tokens);
    width_ = params_.first_offset;
    size_t limit = params_.width;

    for (size_t u = 0; u < units_.size(); u++) {
        if (line_.empty()) {
            line_.push_back(u);
            width_ += units_[u].width;
            continue;
        }

        bool fits = limit == 0 || width_ + 1 + units_[u].width <= limit;
        if (fits && limit && params_.break_on_sentences && units_[line_.back()].ends_sentence &&
            width_ * 2 >= limit && width_ + 1 + rest_[u] > limit) {
            fits = false;
        }
        if (fits) {
            line_.push_back(u);
            width_ += 1 + units_[u].width;
            continue;
        }

        size_t keep = line_.size();
        if (hazardous(u)) {
            // carry trailing units down so the new line starts safely
            size_t carried = units_[u].width;
            keep = 0;
            for (size_t k = line_.size(); k-- > 1;) {
                carried += units_[line_[k]].width + 1;
                if (indent_width_ + carried > limit) break;
                if (!hazardous(line_[k])) {
                    keep = k;
                    break;
                }
            }
            if (keep == 0) {
                line_.push_back(u);
                width_ += 1 + units_[u].width;
                continue;
            }
        }
        flush(keep);
        line_.push_back(u);
        width_ = line_width(line_, false);
    }
    if (!line_.empty()) flush(line_.size());
    return std::move(out_);
}

} // namespace

std::vector<std::string> pack_tokens(const std::vector<Token>& tokens, const PackParams& params) {
    LinePacker packer(params);
    return packer.pack(tokens);
}

} // namespace mdlint
