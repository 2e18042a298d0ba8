// reflow_block.hpp - Block Classifier
//
// Partitions a document into consecutive blocks. Every byte of the input,
// line endings included, belongs to exactly one block. Only paragraphs,
// list items, blockquote lines and definition entries are candidates for
// reflow; everything else is copied through untouched.
//
// This is not a CommonMark parser. It recognizes exactly what a rewrap
// must not break: fences, indented code, math blocks, headings (ATX and
// setext), thematic breaks, tables, HTML blocks, link reference
// definitions and front matter.

#ifndef MDLINT_REFLOW_BLOCK_HPP
#define MDLINT_REFLOW_BLOCK_HPP

#include "reflow_sentence.hpp"
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace mdlint {

enum class BlockKind : uint8_t {
    Blank,
    Paragraph,
    ListItem,
    BlockquoteLine,
    DefinitionEntry,
    Heading,
    CodeBlock,
    MathBlock,
    Table,
    HtmlBlock,
    FrontMatter,
    ThematicBreak,
    LinkDefinition,
};

struct Block {
    BlockKind kind;
    size_t start;                     // first byte
    size_t end;                       // past the last byte, final line ending included
    size_t first_line;                // 0-based line number of the first line
    size_t line_count;
    std::string marker;               // list marker ("-", "12."), empty otherwise
    std::string prefix;               // written before the first output line
    std::string continuation_indent;  // written before every following line
    int depth;                        // blockquote nesting, 0 outside quotes
    bool is_term;                     // definition term line
    bool verbatim;                    // eligible kind that must still be copied as is
    std::vector<ByteRange> lines;     // inline content per line, prefix and line ending excluded

    bool eligible() const;
};

std::vector<Block> classify_blocks(const char* text, size_t len);

inline std::vector<Block> classify_blocks(const std::string& text) {
    return classify_blocks(text.data(), text.size());
}

// Would this line (without its line ending) open a new block when it
// follows a paragraph line?
bool is_block_start(const char* line, size_t len);

// Would a line that begins with this token open a block?
bool token_starts_block(const char* token, size_t len);

const char* block_kind_name(BlockKind kind);

} // namespace mdlint

#endif // MDLINT_REFLOW_BLOCK_HPP
