#pragma once

#include "duckdb.hpp"
#include "logseq_line_classifier.hpp"
#include "logseq_properties.hpp"

namespace duckdb {

enum class BlockType : uint8_t {
	HEADING,   // "# ..." line, markers kept
	LIST_ITEM, // checkbox, bullet, numbered or capitalized marker item
	TEXT,      // non-list line nested under a list item
	PARAGRAPH, // run of consecutive plain lines
	CODE,      // fenced code, fences included
	QUOTE,     // run of consecutive "> ..." lines
	RULE       // horizontal rule
};

struct BlockNode {
	BlockNode(BlockType type, string content, idx_t level = 0);

	BlockType type;
	string content;
	vector<unique_ptr<BlockNode>> children;
	PropertyMap properties;
	// heading level for headings, indentation depth for list items and their text
	idx_t level;
};

struct ParsedDocument {
	PropertyMap properties; // frontmatter only
	vector<unique_ptr<BlockNode>> blocks;
	vector<string> diagnostics;
	size_t body_offset = 0; // where the blocks' text starts in the parsed input
};

// Single forward pass over the lines of a frontmatter-free body. Open headings are
// tracked on heading_stack (outermost first); every other block is attached to the
// innermost open heading, or becomes a root when none is open.
class BlockTreeBuilder {
public:
	explicit BlockTreeBuilder(const string &body);

	// Run the scan and hand over the root blocks. The builder is spent afterwards.
	vector<unique_ptr<BlockNode>> Build();

private:
	idx_t ParseFencedCode(idx_t start);
	idx_t ParseHeading(idx_t start);
	idx_t ParseBlockquote(idx_t start);
	idx_t ParseParagraph(idx_t start);
	// List item at lines[start] plus everything indented below it. Returns the next
	// line to process.
	idx_t ParseListItem(idx_t start, unique_ptr<BlockNode> &result);
	void Attach(unique_ptr<BlockNode> node);

	vector<string> lines;
	vector<ClassifiedLine> classified;
	vector<unique_ptr<BlockNode>> roots;
	vector<BlockNode *> heading_stack;
};

vector<unique_ptr<BlockNode>> ParseBlocks(const string &body);

// Frontmatter extraction followed by block parsing. Never throws on any input.
ParsedDocument ParseDocument(const string &text);

const char *BlockTypeToString(BlockType type);

} // namespace duckdb
