#include "logseq_block_parser.hpp"
#include "logseq_frontmatter.hpp"

namespace duckdb {

BlockNode::BlockNode(BlockType type_p, string content_p, idx_t level_p)
    : type(type_p), content(std::move(content_p)), level(level_p) {
}

BlockTreeBuilder::BlockTreeBuilder(const string &body) {
	size_t begin = 0;
	while (true) {
		size_t end = body.find('\n', begin);
		if (end == string::npos) {
			lines.push_back(body.substr(begin));
			break;
		}
		lines.push_back(body.substr(begin, end - begin));
		begin = end + 1;
	}
	classified.reserve(lines.size());
	for (auto &line : lines) {
		classified.push_back(ClassifyLine(line));
	}
}

vector<unique_ptr<BlockNode>> BlockTreeBuilder::Build() {
	idx_t i = 0;
	while (i < lines.size()) {
		switch (classified[i].kind) {
		case LineKind::BLANK:
			i++;
			break;
		case LineKind::FENCE:
			i = ParseFencedCode(i);
			break;
		case LineKind::HEADING:
			i = ParseHeading(i);
			break;
		case LineKind::HORIZONTAL_RULE:
			Attach(make_uniq<BlockNode>(BlockType::RULE, "---"));
			i++;
			break;
		case LineKind::BLOCKQUOTE:
			i = ParseBlockquote(i);
			break;
		case LineKind::CHECKBOX:
		case LineKind::BULLET:
		case LineKind::NUMBERED:
		case LineKind::MARKER: {
			unique_ptr<BlockNode> item;
			i = ParseListItem(i, item);
			Attach(std::move(item));
			break;
		}
		default:
			i = ParseParagraph(i);
			break;
		}
	}
	heading_stack.clear();
	return std::move(roots);
}

idx_t BlockTreeBuilder::ParseFencedCode(idx_t start) {
	// An unterminated fence runs to the end of the input.
	string code = lines[start];
	idx_t i = start + 1;
	while (i < lines.size()) {
		code += "\n";
		code += lines[i];
		i++;
		if (IsFenceEnd(lines[i - 1])) {
			break;
		}
	}
	Attach(make_uniq<BlockNode>(BlockType::CODE, std::move(code)));
	return i;
}

idx_t BlockTreeBuilder::ParseHeading(idx_t start) {
	idx_t level = classified[start].heading_level;
	while (!heading_stack.empty() && heading_stack.back()->level >= level) {
		heading_stack.pop_back();
	}

	auto heading = make_uniq<BlockNode>(BlockType::HEADING, TrimLine(lines[start]), level);
	BlockNode *open = heading.get();
	if (heading_stack.empty()) {
		roots.push_back(std::move(heading));
	} else {
		heading_stack.back()->children.push_back(std::move(heading));
	}
	heading_stack.push_back(open);
	return start + 1;
}

idx_t BlockTreeBuilder::ParseBlockquote(idx_t start) {
	string quote = RightTrimLine(lines[start]);
	idx_t i = start + 1;
	while (i < lines.size() && classified[i].kind == LineKind::BLOCKQUOTE) {
		quote += "\n";
		quote += RightTrimLine(lines[i]);
		i++;
	}
	Attach(make_uniq<BlockNode>(BlockType::QUOTE, std::move(quote)));
	return i;
}

idx_t BlockTreeBuilder::ParseParagraph(idx_t start) {
	// hard line breaks are folded into single spaces; a marker line only opens a list
	// item when no paragraph precedes it
	string text = TrimLine(lines[start]);
	idx_t i = start + 1;
	while (i < lines.size() &&
	       (classified[i].kind == LineKind::PARAGRAPH || classified[i].kind == LineKind::MARKER)) {
		text += " ";
		text += TrimLine(lines[i]);
		i++;
	}
	Attach(make_uniq<BlockNode>(BlockType::PARAGRAPH, std::move(text)));
	return i;
}

idx_t BlockTreeBuilder::ParseListItem(idx_t start, unique_ptr<BlockNode> &result) {
	const ClassifiedLine &item = classified[start];
	idx_t depth = item.depth;
	result = make_uniq<BlockNode>(BlockType::LIST_ITEM, item.content, depth);

	idx_t i = start + 1;
	while (i < lines.size()) {
		const ClassifiedLine &next = classified[i];
		if (next.kind == LineKind::BLANK) {
			i++;
			continue;
		}
		// siblings, outdented lines and block boundaries all end this item
		if (next.depth <= depth || next.IsBlockBoundary()) {
			break;
		}
		if (next.IsListItem()) {
			unique_ptr<BlockNode> child;
			i = ParseListItem(i, child);
			result->children.push_back(std::move(child));
		} else {
			result->children.push_back(make_uniq<BlockNode>(BlockType::TEXT, TrimLine(lines[i]), next.depth));
			i++;
		}
	}
	return i;
}

void BlockTreeBuilder::Attach(unique_ptr<BlockNode> node) {
	if (heading_stack.empty()) {
		roots.push_back(std::move(node));
	} else {
		heading_stack.back()->children.push_back(std::move(node));
	}
}

vector<unique_ptr<BlockNode>> ParseBlocks(const string &body) {
	if (IsBlankLine(body)) {
		return vector<unique_ptr<BlockNode>>();
	}
	BlockTreeBuilder builder(body);
	return builder.Build();
}

ParsedDocument ParseDocument(const string &text) {
	ParsedDocument result;
	if (IsBlankLine(text)) {
		return result;
	}

	string diagnostic;
	auto fm = ParseFrontmatter(text, &diagnostic);
	if (fm) {
		result.properties = std::move(fm->properties);
		result.body_offset = fm->body_offset;
		result.blocks = ParseBlocks(text.substr(fm->body_offset));
	} else {
		// malformed frontmatter stays in the body untouched
		if (!diagnostic.empty()) {
			result.diagnostics.push_back(std::move(diagnostic));
		}
		result.blocks = ParseBlocks(text);
	}
	return result;
}

const char *BlockTypeToString(BlockType type) {
	switch (type) {
	case BlockType::HEADING:
		return "heading";
	case BlockType::LIST_ITEM:
		return "list_item";
	case BlockType::TEXT:
		return "text";
	case BlockType::PARAGRAPH:
		return "paragraph";
	case BlockType::CODE:
		return "code";
	case BlockType::QUOTE:
		return "quote";
	default:
		return "rule";
	}
}

} // namespace duckdb
