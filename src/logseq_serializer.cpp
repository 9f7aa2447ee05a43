#include "logseq_serializer.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <ryml/ryml_std.hpp>
#include <stdexcept>

namespace duckdb {

void BlockToTree(const BlockNode &block, ryml::Tree &tree, ryml::id_type id) {
	tree.to_map(id);

	// content is always a JSON string, even when it looks like a number
	ryml::id_type content_id = tree.append_child(id);
	tree.to_keyval(content_id, ryml::to_csubstr("content"), ryml::csubstr(), ryml::VAL_DQUO);
	tree.set_val(content_id, tree.to_arena(ryml::to_csubstr(block.content)));

	if (!block.children.empty()) {
		ryml::id_type children_id = tree.append_child(id);
		tree.to_seq(children_id, ryml::to_csubstr("children"));
		for (auto &child : block.children) {
			BlockToTree(*child, tree, tree.append_child(children_id));
		}
	}

	if (!block.properties.empty()) {
		ryml::id_type properties_id = tree.append_child(id);
		tree.to_map(properties_id, ryml::to_csubstr("properties"));
		block.properties.CopyEntriesInto(tree, properties_id);
	}
}

string BlocksToJson(const vector<unique_ptr<BlockNode>> &blocks) {
	if (blocks.empty()) {
		return "[]";
	}
	ryml::Tree tree;
	ryml::id_type root = tree.root_id();
	tree.to_seq(root);
	for (auto &block : blocks) {
		BlockToTree(*block, tree, tree.append_child(root));
	}
	return ryml::emitrs_json<string>(tree);
}

string DocumentToJson(const ParsedDocument &doc) {
	ryml::Tree tree;
	ryml::id_type root = tree.root_id();
	tree.to_map(root);

	ryml::id_type properties_id = tree.append_child(root);
	tree.to_map(properties_id, ryml::to_csubstr("properties"));
	doc.properties.CopyEntriesInto(tree, properties_id);

	ryml::id_type blocks_id = tree.append_child(root);
	tree.to_seq(blocks_id, ryml::to_csubstr("blocks"));
	for (auto &block : doc.blocks) {
		BlockToTree(*block, tree, tree.append_child(blocks_id));
	}
	return ryml::emitrs_json<string>(tree);
}

static unique_ptr<BlockNode> BlockFromTree(const ryml::Tree &tree, ryml::id_type id) {
	if (!tree.is_map(id)) {
		throw InvalidInputException("Block record must be a JSON object");
	}
	ryml::id_type content_id = tree.find_child(id, ryml::to_csubstr("content"));
	if (content_id == ryml::NONE || !tree.has_val(content_id) || !tree.is_val_quoted(content_id)) {
		throw InvalidInputException("Block record is missing a \"content\" string");
	}
	ryml::csubstr content = tree.val(content_id);
	auto block = make_uniq<BlockNode>(BlockType::PARAGRAPH, content.str ? string(content.str, content.len) : string());

	ryml::id_type children_id = tree.find_child(id, ryml::to_csubstr("children"));
	if (children_id != ryml::NONE) {
		if (!tree.is_seq(children_id)) {
			throw InvalidInputException("Block \"children\" must be a JSON array");
		}
		for (ryml::id_type child = tree.first_child(children_id); child != ryml::NONE;
		     child = tree.next_sibling(child)) {
			block->children.push_back(BlockFromTree(tree, child));
		}
	}

	ryml::id_type properties_id = tree.find_child(id, ryml::to_csubstr("properties"));
	if (properties_id != ryml::NONE) {
		if (!tree.is_map(properties_id)) {
			throw InvalidInputException("Block \"properties\" must be a JSON object");
		}
		block->properties = PropertyMap::FromTreeNode(tree, properties_id);
	}
	return block;
}

vector<unique_ptr<BlockNode>> BlocksFromJson(const string &json) {
	vector<unique_ptr<BlockNode>> result;
	if (json.find_first_not_of(" \t\r\n") == string::npos) {
		return result;
	}
	ryml::Tree tree;
	try {
		ParseJsonInArena(json, tree);
	} catch (std::exception &ex) {
		throw InvalidInputException("Invalid block JSON: %s", ex.what());
	}
	ryml::id_type root = tree.root_id();
	if (!tree.is_seq(root)) {
		throw InvalidInputException("Blocks must be a JSON array of records");
	}
	for (ryml::id_type child = tree.first_child(root); child != ryml::NONE; child = tree.next_sibling(child)) {
		result.push_back(BlockFromTree(tree, child));
	}
	return result;
}

static void FlattenBlock(const BlockNode &block, int64_t parent_id, idx_t depth, idx_t position,
                         vector<FlatBlock> &rows) {
	FlatBlock row;
	row.block_id = rows.size();
	row.parent_id = parent_id;
	row.depth = depth;
	row.position = position;
	row.type = block.type;
	row.content = block.content;
	rows.push_back(std::move(row));

	auto block_id = int64_t(rows.back().block_id);
	for (idx_t i = 0; i < block.children.size(); i++) {
		FlattenBlock(*block.children[i], block_id, depth + 1, i, rows);
	}
}

vector<FlatBlock> FlattenBlocks(const vector<unique_ptr<BlockNode>> &blocks) {
	vector<FlatBlock> rows;
	for (idx_t i = 0; i < blocks.size(); i++) {
		FlattenBlock(*blocks[i], -1, 0, i, rows);
	}
	return rows;
}

static void FormatBlock(const BlockNode &block, idx_t depth, int64_t max_depth, vector<string> &lines) {
	string content = TrimLine(block.content);
	if (content.empty()) {
		return;
	}
	lines.push_back(string(depth * 2, ' ') + "- " + content);
	if (max_depth != -1 && int64_t(depth) >= max_depth) {
		return;
	}
	for (auto &child : block.children) {
		FormatBlock(*child, depth + 1, max_depth, lines);
	}
}

string FormatBlockTree(const vector<unique_ptr<BlockNode>> &blocks, int64_t max_depth) {
	vector<string> lines;
	for (auto &block : blocks) {
		FormatBlock(*block, 0, max_depth, lines);
	}
	return StringUtil::Join(lines, "\n");
}

} // namespace duckdb
