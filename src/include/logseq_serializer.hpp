#pragma once

#include "duckdb.hpp"
#include "logseq_block_parser.hpp"

namespace duckdb {

// Batch-insert records: [{"content": ..., "children"?: [...], "properties"?: {...}}].
// Empty children and properties are omitted rather than emitted as empty containers.
string BlocksToJson(const vector<unique_ptr<BlockNode>> &blocks);

// {"properties": {...}, "blocks": [...]}
string DocumentToJson(const ParsedDocument &doc);

// Write block as a record into map node id of tree.
void BlockToTree(const BlockNode &block, ryml::Tree &tree, ryml::id_type id);

// Read records produced by BlocksToJson (or supplied by a caller) back into blocks.
// Throws InvalidInputException on anything that is not an array of such records.
vector<unique_ptr<BlockNode>> BlocksFromJson(const string &json);

struct FlatBlock {
	idx_t block_id;    // pre-order index
	int64_t parent_id; // -1 for root blocks
	idx_t depth;
	idx_t position; // index among siblings
	BlockType type;
	string content;
};

vector<FlatBlock> FlattenBlocks(const vector<unique_ptr<BlockNode>> &blocks);

// Indented "- content" outline, two spaces per level. Blocks with blank content are
// skipped together with their subtree; children below max_depth are left out
// (max_depth -1 means unlimited).
string FormatBlockTree(const vector<unique_ptr<BlockNode>> &blocks, int64_t max_depth = -1);

} // namespace duckdb
