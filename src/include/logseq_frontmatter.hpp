#pragma once

#include "duckdb.hpp"
#include "logseq_properties.hpp"

namespace duckdb {

struct ParsedFrontmatter {
	string yaml_block;      // text between the delimiter lines
	PropertyMap properties; // empty for an empty or null block
	size_t body_offset = 0; // byte offset in the original text where the body starts
};

// Parse a YAML frontmatter block anchored at the start of s. Returns nullptr if absent
// or malformed; for a malformed block the reason is written to diagnostic (if given)
// and the caller keeps the whole text as body.
unique_ptr<ParsedFrontmatter> ParseFrontmatter(const string &s, string *diagnostic = nullptr);

// Rewrite every plain YAML date/timestamp scalar at or below node id to ISO-8601.
void NormalizeTimestamps(ryml::Tree &tree, ryml::id_type id);

// ISO-8601 rendering of a YAML 1.1 date or timestamp. Returns false if text is neither.
bool YamlTimestampToIso(const string &text, string &iso);

} // namespace duckdb
