#pragma once

#include "duckdb.hpp"
#include <ryml/ryml.hpp>

namespace duckdb {

// String-keyed map of arbitrary YAML/JSON values. Backed by a ryml::Tree whose
// root is always a mapping; all scalars live in the tree's own arena so copies
// are self-contained.
class PropertyMap {
public:
	PropertyMap();

	bool empty() const;
	idx_t size() const;

	bool Contains(const string &key) const;
	// Scalar value of key, or empty string when absent or not a scalar.
	string GetString(const string &key) const;
	void SetString(const string &key, const string &value);

	// Shallow merge: every key of overrides replaces (in place) or is appended.
	void Merge(const PropertyMap &overrides);
	// tags/alias/aliases given as {name: bool} mappings become [name, ...] lists.
	void NormalizeListProperties();

	string ToJson() const;
	// Throws InvalidInputException unless json is an object (or empty).
	static PropertyMap FromJson(const string &json);
	// Copies the root mapping of tree. Non-mapping roots give an empty map.
	static PropertyMap FromTree(const ryml::Tree &tree);
	// Copies the entries of mapping node id of tree.
	static PropertyMap FromTreeNode(const ryml::Tree &tree, ryml::id_type id);

	// Append a copy of every entry as children of map node dst_id in dst.
	void CopyEntriesInto(ryml::Tree &dst, ryml::id_type dst_id) const;

private:
	ryml::Tree tree;
};

// Explicit properties take precedence over frontmatter ones on key collision.
PropertyMap MergeProperties(const PropertyMap &frontmatter, const PropertyMap &explicit_properties);

// Deep copy of node src_id of src as a new child of dst_parent in dst, inserted after
// dst_after (ryml::NONE for first position). Returns the new node id.
ryml::id_type CopyYamlNode(const ryml::Tree &src, ryml::id_type src_id, ryml::Tree &dst, ryml::id_type dst_parent,
                           ryml::id_type dst_after);

// Parse text into tree; ryml errors are raised as std::runtime_error.
void ParseYamlInArena(const string &text, ryml::Tree &tree);
void ParseJsonInArena(const string &text, ryml::Tree &tree);

} // namespace duckdb
