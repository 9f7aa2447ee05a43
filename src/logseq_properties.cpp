#include "logseq_properties.hpp"

#include "duckdb/common/exception.hpp"

#include <ryml/ryml_std.hpp>
#include <stdexcept>

namespace duckdb {

// ryml calls this instead of abort() when it encounters a parse error.
// We throw so that callers can handle malformed YAML gracefully.
static void RymlErrorCallback(const char *msg, size_t msg_len, ryml::Location /*loc*/, void * /*userdata*/) {
	throw std::runtime_error(std::string(msg, msg_len));
}

static ryml::Callbacks ThrowingCallbacks() {
	ryml::Callbacks callbacks = ryml::get_callbacks();
	callbacks.m_error = RymlErrorCallback;
	return callbacks;
}

void ParseYamlInArena(const string &text, ryml::Tree &tree) {
	ryml::Callbacks callbacks = ThrowingCallbacks();
	tree = ryml::Tree(callbacks);
	ryml::EventHandlerTree evth(callbacks);
	ryml::Parser parser(&evth);
	ryml::parse_in_arena(&parser, ryml::to_csubstr(text), &tree);
}

void ParseJsonInArena(const string &text, ryml::Tree &tree) {
	ryml::Callbacks callbacks = ThrowingCallbacks();
	tree = ryml::Tree(callbacks);
	ryml::EventHandlerTree evth(callbacks);
	ryml::Parser parser(&evth);
	ryml::parse_json_in_arena(&parser, ryml::to_csubstr(text), &tree);
}

ryml::id_type CopyYamlNode(const ryml::Tree &src, ryml::id_type src_id, ryml::Tree &dst, ryml::id_type dst_parent,
                           ryml::id_type dst_after) {
	ryml::id_type id = dst.insert_child(dst_parent, dst_after);
	bool has_key = src.has_key(src_id);
	// Only one arena allocation may be pending at a time: the arena can relocate.
	ryml::csubstr key = has_key ? dst.to_arena(src.key(src_id)) : ryml::csubstr();

	if (src.is_map(src_id)) {
		if (has_key) {
			dst.to_map(id, key);
		} else {
			dst.to_map(id);
		}
	} else if (src.is_seq(src_id)) {
		if (has_key) {
			dst.to_seq(id, key);
		} else {
			dst.to_seq(id);
		}
	} else {
		ryml::type_bits flags = src.is_val_quoted(src_id) ? ryml::type_bits(ryml::VAL_DQUO) : ryml::type_bits(0);
		if (has_key) {
			dst.to_keyval(id, key, ryml::csubstr(), flags);
		} else {
			dst.to_val(id, ryml::csubstr(), flags);
		}
		if (src.has_val(src_id)) {
			dst.set_val(id, dst.to_arena(src.val(src_id)));
		}
		return id;
	}

	ryml::id_type after = ryml::NONE;
	for (ryml::id_type child = src.first_child(src_id); child != ryml::NONE; child = src.next_sibling(child)) {
		after = CopyYamlNode(src, child, dst, id, after);
	}
	return id;
}

static string ScalarToString(ryml::csubstr val) {
	if (!val.str) {
		return string();
	}
	return string(val.str, val.len);
}

static bool IsTruthyValue(const ryml::Tree &tree, ryml::id_type id) {
	if (tree.is_container(id)) {
		return tree.num_children(id) > 0;
	}
	if (!tree.has_val(id) || tree.val_is_null(id)) {
		return false;
	}
	string val = ScalarToString(tree.val(id));
	if (val.empty()) {
		return false;
	}
	if (tree.is_val_quoted(id)) {
		return true;
	}
	return !(val == "false" || val == "False" || val == "FALSE" || val == "0" || val == "0.0");
}

PropertyMap::PropertyMap() {
}

bool PropertyMap::empty() const {
	return tree.empty() || tree.num_children(tree.root_id()) == 0;
}

idx_t PropertyMap::size() const {
	return tree.empty() ? 0 : tree.num_children(tree.root_id());
}

bool PropertyMap::Contains(const string &key) const {
	return !tree.empty() && tree.find_child(tree.root_id(), ryml::to_csubstr(key)) != ryml::NONE;
}

string PropertyMap::GetString(const string &key) const {
	if (tree.empty()) {
		return string();
	}
	ryml::id_type id = tree.find_child(tree.root_id(), ryml::to_csubstr(key));
	if (id == ryml::NONE || !tree.has_val(id)) {
		return string();
	}
	return ScalarToString(tree.val(id));
}

void PropertyMap::SetString(const string &key, const string &value) {
	if (tree.empty()) {
		tree.to_map(tree.root_id());
	}
	ryml::id_type root = tree.root_id();
	ryml::id_type existing = tree.find_child(root, ryml::to_csubstr(key));
	ryml::id_type after = existing != ryml::NONE ? existing : tree.last_child(root);

	ryml::id_type id = tree.insert_child(root, after);
	tree.to_keyval(id, tree.to_arena(ryml::to_csubstr(key)), ryml::csubstr(), ryml::VAL_DQUO);
	tree.set_val(id, tree.to_arena(ryml::to_csubstr(value)));
	if (existing != ryml::NONE) {
		tree.remove(existing);
	}
}

void PropertyMap::Merge(const PropertyMap &overrides) {
	if (&overrides == this || overrides.empty()) {
		return;
	}
	if (tree.empty()) {
		tree.to_map(tree.root_id());
	}
	const ryml::Tree &src = overrides.tree;
	ryml::id_type root = tree.root_id();
	for (ryml::id_type child = src.first_child(src.root_id()); child != ryml::NONE; child = src.next_sibling(child)) {
		ryml::id_type existing = tree.find_child(root, src.key(child));
		ryml::id_type after = existing != ryml::NONE ? existing : tree.last_child(root);
		CopyYamlNode(src, child, tree, root, after);
		if (existing != ryml::NONE) {
			tree.remove(existing);
		}
	}
}

void PropertyMap::NormalizeListProperties() {
	if (empty()) {
		return;
	}
	static const char *const LIST_KEYS[] = {"tags", "alias", "aliases"};
	ryml::id_type root = tree.root_id();
	for (auto list_key : LIST_KEYS) {
		ryml::id_type map_id = tree.find_child(root, ryml::to_csubstr(list_key));
		if (map_id == ryml::NONE || !tree.is_map(map_id)) {
			continue;
		}
		ryml::id_type seq_id = tree.insert_child(root, map_id);
		tree.to_seq(seq_id, tree.key(map_id));
		for (ryml::id_type child = tree.first_child(map_id); child != ryml::NONE; child = tree.next_sibling(child)) {
			if (!IsTruthyValue(tree, child)) {
				continue;
			}
			ryml::id_type item = tree.append_child(seq_id);
			tree.to_val(item, tree.key(child), ryml::VAL_DQUO);
		}
		tree.remove(map_id);
	}
}

string PropertyMap::ToJson() const {
	if (empty()) {
		return "{}";
	}
	return ryml::emitrs_json<string>(tree);
}

PropertyMap PropertyMap::FromJson(const string &json) {
	PropertyMap result;
	if (json.find_first_not_of(" \t\r\n") == string::npos) {
		return result;
	}
	ryml::Tree parsed;
	try {
		ParseJsonInArena(json, parsed);
	} catch (std::exception &ex) {
		throw InvalidInputException("Invalid JSON properties: %s", ex.what());
	}
	ryml::id_type root = parsed.root_id();
	if (!parsed.is_map(root)) {
		if (!parsed.is_container(root) && (!parsed.has_val(root) || parsed.val_is_null(root))) {
			return result;
		}
		throw InvalidInputException("Properties must be a JSON object, got: %s", json);
	}
	return FromTree(parsed);
}

PropertyMap PropertyMap::FromTree(const ryml::Tree &src) {
	if (src.empty()) {
		return PropertyMap();
	}
	return FromTreeNode(src, src.root_id());
}

PropertyMap PropertyMap::FromTreeNode(const ryml::Tree &src, ryml::id_type id) {
	PropertyMap result;
	if (!src.is_map(id)) {
		return result;
	}
	result.tree.to_map(result.tree.root_id());
	ryml::id_type dst_root = result.tree.root_id();
	ryml::id_type after = ryml::NONE;
	for (ryml::id_type child = src.first_child(id); child != ryml::NONE; child = src.next_sibling(child)) {
		after = CopyYamlNode(src, child, result.tree, dst_root, after);
	}
	return result;
}

void PropertyMap::CopyEntriesInto(ryml::Tree &dst, ryml::id_type dst_id) const {
	if (empty()) {
		return;
	}
	ryml::id_type root = tree.root_id();
	for (ryml::id_type child = tree.first_child(root); child != ryml::NONE; child = tree.next_sibling(child)) {
		CopyYamlNode(tree, child, dst, dst_id, dst.last_child(dst_id));
	}
}

PropertyMap MergeProperties(const PropertyMap &frontmatter, const PropertyMap &explicit_properties) {
	PropertyMap result = frontmatter;
	result.Merge(explicit_properties);
	return result;
}

} // namespace duckdb
