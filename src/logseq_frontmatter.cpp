#include "logseq_frontmatter.hpp"

#include "duckdb/common/string_util.hpp"

#include <ryml/ryml_std.hpp>

#include <stdexcept>

namespace duckdb {

static bool IsInlineSpace(char c) {
	return c == ' ' || c == '\t' || c == '\r';
}

// "---" optionally followed by trailing whitespace
static bool IsDelimiterLine(const string &s, size_t begin, size_t end) {
	if (end - begin < 3 || s.compare(begin, 3, "---") != 0) {
		return false;
	}
	for (size_t i = begin + 3; i < end; i++) {
		if (!IsInlineSpace(s[i])) {
			return false;
		}
	}
	return true;
}

static bool IsBlankText(const string &s) {
	return s.find_first_not_of(" \t\r\n") == string::npos;
}

// Empty or null YAML document (only comments, "~", "null", nothing at all).
static bool IsNullDocument(const ryml::Tree &tree, ryml::id_type root) {
	if (tree.is_container(root)) {
		return !tree.is_seq(root) && tree.num_children(root) == 0;
	}
	return !tree.has_val(root) || tree.val_is_null(root);
}

unique_ptr<ParsedFrontmatter> ParseFrontmatter(const string &s, string *diagnostic) {
	if (s.size() < 3 || s.compare(0, 3, "---") != 0) {
		return nullptr;
	}
	size_t open_end = s.find('\n');
	if (open_end == string::npos || !IsDelimiterLine(s, 0, open_end)) {
		return nullptr;
	}

	// The closing delimiter is the next line consisting of "---" alone.
	size_t close_begin = string::npos;
	size_t close_end = string::npos;
	size_t line_begin = open_end + 1;
	while (line_begin < s.size()) {
		size_t line_end = s.find('\n', line_begin);
		if (line_end == string::npos) {
			line_end = s.size();
		}
		if (IsDelimiterLine(s, line_begin, line_end)) {
			close_begin = line_begin;
			close_end = line_end;
			break;
		}
		line_begin = line_end + 1;
	}
	if (close_begin == string::npos) {
		return nullptr;
	}

	auto result = make_uniq<ParsedFrontmatter>();
	result->yaml_block = s.substr(open_end + 1, close_begin - (open_end + 1));
	result->body_offset = close_end < s.size() ? close_end + 1 : s.size();

	if (IsBlankText(result->yaml_block)) {
		return result;
	}

	ryml::Tree tree;
	try {
		ParseYamlInArena(result->yaml_block, tree);
	} catch (std::exception &ex) {
		if (diagnostic) {
			*diagnostic = StringUtil::Format("Failed to parse YAML frontmatter: %s", ex.what());
		}
		return nullptr;
	}

	ryml::id_type root = tree.root_id();
	if (!tree.is_map(root)) {
		if (IsNullDocument(tree, root)) {
			return result;
		}
		if (diagnostic) {
			*diagnostic = "Frontmatter is not a mapping, ignoring";
		}
		return nullptr;
	}

	NormalizeTimestamps(tree, root);
	result->properties = PropertyMap::FromTree(tree);
	return result;
}

void NormalizeTimestamps(ryml::Tree &tree, ryml::id_type id) {
	if (tree.is_container(id)) {
		for (ryml::id_type child = tree.first_child(id); child != ryml::NONE; child = tree.next_sibling(child)) {
			NormalizeTimestamps(tree, child);
		}
		return;
	}
	if (!tree.has_val(id) || tree.is_val_quoted(id)) {
		return;
	}
	ryml::csubstr val = tree.val(id);
	if (!val.str || val.len == 0) {
		return;
	}
	string iso;
	if (!YamlTimestampToIso(string(val.str, val.len), iso)) {
		return;
	}
	tree.set_val(id, tree.to_arena(ryml::to_csubstr(iso)));
	tree.set_val_style(id, ryml::VAL_DQUO);
}

//===--------------------------------------------------------------------===//
// YAML timestamps
//===--------------------------------------------------------------------===//

static bool ReadDigits(const string &s, size_t &pos, size_t min_count, size_t max_count, int &value) {
	size_t start = pos;
	value = 0;
	while (pos < s.size() && pos - start < max_count && StringUtil::CharacterIsDigit(s[pos])) {
		value = value * 10 + (s[pos] - '0');
		pos++;
	}
	return pos - start >= min_count;
}

static bool SkipChar(const string &s, size_t &pos, char c) {
	if (pos < s.size() && s[pos] == c) {
		pos++;
		return true;
	}
	return false;
}

static string Pad2(int value) {
	return value < 10 ? "0" + std::to_string(value) : std::to_string(value);
}

static bool ValidDate(int month, int day) {
	return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

bool YamlTimestampToIso(const string &text, string &iso) {
	size_t pos = 0;
	int year, month, day;
	if (!ReadDigits(text, pos, 4, 4, year) || !SkipChar(text, pos, '-')) {
		return false;
	}
	size_t month_start = pos;
	if (!ReadDigits(text, pos, 1, 2, month) || !SkipChar(text, pos, '-')) {
		return false;
	}
	size_t day_start = pos;
	if (!ReadDigits(text, pos, 1, 2, day) || !ValidDate(month, day)) {
		return false;
	}
	string year_text = std::to_string(year);
	string date = string(4 - year_text.size(), '0') + year_text + "-" + Pad2(month) + "-" + Pad2(day);

	if (pos == text.size()) {
		// plain dates require the zero-padded form
		if (day_start - month_start != 3 || pos - day_start != 2) {
			return false;
		}
		iso = date;
		return true;
	}

	// date/time separator: 'T', 't' or a run of blanks
	if (text[pos] == 'T' || text[pos] == 't') {
		pos++;
	} else if (text[pos] == ' ' || text[pos] == '\t') {
		while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
			pos++;
		}
	} else {
		return false;
	}

	int hour, minute, second;
	if (!ReadDigits(text, pos, 1, 2, hour) || !SkipChar(text, pos, ':') || !ReadDigits(text, pos, 2, 2, minute) ||
	    !SkipChar(text, pos, ':') || !ReadDigits(text, pos, 2, 2, second)) {
		return false;
	}
	if (hour > 23 || minute > 59 || second > 59) {
		return false;
	}

	int microsecond = 0;
	if (SkipChar(text, pos, '.')) {
		int scale = 100000;
		while (pos < text.size() && StringUtil::CharacterIsDigit(text[pos])) {
			microsecond += (text[pos] - '0') * scale;
			scale /= 10;
			pos++;
		}
	}

	string offset;
	while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
		pos++;
	}
	if (pos < text.size()) {
		if (text[pos] == 'Z') {
			pos++;
			offset = "+00:00";
		} else if (text[pos] == '+' || text[pos] == '-') {
			char sign = text[pos++];
			int tz_hour, tz_minute = 0;
			if (!ReadDigits(text, pos, 1, 2, tz_hour)) {
				return false;
			}
			SkipChar(text, pos, ':');
			if (pos < text.size() && !ReadDigits(text, pos, 2, 2, tz_minute)) {
				return false;
			}
			offset = string(1, sign) + Pad2(tz_hour) + ":" + Pad2(tz_minute);
		} else {
			return false;
		}
	}
	if (pos != text.size()) {
		return false;
	}

	iso = date + "T" + Pad2(hour) + ":" + Pad2(minute) + ":" + Pad2(second);
	if (microsecond != 0) {
		string micros = std::to_string(microsecond);
		iso += "." + string(6 - micros.size(), '0') + micros;
	}
	iso += offset;
	return true;
}

} // namespace duckdb
