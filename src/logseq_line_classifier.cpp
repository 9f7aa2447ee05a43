#include "logseq_line_classifier.hpp"

namespace duckdb {

static bool IsSpace(char c) {
	return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

static bool IsDigit(char c) {
	return c >= '0' && c <= '9';
}

static bool IsUpper(char c) {
	return c >= 'A' && c <= 'Z';
}

static bool IsBulletChar(char c) {
	return c == '-' || c == '*' || c == '+';
}

static size_t SkipSpaces(const string &line, size_t pos) {
	while (pos < line.size() && IsSpace(line[pos])) {
		pos++;
	}
	return pos;
}

static bool OnlySpacesFrom(const string &line, size_t pos) {
	return SkipSpaces(line, pos) == line.size();
}

// Position of the list item text after "<marker><whitespace>", or npos when the marker
// is not followed by whitespace and at least one non-blank character.
static size_t ItemTextStart(const string &line, size_t marker_end) {
	if (marker_end >= line.size() || !IsSpace(line[marker_end])) {
		return string::npos;
	}
	size_t text = SkipSpaces(line, marker_end);
	return text < line.size() ? text : string::npos;
}

bool ClassifiedLine::IsListItem() const {
	return kind == LineKind::CHECKBOX || kind == LineKind::BULLET || kind == LineKind::NUMBERED ||
	       kind == LineKind::MARKER;
}

bool ClassifiedLine::IsBlockBoundary() const {
	return kind == LineKind::HEADING || kind == LineKind::FENCE || kind == LineKind::HORIZONTAL_RULE ||
	       kind == LineKind::BLOCKQUOTE;
}

idx_t IndentDepth(const string &line) {
	idx_t columns = 0;
	for (auto c : line) {
		if (c == ' ') {
			columns += 1;
		} else if (c == '\t') {
			columns += 2;
		} else {
			break;
		}
	}
	return columns / 2;
}

bool IsBlankLine(const string &line) {
	return OnlySpacesFrom(line, 0);
}

bool IsFenceStart(const string &line) {
	size_t pos = SkipSpaces(line, 0);
	return line.compare(pos, 3, "```") == 0;
}

bool IsFenceEnd(const string &line) {
	size_t pos = SkipSpaces(line, 0);
	return line.compare(pos, 3, "```") == 0 && OnlySpacesFrom(line, pos + 3);
}

bool MatchHeading(const string &line, idx_t &level) {
	size_t hashes = 0;
	while (hashes < line.size() && line[hashes] == '#') {
		hashes++;
	}
	if (hashes == 0 || hashes > 6 || ItemTextStart(line, hashes) == string::npos) {
		return false;
	}
	level = hashes;
	return true;
}

bool IsHorizontalRule(const string &line) {
	size_t pos = SkipSpaces(line, 0);
	size_t start = pos;
	while (pos < line.size() && (line[pos] == '-' || line[pos] == '*' || line[pos] == '_')) {
		pos++;
	}
	return pos - start >= 3 && OnlySpacesFrom(line, pos);
}

bool IsBlockquote(const string &line) {
	size_t pos = SkipSpaces(line, 0);
	return pos < line.size() && line[pos] == '>';
}

bool MatchCheckbox(const string &line, string &content) {
	size_t pos = SkipSpaces(line, 0);
	if (pos >= line.size() || !IsBulletChar(line[pos])) {
		return false;
	}
	pos++;
	if (pos >= line.size() || !IsSpace(line[pos])) {
		return false;
	}
	pos = SkipSpaces(line, pos);
	// "[ ]", "[x]" or "[X]" followed by whitespace and text
	if (pos + 2 >= line.size() || line[pos] != '[' || line[pos + 2] != ']' ||
	    ItemTextStart(line, pos + 3) == string::npos) {
		return false;
	}
	char check = line[pos + 1];
	if (check != ' ' && check != 'x' && check != 'X') {
		return false;
	}

	string text = TrimLine(line.substr(pos + 3));
	if (text.compare(0, 5, "TODO:") == 0 || text.compare(0, 5, "DONE:") == 0) {
		text = TrimLine(text.substr(5));
	}
	content = check == ' ' ? "TODO" : "DONE";
	if (!text.empty()) {
		content += " " + text;
	}
	return true;
}

bool MatchBullet(const string &line, string &content) {
	size_t pos = SkipSpaces(line, 0);
	if (pos >= line.size() || !IsBulletChar(line[pos])) {
		return false;
	}
	size_t text = ItemTextStart(line, pos + 1);
	if (text == string::npos) {
		return false;
	}
	content = RightTrimLine(line.substr(text));
	return true;
}

bool MatchNumbered(const string &line, string &content) {
	size_t pos = SkipSpaces(line, 0);
	size_t digits = pos;
	while (pos < line.size() && IsDigit(line[pos])) {
		pos++;
	}
	if (pos == digits || pos >= line.size() || line[pos] != '.') {
		return false;
	}
	size_t text = ItemTextStart(line, pos + 1);
	if (text == string::npos) {
		return false;
	}
	content = RightTrimLine(line.substr(text));
	return true;
}

bool MatchMarker(const string &line, string &content) {
	size_t start = SkipSpaces(line, 0);
	if (start >= line.size() || !IsUpper(line[start])) {
		return false;
	}
	size_t pos = start + 1;
	while (pos < line.size() && (IsUpper(line[pos]) || IsDigit(line[pos]) || line[pos] == '_' || line[pos] == '-')) {
		pos++;
	}
	// two-letter tokens are abbreviations (region codes, initials), not markers
	if (pos - start < 3) {
		return false;
	}
	size_t text = ItemTextStart(line, pos);
	if (text == string::npos) {
		return false;
	}
	content = line.substr(start, pos - start) + " " + RightTrimLine(line.substr(text));
	return true;
}

ClassifiedLine ClassifyLine(const string &line) {
	ClassifiedLine result;
	result.depth = IndentDepth(line);
	if (IsBlankLine(line)) {
		result.kind = LineKind::BLANK;
	} else if (IsFenceStart(line)) {
		result.kind = LineKind::FENCE;
	} else if (MatchHeading(line, result.heading_level)) {
		result.kind = LineKind::HEADING;
	} else if (IsHorizontalRule(line)) {
		result.kind = LineKind::HORIZONTAL_RULE;
	} else if (IsBlockquote(line)) {
		result.kind = LineKind::BLOCKQUOTE;
	} else if (MatchCheckbox(line, result.content)) {
		result.kind = LineKind::CHECKBOX;
	} else if (MatchBullet(line, result.content)) {
		result.kind = LineKind::BULLET;
	} else if (MatchNumbered(line, result.content)) {
		result.kind = LineKind::NUMBERED;
	} else if (MatchMarker(line, result.content)) {
		result.kind = LineKind::MARKER;
	} else {
		result.kind = LineKind::PARAGRAPH;
	}
	return result;
}

string TrimLine(const string &line) {
	size_t begin = SkipSpaces(line, 0);
	size_t end = line.size();
	while (end > begin && IsSpace(line[end - 1])) {
		end--;
	}
	return line.substr(begin, end - begin);
}

string RightTrimLine(const string &line) {
	size_t end = line.size();
	while (end > 0 && IsSpace(line[end - 1])) {
		end--;
	}
	return line.substr(0, end);
}

} // namespace duckdb
