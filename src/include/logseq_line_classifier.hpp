#pragma once

#include "duckdb.hpp"

namespace duckdb {

enum class LineKind : uint8_t {
	BLANK,
	FENCE,
	HEADING,
	HORIZONTAL_RULE,
	BLOCKQUOTE,
	CHECKBOX,
	BULLET,
	NUMBERED,
	MARKER,
	PARAGRAPH
};

struct ClassifiedLine {
	LineKind kind = LineKind::PARAGRAPH;
	idx_t depth = 0;         // leading indentation, two columns per level
	idx_t heading_level = 0; // 1-6 for HEADING
	string content;          // list-like kinds: text with the marker stripped or rewritten

	// checkbox, bullet, numbered or capitalized marker
	bool IsListItem() const;
	// heading, fence, rule or blockquote: never nested under a list item
	bool IsBlockBoundary() const;
};

// Classify one line (without its '\n'). The predicates below are tried in this order,
// first match wins: blank, fence, heading, horizontal rule, blockquote, checkbox,
// bullet, numbered, capitalized marker; anything else is a paragraph line.
ClassifiedLine ClassifyLine(const string &line);

// Leading spaces plus two per tab, divided by two (rounded down).
idx_t IndentDepth(const string &line);

bool IsBlankLine(const string &line);
bool IsFenceStart(const string &line);
bool IsFenceEnd(const string &line);
bool MatchHeading(const string &line, idx_t &level);
bool IsHorizontalRule(const string &line);
bool IsBlockquote(const string &line);
// "- [ ] text" -> "TODO text", "- [x] text" -> "DONE text"
bool MatchCheckbox(const string &line, string &content);
bool MatchBullet(const string &line, string &content);
bool MatchNumbered(const string &line, string &content);
// "DOING text", "IN-PROGRESS text"; tokens need at least three characters
bool MatchMarker(const string &line, string &content);

string TrimLine(const string &line);
string RightTrimLine(const string &line);

} // namespace duckdb
