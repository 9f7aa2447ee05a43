#include <gtest/gtest.h>
#include "logseq_block_parser.hpp"

#include <functional>

using namespace duckdb;

// Test suite for the block tree builder

class BlockParserTest : public ::testing::Test {
protected:
	// Compact dump of a forest: "content{child,child}" joined by ","
	static string Dump(const vector<unique_ptr<BlockNode>> &blocks) {
		string result;
		for (idx_t i = 0; i < blocks.size(); i++) {
			if (i > 0) {
				result += ",";
			}
			result += blocks[i]->content;
			if (!blocks[i]->children.empty()) {
				result += "{" + Dump(blocks[i]->children) + "}";
			}
		}
		return result;
	}

	static string DumpDocument(const string &text) {
		auto doc = ParseDocument(text);
		return Dump(doc.blocks);
	}
};

TEST_F(BlockParserTest, EmptyInput) {
	auto doc = ParseDocument("");
	EXPECT_TRUE(doc.blocks.empty());
	EXPECT_TRUE(doc.properties.empty());
	EXPECT_TRUE(doc.diagnostics.empty());
	EXPECT_TRUE(ParseDocument(" \n\n\t\n").blocks.empty());
}

TEST_F(BlockParserTest, HeadingOwnsNestedList) {
	auto doc = ParseDocument("# Title\n\n- A\n  - B\n");
	ASSERT_EQ(doc.blocks.size(), 1u);
	auto &title = *doc.blocks[0];
	EXPECT_EQ(title.content, "# Title");
	EXPECT_EQ(title.type, BlockType::HEADING);
	EXPECT_EQ(title.level, 1u);
	ASSERT_EQ(title.children.size(), 1u);
	EXPECT_EQ(title.children[0]->content, "A");
	ASSERT_EQ(title.children[0]->children.size(), 1u);
	EXPECT_EQ(title.children[0]->children[0]->content, "B");
	EXPECT_TRUE(title.children[0]->children[0]->children.empty());
}

TEST_F(BlockParserTest, CheckboxesAreRewritten) {
	EXPECT_EQ(DumpDocument("- [ ] task\n- [x] done\n"), "TODO task,DONE done");
	EXPECT_EQ(DumpDocument("- [ ] TODO: task"), "TODO task");
	EXPECT_EQ(DumpDocument("- [ ]"), "[ ]");
}

TEST_F(BlockParserTest, FrontmatterIsDetached) {
	auto doc = ParseDocument("---\nk: v\n---\nBody");
	EXPECT_EQ(doc.properties.GetString("k"), "v");
	EXPECT_TRUE(doc.diagnostics.empty());
	ASSERT_EQ(doc.blocks.size(), 1u);
	EXPECT_EQ(doc.blocks[0]->content, "Body");
	EXPECT_EQ(doc.blocks[0]->type, BlockType::PARAGRAPH);
	EXPECT_EQ(doc.body_offset, 13u);
}

TEST_F(BlockParserTest, BlockquotesGroupUntilBlankLine) {
	auto doc = ParseDocument("> line1\n> line2\n\n> line3\n");
	ASSERT_EQ(doc.blocks.size(), 2u);
	EXPECT_EQ(doc.blocks[0]->content, "> line1\n> line2");
	EXPECT_EQ(doc.blocks[0]->type, BlockType::QUOTE);
	EXPECT_EQ(doc.blocks[1]->content, "> line3");
}

TEST_F(BlockParserTest, ShortCapitalizedWordIsNotAMarker) {
	EXPECT_EQ(DumpDocument("CA region\n  - x"), "CA region,x");
}

TEST_F(BlockParserTest, MarkersNestLikeListItems) {
	EXPECT_EQ(DumpDocument("DOING refactor\n  - step one\n  - step two\nLATER cleanup"),
	          "DOING refactor{step one,step two},LATER cleanup");
}

TEST_F(BlockParserTest, UnterminatedFenceRunsToEnd) {
	auto doc = ParseDocument("intro\n```python\nprint(1)\n\n- not a list");
	ASSERT_EQ(doc.blocks.size(), 2u);
	EXPECT_EQ(doc.blocks[1]->type, BlockType::CODE);
	EXPECT_EQ(doc.blocks[1]->content, "```python\nprint(1)\n\n- not a list");
}

TEST_F(BlockParserTest, FencedCodeKeepsDelimitersAndBlankLines) {
	auto doc = ParseDocument("```\n# not a heading\n\n  - not a list\n```\nafter");
	ASSERT_EQ(doc.blocks.size(), 2u);
	EXPECT_EQ(doc.blocks[0]->content, "```\n# not a heading\n\n  - not a list\n```");
	EXPECT_EQ(doc.blocks[1]->content, "after");
}

TEST_F(BlockParserTest, NonGridIndentationFloors) {
	// three spaces is depth 1: nested
	EXPECT_EQ(DumpDocument("- a\n   - b"), "a{b}");
	// one space is depth 0: sibling
	EXPECT_EQ(DumpDocument("- a\n - b"), "a,b");
	EXPECT_EQ(DumpDocument("- a\n\t- b\n\t\t- c"), "a{b{c}}");
}

TEST_F(BlockParserTest, HeadingHierarchy) {
	EXPECT_EQ(DumpDocument("# A\n## B\ntext\n# C\n"), "# A{## B{text}},# C");
	EXPECT_EQ(DumpDocument("## B\n# A\n"), "## B,# A");
	EXPECT_EQ(DumpDocument("# A\n### C\n## B\n"), "# A{### C,## B}");
	EXPECT_EQ(DumpDocument("# A\n## B\n## C\n"), "# A{## B,## C}");
}

TEST_F(BlockParserTest, HeadingLevelsAreRecorded) {
	auto doc = ParseDocument("### Deep\n");
	ASSERT_EQ(doc.blocks.size(), 1u);
	EXPECT_EQ(doc.blocks[0]->level, 3u);
}

TEST_F(BlockParserTest, ParagraphLinesAreFolded) {
	auto doc = ParseDocument("line one\n  line two  \n\nnext");
	ASSERT_EQ(doc.blocks.size(), 2u);
	EXPECT_EQ(doc.blocks[0]->content, "line one line two");
	EXPECT_EQ(doc.blocks[1]->content, "next");
}

TEST_F(BlockParserTest, ParagraphStopsAtStructuredLine) {
	EXPECT_EQ(DumpDocument("text\n- item\nmore"), "text,item,more");
}

TEST_F(BlockParserTest, ParagraphAbsorbsMarkerLines) {
	auto doc = ParseDocument("Meeting notes\nNOTE budget approved");
	ASSERT_EQ(doc.blocks.size(), 1u);
	EXPECT_EQ(doc.blocks[0]->type, BlockType::PARAGRAPH);
	EXPECT_EQ(doc.blocks[0]->content, "Meeting notes NOTE budget approved");
	EXPECT_EQ(DumpDocument("text\nTODO later"), "text TODO later");
	// without preceding text the marker still opens a list item
	EXPECT_EQ(DumpDocument("intro\n\nTODO later\n  - step"), "intro,TODO later{step}");
}

TEST_F(BlockParserTest, ListItemTextContinuation) {
	auto doc = ParseDocument("- item\n  continued here\n  - child");
	ASSERT_EQ(doc.blocks.size(), 1u);
	auto &item = *doc.blocks[0];
	ASSERT_EQ(item.children.size(), 2u);
	EXPECT_EQ(item.children[0]->type, BlockType::TEXT);
	EXPECT_EQ(item.children[0]->content, "continued here");
	EXPECT_EQ(item.children[1]->type, BlockType::LIST_ITEM);
	EXPECT_EQ(item.children[1]->content, "child");
}

TEST_F(BlockParserTest, BlankLinesInsideListsAreSkipped) {
	EXPECT_EQ(DumpDocument("- a\n\n  - b\n\n- c"), "a{b},c");
}

TEST_F(BlockParserTest, OutdentClosesNestedItems) {
	EXPECT_EQ(DumpDocument("- a\n  - b\n    - c\n  - d\n- e"), "a{b{c},d},e");
}

TEST_F(BlockParserTest, BlockBoundariesEndLists) {
	auto doc = ParseDocument("- a\n  > quoted\n  ```\n  code\n  ```");
	ASSERT_EQ(doc.blocks.size(), 3u);
	EXPECT_EQ(doc.blocks[0]->content, "a");
	EXPECT_TRUE(doc.blocks[0]->children.empty());
	EXPECT_EQ(doc.blocks[1]->type, BlockType::QUOTE);
	EXPECT_EQ(doc.blocks[1]->content, "  > quoted");
	EXPECT_EQ(doc.blocks[2]->type, BlockType::CODE);
}

TEST_F(BlockParserTest, HeadingEndsListAndStartsSection) {
	EXPECT_EQ(DumpDocument("- a\n  - b\n# H\n- c\nplain"), "a{b},# H{c,plain}");
}

TEST_F(BlockParserTest, HorizontalRules) {
	auto doc = ParseDocument("above\n***\nbelow");
	ASSERT_EQ(doc.blocks.size(), 3u);
	EXPECT_EQ(doc.blocks[1]->type, BlockType::RULE);
	EXPECT_EQ(doc.blocks[1]->content, "---");
}

TEST_F(BlockParserTest, NumberedItems) {
	EXPECT_EQ(DumpDocument("1. first\n2. second\n   1. inner"), "first,second{inner}");
}

TEST_F(BlockParserTest, MalformedFrontmatterKeepsText) {
	auto doc = ParseDocument("---\n- a\n- b\n---\nBody");
	EXPECT_TRUE(doc.properties.empty());
	ASSERT_EQ(doc.diagnostics.size(), 1u);
	EXPECT_EQ(doc.body_offset, 0u);
	ASSERT_EQ(doc.blocks.size(), 5u);
	EXPECT_EQ(doc.blocks[0]->type, BlockType::RULE);
	EXPECT_EQ(doc.blocks[1]->content, "a");
	EXPECT_EQ(doc.blocks[2]->content, "b");
	EXPECT_EQ(doc.blocks[3]->type, BlockType::RULE);
	EXPECT_EQ(doc.blocks[4]->content, "Body");
}

TEST_F(BlockParserTest, NoEmptyContent) {
	auto doc = ParseDocument("- \n-\n#\n\n   \n- [ ]\n> \n");
	std::function<void(const vector<unique_ptr<BlockNode>> &)> check =
	    [&](const vector<unique_ptr<BlockNode>> &blocks) {
		    for (auto &block : blocks) {
			    EXPECT_FALSE(block->content.empty());
			    check(block->children);
		    }
	    };
	check(doc.blocks);
	EXPECT_FALSE(doc.blocks.empty());
}

TEST_F(BlockParserTest, SiblingOrderMatchesSource) {
	EXPECT_EQ(DumpDocument("- 3\n- 1\n- 2"), "3,1,2");
}

TEST_F(BlockParserTest, Deterministic) {
	string text = "---\ntags: [a]\n---\n# H\n- a\n  - b\n> q\n```\nx\n```\nDONE thing\n";
	EXPECT_EQ(DumpDocument(text), DumpDocument(text));
	EXPECT_EQ(DumpDocument(text), "# H{a{b},> q,```\nx\n```,DONE thing}");
}

TEST_F(BlockParserTest, WindowsLineEndings) {
	EXPECT_EQ(DumpDocument("- a\r\n  - b\r\nplain\r\n"), "a{b},plain");
}

TEST_F(BlockParserTest, BlockTypeNames) {
	EXPECT_STREQ(BlockTypeToString(BlockType::HEADING), "heading");
	EXPECT_STREQ(BlockTypeToString(BlockType::LIST_ITEM), "list_item");
	EXPECT_STREQ(BlockTypeToString(BlockType::TEXT), "text");
	EXPECT_STREQ(BlockTypeToString(BlockType::PARAGRAPH), "paragraph");
	EXPECT_STREQ(BlockTypeToString(BlockType::CODE), "code");
	EXPECT_STREQ(BlockTypeToString(BlockType::QUOTE), "quote");
	EXPECT_STREQ(BlockTypeToString(BlockType::RULE), "rule");
}
