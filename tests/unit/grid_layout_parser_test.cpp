#include <gtest/gtest.h>
#include <gridform/layout/GridLayoutParser.hpp>
#include <gridform/constraints/ConstraintTypes.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace gform;

namespace {

void expectRegion(const RegionRegistry& registry, const std::string& name,
                  int row, int col, int width, int height,
                  const std::string& constraints = "") {
    auto region = registry.find(name);
    ASSERT_TRUE(region.has_value()) << "missing region " << name;
    EXPECT_EQ(region->row, row) << name;
    EXPECT_EQ(region->col, col) << name;
    EXPECT_EQ(region->width, width) << name;
    EXPECT_EQ(region->height, height) << name;
    EXPECT_EQ(region->constraints, constraints) << name;
}

} // namespace

// =============================================================================
// Lexer
// =============================================================================

class GridLexerTest : public ::testing::Test {};

// Test 1: Every token kind with offsets
TEST_F(GridLexerTest, TokenKindsAndOffsets) {
    GridLexer lexer("{a:wx1 + < | ^ -}");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 8u);
    EXPECT_EQ(tokens[0].type, GridTokenType::RowStart);
    EXPECT_EQ(tokens[1].type, GridTokenType::Identifier);
    EXPECT_EQ(tokens[1].lexeme, "a:wx1");
    EXPECT_EQ(tokens[1].offset, 1u);
    EXPECT_EQ(tokens[2].type, GridTokenType::HorizontalExtend);
    EXPECT_EQ(tokens[2].offset, 7u);
    EXPECT_EQ(tokens[3].type, GridTokenType::HorizontalExtend);
    EXPECT_EQ(tokens[3].lexeme, "<");
    EXPECT_EQ(tokens[4].type, GridTokenType::VerticalExtend);
    EXPECT_EQ(tokens[5].type, GridTokenType::VerticalExtend);
    EXPECT_EQ(tokens[5].lexeme, "^");
    EXPECT_EQ(tokens[6].type, GridTokenType::Filler);
    EXPECT_EQ(tokens[7].type, GridTokenType::RowEnd);
    EXPECT_EQ(tokens[7].offset, 16u);
}

// Test 2: Identifiers end at structural characters
TEST_F(GridLexerTest, IdentifierStopsAtStructural) {
    GridLexer lexer("{c1++c2}");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[1].lexeme, "c1");
    EXPECT_EQ(tokens[4].lexeme, "c2");
    EXPECT_EQ(tokens[5].type, GridTokenType::RowEnd);
}

// Test 3: Tokens are produced one at a time
TEST_F(GridLexerTest, LazyNext) {
    GridLexer lexer("  {x}  ");

    auto first = lexer.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->type, GridTokenType::RowStart);
    EXPECT_EQ(first->offset, 2u);

    auto second = lexer.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->lexeme, "x");

    auto third = lexer.next();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->type, GridTokenType::RowEnd);

    EXPECT_FALSE(lexer.next().has_value());
    EXPECT_FALSE(lexer.next().has_value());
}

// Test 4: Empty and blank input
TEST_F(GridLexerTest, EmptyInput) {
    EXPECT_TRUE(GridLexer("").tokenize().empty());
    EXPECT_TRUE(GridLexer(" \n\t ").tokenize().empty());
}

// Test 5: Each structural character maps to its token kind
TEST_F(GridLexerTest, StructuralTokenKinds) {
    const std::vector<std::pair<std::string, GridTokenType>> expected = {
        {"{", GridTokenType::RowStart},
        {"}", GridTokenType::RowEnd},
        {"|", GridTokenType::VerticalExtend},
        {"^", GridTokenType::VerticalExtend},
        {"+", GridTokenType::HorizontalExtend},
        {"<", GridTokenType::HorizontalExtend},
        {"-", GridTokenType::Filler},
        {"name", GridTokenType::Identifier}
    };

    for (const auto& [text, type] : expected) {
        auto token = GridLexer(text).next();
        ASSERT_TRUE(token.has_value()) << text;
        EXPECT_EQ(token->type, type) << text << " lexed as " << gridTokenTypeToString(token->type)
                                     << ", expected " << gridTokenTypeToString(type);
    }

    EXPECT_STREQ(gridTokenTypeToString(GridTokenType::VerticalExtend), "vertical-extend");
    EXPECT_STREQ(gridTokenTypeToString(GridTokenType::Identifier), "identifier");
}

// Test 6: Structural character set
TEST_F(GridLexerTest, StructuralCharacters) {
    for (char c : std::string("{}|^+<-")) {
        EXPECT_TRUE(GridLexer::isStructural(c)) << c;
    }
    for (char c : std::string("a:*,._1")) {
        EXPECT_FALSE(GridLexer::isStructural(c)) << c;
    }
}

// =============================================================================
// Parser
// =============================================================================

class GridLayoutParserTest : public ::testing::Test {};

// Test 1: One row with a widened region
TEST_F(GridLayoutParserTest, HorizontalExtension) {
    auto registry = GridLayoutParser::parse("{c1 + + c2}");

    ASSERT_EQ(registry.size(), 2u);
    expectRegion(registry, "c1", 0, 0, 3, 1);
    expectRegion(registry, "c2", 0, 3, 1, 1);
}

// Test 2: Four-row example
TEST_F(GridLayoutParserTest, FourByFourExample) {
    auto registry = GridLayoutParser::parse(
        "{c1                  +  +  c2}\n"
        "{c3:wx1,wy2,i*5,fxy  +  c4 +}\n"
        "{|                   -  -  c5}\n"
        "{|                   -  c6 +}");

    ASSERT_EQ(registry.size(), 6u);
    expectRegion(registry, "c1", 0, 0, 3, 1);
    expectRegion(registry, "c2", 0, 3, 1, 1);
    expectRegion(registry, "c3", 1, 0, 2, 3, "wx 1 wy 2 i* 5 f xy");
    expectRegion(registry, "c4", 1, 2, 2, 1);
    expectRegion(registry, "c5", 2, 3, 1, 1);
    expectRegion(registry, "c6", 3, 2, 2, 1);
}

// Test 3: Compact form gives the same regions
TEST_F(GridLayoutParserTest, CompactForm) {
    auto spaced = GridLayoutParser::parse(
        "{c1 + + c2}{c3:wx1,wy2,i*5,fxy + c4 +}{| - - c5}{| - c6 +}");
    auto compact = GridLayoutParser::parse(
        "{c1++c2}{c3:wx1,wy2,i*5,fxy+c4+}{|--c5}{|-c6+}");

    ASSERT_EQ(spaced.size(), compact.size());
    for (size_t i = 0; i < spaced.size(); ++i) {
        const auto& a = spaced.regions()[i];
        const auto& b = compact.regions()[i];
        EXPECT_EQ(a.name, b.name);
        EXPECT_EQ(a.row, b.row);
        EXPECT_EQ(a.col, b.col);
        EXPECT_EQ(a.width, b.width);
        EXPECT_EQ(a.height, b.height);
        EXPECT_EQ(a.constraints, b.constraints);
    }
}

// Test 4: Filler after a region leaves its width alone
TEST_F(GridLayoutParserTest, FillerDoesNotExtend) {
    auto registry = GridLayoutParser::parse("{c3 + c4 -}");
    expectRegion(registry, "c3", 0, 0, 2, 1);
    expectRegion(registry, "c4", 0, 2, 1, 1);
}

// Test 5: Alternative extension characters
TEST_F(GridLayoutParserTest, AlternativeExtensionMarkers) {
    auto registry = GridLayoutParser::parse("{a < b}{^ c <}");
    expectRegion(registry, "a", 0, 0, 2, 2);
    expectRegion(registry, "b", 0, 2, 1, 1);
    expectRegion(registry, "c", 1, 1, 2, 1);
}

// Test 6: Regions appear in creation order
TEST_F(GridLayoutParserTest, InsertionOrder) {
    auto registry = GridLayoutParser::parse("{z y}{x}");
    std::vector<std::string> names;
    for (const auto& region : registry) {
        names.push_back(region.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"z", "y", "x"}));
}

// Test 7: Lookup miss
TEST_F(GridLayoutParserTest, LookupMiss) {
    auto registry = GridLayoutParser::parse("{a b}");
    EXPECT_FALSE(registry.find("c").has_value());
    EXPECT_FALSE(registry.contains("A"));
    EXPECT_TRUE(registry.contains("a"));
}

// Test 8: Empty layout
TEST_F(GridLayoutParserTest, EmptyLayout) {
    EXPECT_TRUE(GridLayoutParser::parse("").empty());
    EXPECT_TRUE(GridLayoutParser::parse("{}{}").empty());
}

// Test 9: Extensions with nothing to extend still advance the column
TEST_F(GridLayoutParserTest, ExtensionsWithoutPredecessor) {
    auto registry = GridLayoutParser::parse("{+ | a}");
    ASSERT_EQ(registry.size(), 1u);
    expectRegion(registry, "a", 0, 2, 1, 1);
}

// Test 10: Vertical extension skips rows to the nearest region above
TEST_F(GridLayoutParserTest, VerticalExtendSkipsRows) {
    auto registry = GridLayoutParser::parse("{a b}{- c}{| -}");
    expectRegion(registry, "a", 0, 0, 1, 2);
    expectRegion(registry, "b", 0, 1, 1, 1);
    expectRegion(registry, "c", 1, 1, 1, 1);
}

// Test 11: Vertical extension prefers the nearest row
TEST_F(GridLayoutParserTest, VerticalExtendNearestRow) {
    auto registry = GridLayoutParser::parse("{a}{b}{|}");
    expectRegion(registry, "a", 0, 0, 1, 1);
    expectRegion(registry, "b", 1, 0, 1, 2);
}

// Test 12: Vertical extension matches the top-left column only
TEST_F(GridLayoutParserTest, VerticalExtendMatchesTopLeftColumn) {
    auto registry = GridLayoutParser::parse("{a +}{- |}");
    expectRegion(registry, "a", 0, 0, 2, 1);
}

// Test 13: Row end clears the current region
TEST_F(GridLayoutParserTest, RowEndClearsCurrent) {
    auto registry = GridLayoutParser::parse("{a}{+ b}");
    expectRegion(registry, "a", 0, 0, 1, 1);
    expectRegion(registry, "b", 1, 1, 1, 1);
}

// Test 14: Duplicate names resolve to the first region
TEST_F(GridLayoutParserTest, DuplicateNamesFirstWins) {
    auto registry = GridLayoutParser::parse("{a +}{a}");
    EXPECT_EQ(registry.size(), 2u);
    expectRegion(registry, "a", 0, 0, 2, 1);
}

// Test 15: Empty embedded spec
TEST_F(GridLayoutParserTest, EmptyEmbeddedSpec) {
    auto registry = GridLayoutParser::parse("{c1:}");
    expectRegion(registry, "c1", 0, 0, 1, 1, "");
}

// Test 16: Malformed embedded spec aborts the parse
TEST_F(GridLayoutParserTest, BadEmbeddedSpecThrows) {
    try {
        GridLayoutParser::parse("{ok c1:zz9}");
        FAIL() << "expected ConstraintError";
    } catch (const ConstraintError& e) {
        EXPECT_EQ(e.kind(), ConstraintErrorKind::UnrecognizedEmbeddedConstraint);
        EXPECT_EQ(e.token(), "zz9");
    }
}

// Test 17: Text after a second colon is ignored
TEST_F(GridLayoutParserTest, SecondColonEndsSpec) {
    auto registry = GridLayoutParser::parse("{c:wx1:wy2 + d:px1:}");
    expectRegion(registry, "c", 0, 0, 2, 1, "wx 1");
    expectRegion(registry, "d", 0, 2, 1, 1, "px 1");
}

// Test 18: Empty items inside an embedded spec abort the parse
TEST_F(GridLayoutParserTest, EmptyEmbeddedItemThrows) {
    EXPECT_THROW(GridLayoutParser::parse("{c:,wx1}"), ConstraintError);
    EXPECT_THROW(GridLayoutParser::parse("{c:wx1,,wy2}"), ConstraintError);
    expectRegion(GridLayoutParser::parse("{c:wx1,}"), "c", 0, 0, 1, 1, "wx 1");
}
