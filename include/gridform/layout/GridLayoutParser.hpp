#pragma once

/**
 * @file GridLayoutParser.hpp
 * @brief Tokenizer and interpreter for the 2D grid layout language
 *
 * A layout string draws the grid row by row:
 *
 *     {c1                  +  +  c2}
 *     {c3:wx1,wy2,i*5,fxy  +  c4 +}
 *     {|                   -  -  c5}
 *     {|                   -  c6 +}
 *
 * - { and } delimit a row
 * - + (or <) widens the region to its left by one column
 * - | (or ^) heightens the nearest region directly above by one row
 * - - only occupies a cell
 * - anything else up to whitespace or a structural character names a
 *   region; a ":spec" suffix carries embedded constraints
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "RegionRegistry.hpp"

namespace gform {

enum class GridTokenType {
    RowStart,
    RowEnd,
    VerticalExtend,
    HorizontalExtend,
    Filler,
    Identifier
};

struct GridToken {
    GridTokenType type;
    std::string lexeme;
    size_t offset;

    GridToken(GridTokenType t, std::string lex, size_t off)
        : type(t), lexeme(std::move(lex)), offset(off) {}
};

const char* gridTokenTypeToString(GridTokenType type);

/**
 * @brief Single-pass tokenizer over a layout string
 *
 * next() yields tokens lazily and returns nullopt once the input is
 * exhausted. The sequence cannot be restarted.
 */
class GridLexer {
public:
    explicit GridLexer(std::string source);

    std::optional<GridToken> next();
    std::vector<GridToken> tokenize();

    static bool isStructural(char c);

private:
    std::string source_;
    size_t current_{0};

    bool isAtEnd() const { return current_ >= source_.size(); }
    char peek() const;
    void skipWhitespace();
    GridToken identifier();
};

class GridLayoutParser {
public:
    /**
     * @brief Parse a layout string into its regions
     *
     * Nonsensical geometry (extensions with nothing to extend) is
     * tolerated silently.
     *
     * @throws ConstraintError if an embedded constraint spec is malformed
     */
    static RegionRegistry parse(const std::string& layout);

private:
    explicit GridLayoutParser(const std::string& layout);

    GridLexer lexer_;
    RegionRegistry registry_;

    int row_{0};
    int col_{0};
    std::optional<size_t> current_region_;

    RegionRegistry run();
    void handle(const GridToken& token);
    void addRegion(const std::string& identifier);
};

} // namespace gform
