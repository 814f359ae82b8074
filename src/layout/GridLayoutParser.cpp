#include "gridform/layout/GridLayoutParser.hpp"
#include "gridform/constraints/ConstraintParser.hpp"
#include <cctype>
#include <utility>

namespace gform {

const char* gridTokenTypeToString(GridTokenType type) {
    switch (type) {
        case GridTokenType::RowStart: return "row-start";
        case GridTokenType::RowEnd: return "row-end";
        case GridTokenType::VerticalExtend: return "vertical-extend";
        case GridTokenType::HorizontalExtend: return "horizontal-extend";
        case GridTokenType::Filler: return "filler";
        case GridTokenType::Identifier: return "identifier";
    }
    return "unknown";
}

// ============================================================================
// GridLexer Implementation
// ============================================================================

GridLexer::GridLexer(std::string source)
    : source_(std::move(source)) {}

bool GridLexer::isStructural(char c) {
    switch (c) {
        case '{':
        case '}':
        case '|':
        case '^':
        case '+':
        case '<':
        case '-':
            return true;
        default:
            return false;
    }
}

char GridLexer::peek() const {
    if (isAtEnd()) return '\0';
    return source_[current_];
}

void GridLexer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        current_++;
    }
}

std::optional<GridToken> GridLexer::next() {
    skipWhitespace();
    if (isAtEnd()) {
        return std::nullopt;
    }

    size_t start = current_;
    char c = peek();

    switch (c) {
        case '{':
            current_++;
            return GridToken(GridTokenType::RowStart, "{", start);
        case '}':
            current_++;
            return GridToken(GridTokenType::RowEnd, "}", start);
        case '|':
        case '^':
            current_++;
            return GridToken(GridTokenType::VerticalExtend, std::string(1, c), start);
        case '+':
        case '<':
            current_++;
            return GridToken(GridTokenType::HorizontalExtend, std::string(1, c), start);
        case '-':
            current_++;
            return GridToken(GridTokenType::Filler, "-", start);
        default:
            return identifier();
    }
}

std::vector<GridToken> GridLexer::tokenize() {
    std::vector<GridToken> tokens;
    while (auto token = next()) {
        tokens.push_back(std::move(*token));
    }
    return tokens;
}

GridToken GridLexer::identifier() {
    size_t start = current_;
    while (!isAtEnd()) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c)) || isStructural(c)) {
            break;
        }
        current_++;
    }
    return GridToken(GridTokenType::Identifier, source_.substr(start, current_ - start), start);
}

// ============================================================================
// GridLayoutParser Implementation
// ============================================================================

GridLayoutParser::GridLayoutParser(const std::string& layout)
    : lexer_(layout) {}

RegionRegistry GridLayoutParser::parse(const std::string& layout) {
    GridLayoutParser parser(layout);
    return parser.run();
}

RegionRegistry GridLayoutParser::run() {
    while (auto token = lexer_.next()) {
        handle(*token);
    }
    return std::move(registry_);
}

void GridLayoutParser::handle(const GridToken& token) {
    switch (token.type) {
        case GridTokenType::RowStart:
            col_ = 0;
            break;

        case GridTokenType::RowEnd:
            current_region_.reset();
            ++row_;
            break;

        case GridTokenType::HorizontalExtend:
            if (current_region_) {
                registry_.at(*current_region_).width++;
            }
            ++col_;
            break;

        case GridTokenType::VerticalExtend:
            if (auto above = registry_.findAbove(row_, col_)) {
                registry_.at(*above).height++;
            }
            ++col_;
            break;

        case GridTokenType::Filler:
            ++col_;
            break;

        case GridTokenType::Identifier:
            addRegion(token.lexeme);
            ++col_;
            break;
    }
}

void GridLayoutParser::addRegion(const std::string& identifier) {
    Region region;
    region.row = row_;
    region.col = col_;

    auto colon = identifier.find(':');
    if (colon != std::string::npos) {
        // Only the text up to a second colon holds constraints.
        std::string spec = identifier.substr(colon + 1);
        region.name = identifier.substr(0, colon);
        region.constraints = splitEmbedded(spec.substr(0, spec.find(':')));
    } else {
        region.name = identifier;
    }

    current_region_ = registry_.add(std::move(region));
}

} // namespace gform
