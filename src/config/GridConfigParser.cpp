#include "gridform/config/GridConfigParser.hpp"
#include "gridform/layout/GridLayoutParser.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace gform {

// ============================================================================
// GridConfigLexer Implementation
// ============================================================================

GridConfigLexer::GridConfigLexer(std::string source)
    : source_(std::move(source)) {}

std::vector<GridConfigToken> GridConfigLexer::tokenize() {
    std::vector<GridConfigToken> tokens;

    while (!isAtEnd()) {
        skipWhitespace();

        if (isAtEnd()) break;

        char c = peek();

        // Skip comments
        if ((c == '/' && peekNext() == '/') || c == '#') {
            skipComment();
            continue;
        }

        if (c == '"') {
            tokens.push_back(stringLiteral());
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            ((c == '-' || c == '.') && std::isdigit(static_cast<unsigned char>(peekNext())))) {
            tokens.push_back(number());
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            tokens.push_back(identifier());
            continue;
        }

        int start_col = column_;
        switch (c) {
            case '=': advance(); tokens.push_back(makeToken(GridConfigTokenType::Assign, start_col)); break;
            case ';': advance(); tokens.push_back(makeToken(GridConfigTokenType::Semicolon, start_col)); break;
            case '{': advance(); tokens.push_back(makeToken(GridConfigTokenType::LeftBrace, start_col)); break;
            case '}': advance(); tokens.push_back(makeToken(GridConfigTokenType::RightBrace, start_col)); break;
            default:
                addError("Unexpected character '" + std::string(1, c) + "'");
                advance();
                break;
        }
    }

    tokens.push_back(GridConfigToken(GridConfigTokenType::EndOfFile, "", line_, column_));
    return tokens;
}

char GridConfigLexer::peek() const {
    if (isAtEnd()) return '\0';
    return source_[current_];
}

char GridConfigLexer::peekNext() const {
    if (current_ + 1 >= source_.size()) return '\0';
    return source_[current_ + 1];
}

char GridConfigLexer::advance() {
    char c = source_[current_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

bool GridConfigLexer::isAtEnd() const {
    return current_ >= source_.size();
}

void GridConfigLexer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

void GridConfigLexer::skipComment() {
    while (!isAtEnd() && peek() != '\n') {
        advance();
    }
}

GridConfigToken GridConfigLexer::makeToken(GridConfigTokenType type, int start_col) {
    return GridConfigToken(type, std::string(1, source_[current_ - 1]), line_, start_col);
}

GridConfigToken GridConfigLexer::number() {
    int start_col = column_;
    std::string num_str;
    bool is_float = false;

    if (peek() == '-') {
        num_str += advance();
    }

    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        num_str += advance();
    }

    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peekNext()))) {
        is_float = true;
        num_str += advance(); // consume '.'
        while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
            num_str += advance();
        }
    }

    try {
        if (is_float) {
            return GridConfigToken(GridConfigTokenType::Float, num_str, line_, start_col,
                                   std::stod(num_str));
        }
        return GridConfigToken(GridConfigTokenType::Integer, num_str, line_, start_col,
                               std::stoi(num_str));
    } catch (const std::out_of_range&) {
        addError("Number out of range: " + num_str);
        return GridConfigToken(GridConfigTokenType::Invalid, num_str, line_, start_col);
    }
}

GridConfigToken GridConfigLexer::stringLiteral() {
    int start_line = line_;
    int start_col = column_;
    advance(); // consume opening quote

    std::string value;
    while (!isAtEnd() && peek() != '"') {
        if (peek() == '\n') {
            addError("Unterminated string");
            break;
        }
        if (peek() == '\\') {
            advance();
            if (!isAtEnd()) {
                char escaped = advance();
                switch (escaped) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case '\\': value += '\\'; break;
                    case '"': value += '"'; break;
                    default: value += escaped; break;
                }
            }
        } else {
            value += advance();
        }
    }

    if (isAtEnd()) {
        addError("Unterminated string");
    } else if (peek() == '"') {
        advance(); // consume closing quote
    }

    return GridConfigToken(GridConfigTokenType::String, value, start_line, start_col, value);
}

GridConfigToken GridConfigLexer::identifier() {
    int start_col = column_;
    std::string ident;

    while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        ident += advance();
    }

    if (ident == "region") {
        return GridConfigToken(GridConfigTokenType::Region, ident, line_, start_col);
    }
    return GridConfigToken(GridConfigTokenType::Identifier, ident, line_, start_col);
}

void GridConfigLexer::addError(const std::string& message) {
    errors_.push_back("Line " + std::to_string(line_) + ", Column " +
                      std::to_string(column_) + ": " + message);
}

// ============================================================================
// GridConfigReader Implementation
// ============================================================================

GridConfigReader::GridConfigReader(std::vector<GridConfigToken> tokens)
    : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != GridConfigTokenType::EndOfFile) {
        tokens_.push_back(GridConfigToken(GridConfigTokenType::EndOfFile, "", 0, 0));
    }
}

config_ast::ConfigFile GridConfigReader::parse() {
    config_ast::ConfigFile file;

    while (!isAtEnd()) {
        try {
            if (match({GridConfigTokenType::Region})) {
                file.regions.push_back(regionBlock());
            } else if (check(GridConfigTokenType::Identifier)) {
                file.assignments.push_back(assignment());
            } else {
                consume(GridConfigTokenType::Identifier, "Expected setting name or 'region'");
            }
        } catch (const std::runtime_error&) {
            // Already recorded by consume(); resume at the next statement.
            synchronize();
        }
    }

    return file;
}

const GridConfigToken& GridConfigReader::peek() const {
    return tokens_[current_];
}

const GridConfigToken& GridConfigReader::previous() const {
    return tokens_[current_ - 1];
}

bool GridConfigReader::isAtEnd() const {
    return peek().type == GridConfigTokenType::EndOfFile;
}

const GridConfigToken& GridConfigReader::advance() {
    if (!isAtEnd()) current_++;
    return previous();
}

bool GridConfigReader::check(GridConfigTokenType type) const {
    if (isAtEnd()) return false;
    return peek().type == type;
}

bool GridConfigReader::match(std::initializer_list<GridConfigTokenType> types) {
    for (auto type : types) {
        if (check(type)) {
            advance();
            return true;
        }
    }
    return false;
}

const GridConfigToken& GridConfigReader::consume(GridConfigTokenType type, const std::string& message) {
    if (check(type)) return advance();
    addError(message);
    throw std::runtime_error(message);
}

config_ast::RegionBlock GridConfigReader::regionBlock() {
    config_ast::RegionBlock block;
    block.line = previous().line;

    if (match({GridConfigTokenType::String})) {
        block.name = std::get<std::string>(previous().literal_value);
    } else {
        block.name = consume(GridConfigTokenType::Identifier, "Expected region name after 'region'").lexeme;
    }

    consume(GridConfigTokenType::LeftBrace, "Expected '{' after region name");

    while (!check(GridConfigTokenType::RightBrace) && !isAtEnd()) {
        block.assignments.push_back(assignment());
    }

    consume(GridConfigTokenType::RightBrace, "Expected '}' to close region block");
    return block;
}

config_ast::Assignment GridConfigReader::assignment() {
    config_ast::Assignment assign;
    const auto& name = consume(GridConfigTokenType::Identifier, "Expected setting name");
    assign.name = name.lexeme;
    assign.line = name.line;
    assign.column = name.column;

    consume(GridConfigTokenType::Assign, "Expected '=' after '" + assign.name + "'");

    while (match({GridConfigTokenType::String, GridConfigTokenType::Integer, GridConfigTokenType::Float})) {
        const auto& value = previous().literal_value;
        if (const auto* str = std::get_if<std::string>(&value)) {
            assign.values.emplace_back(*str);
        } else if (const auto* ival = std::get_if<int>(&value)) {
            assign.values.emplace_back(*ival);
        } else {
            assign.values.emplace_back(std::get<double>(value));
        }
    }

    if (assign.values.empty()) {
        consume(GridConfigTokenType::String, "Expected value for '" + assign.name + "'");
    }

    consume(GridConfigTokenType::Semicolon, "Expected ';' after value of '" + assign.name + "'");
    return assign;
}

void GridConfigReader::addError(const std::string& message) {
    errors_.push_back("Line " + std::to_string(peek().line) + ", Column " +
                      std::to_string(peek().column) + ": " + message);
}

void GridConfigReader::synchronize() {
    while (!isAtEnd()) {
        const auto& token = advance();
        if (token.type == GridConfigTokenType::Semicolon ||
            token.type == GridConfigTokenType::RightBrace) {
            return;
        }
        if (peek().type == GridConfigTokenType::Region) {
            return;
        }
    }
}

// ============================================================================
// GridConfigParser Implementation
// ============================================================================

std::optional<std::string> GridConfig::overrideFor(const std::string& region) const {
    auto it = std::find_if(region_overrides.begin(), region_overrides.end(),
                           [&region](const auto& entry) { return entry.first == region; });
    if (it != region_overrides.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::filesystem::path GridConfigParser::getDefaultConfigPath() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config != nullptr && xdg_config[0] != '\0') {
        return std::filesystem::path(xdg_config) / "gridform" / "layout.grid";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "gridform" / "layout.grid";
    }
    return std::filesystem::path(".") / "layout.grid";
}

bool GridConfigParser::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        reportError("Config file not found: " + path.string());
        return false;
    }

    auto content = readFile(path);
    if (!content) {
        reportError("Failed to read config file: " + path.string());
        return false;
    }

    return parse(*content);
}

bool GridConfigParser::parse(const std::string& source) {
    config_ = GridConfig{};
    errors_.clear();

    GridConfigLexer lexer(source);
    auto tokens = lexer.tokenize();
    if (!lexer.getErrors().empty()) {
        reportErrors(lexer.getErrors());
        return false;
    }

    GridConfigReader reader(std::move(tokens));
    auto ast = reader.parse();
    if (!reader.getErrors().empty()) {
        reportErrors(reader.getErrors());
        return false;
    }

    if (!interpret(ast)) {
        return false;
    }
    return validate();
}

bool GridConfigParser::interpret(const config_ast::ConfigFile& ast) {
    bool ok = true;

    auto where = [](const config_ast::Assignment& assign) {
        return "Line " + std::to_string(assign.line) + ", Column " +
               std::to_string(assign.column) + ": ";
    };

    for (const auto& assign : ast.assignments) {
        if (assign.name == "layout") {
            for (const auto& part : assign.values) {
                const auto* text = std::get_if<std::string>(&part);
                if (!text) {
                    reportError(where(assign) + "layout expects string values");
                    ok = false;
                    break;
                }
                config_.layout += *text;
            }
        } else if (assign.name == "defaults") {
            std::string defaults = buildConstraintString(assign.values);
            config_.defaults = buildConstraintString({config_.defaults, defaults});
        } else {
            reportError(where(assign) + "Unknown setting '" + assign.name + "'");
            ok = false;
        }
    }

    for (const auto& block : ast.regions) {
        for (const auto& assign : block.assignments) {
            if (assign.name != "constraints") {
                reportError(where(assign) + "Unknown region setting '" + assign.name + "'");
                ok = false;
                continue;
            }

            std::string constraints = buildConstraintString(assign.values);
            auto it = std::find_if(config_.region_overrides.begin(), config_.region_overrides.end(),
                                   [&block](const auto& entry) { return entry.first == block.name; });
            if (it != config_.region_overrides.end()) {
                it->second = buildConstraintString({it->second, constraints});
            } else {
                config_.region_overrides.emplace_back(block.name, constraints);
            }
        }
    }

    return ok;
}

bool GridConfigParser::validate() {
    bool ok = true;
    ConstraintRecord scratch;

    try {
        applyConstraints(scratch, config_.defaults);
    } catch (const ConstraintError& e) {
        reportError("Invalid defaults: " + std::string(e.what()));
        ok = false;
    }

    std::optional<RegionRegistry> registry;
    try {
        registry = GridLayoutParser::parse(config_.layout);
    } catch (const ConstraintError& e) {
        reportError("Invalid layout: " + std::string(e.what()));
        ok = false;
    }

    for (const auto& [name, constraints] : config_.region_overrides) {
        try {
            ConstraintRecord record;
            applyConstraints(record, constraints);
        } catch (const ConstraintError& e) {
            reportError("Invalid constraints for region " + name + ": " + e.what());
            ok = false;
        }

        if (registry && !registry->empty() && !registry->contains(name)) {
            std::cerr << "[GridConfigParser] Warning: region '" << name
                      << "' does not appear in the layout" << std::endl;
        }
    }

    return ok;
}

GridPlacer GridConfigParser::makePlacer() const {
    GridPlacer placer({config_.defaults});
    if (!config_.layout.empty()) {
        placer.parseLayout(config_.layout);
    }
    return placer;
}

void GridConfigParser::reportError(const std::string& message) {
    errors_.push_back(message);
    std::cerr << "[GridConfigParser Error] " << message << std::endl;
}

void GridConfigParser::reportErrors(const std::vector<std::string>& errors) {
    for (const auto& error : errors) {
        errors_.push_back(error);
        std::cerr << "[GridConfigParser] " << error << std::endl;
    }
}

std::optional<std::string> GridConfigParser::readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace gform
