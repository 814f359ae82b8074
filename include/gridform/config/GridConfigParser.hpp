#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "gridform/constraints/ConstraintParser.hpp"
#include "gridform/layout/GridPlacer.hpp"

namespace gform {

/**
 * @brief AST for .grid configuration files
 *
 *     // comment
 *     defaults = "weightx 1.0 fill both";
 *     layout = "{c1 + + c2}"
 *              "{c3 + c4 +}";
 *     region c1 { constraints = "anchor w"; }
 */
namespace config_ast {

struct Assignment {
    std::string name;
    std::vector<ConstraintPart> values;
    int line{0};
    int column{0};
};

struct RegionBlock {
    std::string name;
    std::vector<Assignment> assignments;
    int line{0};
};

struct ConfigFile {
    std::vector<Assignment> assignments;
    std::vector<RegionBlock> regions;
};

} // namespace config_ast

enum class GridConfigTokenType {
    Integer, Float, String,
    Identifier, Region,
    Assign, Semicolon,
    LeftBrace, RightBrace,
    EndOfFile, Invalid
};

struct GridConfigToken {
    GridConfigTokenType type;
    std::string lexeme;
    int line;
    int column;

    std::variant<std::monostate, int, double, std::string> literal_value;

    GridConfigToken() : type(GridConfigTokenType::Invalid), line(0), column(0),
                        literal_value(std::monostate{}) {}

    GridConfigToken(GridConfigTokenType t, std::string lex, int l, int c)
        : type(t), lexeme(std::move(lex)), line(l), column(c),
          literal_value(std::monostate{}) {}

    GridConfigToken(GridConfigTokenType t, std::string lex, int l, int c, const std::string& lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c),
          literal_value(lit) {}

    GridConfigToken(GridConfigTokenType t, std::string lex, int l, int c, int lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c),
          literal_value(lit) {}

    GridConfigToken(GridConfigTokenType t, std::string lex, int l, int c, double lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c),
          literal_value(lit) {}
};

class GridConfigLexer {
public:
    explicit GridConfigLexer(std::string source);

    std::vector<GridConfigToken> tokenize();
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::string source_;
    size_t current_{0};
    int line_{1};
    int column_{1};
    std::vector<std::string> errors_;

    char peek() const;
    char peekNext() const;
    char advance();
    bool isAtEnd() const;

    void skipWhitespace();
    void skipComment();

    GridConfigToken makeToken(GridConfigTokenType type, int start_col);
    GridConfigToken number();
    GridConfigToken stringLiteral();
    GridConfigToken identifier();

    void addError(const std::string& message);
};

class GridConfigReader {
public:
    explicit GridConfigReader(std::vector<GridConfigToken> tokens);

    config_ast::ConfigFile parse();
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::vector<GridConfigToken> tokens_;
    size_t current_{0};
    std::vector<std::string> errors_;

    const GridConfigToken& peek() const;
    const GridConfigToken& previous() const;
    bool isAtEnd() const;
    const GridConfigToken& advance();
    bool check(GridConfigTokenType type) const;
    bool match(std::initializer_list<GridConfigTokenType> types);
    const GridConfigToken& consume(GridConfigTokenType type, const std::string& message);

    config_ast::RegionBlock regionBlock();
    config_ast::Assignment assignment();

    void addError(const std::string& message);
    void synchronize();
};

struct GridConfig {
    std::string layout;
    std::string defaults;

    // Per-region constraints in file order.
    std::vector<std::pair<std::string, std::string>> region_overrides;

    std::optional<std::string> overrideFor(const std::string& region) const;
};

class GridConfigParser {
public:
    GridConfigParser() = default;

    bool load(const std::filesystem::path& path = getDefaultConfigPath());

    bool parse(const std::string& source);

    const GridConfig& getConfig() const { return config_; }

    GridConfig& getConfigMutable() { return config_; }

    const std::vector<std::string>& getErrors() const { return errors_; }

    /**
     * @brief Default config location
     *
     * $XDG_CONFIG_HOME/gridform/layout.grid, falling back to
     * $HOME/.config/gridform/layout.grid.
     */
    static std::filesystem::path getDefaultConfigPath();

    /**
     * @brief Build a placer with the configured defaults and layout
     * @throws ConstraintError if the configuration holds bad constraints
     */
    GridPlacer makePlacer() const;

private:
    GridConfig config_;
    std::vector<std::string> errors_;

    bool interpret(const config_ast::ConfigFile& ast);
    bool validate();

    void reportError(const std::string& message);
    void reportErrors(const std::vector<std::string>& errors);

    std::optional<std::string> readFile(const std::filesystem::path& path);
};

} // namespace gform
