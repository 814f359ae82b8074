#pragma once

/**
 * @file ConstraintTypes.hpp
 * @brief Typed constraint record produced by the constraint language
 *
 * A ConstraintRecord is always fully populated. The constraint parser
 * only overwrites the fields named in its input.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace gform {

enum class AnchorDirection {
    Center,
    North,
    South,
    East,
    West,
    NorthEast,
    NorthWest,
    SouthEast,
    SouthWest
};

/**
 * @brief Numeric anchor code passed through unvalidated
 */
struct RawAnchorCode {
    int value;

    bool operator==(const RawAnchorCode& other) const { return value == other.value; }
    bool operator!=(const RawAnchorCode& other) const { return value != other.value; }
};

using Anchor = std::variant<AnchorDirection, RawAnchorCode>;

enum class FillMode {
    None,
    Horizontal,
    Vertical,
    Both
};

struct RawFillCode {
    int value;

    bool operator==(const RawFillCode& other) const { return value == other.value; }
    bool operator!=(const RawFillCode& other) const { return value != other.value; }
};

using Fill = std::variant<FillMode, RawFillCode>;

struct Insets {
    int top{0};
    int bottom{0};
    int left{0};
    int right{0};

    bool operator==(const Insets& other) const {
        return top == other.top && bottom == other.bottom &&
               left == other.left && right == other.right;
    }
    bool operator!=(const Insets& other) const { return !(*this == other); }
};

struct ConstraintRecord {
    int gridwidth{1};
    int gridheight{1};

    double weightx{0.0};
    double weighty{0.0};

    Anchor anchor{AnchorDirection::Center};
    Fill fill{FillMode::None};

    int ipadx{0};
    int ipady{0};

    Insets insets;
};

/**
 * @brief Fields a constraint mnemonic can write
 *
 * Used as bit flags so wildcard mnemonics can name several fields.
 */
enum class ConstraintField : unsigned {
    GridWidth    = 1u << 0,
    GridHeight   = 1u << 1,
    WeightX      = 1u << 2,
    WeightY      = 1u << 3,
    Anchor       = 1u << 4,
    Fill         = 1u << 5,
    IPadX        = 1u << 6,
    IPadY        = 1u << 7,
    InsetTop     = 1u << 8,
    InsetBottom  = 1u << 9,
    InsetLeft    = 1u << 10,
    InsetRight   = 1u << 11
};

inline unsigned fieldMask(ConstraintField field) {
    return static_cast<unsigned>(field);
}

enum class ConstraintErrorKind {
    IncompleteConstraintPair,
    UnknownConstraintName,
    InvalidNumericValue,
    UnknownAnchorValue,
    UnknownFillValue,
    UnrecognizedEmbeddedConstraint
};

/**
 * @brief Fatal error raised while splitting or interpreting constraints
 *
 * token() holds the offending token: the mnemonic for name and numeric
 * errors, the value for anchor and fill errors, the embedded item for
 * split errors, and the whole input for an incomplete pair.
 */
class ConstraintError : public std::runtime_error {
public:
    ConstraintError(ConstraintErrorKind kind, std::string token, const std::string& message)
        : std::runtime_error(message), kind_(kind), token_(std::move(token)) {}

    ConstraintErrorKind kind() const { return kind_; }
    const std::string& token() const { return token_; }

private:
    ConstraintErrorKind kind_;
    std::string token_;
};

// Keyword lookup expects an already lower-cased value.
std::optional<AnchorDirection> anchorDirectionFromString(const std::string& str);
std::optional<FillMode> fillModeFromString(const std::string& str);

std::string anchorToString(const Anchor& anchor);
std::string fillToString(const Fill& fill);

const char* constraintErrorKindToString(ConstraintErrorKind kind);

} // namespace gform
