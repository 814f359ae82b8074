#include "gridform/constraints/ConstraintTypes.hpp"
#include <unordered_map>

namespace gform {

std::optional<AnchorDirection> anchorDirectionFromString(const std::string& str) {
    static const std::unordered_map<std::string, AnchorDirection> anchor_map = {
        {"center", AnchorDirection::Center},
        {"ctr", AnchorDirection::Center},
        {"c", AnchorDirection::Center},
        {"north", AnchorDirection::North},
        {"n", AnchorDirection::North},
        {"top", AnchorDirection::North},
        {"south", AnchorDirection::South},
        {"s", AnchorDirection::South},
        {"bot", AnchorDirection::South},
        {"bottom", AnchorDirection::South},
        {"east", AnchorDirection::East},
        {"e", AnchorDirection::East},
        {"right", AnchorDirection::East},
        {"r", AnchorDirection::East},
        {"west", AnchorDirection::West},
        {"w", AnchorDirection::West},
        {"left", AnchorDirection::West},
        {"l", AnchorDirection::West},
        {"northeast", AnchorDirection::NorthEast},
        {"ne", AnchorDirection::NorthEast},
        {"topright", AnchorDirection::NorthEast},
        {"tr", AnchorDirection::NorthEast},
        {"northwest", AnchorDirection::NorthWest},
        {"nw", AnchorDirection::NorthWest},
        {"topleft", AnchorDirection::NorthWest},
        {"tl", AnchorDirection::NorthWest},
        {"southeast", AnchorDirection::SouthEast},
        {"se", AnchorDirection::SouthEast},
        {"bottomright", AnchorDirection::SouthEast},
        {"br", AnchorDirection::SouthEast},
        {"southwest", AnchorDirection::SouthWest},
        {"sw", AnchorDirection::SouthWest},
        {"bottomleft", AnchorDirection::SouthWest},
        {"bl", AnchorDirection::SouthWest}
    };

    auto it = anchor_map.find(str);
    if (it != anchor_map.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<FillMode> fillModeFromString(const std::string& str) {
    static const std::unordered_map<std::string, FillMode> fill_map = {
        {"none", FillMode::None},
        {"neither", FillMode::None},
        {"n", FillMode::None},
        {"horizontal", FillMode::Horizontal},
        {"h", FillMode::Horizontal},
        {"x", FillMode::Horizontal},
        {"vertical", FillMode::Vertical},
        {"v", FillMode::Vertical},
        {"y", FillMode::Vertical},
        {"both", FillMode::Both},
        {"all", FillMode::Both},
        {"xy", FillMode::Both},
        {"yx", FillMode::Both},
        {"hv", FillMode::Both},
        {"vh", FillMode::Both}
    };

    auto it = fill_map.find(str);
    if (it != fill_map.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string anchorToString(const Anchor& anchor) {
    if (const auto* raw = std::get_if<RawAnchorCode>(&anchor)) {
        return std::to_string(raw->value);
    }
    switch (std::get<AnchorDirection>(anchor)) {
        case AnchorDirection::Center: return "center";
        case AnchorDirection::North: return "north";
        case AnchorDirection::South: return "south";
        case AnchorDirection::East: return "east";
        case AnchorDirection::West: return "west";
        case AnchorDirection::NorthEast: return "northeast";
        case AnchorDirection::NorthWest: return "northwest";
        case AnchorDirection::SouthEast: return "southeast";
        case AnchorDirection::SouthWest: return "southwest";
    }
    return "center";
}

std::string fillToString(const Fill& fill) {
    if (const auto* raw = std::get_if<RawFillCode>(&fill)) {
        return std::to_string(raw->value);
    }
    switch (std::get<FillMode>(fill)) {
        case FillMode::None: return "none";
        case FillMode::Horizontal: return "horizontal";
        case FillMode::Vertical: return "vertical";
        case FillMode::Both: return "both";
    }
    return "none";
}

const char* constraintErrorKindToString(ConstraintErrorKind kind) {
    switch (kind) {
        case ConstraintErrorKind::IncompleteConstraintPair: return "incomplete constraint pair";
        case ConstraintErrorKind::UnknownConstraintName: return "unknown constraint name";
        case ConstraintErrorKind::InvalidNumericValue: return "invalid numeric value";
        case ConstraintErrorKind::UnknownAnchorValue: return "unknown anchor value";
        case ConstraintErrorKind::UnknownFillValue: return "unknown fill value";
        case ConstraintErrorKind::UnrecognizedEmbeddedConstraint: return "unrecognized embedded constraint";
    }
    return "constraint error";
}

} // namespace gform
