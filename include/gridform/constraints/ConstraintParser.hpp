#pragma once

#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "ConstraintTypes.hpp"

namespace gform {

/**
 * @brief One token of a heterogeneous constraint list
 *
 * Constraints may be given as one big string, several strings, or
 * alternating names and numbers, e.g. {"weightx", 2.0, "fill both"}.
 */
using ConstraintPart = std::variant<std::string, int, double>;

/**
 * @brief Entry of the ordered mnemonic table
 *
 * The table drives both embedded-constraint splitting (first entry whose
 * name prefixes the item wins) and interpretation (exact lookup).
 */
struct ConstraintMnemonic {
    std::string name;
    unsigned fields;
    std::function<void(ConstraintRecord&, const std::string& mnemonic, const std::string& value)> set;
};

const std::vector<ConstraintMnemonic>& constraintMnemonics();

// Exact, case-insensitive lookup. Returns nullptr for unknown names.
const ConstraintMnemonic* findConstraintMnemonic(const std::string& name);

bool mnemonicTouches(const std::string& name, ConstraintField field);

/**
 * @brief Split an embedded constraint spec into canonical form
 *
 * "wx1,wy2,i*5,fxy" becomes "wx 1 wy 2 i* 5 f xy".
 *
 * Trailing empty items are dropped, so "wx1," is accepted.
 *
 * @throws ConstraintError (UnrecognizedEmbeddedConstraint) when an item
 * is empty or does not start with any known mnemonic.
 */
std::string splitEmbedded(const std::string& spec);

/**
 * @brief Split a single "mnemonicvalue" item such as "wx1.0"
 * @return {mnemonic, value}, the mnemonic spelled as in the input
 */
std::pair<std::string, std::string> splitEmbeddedItem(const std::string& item);

/**
 * @brief Interpret a canonical "name value name value ..." string
 *
 * Only the fields named in the string are written. Names and values are
 * case-insensitive. Throws ConstraintError on the first bad pair; pairs
 * before it have already been applied.
 */
void applyConstraints(ConstraintRecord& record, const std::string& constraints);
void applyConstraintParts(ConstraintRecord& record, const std::vector<ConstraintPart>& parts);

void interpretConstraint(ConstraintRecord& record, const std::string& name, const std::string& value);

std::string buildConstraintString(const std::vector<ConstraintPart>& parts);

// Full canonical form of every field, accepted back by applyConstraints.
std::string formatConstraints(const ConstraintRecord& record);

int toConstraintInt(const std::string& mnemonic, const std::string& value);
double toConstraintDouble(const std::string& mnemonic, const std::string& value);
Anchor toAnchorValue(const std::string& value);
Fill toFillValue(const std::string& value);

} // namespace gform
