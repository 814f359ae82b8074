#include "gridform/constraints/ConstraintParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>

namespace gform {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

// Optional sign followed by decimal digits, nothing else.
std::optional<int> parseInteger(const std::string& value) {
    size_t start = (!value.empty() && (value[0] == '+' || value[0] == '-')) ? 1 : 0;
    if (start >= value.size()) {
        return std::nullopt;
    }
    for (size_t i = start; i < value.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return std::nullopt;
        }
    }
    try {
        return std::stoi(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

unsigned mask(std::initializer_list<ConstraintField> fields) {
    unsigned result = 0;
    for (auto field : fields) {
        result |= fieldMask(field);
    }
    return result;
}

void setGridWidth(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.gridwidth = toConstraintInt(m, v);
}

void setGridHeight(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.gridheight = toConstraintInt(m, v);
}

void setWeightX(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.weightx = toConstraintDouble(m, v);
}

void setWeightY(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.weighty = toConstraintDouble(m, v);
}

void setWeights(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.weightx = r.weighty = toConstraintDouble(m, v);
}

void setAnchor(ConstraintRecord& r, const std::string&, const std::string& v) {
    r.anchor = toAnchorValue(v);
}

void setFill(ConstraintRecord& r, const std::string&, const std::string& v) {
    r.fill = toFillValue(v);
}

void setPadX(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.ipadx = toConstraintInt(m, v);
}

void setPadY(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.ipady = toConstraintInt(m, v);
}

void setPads(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.ipadx = r.ipady = toConstraintInt(m, v);
}

void setInsetTop(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.insets.top = toConstraintInt(m, v);
}

void setInsetBottom(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.insets.bottom = toConstraintInt(m, v);
}

void setInsetLeft(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.insets.left = toConstraintInt(m, v);
}

void setInsetRight(ConstraintRecord& r, const std::string& m, const std::string& v) {
    r.insets.right = toConstraintInt(m, v);
}

void setInsets(ConstraintRecord& r, const std::string& m, const std::string& v) {
    int inset = toConstraintInt(m, v);
    r.insets.top = r.insets.bottom = r.insets.left = r.insets.right = inset;
}

} // namespace

// ============================================================================
// Mnemonic table
// ============================================================================

const std::vector<ConstraintMnemonic>& constraintMnemonics() {
    using F = ConstraintField;

    // Order matters for splitting: a longer mnemonic must come before any
    // shorter one that prefixes it (e.g. "anchor" before "a").
    static const std::vector<ConstraintMnemonic> table = {
        {"gridwidth",     mask({F::GridWidth}), setGridWidth},
        {"width",         mask({F::GridWidth}), setGridWidth},
        {"wd",            mask({F::GridWidth}), setGridWidth},
        {"gridheight",    mask({F::GridHeight}), setGridHeight},
        {"height",        mask({F::GridHeight}), setGridHeight},
        {"ht",            mask({F::GridHeight}), setGridHeight},
        {"weightx",       mask({F::WeightX}), setWeightX},
        {"wx",            mask({F::WeightX}), setWeightX},
        {"weighty",       mask({F::WeightY}), setWeightY},
        {"wy",            mask({F::WeightY}), setWeightY},
        {"w*",            mask({F::WeightX, F::WeightY}), setWeights},
        {"weight*",       mask({F::WeightX, F::WeightY}), setWeights},
        {"anchor",        mask({F::Anchor}), setAnchor},
        {"a",             mask({F::Anchor}), setAnchor},
        {"fill",          mask({F::Fill}), setFill},
        {"f",             mask({F::Fill}), setFill},
        {"ipadx",         mask({F::IPadX}), setPadX},
        {"px",            mask({F::IPadX}), setPadX},
        {"ipady",         mask({F::IPadY}), setPadY},
        {"py",            mask({F::IPadY}), setPadY},
        {"ipad*",         mask({F::IPadX, F::IPadY}), setPads},
        {"p*",            mask({F::IPadX, F::IPadY}), setPads},
        {"inset_top",     mask({F::InsetTop}), setInsetTop},
        {"insets_top",    mask({F::InsetTop}), setInsetTop},
        {"it",            mask({F::InsetTop}), setInsetTop},
        {"inset_bottom",  mask({F::InsetBottom}), setInsetBottom},
        {"insets_bottom", mask({F::InsetBottom}), setInsetBottom},
        {"ib",            mask({F::InsetBottom}), setInsetBottom},
        {"inset_left",    mask({F::InsetLeft}), setInsetLeft},
        {"insets_left",   mask({F::InsetLeft}), setInsetLeft},
        {"il",            mask({F::InsetLeft}), setInsetLeft},
        {"inset_right",   mask({F::InsetRight}), setInsetRight},
        {"insets_right",  mask({F::InsetRight}), setInsetRight},
        {"ir",            mask({F::InsetRight}), setInsetRight},
        {"insets*",       mask({F::InsetTop, F::InsetBottom, F::InsetLeft, F::InsetRight}), setInsets},
        {"inset*",        mask({F::InsetTop, F::InsetBottom, F::InsetLeft, F::InsetRight}), setInsets},
        {"i*",            mask({F::InsetTop, F::InsetBottom, F::InsetLeft, F::InsetRight}), setInsets}
    };
    return table;
}

const ConstraintMnemonic* findConstraintMnemonic(const std::string& name) {
    std::string lowered = toLower(name);
    const auto& table = constraintMnemonics();
    auto it = std::find_if(table.begin(), table.end(),
                           [&lowered](const ConstraintMnemonic& entry) { return entry.name == lowered; });
    return it != table.end() ? &*it : nullptr;
}

bool mnemonicTouches(const std::string& name, ConstraintField field) {
    const ConstraintMnemonic* entry = findConstraintMnemonic(name);
    return entry != nullptr && (entry->fields & fieldMask(field)) != 0;
}

// ============================================================================
// Embedded constraints
// ============================================================================

std::pair<std::string, std::string> splitEmbeddedItem(const std::string& item) {
    std::string lowered = toLower(item);
    for (const auto& entry : constraintMnemonics()) {
        if (lowered.compare(0, entry.name.size(), entry.name) == 0) {
            return {item.substr(0, entry.name.size()), item.substr(entry.name.size())};
        }
    }
    throw ConstraintError(ConstraintErrorKind::UnrecognizedEmbeddedConstraint, item,
                          "Could not interpret embedded constraint '" + item + "'");
}

std::string splitEmbedded(const std::string& spec) {
    std::vector<std::string> items;
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        items.push_back(trim(item));
    }

    // Trailing empty items are dropped; any other empty item is an error.
    while (!items.empty() && items.back().empty()) {
        items.pop_back();
    }

    std::vector<ConstraintPart> parts;
    for (const auto& entry : items) {
        auto [mnemonic, value] = splitEmbeddedItem(entry);
        parts.emplace_back(mnemonic);
        parts.emplace_back(value);
    }

    return buildConstraintString(parts);
}

// ============================================================================
// Interpretation
// ============================================================================

void applyConstraints(ConstraintRecord& record, const std::string& constraints) {
    std::istringstream iss(constraints);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }

    if (tokens.size() % 2 != 0) {
        throw ConstraintError(ConstraintErrorKind::IncompleteConstraintPair, constraints,
                              "Incomplete constraint pair in {" + constraints + "}");
    }

    for (size_t i = 0; i < tokens.size(); i += 2) {
        interpretConstraint(record, tokens[i], tokens[i + 1]);
    }
}

void applyConstraintParts(ConstraintRecord& record, const std::vector<ConstraintPart>& parts) {
    applyConstraints(record, buildConstraintString(parts));
}

void interpretConstraint(ConstraintRecord& record, const std::string& name, const std::string& value) {
    std::string cname = toLower(name);
    std::string cval = toLower(value);

    const ConstraintMnemonic* entry = findConstraintMnemonic(cname);
    if (!entry) {
        throw ConstraintError(ConstraintErrorKind::UnknownConstraintName, cname,
                              "Unknown constraint name '" + cname + "'");
    }
    entry->set(record, cname, cval);
}

int toConstraintInt(const std::string& mnemonic, const std::string& value) {
    auto parsed = parseInteger(value);
    if (!parsed) {
        throw ConstraintError(ConstraintErrorKind::InvalidNumericValue, mnemonic,
                              "Invalid numeric value {" + value + "} for constraint " + mnemonic);
    }
    return *parsed;
}

double toConstraintDouble(const std::string& mnemonic, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    bool ok = false;
    try {
        result = std::stod(value, &consumed);
        ok = consumed == value.size() && std::isfinite(result);
    } catch (const std::invalid_argument&) {
        ok = false;
    } catch (const std::out_of_range&) {
        ok = false;
    }
    if (!ok) {
        throw ConstraintError(ConstraintErrorKind::InvalidNumericValue, mnemonic,
                              "Invalid numeric value {" + value + "} for constraint " + mnemonic);
    }
    return result;
}

Anchor toAnchorValue(const std::string& value) {
    // Integers are assumed to be caller-domain anchor codes.
    if (auto code = parseInteger(value)) {
        return RawAnchorCode{*code};
    }
    if (auto direction = anchorDirectionFromString(toLower(value))) {
        return *direction;
    }
    throw ConstraintError(ConstraintErrorKind::UnknownAnchorValue, value,
                          "Unknown anchor value {" + value + "}");
}

Fill toFillValue(const std::string& value) {
    if (auto code = parseInteger(value)) {
        return RawFillCode{*code};
    }
    if (auto mode = fillModeFromString(toLower(value))) {
        return *mode;
    }
    throw ConstraintError(ConstraintErrorKind::UnknownFillValue, value,
                          "Unknown fill value {" + value + "}");
}

// ============================================================================
// Building and formatting
// ============================================================================

std::string buildConstraintString(const std::vector<ConstraintPart>& parts) {
    std::string result;

    for (const auto& part : parts) {
        std::string text;
        if (const auto* str = std::get_if<std::string>(&part)) {
            text = trim(*str);
        } else if (const auto* ival = std::get_if<int>(&part)) {
            text = std::to_string(*ival);
        } else {
            text = formatNumber(std::get<double>(part));
        }

        if (text.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += ' ';
        }
        result += text;
    }

    return result;
}

std::string formatConstraints(const ConstraintRecord& record) {
    std::ostringstream oss;
    oss << "gridwidth " << record.gridwidth
        << " gridheight " << record.gridheight
        << " weightx " << formatNumber(record.weightx)
        << " weighty " << formatNumber(record.weighty)
        << " anchor " << anchorToString(record.anchor)
        << " fill " << fillToString(record.fill)
        << " ipadx " << record.ipadx
        << " ipady " << record.ipady
        << " inset_top " << record.insets.top
        << " inset_bottom " << record.insets.bottom
        << " inset_left " << record.insets.left
        << " inset_right " << record.insets.right;
    return oss.str();
}

} // namespace gform
