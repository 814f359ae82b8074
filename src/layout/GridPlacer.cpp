#include "gridform/layout/GridPlacer.hpp"
#include "gridform/layout/GridLayoutParser.hpp"
#include <sstream>
#include <stdexcept>

namespace gform {

namespace {

// True if any constraint name in a canonical string writes the field.
bool namesField(const std::string& constraints, ConstraintField field) {
    std::istringstream iss(constraints);
    std::string name;
    std::string value;
    while (iss >> name) {
        if (mnemonicTouches(name, field)) {
            return true;
        }
        iss >> value;
    }
    return false;
}

} // namespace

GridPlacer::GridPlacer(const std::vector<ConstraintPart>& defaults) {
    updateDefaults(defaults);
}

void GridPlacer::updateDefaults(const std::vector<ConstraintPart>& constraints) {
    applyConstraintParts(defaults_, constraints);
}

Placement GridPlacer::placeAt(int row, int col, const std::vector<ConstraintPart>& overrides) const {
    Placement placement;
    placement.row = row;
    placement.col = col;
    placement.constraints = defaults_;
    applyConstraintParts(placement.constraints, overrides);
    return placement;
}

void GridPlacer::parseLayout(const std::string& layout) {
    layout_ = GridLayoutParser::parse(layout);
}

Placement GridPlacer::place(const std::string& name, const std::vector<ConstraintPart>& overrides) const {
    if (!layout_) {
        throw std::runtime_error("No layout string has been parsed");
    }

    auto region = layout_->find(name);
    if (!region) {
        throw std::runtime_error("No region named " + name + " in layout");
    }

    return placeRegion(*region, overrides);
}

Placement GridPlacer::placeRegion(const Region& region, const std::vector<ConstraintPart>& overrides) const {
    std::string extra = buildConstraintString(overrides);

    Placement placement;
    placement.name = region.name;
    placement.row = region.row;
    placement.col = region.col;
    placement.constraints = defaults_;

    ConstraintRecord& record = placement.constraints;
    applyConstraints(record, region.constraints);
    applyConstraints(record, extra);

    record.gridwidth = region.width;
    record.gridheight = region.height;

    if (!namesField(region.constraints, ConstraintField::WeightX) &&
        !namesField(extra, ConstraintField::WeightX)) {
        record.weightx = region.width / 100.0;
    }
    if (!namesField(region.constraints, ConstraintField::WeightY) &&
        !namesField(extra, ConstraintField::WeightY)) {
        record.weighty = region.height / 100.0;
    }

    return placement;
}

} // namespace gform
