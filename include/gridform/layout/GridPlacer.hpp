#pragma once

/**
 * @file GridPlacer.hpp
 * @brief Headless placement of named grid regions
 *
 * Holds default constraints and the last parsed layout, and resolves the
 * final cell position and constraint record for each placement. Nothing
 * here knows about widgets; a presentation layer consumes Placement.
 */

#include <optional>
#include <string>
#include <vector>

#include "RegionRegistry.hpp"
#include "gridform/constraints/ConstraintParser.hpp"

namespace gform {

struct Placement {
    std::string name;
    int row{0};
    int col{0};
    ConstraintRecord constraints;
};

class GridPlacer {
public:
    GridPlacer() = default;
    explicit GridPlacer(const std::vector<ConstraintPart>& defaults);

    // Later calls override earlier ones field by field.
    void updateDefaults(const std::vector<ConstraintPart>& constraints);

    const ConstraintRecord& getDefaults() const { return defaults_; }

    /**
     * @brief Place at an explicit cell using defaults plus overrides
     */
    Placement placeAt(int row, int col, const std::vector<ConstraintPart>& overrides = {}) const;

    /**
     * @brief Parse a layout string, replacing any previous layout
     * @throws ConstraintError on a malformed embedded constraint
     */
    void parseLayout(const std::string& layout);

    bool hasLayout() const { return layout_.has_value(); }
    const std::optional<RegionRegistry>& getLayout() const { return layout_; }

    /**
     * @brief Place a region of the parsed layout
     *
     * Constraints are applied as defaults, then the region's embedded
     * constraints, then overrides. gridwidth and gridheight always come
     * from the layout. A weight left unnamed by both embedded and override
     * constraints becomes extent / 100 so regions scale with their size.
     *
     * @throws std::runtime_error if no layout was parsed or the name is absent
     */
    Placement place(const std::string& name, const std::vector<ConstraintPart>& overrides = {}) const;

    // Same as place() for a region taken directly from a registry, so
    // regions sharing a name each keep their own geometry.
    Placement placeRegion(const Region& region, const std::vector<ConstraintPart>& overrides = {}) const;

private:
    ConstraintRecord defaults_;
    std::optional<RegionRegistry> layout_;
};

} // namespace gform
