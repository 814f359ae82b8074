#include "gridform/layout/RegionRegistry.hpp"
#include <algorithm>
#include <utility>

namespace gform {

std::optional<Region> RegionRegistry::find(const std::string& name) const {
    auto it = std::find_if(regions_.begin(), regions_.end(),
                           [&name](const Region& region) { return region.name == name; });
    if (it != regions_.end()) {
        return *it;
    }
    return std::nullopt;
}

size_t RegionRegistry::add(Region region) {
    regions_.push_back(std::move(region));
    return regions_.size() - 1;
}

std::optional<size_t> RegionRegistry::findAbove(int row, int col) const {
    for (--row; row >= 0; --row) {
        for (size_t i = 0; i < regions_.size(); ++i) {
            if (regions_[i].row == row && regions_[i].col == col) {
                return i;
            }
        }
    }
    return std::nullopt;
}

} // namespace gform
