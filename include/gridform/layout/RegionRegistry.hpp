#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gform {

/**
 * @brief A named rectangular area of a parsed grid layout
 *
 * row/col locate the top-left cell. constraints holds the canonical
 * "name value ..." form of any embedded "name:spec" suffix, or "".
 */
struct Region {
    std::string name;
    int row{0};
    int col{0};
    int width{1};
    int height{1};
    std::string constraints;
};

/**
 * @brief Insertion-ordered collection of regions from one layout parse
 *
 * Only GridLayoutParser builds registries. Once returned a registry is
 * never modified, so concurrent readers are safe.
 */
class RegionRegistry {
public:
    RegionRegistry() = default;

    // First region with this exact name, or nullopt.
    std::optional<Region> find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name).has_value(); }

    const std::vector<Region>& regions() const { return regions_; }
    size_t size() const { return regions_.size(); }
    bool empty() const { return regions_.empty(); }

    std::vector<Region>::const_iterator begin() const { return regions_.begin(); }
    std::vector<Region>::const_iterator end() const { return regions_.end(); }

private:
    friend class GridLayoutParser;

    std::vector<Region> regions_;

    size_t add(Region region);
    Region& at(size_t index) { return regions_[index]; }

    // Nearest region above (row, col), scanning rows upward.
    std::optional<size_t> findAbove(int row, int col) const;
};

} // namespace gform
