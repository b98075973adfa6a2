#pragma once
#include "roix/region.hpp"
#include "roix/superpixel.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <vector>

namespace roix
{
    // Interactive selection over one SuperpixelEngine. The selection belongs to
    // the engine generation it was built on and is dropped when that changes.
    class SuperpixelMergeTool
    {
    public:
        explicit SuperpixelMergeTool(SuperpixelEngine &engine) : engine_(engine) {}

        // Non-additive: selection becomes {label}; additive: toggles label.
        // Nothing under the point clears (non-additive) or does nothing (additive).
        const SuperpixelRegion *click_select(int x, int y, bool additive = false);

        // Adds every label under the rectangle; never removes.
        std::vector<const SuperpixelRegion *> rect_select(int x1, int y1, int x2, int y2);

        void clear_selection();
        const std::set<int> &selection();
        std::vector<const SuperpixelRegion *> selected_regions();

        // Needs at least two selected labels; clears the selection on success.
        std::optional<Region> merge_selected();

        // One pass in stored order: every unmerged region smaller than minArea
        // absorbs later unmerged regions of similar mean color whose centroids
        // lie within the sum of both larger bbox sides.
        std::vector<Region> auto_merge_all(double minArea = 500.0, double colorThreshold = 30.0);

        const std::vector<Region> &merged_regions() const { return merged_; }

        // Hands over every merged region produced so far.
        std::vector<Region> finalize();

    private:
        void sync();

        SuperpixelEngine &engine_;
        std::set<int> selected_;
        std::uint64_t generation_{0};
        std::vector<Region> merged_;
    };
}
