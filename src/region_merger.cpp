#include "roix/region_merger.hpp"
#include "roix/errors.hpp"

#include <algorithm>
#include <string>

namespace roix
{
    std::vector<Region> RegionMerger::merge(std::vector<Region> regions, double iouThreshold)
    {
        if (!(iouThreshold >= 0.0 && iouThreshold <= 1.0))
            throw InputError("IoU threshold must be within [0,1], got " + std::to_string(iouThreshold));

        std::stable_sort(regions.begin(), regions.end(),
                         [](const Region &a, const Region &b)
                         { return a.bbox_area() > b.bbox_area(); });

        std::vector<Region> kept;
        kept.reserve(regions.size());
        for (auto &cand : regions)
        {
            const bool overlaps = std::any_of(kept.begin(), kept.end(),
                                              [&](const Region &k)
                                              { return iou(cand.bbox(), k.bbox()) > iouThreshold; });
            if (!overlaps)
                kept.push_back(std::move(cand));
        }
        return kept;
    }
}
