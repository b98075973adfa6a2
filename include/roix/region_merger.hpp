#pragma once
#include "roix/region.hpp"
#include <vector>

namespace roix
{
    class RegionMerger
    {
    public:
        static constexpr double kDefaultIouThreshold = 0.3;

        // Stable-sorts by bbox area (descending) and keeps a candidate unless its
        // IoU with an already kept region exceeds iouThreshold.
        // Throws InputError for a threshold outside [0,1].
        static std::vector<Region> merge(std::vector<Region> regions,
                                         double iouThreshold = kDefaultIouThreshold);
    };
}
