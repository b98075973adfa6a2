#include "roix/merge_tool.hpp"
#include "roix/log.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace roix
{
    void SuperpixelMergeTool::sync()
    {
        const std::uint64_t gen = engine_.generation();
        if (gen != generation_)
        {
            if (!selected_.empty())
                log::d("merge tool: segmentation replaced, dropping " + std::to_string(selected_.size()) +
                       " selected label(s)");
            selected_.clear();
            generation_ = gen;
        }
    }

    const SuperpixelRegion *SuperpixelMergeTool::click_select(int x, int y, bool additive)
    {
        sync();
        const SuperpixelRegion *region = engine_.get_region_at_point(x, y);
        if (!region)
        {
            if (!additive)
                selected_.clear();
            return nullptr;
        }

        if (additive)
        {
            if (!selected_.erase(region->label))
                selected_.insert(region->label);
        }
        else
        {
            selected_.clear();
            selected_.insert(region->label);
        }
        return region;
    }

    std::vector<const SuperpixelRegion *> SuperpixelMergeTool::rect_select(int x1, int y1, int x2, int y2)
    {
        sync();
        auto regions = engine_.get_regions_in_rect(x1, y1, x2, y2);
        for (const auto *r : regions)
            selected_.insert(r->label);
        return regions;
    }

    void SuperpixelMergeTool::clear_selection()
    {
        selected_.clear();
    }

    const std::set<int> &SuperpixelMergeTool::selection()
    {
        sync();
        return selected_;
    }

    std::vector<const SuperpixelRegion *> SuperpixelMergeTool::selected_regions()
    {
        sync();
        std::vector<const SuperpixelRegion *> out;
        auto res = engine_.result();
        if (!res)
            return out;
        for (const auto &r : res->regions)
            if (selected_.count(r.label))
                out.push_back(&r);
        return out;
    }

    std::optional<Region> SuperpixelMergeTool::merge_selected()
    {
        auto res = engine_.result(); // keeps the regions alive during the merge
        auto regions = selected_regions();
        if (regions.size() < 2)
            return std::nullopt;

        auto merged = engine_.merge_regions(regions);
        if (merged)
        {
            merged_.push_back(*merged);
            selected_.clear();
        }
        return merged;
    }

    std::vector<Region> SuperpixelMergeTool::auto_merge_all(double minArea, double colorThreshold)
    {
        sync();
        std::vector<Region> out;
        auto res = engine_.result();
        if (!res)
            return out;

        const auto &regions = res->regions;
        std::vector<char> taken(regions.size(), 0);
        for (std::size_t i = 0; i < regions.size(); ++i)
        {
            const SuperpixelRegion &r1 = regions[i];
            if (taken[i] || r1.area >= minArea)
                continue;
            taken[i] = 1;

            std::vector<const SuperpixelRegion *> group{&r1};
            const int reach1 = std::max(r1.bbox.width, r1.bbox.height);
            for (std::size_t j = i + 1; j < regions.size(); ++j)
            {
                if (taken[j])
                    continue;
                const SuperpixelRegion &r2 = regions[j];
                if (color_distance(r1.avg_color, r2.avg_color) >= colorThreshold)
                    continue;
                // adjacency approximated by centroid distance
                const int reach2 = std::max(r2.bbox.width, r2.bbox.height);
                if (point_distance(r1.centroid, r2.centroid) >= double(reach1 + reach2))
                    continue;
                group.push_back(&r2);
                taken[j] = 1;
            }

            if (group.size() < 2)
                continue;
            if (auto merged = engine_.merge_regions(group))
                out.push_back(std::move(*merged));
        }

        log::d("auto_merge_all: " + std::to_string(out.size()) + " group(s)");
        merged_.insert(merged_.end(), out.begin(), out.end());
        return out;
    }

    std::vector<Region> SuperpixelMergeTool::finalize()
    {
        std::vector<Region> out = std::move(merged_);
        merged_.clear();
        selected_.clear();
        return out;
    }
}
