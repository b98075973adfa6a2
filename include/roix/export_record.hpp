#pragma once
#include "roix/region.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace roix
{
    // Stable record schema shared with the export collaborators:
    // {id, name, node_name, roi_type, x, y, width, height, center:[cx,cy]} plus
    // image_name/image_action for images, action and its settings for regions.
    nlohmann::json to_record(const Region &region);

    // Missing keys take their defaults; unknown enum strings or a
    // non-positive size are InputError.
    Region region_from_record(const nlohmann::json &record);

    // {version, roi_count, rois:[...]}
    nlohmann::json to_document(const RegionCollection &regions);
    void load_document(const nlohmann::json &doc, RegionCollection &out);

    const char *to_string(RoiType t);
    const char *to_string(ImageAction a);
    const char *to_string(Action a);
    const char *to_string(ClickMode m);
    const char *to_string(SwipeDirection d);
}
