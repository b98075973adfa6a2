#include "roix/export_record.hpp"
#include "roix/errors.hpp"

#include <array>
#include <string>
#include <utility>

namespace roix
{
    namespace
    {
        constexpr const char *kSchemaVersion = "1.0.0";

        template <typename E, std::size_t N>
        E parse_enum(const std::string &s, const std::array<std::pair<E, const char *>, N> &table, const char *key)
        {
            for (const auto &entry : table)
                if (s == entry.second)
                    return entry.first;
            throw InputError(std::string("unknown ") + key + " '" + s + "'");
        }

        template <typename E, std::size_t N>
        const char *enum_name(E v, const std::array<std::pair<E, const char *>, N> &table)
        {
            for (const auto &entry : table)
                if (entry.first == v)
                    return entry.second;
            return "";
        }

        const std::array<std::pair<RoiType, const char *>, 2> kRoiTypes{{
            {RoiType::Image, "image"},
            {RoiType::Region, "region"},
        }};
        const std::array<std::pair<ImageAction, const char *>, 2> kImageActions{{
            {ImageAction::Detect, "detect"},
            {ImageAction::DetectAndClick, "detect_and_click"},
        }};
        const std::array<std::pair<Action, const char *>, 4> kActions{{
            {Action::None, ""},
            {Action::Click, "click"},
            {Action::Ocr, "ocr"},
            {Action::Swipe, "swipe"},
        }};
        const std::array<std::pair<ClickMode, const char *>, 2> kClickModes{{
            {ClickMode::Single, "single"},
            {ClickMode::Loop, "loop"},
        }};
        const std::array<std::pair<SwipeDirection, const char *>, 4> kSwipeDirections{{
            {SwipeDirection::TopToBottom, "top_to_bottom"},
            {SwipeDirection::BottomToTop, "bottom_to_top"},
            {SwipeDirection::LeftToRight, "left_to_right"},
            {SwipeDirection::RightToLeft, "right_to_left"},
        }};
    }

    const char *to_string(RoiType t) { return enum_name(t, kRoiTypes); }
    const char *to_string(ImageAction a) { return enum_name(a, kImageActions); }
    const char *to_string(Action a) { return enum_name(a, kActions); }
    const char *to_string(ClickMode m) { return enum_name(m, kClickModes); }
    const char *to_string(SwipeDirection d) { return enum_name(d, kSwipeDirections); }

    nlohmann::json to_record(const Region &region)
    {
        const ExportAttributes &a = region.attributes();
        const cv::Point c = region.center();

        nlohmann::json j = {
            {"id", region.id()},
            {"name", region.name()},
            {"node_name", a.node_name},
            {"roi_type", to_string(a.roi_type)},
            {"x", region.x()},
            {"y", region.y()},
            {"width", region.width()},
            {"height", region.height()},
            {"center", {c.x, c.y}},
        };

        if (a.roi_type == RoiType::Image)
        {
            j["image_name"] = a.image_name;
            j["image_action"] = to_string(a.image_action);
            return j;
        }

        j["action"] = to_string(a.action);
        if (a.action == Action::Click)
        {
            j["click_mode"] = to_string(a.click_mode);
            j["click_count"] = a.click_count;
            j["click_interval_ms"] = a.click_interval_ms;
        }
        else if (a.action == Action::Swipe)
        {
            j["swipe_direction"] = to_string(a.swipe_direction);
            j["swipe_speed_px_s"] = a.swipe_speed_px_s;
        }
        return j;
    }

    Region region_from_record(const nlohmann::json &record)
    {
        if (!record.is_object())
            throw InputError("region record must be a JSON object");

        try
        {
            Region r(record.value("x", 0), record.value("y", 0),
                     record.value("width", 0), record.value("height", 0),
                     record.value("name", std::string{}));
            if (record.contains("id"))
                r.set_id(record.at("id").get<std::string>());

            ExportAttributes a;
            a.node_name = record.value("node_name", std::string{});
            a.image_name = record.value("image_name", std::string{});
            a.roi_type = parse_enum(record.value("roi_type", std::string("image")), kRoiTypes, "roi_type");
            a.image_action = parse_enum(record.value("image_action", std::string("detect")), kImageActions, "image_action");
            a.action = parse_enum(record.value("action", std::string{}), kActions, "action");
            a.click_mode = parse_enum(record.value("click_mode", std::string("single")), kClickModes, "click_mode");
            a.click_count = record.value("click_count", 1);
            a.click_interval_ms = record.value("click_interval_ms", 500);
            a.swipe_direction = parse_enum(record.value("swipe_direction", std::string("top_to_bottom")),
                                           kSwipeDirections, "swipe_direction");
            a.swipe_speed_px_s = record.value("swipe_speed_px_s", 400);
            r.set_attributes(std::move(a));
            return r;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw InputError(std::string("malformed region record: ") + ex.what());
        }
    }

    nlohmann::json to_document(const RegionCollection &regions)
    {
        nlohmann::json rois = nlohmann::json::array();
        for (const auto &r : regions)
            rois.push_back(to_record(r));
        return {
            {"version", kSchemaVersion},
            {"roi_count", regions.size()},
            {"rois", std::move(rois)},
        };
    }

    void load_document(const nlohmann::json &doc, RegionCollection &out)
    {
        if (!doc.is_object() || !doc.contains("rois") || !doc.at("rois").is_array())
            throw InputError("region document needs a 'rois' array");

        RegionCollection loaded;
        for (const auto &rec : doc.at("rois"))
            loaded.add(region_from_record(rec));
        out = std::move(loaded);
    }
}
