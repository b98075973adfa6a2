#include "roix/geometric_detector.hpp"
#include "roix/region_merger.hpp"
#include "roix/image.hpp"
#include "roix/log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace roix
{
    namespace
    {
        // Square box around a circle, grown by margin and clipped to the image.
        Region circle_region(cv::Point center, int radius, int margin,
                             const cv::Size &sz, const std::string &name)
        {
            center = clamp_point(center.x, center.y, sz);
            const int half = radius + margin;
            cv::Rect box(center.x - half, center.y - half, 2 * half, 2 * half);
            box = clamp_rect(box, sz);
            return Region::circle(box, center, radius, name);
        }

        std::vector<Contour> external_contours(const cv::Mat &binary)
        {
            std::vector<Contour> contours;
            cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
            return contours;
        }
    }

    std::vector<Region> GeometricDetector::detect_circles(const cv::Mat &bgr) const
    {
        return detect_circles(bgr, params_.circle_min_radius, params_.circle_max_radius);
    }

    std::vector<Region> GeometricDetector::detect_circles(const cv::Mat &bgr, int minRadius, int maxRadius) const
    {
        require_bgr(bgr, "detect_circles");
        const auto &P = params_;

        cv::Mat gray;
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
        cv::medianBlur(gray, gray, P.circle_median_ksize);

        std::vector<cv::Vec3f> circles;
        cv::HoughCircles(gray, circles, cv::HOUGH_GRADIENT, P.circle_dp, P.circle_min_dist,
                         P.circle_canny_high, P.circle_acc_threshold, minRadius, maxRadius);

        std::vector<Region> out;
        out.reserve(circles.size());
        for (const auto &c : circles)
        {
            const cv::Point center((int)std::lround(c[0]), (int)std::lround(c[1]));
            const int radius = (int)std::lround(c[2]);
            out.push_back(circle_region(center, radius, P.circle_margin, bgr.size(),
                                        numbered_name("circle", (int)out.size() + 1)));
        }
        log::d("detect_circles: " + std::to_string(out.size()) + " hit(s)");
        return out;
    }

    std::vector<Region> GeometricDetector::detect_red_dots(const cv::Mat &bgr) const
    {
        require_bgr(bgr, "detect_red_dots");
        const auto &P = params_;

        cv::Mat hsv;
        cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

        // red wraps around hue 0
        cv::Mat low, high, mask;
        cv::inRange(hsv, cv::Scalar(0, P.red_s_min, P.red_v_min),
                    cv::Scalar(P.red_low_hue_max, 255, 255), low);
        cv::inRange(hsv, cv::Scalar(P.red_high_hue_min, P.red_s_min, P.red_v_min),
                    cv::Scalar(180, 255, 255), high);
        cv::bitwise_or(low, high, mask);

        cv::Mat k = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
        cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, k, cv::Point(-1, -1), P.red_close_iters);

        std::vector<Region> out;
        for (const auto &c : external_contours(mask))
        {
            const double area = cv::contourArea(c);
            if (area < P.red_min_area || area > P.red_max_area)
                continue;

            const double circ = circularity(area, cv::arcLength(c, true));
            if (circ <= P.red_min_circularity)
                continue;

            cv::Point2f ctr;
            float rad = 0.f;
            cv::minEnclosingCircle(c, ctr, rad);
            out.push_back(circle_region(cv::Point((int)ctr.x, (int)ctr.y), (int)rad, P.circle_margin,
                                        bgr.size(), numbered_name("red_dot", (int)out.size() + 1)));
            log::d("red dot area=" + std::to_string(area) + " circularity=" + std::to_string(circ));
        }
        return out;
    }

    std::vector<Region> GeometricDetector::detect_ui_buttons(const cv::Mat &bgr) const
    {
        require_bgr(bgr, "detect_ui_buttons");
        const auto &P = params_;

        cv::Mat gray, bin;
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
        cv::GaussianBlur(gray, gray, {5, 5}, 0);
        int blk = (P.button_block % 2 == 0) ? P.button_block + 1 : P.button_block;
        blk = std::max(3, blk);
        cv::adaptiveThreshold(gray, bin, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                              cv::THRESH_BINARY_INV, blk, P.button_c);

        cv::Mat k = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(P.button_close_k, P.button_close_k));
        cv::morphologyEx(bin, bin, cv::MORPH_CLOSE, k, cv::Point(-1, -1), P.button_close_iters);

        const double maxArea = P.button_max_area_frac * double(bgr.cols) * double(bgr.rows);
        std::vector<Region> out;
        for (const auto &c : external_contours(bin))
        {
            const double area = cv::contourArea(c);
            if (area < P.button_min_area || area > maxArea)
                continue;

            const cv::Rect box = cv::boundingRect(c);
            const double aspect = double(box.width) / double(box.height);
            if (aspect < P.button_min_aspect || aspect > P.button_max_aspect)
                continue;

            Contour approx;
            cv::approxPolyDP(c, approx, P.button_approx_eps_frac * cv::arcLength(c, true), true);
            if ((int)approx.size() < P.button_min_vertices)
                continue;

            out.emplace_back(box, numbered_name("button", (int)out.size() + 1));
        }
        log::d("detect_ui_buttons: " + std::to_string(out.size()) + " hit(s)");
        return out;
    }

    std::vector<Region> GeometricDetector::detect_icons(const cv::Mat &bgr) const
    {
        require_bgr(bgr, "detect_icons");
        const auto &P = params_;

        cv::Mat gray, edges;
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
        cv::Canny(gray, edges, P.icon_canny_low, P.icon_canny_high);
        cv::Mat k = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
        cv::dilate(edges, edges, k, {-1, -1}, P.icon_dilate_iters);

        const double maxArea = P.icon_max_area_frac * double(bgr.cols) * double(bgr.rows);
        std::vector<Region> out;
        for (const auto &c : external_contours(edges))
        {
            const double area = cv::contourArea(c);
            if (area < P.icon_min_area || area > maxArea)
                continue;

            const cv::Rect box = cv::boundingRect(c);
            const int lo = std::min(box.width, box.height);
            if (lo <= 0)
                continue;
            if (double(std::max(box.width, box.height)) / lo > P.icon_max_aspect)
                continue;

            out.emplace_back(box, numbered_name("icon", (int)out.size() + 1));
        }
        log::d("detect_icons: " + std::to_string(out.size()) + " hit(s)");
        return out;
    }

    std::vector<Region> GeometricDetector::detect_all(const cv::Mat &bgr) const
    {
        std::vector<Region> all = detect_circles(bgr);
        for (auto pass : {&GeometricDetector::detect_red_dots,
                           &GeometricDetector::detect_ui_buttons,
                           &GeometricDetector::detect_icons})
        {
            auto found = (this->*pass)(bgr);
            all.insert(all.end(), std::make_move_iterator(found.begin()),
                       std::make_move_iterator(found.end()));
        }

        const std::size_t candidates = all.size();
        std::vector<Region> merged = RegionMerger::merge(std::move(all), params_.merge_iou);
        for (std::size_t i = 0; i < merged.size(); ++i)
            merged[i].set_name(numbered_name("auto", (int)i + 1));

        log::d("detect_all: " + std::to_string(candidates) + " candidate(s) -> " +
               std::to_string(merged.size()) + " after merge");
        return merged;
    }

    cv::Mat GeometricDetector::draw_preview(const cv::Mat &bgr, const std::vector<Region> &regions)
    {
        require_bgr(bgr, "draw_preview");
        cv::Mat dbg = bgr.clone();
        for (const auto &r : regions)
        {
            cv::Scalar color(0, 255, 0);
            if (const auto *c = r.circle_shape())
            {
                color = cv::Scalar(255, 0, 0);
                cv::circle(dbg, c->center, c->radius, color, 2, cv::LINE_AA);
            }
            cv::rectangle(dbg, r.bbox(), color, 2);
            cv::putText(dbg, r.name(), {r.x(), std::max(10, r.y() - 5)},
                        cv::FONT_HERSHEY_SIMPLEX, 0.4, color, 1, cv::LINE_AA);
        }
        return dbg;
    }
}
