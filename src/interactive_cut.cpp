#include "roix/interactive_cut.hpp"
#include "roix/errors.hpp"
#include "roix/image.hpp"
#include "roix/log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace roix
{
    cv::Rect cut_hint_rect(const cv::Size &sz, const cv::Point &seed, int expansion)
    {
        expansion = std::min(expansion, std::max(sz.width, sz.height));
        const int rx = std::max(0, seed.x - expansion);
        const int ry = std::max(0, seed.y - expansion);
        const int rw = std::min(sz.width - rx, expansion * 2);
        const int rh = std::min(sz.height - ry, expansion * 2);
        return {rx, ry, rw, rh};
    }

    int pick_seed_contour(const std::vector<Contour> &contours, const cv::Point &seed, double minArea)
    {
        int best = -1;
        double bestArea = 0.0;
        for (int i = 0; i < (int)contours.size(); ++i)
        {
            const double area = cv::contourArea(contours[i]);
            if (area < minArea)
                continue;
            if (cv::pointPolygonTest(contours[i], cv::Point2f((float)seed.x, (float)seed.y), false) >= 0 &&
                area > bestArea)
            {
                bestArea = area;
                best = i;
            }
        }
        if (best >= 0)
            return best;

        double bestDist = std::numeric_limits<double>::max();
        for (int i = 0; i < (int)contours.size(); ++i)
        {
            if (cv::contourArea(contours[i]) < minArea)
                continue;
            const double d = point_distance(contour_centroid(contours[i]), seed);
            if (d < bestDist)
            {
                bestDist = d;
                best = i;
            }
        }
        return best;
    }

    std::optional<CutResult> InteractiveCutSegmenter::segment_at_point(const cv::Mat &bgr, int x, int y,
                                                                       int expansion) const
    {
        require_bgr(bgr, "segment_at_point");
        if (expansion < 1)
            throw InputError("cut expansion must be at least 1, got " + std::to_string(expansion));

        const cv::Point seed = clamp_point(x, y, bgr.size());
        const cv::Rect hint = cut_hint_rect(bgr.size(), seed, expansion);

        cv::Mat gc(bgr.size(), CV_8U, cv::Scalar(cv::GC_BGD));
        cv::Mat bgdModel, fgdModel;
        try
        {
            cv::grabCut(bgr, gc, hint, bgdModel, fgdModel, params_.iterations, cv::GC_INIT_WITH_RECT);
        }
        catch (const cv::Exception &ex)
        {
            // e.g. the hint covers the whole image and leaves no background samples
            log::w("grabCut failed at (" + std::to_string(seed.x) + "," + std::to_string(seed.y) +
                   "): " + ex.what());
            return std::nullopt;
        }

        // GC_FGD (1) and GC_PR_FGD (3) are foreground
        cv::Mat fg = (gc == cv::GC_FGD) | (gc == cv::GC_PR_FGD);

        std::vector<Contour> contours;
        cv::findContours(fg, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
        const int best = pick_seed_contour(contours, seed, params_.min_contour_area);
        if (best < 0)
        {
            log::d("segment_at_point: no contour of area >= " + std::to_string(params_.min_contour_area));
            return std::nullopt;
        }

        cv::Mat mask(bgr.size(), CV_8U, cv::Scalar(0));
        cv::drawContours(mask, contours, best, cv::Scalar(255), cv::FILLED);

        Region region = Region::freeform(cv::boundingRect(contours[best]), contours[best], "segmented");
        region.set_segmented(true);
        region.set_mask(mask(region.bbox()).clone());
        log::d("segment_at_point: bbox " + std::to_string(region.x()) + "," + std::to_string(region.y()) +
               " " + std::to_string(region.width()) + "x" + std::to_string(region.height()));
        return CutResult{std::move(region), std::move(mask)};
    }

    std::optional<CutResult> InteractiveCutSegmenter::segment_with_refinement(const cv::Mat &bgr, int x, int y,
                                                                              int expansion) const
    {
        auto result = segment_at_point(bgr, x, y, expansion);
        if (!result)
            return std::nullopt;

        cv::Mat &mask = result->mask;
        cv::Mat k = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(params_.refine_morph_k, params_.refine_morph_k));
        cv::morphologyEx(mask, mask, cv::MORPH_OPEN, k);
        cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, k);
        cv::GaussianBlur(mask, mask, cv::Size(params_.refine_blur_k, params_.refine_blur_k), 0);
        cv::threshold(mask, mask, 127, 255, cv::THRESH_BINARY);
        result->region.set_mask(mask(result->region.bbox()).clone());
        return result;
    }
}
