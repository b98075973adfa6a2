#pragma once
#include "roix/region.hpp"

#include <opencv2/core.hpp>
#include <optional>

namespace roix
{
    struct CutParams
    {
        int iterations = 5;
        int expansion = 50;
        int refine_expansion = 80;
        double min_contour_area = 100.0;
        int refine_morph_k = 5;
        int refine_blur_k = 5;
    };

    struct CutResult
    {
        Region region;
        cv::Mat mask; // image-sized, 0 or 255
    };

    // Point-seeded GrabCut foreground extraction.
    class InteractiveCutSegmenter
    {
    public:
        InteractiveCutSegmenter() = default;
        explicit InteractiveCutSegmenter(const CutParams &params) : params_(params) {}

        const CutParams &params() const { return params_; }

        // Hint rectangle of side 2*expansion around the clamped seed. Returns
        // nullopt when no contour qualifies or GrabCut fails on this input.
        // The region carries the bbox window of the mask.
        std::optional<CutResult> segment_at_point(const cv::Mat &bgr, int x, int y, int expansion) const;
        std::optional<CutResult> segment_at_point(const cv::Mat &bgr, int x, int y) const
        {
            return segment_at_point(bgr, x, y, params_.expansion);
        }

        // segment_at_point followed by open/close, blur and re-threshold of the
        // mask; the region mask is replaced by the refined window.
        std::optional<CutResult> segment_with_refinement(const cv::Mat &bgr, int x, int y, int expansion) const;
        std::optional<CutResult> segment_with_refinement(const cv::Mat &bgr, int x, int y) const
        {
            return segment_with_refinement(bgr, x, y, params_.refine_expansion);
        }

    private:
        CutParams params_;
    };

    // Hint rectangle used by segment_at_point, exposed for callers that draw it.
    // expansion is capped at the larger image side.
    cv::Rect cut_hint_rect(const cv::Size &sz, const cv::Point &seed, int expansion);

    // Index of the chosen contour or -1. Contours containing the seed win by
    // area; otherwise the nearest centroid wins.
    int pick_seed_contour(const std::vector<Contour> &contours, const cv::Point &seed, double minArea);
}
