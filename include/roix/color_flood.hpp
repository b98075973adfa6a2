#pragma once
#include "roix/region.hpp"

#include <opencv2/core.hpp>
#include <optional>

namespace roix
{
    struct FloodParams
    {
        double tolerance = 30.0; // Euclidean distance in BGR space
        int morph_k = 3;
        int min_component_area = 20;
    };

    // Seed-point connected-component extraction by color distance.
    // Deterministic: identical input gives identical output.
    class ColorFloodSegmenter
    {
    public:
        ColorFloodSegmenter() = default;
        explicit ColorFloodSegmenter(const FloodParams &params) : params_(params) {}

        const FloodParams &params() const { return params_; }

        // (x,y) is clamped to the image. With mergeAll=false the component under
        // the seed is returned; with mergeAll=true the union of all qualifying
        // components. Returns nullopt when nothing qualifies.
        std::optional<Region> detect_at_point(const cv::Mat &bgr, int x, int y,
                                              double tolerance, bool mergeAll = false) const;
        std::optional<Region> detect_at_point(const cv::Mat &bgr, int x, int y) const
        {
            return detect_at_point(bgr, x, y, params_.tolerance, false);
        }

        // 0/255 mask of pixels within tolerance of seed, after open/close cleanup.
        cv::Mat similarity_mask(const cv::Mat &bgr, const cv::Vec3b &seed, double tolerance) const;

    private:
        FloodParams params_;
    };
}
