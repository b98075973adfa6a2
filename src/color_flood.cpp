#include "roix/color_flood.hpp"
#include "roix/errors.hpp"
#include "roix/image.hpp"
#include "roix/log.hpp"

#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

namespace roix
{
    namespace
    {
        // Largest external contour of a 0/255 mask.
        Contour main_contour(const cv::Mat &mask)
        {
            std::vector<Contour> contours;
            cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
            const int best = largest_contour_index(contours);
            return best >= 0 ? contours[best] : Contour{};
        }

        Region make_region(const cv::Mat &mask, const cv::Rect &box, const char *name)
        {
            Region r = Region::freeform(box, main_contour(mask), name);
            r.set_mask(mask(box).clone());
            return r;
        }
    }

    cv::Mat ColorFloodSegmenter::similarity_mask(const cv::Mat &bgr, const cv::Vec3b &seed,
                                                 double tolerance) const
    {
        const double tol2 = tolerance * tolerance;
        cv::Mat mask(bgr.rows, bgr.cols, CV_8U, cv::Scalar(0));
        for (int y = 0; y < bgr.rows; ++y)
        {
            const cv::Vec3b *px = bgr.ptr<cv::Vec3b>(y);
            uchar *mr = mask.ptr<uchar>(y);
            for (int x = 0; x < bgr.cols; ++x)
            {
                const double d0 = double(px[x][0]) - seed[0];
                const double d1 = double(px[x][1]) - seed[1];
                const double d2 = double(px[x][2]) - seed[2];
                mr[x] = (d0 * d0 + d1 * d1 + d2 * d2 <= tol2) ? 255 : 0;
            }
        }

        cv::Mat k = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(params_.morph_k, params_.morph_k));
        cv::morphologyEx(mask, mask, cv::MORPH_OPEN, k);
        cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, k);
        return mask;
    }

    std::optional<Region> ColorFloodSegmenter::detect_at_point(const cv::Mat &bgr, int x, int y,
                                                               double tolerance, bool mergeAll) const
    {
        require_bgr(bgr, "detect_at_point");
        if (tolerance < 0.0)
            throw InputError("color tolerance must be non-negative");

        const cv::Point seed = clamp_point(x, y, bgr.size());
        const cv::Mat mask = similarity_mask(bgr, bgr.at<cv::Vec3b>(seed), tolerance);

        cv::Mat labels, stats, centroids;
        const int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);
        if (n < 2)
            return std::nullopt;

        const int minArea = params_.min_component_area;
        if (!mergeAll)
        {
            const int label = labels.at<int>(seed);
            if (label == 0)
                return std::nullopt;
            if (stats.at<int>(label, cv::CC_STAT_AREA) < minArea)
                return std::nullopt;

            const cv::Rect box(stats.at<int>(label, cv::CC_STAT_LEFT), stats.at<int>(label, cv::CC_STAT_TOP),
                               stats.at<int>(label, cv::CC_STAT_WIDTH), stats.at<int>(label, cv::CC_STAT_HEIGHT));
            cv::Mat component = (labels == label);
            log::d("color_blob at (" + std::to_string(seed.x) + "," + std::to_string(seed.y) +
                   ") area=" + std::to_string(stats.at<int>(label, cv::CC_STAT_AREA)));
            return make_region(component, box, "color_blob");
        }

        cv::Rect box;
        cv::Mat unionMask(mask.size(), CV_8U, cv::Scalar(0));
        int members = 0;
        for (int label = 1; label < n; ++label)
        {
            if (stats.at<int>(label, cv::CC_STAT_AREA) < minArea)
                continue;
            box = union_rect(box, cv::Rect(stats.at<int>(label, cv::CC_STAT_LEFT), stats.at<int>(label, cv::CC_STAT_TOP),
                                           stats.at<int>(label, cv::CC_STAT_WIDTH), stats.at<int>(label, cv::CC_STAT_HEIGHT)));
            unionMask.setTo(255, labels == label);
            ++members;
        }
        if (members == 0)
            return std::nullopt;

        log::d("color_merged: " + std::to_string(members) + " component(s)");
        return make_region(unionMask, box, "color_merged");
    }
}
