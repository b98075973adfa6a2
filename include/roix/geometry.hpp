#pragma once
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace roix
{
    using Contour = std::vector<cv::Point>;

    // Intersection over union of two axis-aligned boxes; 0 when they do not overlap.
    inline double iou(const cv::Rect &a, const cv::Rect &b)
    {
        const int x1 = std::max(a.x, b.x);
        const int y1 = std::max(a.y, b.y);
        const int x2 = std::min(a.x + a.width, b.x + b.width);
        const int y2 = std::min(a.y + a.height, b.y + b.height);
        if (x2 <= x1 || y2 <= y1)
            return 0.0;

        const double inter = double(x2 - x1) * double(y2 - y1);
        const double uni = double(a.area()) + double(b.area()) - inter;
        return uni > 0.0 ? inter / uni : 0.0;
    }

    inline cv::Rect clamp_rect(const cv::Rect &r, const cv::Size &sz)
    {
        return r & cv::Rect(0, 0, sz.width, sz.height);
    }

    inline cv::Point clamp_point(int x, int y, const cv::Size &sz)
    {
        return {std::clamp(x, 0, sz.width - 1), std::clamp(y, 0, sz.height - 1)};
    }

    // Smallest rect holding both; an empty operand is ignored.
    inline cv::Rect union_rect(const cv::Rect &a, const cv::Rect &b)
    {
        if (a.empty())
            return b;
        if (b.empty())
            return a;
        return a | b;
    }

    // Index of the contour with the largest area, -1 for an empty list.
    inline int largest_contour_index(const std::vector<Contour> &contours)
    {
        int best = -1;
        double bestArea = -1.0;
        for (int i = 0; i < (int)contours.size(); ++i)
        {
            double a = std::abs(cv::contourArea(contours[i]));
            if (a > bestArea)
            {
                bestArea = a;
                best = i;
            }
        }
        return best;
    }

    // Area-moment centroid, or the bbox center when the moments are degenerate.
    inline cv::Point centroid_or_center(const cv::Moments &m, const cv::Rect &bbox)
    {
        if (m.m00 > 0.0 && std::isfinite(m.m00))
            return {int(m.m10 / m.m00), int(m.m01 / m.m00)};
        return {bbox.x + bbox.width / 2, bbox.y + bbox.height / 2};
    }

    inline cv::Point contour_centroid(const Contour &c)
    {
        return centroid_or_center(cv::moments(c), cv::boundingRect(c));
    }

    inline double circularity(double area, double perimeter)
    {
        if (perimeter <= 0.0)
            return 0.0;
        return 4.0 * CV_PI * area / (perimeter * perimeter);
    }

    inline double color_distance(const cv::Vec3d &a, const cv::Vec3d &b)
    {
        return cv::norm(a - b);
    }

    inline double point_distance(const cv::Point &a, const cv::Point &b)
    {
        const double dx = a.x - b.x, dy = a.y - b.y;
        return std::sqrt(dx * dx + dy * dy);
    }
}
