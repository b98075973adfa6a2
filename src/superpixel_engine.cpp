#include "roix/superpixel.hpp"
#include "roix/errors.hpp"
#include "roix/image.hpp"
#include "roix/log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <atomic>
#include <climits>
#include <string>
#include <utility>

namespace roix
{
    namespace
    {
        std::atomic<std::uint64_t> g_next_generation{1};

        void check_params(const SuperpixelParams &p)
        {
            if (p.region_size < 2)
                throw InputError("superpixel region size must be >= 2, got " + std::to_string(p.region_size));
            if (!(p.ruler > 0.0f))
                throw InputError("superpixel ruler must be positive");
            if (p.iterations < 1)
                throw InputError("superpixel iterations must be >= 1");
        }

        void check_labels(const cv::Mat &labels, const cv::Mat &bgr, const char *backend)
        {
            if (labels.type() != CV_32SC1 || labels.size() != bgr.size())
                throw AlgorithmFailure(std::string(backend) + " returned a malformed label raster");
            double lo = 0.0;
            cv::minMaxLoc(labels, &lo);
            if (lo < 0.0)
                throw AlgorithmFailure(std::string(backend) + " left pixels unlabeled");
        }

        std::vector<std::unique_ptr<SuperpixelBackend>> default_backends()
        {
            std::vector<std::unique_ptr<SuperpixelBackend>> b;
            b.push_back(std::make_unique<XimgprocSlicBackend>());
            b.push_back(std::make_unique<NativeSlicBackend>());
            return b;
        }
    }

    const SuperpixelRegion *SegmentationResult::find(int label) const
    {
        if (label < 0 || label >= (int)index_of_label.size())
            return nullptr;
        const int idx = index_of_label[label];
        return idx >= 0 ? &regions[idx] : nullptr;
    }

    // ------------------------------ construction ------------------------------

    SuperpixelEngine::SuperpixelEngine()
        : SuperpixelEngine(default_backends())
    {
    }

    SuperpixelEngine::SuperpixelEngine(std::vector<std::unique_ptr<SuperpixelBackend>> backends)
    {
        for (auto &b : backends)
        {
            if (!b)
                continue;
            if (b->probe())
            {
                log::d(std::string("superpixel backend available: ") + b->name());
                backends_.push_back(std::move(b));
            }
        }
        if (backends_.empty())
            log::w("no superpixel backend available; segment() will fail");
    }

    std::vector<std::string> SuperpixelEngine::available_backends() const
    {
        std::vector<std::string> names;
        for (const auto &b : backends_)
            names.emplace_back(b->name());
        return names;
    }

    // ------------------------------ segmentation ------------------------------

    SuperpixelEngine::ResultPtr SuperpixelEngine::compute(const cv::Mat &bgr, const SuperpixelParams &params) const
    {
        require_bgr(bgr, "segment");
        check_params(params);
        if (backends_.empty())
            throw BackendUnavailable("no superpixel backend available");

        std::string lastError;
        for (const auto &b : backends_)
        {
            try
            {
                cv::Mat labels = b->compute_labels(bgr, params);
                check_labels(labels, bgr, b->name());

                auto res = std::make_shared<SegmentationResult>();
                res->labels = labels;
                res->regions = extract_regions(bgr, labels);
                res->backend = b->name();

                int maxLabel = -1;
                for (const auto &r : res->regions)
                    maxLabel = std::max(maxLabel, r.label);
                res->index_of_label.assign(std::size_t(maxLabel + 1), -1);
                for (int i = 0; i < (int)res->regions.size(); ++i)
                    res->index_of_label[res->regions[i].label] = i;

                res->generation = g_next_generation.fetch_add(1);
                log::d("segment: " + std::to_string(res->regions.size()) + " superpixel(s) via " +
                       res->backend + " (generation " + std::to_string(res->generation) + ")");
                return res;
            }
            catch (const cv::Exception &ex)
            {
                lastError = ex.what();
            }
            catch (const AlgorithmFailure &ex)
            {
                lastError = ex.what();
            }
            log::w(std::string("superpixel backend ") + b->name() + " failed, trying next: " + lastError);
        }
        throw BackendUnavailable("every superpixel backend failed: " + lastError);
    }

    SuperpixelEngine::ResultPtr SuperpixelEngine::segment(const cv::Mat &bgr, const SuperpixelParams &params)
    {
        ResultPtr res = compute(bgr, params);
        install(res);
        return res;
    }

    SuperpixelEngine::ResultPtr SuperpixelEngine::segment(const cv::Mat &bgr, int regionSize, float ruler)
    {
        SuperpixelParams p;
        p.region_size = regionSize;
        p.ruler = ruler;
        return segment(bgr, p);
    }

    std::future<SuperpixelEngine::ResultPtr> SuperpixelEngine::segment_async(cv::Mat bgr,
                                                                            const SuperpixelParams &params) const
    {
        cv::Mat owned = bgr.clone();
        return std::async(std::launch::async, [this, owned, params]()
                          { return compute(owned, params); });
    }

    void SuperpixelEngine::install(ResultPtr result)
    {
        std::lock_guard<std::mutex> lock(mu_);
        current_ = std::move(result);
    }

    SuperpixelEngine::ResultPtr SuperpixelEngine::result() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return current_;
    }

    std::uint64_t SuperpixelEngine::generation() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return current_ ? current_->generation : 0;
    }

    std::vector<SuperpixelRegion> SuperpixelEngine::extract_regions(const cv::Mat &bgr, const cv::Mat &labels)
    {
        double hi = -1.0;
        cv::minMaxLoc(labels, nullptr, &hi);
        const int n = (int)hi + 1;

        struct Acc
        {
            int x0 = INT_MAX, y0 = INT_MAX, x1 = -1, y1 = -1;
            int count = 0;
            cv::Vec3d sum{0, 0, 0};
        };
        std::vector<Acc> acc(std::size_t(std::max(n, 0)));
        for (int y = 0; y < labels.rows; ++y)
        {
            const int *lr = labels.ptr<int>(y);
            const cv::Vec3b *pr = bgr.ptr<cv::Vec3b>(y);
            for (int x = 0; x < labels.cols; ++x)
            {
                Acc &a = acc[lr[x]];
                a.x0 = std::min(a.x0, x);
                a.y0 = std::min(a.y0, y);
                a.x1 = std::max(a.x1, x);
                a.y1 = std::max(a.y1, y);
                ++a.count;
                a.sum += cv::Vec3d(pr[x][0], pr[x][1], pr[x][2]);
            }
        }

        std::vector<SuperpixelRegion> regions;
        for (int label = 0; label < n; ++label)
        {
            const Acc &a = acc[label];
            if (a.count == 0)
                continue;

            SuperpixelRegion r;
            r.label = label;
            r.bbox = cv::Rect(a.x0, a.y0, a.x1 - a.x0 + 1, a.y1 - a.y0 + 1);
            r.mask = (labels(r.bbox) == label);
            r.area = (double)a.count;
            r.avg_color = a.sum / double(a.count);

            std::vector<Contour> contours;
            cv::findContours(r.mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE, r.bbox.tl());
            const int best = largest_contour_index(contours);
            if (best >= 0)
                r.contour = contours[best];

            cv::Point c = centroid_or_center(cv::moments(r.mask, true), cv::Rect(0, 0, r.bbox.width, r.bbox.height));
            r.centroid = c + r.bbox.tl();
            regions.push_back(std::move(r));
        }

        std::sort(regions.begin(), regions.end(),
                  [](const SuperpixelRegion &a, const SuperpixelRegion &b)
                  {
                      if (a.area != b.area)
                          return a.area > b.area;
                      return a.label < b.label;
                  });
        return regions;
    }

    // -------------------------------- queries --------------------------------

    std::vector<SuperpixelRegion> SuperpixelEngine::regions() const
    {
        ResultPtr res = result();
        return res ? res->regions : std::vector<SuperpixelRegion>{};
    }

    const SuperpixelRegion *SuperpixelEngine::get_region_at_point(int x, int y) const
    {
        ResultPtr res = result();
        if (!res)
            return nullptr;
        if (x < 0 || y < 0 || x >= res->labels.cols || y >= res->labels.rows)
            return nullptr;
        return res->find(res->labels.at<int>(y, x));
    }

    std::vector<const SuperpixelRegion *> SuperpixelEngine::get_regions_in_rect(int x1, int y1, int x2, int y2) const
    {
        std::vector<const SuperpixelRegion *> out;
        ResultPtr res = result();
        if (!res)
            return out;

        if (x1 > x2)
            std::swap(x1, x2);
        if (y1 > y2)
            std::swap(y1, y2);
        x1 = std::max(0, x1);
        y1 = std::max(0, y1);
        x2 = std::min(res->labels.cols, x2);
        y2 = std::min(res->labels.rows, y2);
        if (x2 <= x1 || y2 <= y1)
            return out;

        std::vector<char> seen(res->index_of_label.size(), 0);
        for (int y = y1; y < y2; ++y)
        {
            const int *lr = res->labels.ptr<int>(y);
            for (int x = x1; x < x2; ++x)
                seen[lr[x]] = 1;
        }
        for (const auto &r : res->regions)
            if (seen[r.label])
                out.push_back(&r);
        return out;
    }

    std::vector<const SuperpixelRegion *> SuperpixelEngine::filter_regions(double minArea,
                                                                          std::optional<double> maxArea,
                                                                          int minWH) const
    {
        std::vector<const SuperpixelRegion *> out;
        ResultPtr res = result();
        if (!res)
            return out;
        for (const auto &r : res->regions)
        {
            if (r.area < minArea)
                continue;
            if (maxArea && r.area > *maxArea)
                continue;
            if (r.bbox.width < minWH || r.bbox.height < minWH)
                continue;
            out.push_back(&r);
        }
        return out;
    }

    std::optional<Region> SuperpixelEngine::merge_regions(const std::vector<const SuperpixelRegion *> &regions) const
    {
        if (regions.empty())
            return std::nullopt;
        for (const auto *r : regions)
            if (!r || r->mask.empty())
                throw InputError("merge_regions: null or maskless superpixel");

        if (regions.size() == 1)
        {
            const SuperpixelRegion &r = *regions.front();
            Region out = Region::freeform(r.bbox, r.contour, "superpixel_" + std::to_string(r.label));
            out.set_mask(r.mask.clone());
            out.set_segmented(true);
            return out;
        }

        cv::Rect box;
        for (const auto *r : regions)
            box = union_rect(box, r->bbox);

        cv::Mat canvas(box.size(), CV_8U, cv::Scalar(0));
        for (const auto *r : regions)
        {
            cv::Mat dst = canvas(r->bbox - box.tl());
            cv::bitwise_or(dst, r->mask, dst);
        }

        std::vector<Contour> contours;
        cv::findContours(canvas, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE, box.tl());
        const int best = largest_contour_index(contours);
        if (best < 0)
            return std::nullopt;

        // bbox spans the whole union so that disconnected members stay covered
        Region out = Region::freeform(box, contours[best], "superpixel_merge_" + std::to_string(regions.size()));
        out.set_mask(canvas);
        out.set_segmented(true);
        return out;
    }

    cv::Mat SuperpixelEngine::draw_boundaries(const cv::Mat &bgr) const
    {
        require_bgr(bgr, "draw_boundaries");
        cv::Mat vis = bgr.clone();
        ResultPtr res = result();
        if (!res || res->labels.size() != bgr.size())
            return vis;

        const cv::Mat &L = res->labels;
        for (int y = 0; y < L.rows; ++y)
            for (int x = 0; x < L.cols; ++x)
            {
                const int l = L.at<int>(y, x);
                const bool edge = (x + 1 < L.cols && L.at<int>(y, x + 1) != l) ||
                                  (y + 1 < L.rows && L.at<int>(y + 1, x) != l);
                if (edge)
                    vis.at<cv::Vec3b>(y, x) = cv::Vec3b(0, 0, 255);
            }
        return vis;
    }
}
