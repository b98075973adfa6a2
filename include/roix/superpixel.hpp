#pragma once
#include "roix/region.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roix
{
    struct SuperpixelParams
    {
        int region_size = 30;   // approximate cell side in pixels
        float ruler = 10.0f;    // compactness weight
        int iterations = 10;
        int min_element_size = 25; // percent of region_size^2 merged into neighbours
    };

    struct SuperpixelRegion
    {
        int label{-1};
        cv::Mat mask;      // bbox-sized, 0/255
        Contour contour;   // largest external contour, image coordinates
        cv::Rect bbox;
        double area{0.0};  // pixel count
        cv::Point centroid;
        cv::Vec3d avg_color; // BGR mean over mask
    };

    // One segmentation run. Labels are only meaningful against this result's raster.
    struct SegmentationResult
    {
        std::uint64_t generation{0};
        cv::Mat labels; // CV_32S, image-sized
        std::vector<SuperpixelRegion> regions; // area descending
        std::vector<int> index_of_label;       // label -> index into regions, -1 if absent
        std::string backend;

        const SuperpixelRegion *find(int label) const;
    };

    class SuperpixelBackend
    {
    public:
        virtual ~SuperpixelBackend() = default;

        virtual const char *name() const = 0;

        // CV_32S label raster, every pixel >= 0.
        virtual cv::Mat compute_labels(const cv::Mat &bgr, const SuperpixelParams &params) const = 0;

        // Runs the backend on a tiny synthetic image.
        virtual bool probe() const;
    };

    // OpenCV contrib SLICO (SLIC when SLICO is rejected) on Lab.
    class XimgprocSlicBackend : public SuperpixelBackend
    {
    public:
        const char *name() const override { return "ximgproc-slico"; }
        cv::Mat compute_labels(const cv::Mat &bgr, const SuperpixelParams &params) const override;
    };

    // In-tree SLIC: grid seeds, local k-means on Lab+xy, connectivity enforcement.
    class NativeSlicBackend : public SuperpixelBackend
    {
    public:
        const char *name() const override { return "native-slic"; }
        cv::Mat compute_labels(const cv::Mat &bgr, const SuperpixelParams &params) const override;
    };

    // Whole-image superpixel clustering plus queries over the installed result.
    // Each segment()/install() replaces the installed result; callers serialize
    // these against other use of the same instance.
    class SuperpixelEngine
    {
    public:
        using ResultPtr = std::shared_ptr<const SegmentationResult>;

        // ximgproc first, native SLIC second; unavailable backends are dropped.
        SuperpixelEngine();
        // Backends in preference order; each is probed once here.
        explicit SuperpixelEngine(std::vector<std::unique_ptr<SuperpixelBackend>> backends);

        std::vector<std::string> available_backends() const;

        // Computes without touching the installed result. Throws InputError for
        // bad parameters and BackendUnavailable when every backend fails.
        ResultPtr compute(const cv::Mat &bgr, const SuperpixelParams &params) const;

        ResultPtr segment(const cv::Mat &bgr, const SuperpixelParams &params);
        ResultPtr segment(const cv::Mat &bgr, int regionSize, float ruler);

        // compute() on a worker thread; the engine must outlive the future.
        std::future<ResultPtr> segment_async(cv::Mat bgr, const SuperpixelParams &params) const;

        void install(ResultPtr result);
        ResultPtr result() const;
        std::uint64_t generation() const; // 0 before the first install
        bool is_current(std::uint64_t generation) const { return generation != 0 && generation == this->generation(); }

        // Snapshot of the installed result's regions (empty when none). Masks
        // share pixel data with the result.
        std::vector<SuperpixelRegion> regions() const;

        // Pointers below point into the result installed at call time. They
        // stay valid while that result is installed (same generation()) or
        // while the caller holds it via result(); install() may free it.
        const SuperpixelRegion *get_region_at_point(int x, int y) const;
        std::vector<const SuperpixelRegion *> get_regions_in_rect(int x1, int y1, int x2, int y2) const;
        std::vector<const SuperpixelRegion *> filter_regions(double minArea = 100.0,
                                                             std::optional<double> maxArea = std::nullopt,
                                                             int minWH = 10) const;

        // Union of masks as one freeform Region; nullopt for an empty list.
        std::optional<Region> merge_regions(const std::vector<const SuperpixelRegion *> &regions) const;

        // Label boundaries painted red over a copy of bgr.
        cv::Mat draw_boundaries(const cv::Mat &bgr) const;

        static std::vector<SuperpixelRegion> extract_regions(const cv::Mat &bgr, const cv::Mat &labels);

    private:
        std::vector<std::unique_ptr<SuperpixelBackend>> backends_;
        mutable std::mutex mu_;
        ResultPtr current_;
    };
}
