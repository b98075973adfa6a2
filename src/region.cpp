#include "roix/region.hpp"
#include "roix/errors.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <utility>

namespace roix
{
    namespace
    {
        void require_positive(int w, int h)
        {
            if (w <= 0 || h <= 0)
                throw InputError("region size must be positive, got " +
                                 std::to_string(w) + "x" + std::to_string(h));
        }
    }

    std::string make_region_id()
    {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<unsigned> dist(0, 0xffffffffu);
        char buf[9];
        std::snprintf(buf, sizeof(buf), "%08x", dist(rng));
        return buf;
    }

    std::string numbered_name(const std::string &prefix, int n)
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%02d", n);
        return prefix + "_" + buf;
    }

    // ------------------------------- Region -------------------------------

    Region::Region(int x, int y, int w, int h, std::string name)
        : id_(make_region_id()), name_(std::move(name)), bbox_(x, y, w, h)
    {
        require_positive(w, h);
        created_at_ = modified_at_ = Clock::now();
    }

    Region::Region(const cv::Rect &bbox, std::string name)
        : Region(bbox.x, bbox.y, bbox.width, bbox.height, std::move(name))
    {
    }

    Region Region::circle(const cv::Rect &bbox, cv::Point center, int radius, std::string name)
    {
        Region r(bbox, std::move(name));
        if (!bbox.contains(center))
            throw InputError("circle center lies outside its bbox");
        if (radius < 0)
            throw InputError("circle radius must be non-negative");
        radius = std::min(radius, std::max(bbox.width, bbox.height) / 2);
        r.shape_ = CircleShape{center, radius};
        return r;
    }

    Region Region::freeform(const cv::Rect &bbox, Contour contour, std::string name)
    {
        Region r(bbox, std::move(name));
        r.shape_ = FreeformShape{std::move(contour)};
        return r;
    }

    void Region::set_id(std::string id)
    {
        id_ = std::move(id);
        touch();
    }

    void Region::set_name(std::string name)
    {
        name_ = std::move(name);
        touch();
    }

    double Region::area() const
    {
        if (!mask_.empty())
            return (double)cv::countNonZero(mask_);
        return (double)bbox_.area();
    }

    const Contour *Region::contour() const
    {
        const auto *f = std::get_if<FreeformShape>(&shape_);
        return f ? &f->contour : nullptr;
    }

    void Region::set_mask(cv::Mat mask)
    {
        if (!mask.empty())
        {
            if (mask.type() != CV_8UC1)
                throw InputError("region mask must be CV_8UC1");
            if (mask.size() != bbox_.size())
                throw InputError("region mask must be bbox-sized");
        }
        mask_ = std::move(mask);
        touch();
    }

    void Region::set_segmented(bool s)
    {
        segmented_ = s;
        touch();
    }

    void Region::set_bbox(const cv::Rect &bbox)
    {
        require_positive(bbox.width, bbox.height);
        if (bbox.size() != bbox_.size())
            mask_.release();
        const cv::Point shift = bbox.tl() - bbox_.tl();
        bbox_ = bbox;

        if (auto *c = std::get_if<CircleShape>(&shape_))
        {
            c->center += shift;
            if (!bbox_.contains(c->center))
                c->center = center();
            c->radius = std::min(c->radius, std::max(bbox_.width, bbox_.height) / 2);
        }
        else if (auto *f = std::get_if<FreeformShape>(&shape_))
        {
            for (auto &p : f->contour)
                p += shift;
        }
        touch();
    }

    void Region::translate(int dx, int dy)
    {
        set_bbox(bbox_ + cv::Point(dx, dy));
    }

    void Region::set_attributes(ExportAttributes attrs)
    {
        attrs_ = std::move(attrs);
        touch();
    }

    Region Region::copy_as(std::string name) const
    {
        Region r = *this;
        r.id_ = make_region_id();
        r.name_ = std::move(name);
        r.mask_ = mask_.clone();
        r.created_at_ = r.modified_at_ = Clock::now();
        return r;
    }

    // -------------------------- RegionCollection --------------------------

    bool RegionCollection::contains_name(const std::string &name) const
    {
        for (const auto &r : regions_)
            if (r.name() == name)
                return true;
        return false;
    }

    std::string RegionCollection::unique_name(const std::string &wanted) const
    {
        if (!contains_name(wanted))
            return wanted;
        for (int n = 2;; ++n)
        {
            std::string candidate = wanted + "_" + std::to_string(n);
            if (!contains_name(candidate))
                return candidate;
        }
    }

    int RegionCollection::add(Region r)
    {
        if (r.name().empty())
        {
            char buf[16];
            do
            {
                std::snprintf(buf, sizeof(buf), "ROI_%03d", ++name_counter_);
            } while (contains_name(buf));
            r.set_name(buf);
        }
        else if (contains_name(r.name()))
        {
            r.set_name(unique_name(r.name()));
        }
        regions_.push_back(std::move(r));
        return (int)regions_.size() - 1;
    }

    bool RegionCollection::remove(int index)
    {
        if (index < 0 || index >= (int)regions_.size())
            return false;
        regions_.erase(regions_.begin() + index);
        if (selected_ == index)
            selected_ = -1;
        else if (selected_ > index)
            --selected_;
        return true;
    }

    bool RegionCollection::remove_selected()
    {
        return selected_ >= 0 && remove(selected_);
    }

    Region *RegionCollection::get(int index)
    {
        if (index < 0 || index >= (int)regions_.size())
            return nullptr;
        return &regions_[index];
    }

    const Region *RegionCollection::get(int index) const
    {
        if (index < 0 || index >= (int)regions_.size())
            return nullptr;
        return &regions_[index];
    }

    void RegionCollection::select(int index)
    {
        selected_ = (index >= 0 && index < (int)regions_.size()) ? index : -1;
    }

    int RegionCollection::select_at(const cv::Point &p)
    {
        for (int i = 0; i < (int)regions_.size(); ++i)
        {
            if (regions_[i].contains(p))
            {
                selected_ = i;
                return i;
            }
        }
        selected_ = -1;
        return -1;
    }

    Region *RegionCollection::copy_selected()
    {
        const Region *src = get(selected_);
        if (!src)
            return nullptr;
        Region copy = src->copy_as(src->name() + "_copy");
        copy.translate(20, 20);
        selected_ = add(std::move(copy));
        return &regions_[selected_];
    }

    bool RegionCollection::move(int index, int dx, int dy)
    {
        Region *r = get(index);
        if (!r)
            return false;
        r->translate(dx, dy);
        return true;
    }

    namespace
    {
        cv::Point handle_point(const cv::Rect &b, int handle)
        {
            const int xs[3] = {b.x, b.x + b.width / 2, b.x + b.width};
            const int ys[3] = {b.y, b.y + b.height / 2, b.y + b.height};
            static const int col[RegionCollection::kHandleCount] = {0, 1, 2, 0, 2, 0, 1, 2};
            static const int row[RegionCollection::kHandleCount] = {0, 0, 0, 1, 1, 2, 2, 2};
            return {xs[col[handle]], ys[row[handle]]};
        }
    }

    int RegionCollection::resize_handle_at(const cv::Point &p, int index) const
    {
        const Region *r = get(index);
        if (!r)
            return -1;
        for (int h = 0; h < kHandleCount; ++h)
        {
            const cv::Point hp = handle_point(r->bbox(), h);
            if (std::abs(p.x - hp.x) <= kHandleTolerance && std::abs(p.y - hp.y) <= kHandleTolerance)
                return h;
        }
        return -1;
    }

    bool RegionCollection::resize(int index, int handle, const cv::Point &pos)
    {
        Region *r = get(index);
        if (!r)
            return false;
        if (handle < 0 || handle >= kHandleCount)
            throw InputError("resize handle must be 0-7, got " + std::to_string(handle));

        const cv::Rect b = r->bbox();
        int left = b.x, top = b.y, right = b.x + b.width, bottom = b.y + b.height;
        if (handle == 0 || handle == 3 || handle == 5)
            left = pos.x;
        if (handle == 2 || handle == 4 || handle == 7)
            right = pos.x;
        if (handle == 0 || handle == 1 || handle == 2)
            top = pos.y;
        if (handle == 5 || handle == 6 || handle == 7)
            bottom = pos.y;

        if (left > right)
            std::swap(left, right);
        if (top > bottom)
            std::swap(top, bottom);
        if (right == left || bottom == top)
            throw InputError("resize would leave " + r->name() + " with zero size");

        r->set_bbox(cv::Rect(left, top, right - left, bottom - top));
        return true;
    }

    void RegionCollection::clear()
    {
        regions_.clear();
        selected_ = -1;
        name_counter_ = 0;
    }
}
