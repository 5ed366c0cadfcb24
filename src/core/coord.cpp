#include "core/coord.hpp"

#include <string>
#include "common/errors.hpp"

namespace gem2bgef {

    uint64_t span_length(int64_t min_v, int64_t max_v) {
        if (max_v < min_v) {
            throw InvariantError("non-positive extent length: min=" + std::to_string(min_v)
                + " max=" + std::to_string(max_v));
        }
        // Two's complement difference is exact in uint64 for any int64 pair with max >= min.
        const uint64_t diff = (uint64_t)max_v - (uint64_t)min_v;
        if (diff == std::numeric_limits<uint64_t>::max()) {
            throw InvariantError("extent length exceeds 64-bit range: min=" + std::to_string(min_v)
                + " max=" + std::to_string(max_v));
        }
        return diff + 1;
    }

    uint64_t Extent::len_x() const { return span_length(min_x, max_x); }
    uint64_t Extent::len_y() const { return span_length(min_y, max_y); }

    void ExtentTracker::merge(const ExtentTracker& other) {
        if (other.empty()) return;
        if (other.min_x_ < min_x_) min_x_ = other.min_x_;
        if (other.max_x_ > max_x_) max_x_ = other.max_x_;
        if (other.min_y_ < min_y_) min_y_ = other.min_y_;
        if (other.max_y_ > max_y_) max_y_ = other.max_y_;
        n_ += other.n_;
    }

    Extent ExtentTracker::extent() const {
        if (n_ == 0) throw EmptyExtentError("extent of an empty coordinate set");

        Extent e;
        e.min_x = min_x_;
        e.max_x = max_x_;
        e.min_y = min_y_;
        e.max_y = max_y_;
        // Validate both lengths now so no caller ever sees a wrapped size.
        (void)e.len_x();
        (void)e.len_y();
        return e;
    }

    Extent extent_of(const std::vector<std::pair<int64_t, int64_t>>& points) {
        ExtentTracker t;
        for (const auto& p : points) t.add(p.first, p.second);
        return t.extent();
    }

} // namespace gem2bgef
