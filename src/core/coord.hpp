#pragma once
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>
#include "common/types.hpp"

namespace gem2bgef {

    // Mathematical floor(v / b) for b > 0 (C++ '/' truncates toward zero).
    inline int64_t floor_div(int64_t v, int64_t b) {
        int64_t q = v / b;
        if ((v % b) != 0 && v < 0) --q;
        return q;
    }

    // max - min + 1 evaluated in unsigned 64-bit.
    // Throws InvariantError if max < min or the length would be 2^64.
    uint64_t span_length(int64_t min_v, int64_t max_v);

    // Running min/max over (x, y) pairs.
    class ExtentTracker {
    public:
        void add(int64_t x, int64_t y) {
            if (x < min_x_) min_x_ = x;
            if (x > max_x_) max_x_ = x;
            if (y < min_y_) min_y_ = y;
            if (y > max_y_) max_y_ = y;
            ++n_;
        }

        void merge(const ExtentTracker& other);

        bool empty() const { return n_ == 0; }
        uint64_t count() const { return n_; }

        // Throws EmptyExtentError when nothing was added, InvariantError when
        // either length is not representable.
        Extent extent() const;

    private:
        int64_t min_x_ = std::numeric_limits<int64_t>::max();
        int64_t max_x_ = std::numeric_limits<int64_t>::min();
        int64_t min_y_ = std::numeric_limits<int64_t>::max();
        int64_t max_y_ = std::numeric_limits<int64_t>::min();
        uint64_t n_ = 0;
    };

    Extent extent_of(const std::vector<std::pair<int64_t, int64_t>>& points);

} // namespace gem2bgef
