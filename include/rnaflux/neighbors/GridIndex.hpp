#ifndef RNAFLUX_GRID_INDEX_HPP
#define RNAFLUX_GRID_INDEX_HPP

#include <vector>
#include <algorithm>
#include <numeric>
#include <cmath>
#include <stdexcept>
#include <utility>

/**
 * @file GridIndex.hpp
 *
 * @brief Uniform grid index for fixed-radius searches in two dimensions.
 */

namespace rnaflux {

/**
 * @brief Uniform grid index for fixed-radius searches in two dimensions.
 *
 * Points are binned into square buckets of a given width.
 * A search with a radius no greater than the bucket width only needs to inspect the 3x3 block of buckets around the query,
 * so the cost of each search is proportional to the local density rather than the total number of points.
 * Only non-empty buckets are stored, so memory usage does not depend on the spatial extent of the points.
 */
class GridIndex {
public:
    /**
     * @param n Number of points.
     * @param[in] x Pointer to an array of length `n` containing the x-coordinates.
     * @param[in] y Pointer to an array of length `n` containing the y-coordinates.
     * @param width Width of each bucket.
     * This should be positive and no less than the largest radius to be used in `visit_within()`.
     * Each coordinate divided by `width` should be finite with an absolute value below 1e18, otherwise an error is raised.
     */
    GridIndex(size_t n, const double* x, const double* y, double width) : bucket_width(width), xcoords(x, x + n), ycoords(y, y + n) {
        if (!(width > 0)) {
            throw std::runtime_error("bucket width should be positive");
        }

        std::vector<std::pair<Bucket, int> > keyed;
        keyed.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            keyed.emplace_back(bucket_of(x[i], y[i]), i);
        }
        std::sort(keyed.begin(), keyed.end());

        order.reserve(n);
        for (const auto& k : keyed) {
            if (buckets.empty() || buckets.back() != k.first) {
                buckets.push_back(k.first);
                starts.push_back(order.size());
            }
            order.push_back(k.second);
        }
        starts.push_back(order.size());
    }

private:
    typedef std::pair<long long, long long> Bucket; // (y, x) so that sorting is row-major.

    double bucket_width;
    std::vector<double> xcoords, ycoords;
    std::vector<Bucket> buckets;
    std::vector<size_t> starts;
    std::vector<int> order;

    static long long bucket_coordinate(double v) {
        // Leaves headroom for the neighboring buckets in visit_within().
        constexpr double limit = 1e18;
        double b = std::floor(v);
        if (!(std::abs(b) < limit)) {
            throw std::runtime_error("coordinates are not finite or too large relative to the bucket width");
        }
        return static_cast<long long>(b);
    }

    Bucket bucket_of(double x, double y) const {
        return Bucket(bucket_coordinate(y / bucket_width), bucket_coordinate(x / bucket_width));
    }

public:
    /**
     * @return Number of points in the index.
     */
    size_t nobs() const {
        return xcoords.size();
    }

    /**
     * @return Bucket width.
     */
    double width() const {
        return bucket_width;
    }

    /**
     * Visit all points within a given distance of a query location.
     *
     * @tparam Function_ Function that accepts the index of a point and its distance to the query.
     *
     * @param qx x-coordinate of the query.
     * @param qy y-coordinate of the query.
     * @param radius Search radius, no greater than `width()`.
     * Points at exactly `radius` from the query are included.
     * @param fun Function to call on each neighboring point, in no particular order.
     * The query coordinates are subject to the same limits as those in the constructor.
     */
    template<class Function_>
    void visit_within(double qx, double qy, double radius, Function_ fun) const {
        if (radius > bucket_width) {
            throw std::runtime_error("search radius should not be greater than the bucket width");
        }

        auto center = bucket_of(qx, qy);
        double r2 = radius * radius;

        for (long long by = center.first - 1; by <= center.first + 1; ++by) {
            for (long long bx = center.second - 1; bx <= center.second + 1; ++bx) {
                auto it = std::lower_bound(buckets.begin(), buckets.end(), Bucket(by, bx));
                if (it == buckets.end() || *it != Bucket(by, bx)) {
                    continue;
                }

                size_t b = it - buckets.begin();
                for (size_t s = starts[b], end = starts[b + 1]; s < end; ++s) {
                    auto i = order[s];
                    double ddx = xcoords[i] - qx, ddy = ycoords[i] - qy;
                    double d2 = ddx * ddx + ddy * ddy;
                    if (d2 <= r2) {
                        fun(i, std::sqrt(d2));
                    }
                }
            }
        }
    }
};

}

#endif
