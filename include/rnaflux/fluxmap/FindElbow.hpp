#ifndef RNAFLUX_FIND_ELBOW_HPP
#define RNAFLUX_FIND_ELBOW_HPP

#include <vector>
#include <algorithm>
#include <cmath>
#include <stdexcept>

/**
 * @file FindElbow.hpp
 *
 * @brief Find the elbow of a convex decreasing curve.
 */

namespace rnaflux {

/**
 * @brief Find the elbow of a convex decreasing curve.
 *
 * This implements the "Kneedle" algorithm (Satopaa et al., 2011) for a convex decreasing curve, e.g., quantization error against the number of clusters.
 * Both axes are scaled to `[0, 1]` and the curve is flipped so that the elbow becomes a local maximum of the difference curve `y' - x'`.
 * Each local maximum defines a threshold equal to its difference minus `S` times the mean spacing of `x'`;
 * the elbow is reported at the first local maximum where the difference curve subsequently drops below its threshold before reaching another local minimum.
 * Straight lines have a flat difference curve and do not yield an elbow.
 */
class FindElbow {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_sensitivity()` for details.
         */
        static constexpr double sensitivity = 1;
    };

private:
    double sensitivity = Defaults::sensitivity;

public:
    /**
     * @param s Sensitivity of the elbow detection.
     * Larger values are more conservative.
     *
     * @return A reference to this `FindElbow` object.
     */
    FindElbow& set_sensitivity(double s = Defaults::sensitivity) {
        sensitivity = s;
        return *this;
    }

public:
    /**
     * @brief Location of the elbow.
     */
    struct Results {
        /**
         * Whether an elbow was found.
         */
        bool found = false;

        /**
         * Index of the elbow in the input arrays.
         * Only meaningful if `found = true`.
         */
        size_t index = 0;

        /**
         * x-coordinate of the elbow.
         * Only meaningful if `found = true`.
         */
        double x = 0;
    };

private:
    static std::vector<double> scale(const std::vector<double>& values) {
        auto range = std::minmax_element(values.begin(), values.end());
        double lo = *(range.first), width = *(range.second) - lo;
        std::vector<double> output(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
            output[i] = (values[i] - lo) / width;
        }
        return output;
    }

public:
    /**
     * @param x x-coordinates, sorted in increasing order.
     * @param y y-coordinates, of the same length as `x`.
     *
     * @return Location of the elbow, if any.
     */
    Results run(const std::vector<double>& x, const std::vector<double>& y) const {
        if (x.size() != y.size()) {
            throw std::runtime_error("'x' and 'y' should have the same length");
        }

        Results output;
        size_t n = x.size();
        if (n < 3) {
            return output;
        }

        auto yrange = std::minmax_element(y.begin(), y.end());
        if (*(yrange.first) == *(yrange.second) || x.front() == x.back()) {
            return output;
        }

        auto xn = scale(x);
        auto yn = scale(y);
        std::vector<double> diff(n);
        for (size_t i = 0; i < n; ++i) {
            diff[i] = (1 - yn[i]) - xn[i];

            // Rounding in the scaling leaves straight lines slightly off zero.
            if (std::abs(diff[i]) < 1e-8) {
                diff[i] = 0;
            }
        }

        // Local extrema with clipped boundaries, so the endpoints are compared against themselves.
        std::vector<char> is_max(n), is_min(n);
        for (size_t i = 0; i < n; ++i) {
            double left = diff[i == 0 ? 0 : i - 1];
            double right = diff[i + 1 == n ? i : i + 1];
            is_max[i] = (diff[i] >= left && diff[i] >= right);
            is_min[i] = (diff[i] <= left && diff[i] <= right);
        }

        size_t first_max = n;
        for (size_t i = 0; i < n; ++i) {
            if (is_max[i]) {
                first_max = i;
                break;
            }
        }
        if (first_max == n) {
            return output;
        }

        double mean_spacing = std::abs(xn.back() - xn.front()) / (n - 1);
        double threshold = 0;
        size_t threshold_index = first_max;

        for (size_t i = first_max; i + 1 < n; ++i) {
            if (xn[i] == 1.0) {
                break;
            }
            if (is_max[i]) {
                threshold = diff[i] - sensitivity * mean_spacing;
                threshold_index = i;
            }
            if (is_min[i]) {
                threshold = 0;
            }
            if (diff[i + 1] < threshold) {
                output.found = true;
                output.index = threshold_index;
                output.x = x[threshold_index];
                return output;
            }
        }

        return output;
    }
};

}

#endif
