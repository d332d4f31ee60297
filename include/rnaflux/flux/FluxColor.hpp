#ifndef RNAFLUX_FLUX_COLOR_HPP
#define RNAFLUX_FLUX_COLOR_HPP

#include <vector>
#include <array>
#include <string>
#include <algorithm>
#include <cmath>
#include <stdexcept>

/**
 * @file FluxColor.hpp
 *
 * @brief Map flux embeddings to display colors.
 */

namespace rnaflux {

/**
 * @brief Map flux embeddings to display colors.
 *
 * The first three components of the embedding are used as the red, green and blue channels.
 * Each component is quantile-transformed to a uniform distribution and then linearly rescaled to `[vmin, vmax]`,
 * so that the colors are robust to outliers and avoid the extremes of the color space.
 * If fewer than three components are available, the remaining channels are set to zero.
 * The alpha channel is defined from the point density, divided by its maximum across all observations.
 */
class FluxColor {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_range()` for details.
         */
        static constexpr double vmin = 0.1;

        /**
         * See `set_range()` for details.
         */
        static constexpr double vmax = 0.9;

        /**
         * See `set_max_quantiles()` for details.
         */
        static constexpr int max_quantiles = 1000;
    };

private:
    double vmin = Defaults::vmin;
    double vmax = Defaults::vmax;
    int max_quantiles = Defaults::max_quantiles;

public:
    /**
     * @param lower Lower bound of the color channels.
     * @param upper Upper bound of the color channels.
     *
     * @return A reference to this `FluxColor` object.
     */
    FluxColor& set_range(double lower = Defaults::vmin, double upper = Defaults::vmax) {
        vmin = lower;
        vmax = upper;
        return *this;
    }

    /**
     * @param q Maximum number of quantiles used to approximate the distribution of each component.
     *
     * @return A reference to this `FluxColor` object.
     */
    FluxColor& set_max_quantiles(int q = Defaults::max_quantiles) {
        max_quantiles = q;
        return *this;
    }

private:
    // Same as numpy's interp(), assuming that 'xp' is sorted.
    static double interpolate(double x, const std::vector<double>& xp, const std::vector<double>& fp) {
        if (x <= xp.front()) {
            return fp.front();
        }
        if (x >= xp.back()) {
            return fp.back();
        }

        size_t j = (std::upper_bound(xp.begin(), xp.end(), x) - xp.begin()) - 1;
        double width = xp[j + 1] - xp[j];
        return fp[j] + (fp[j + 1] - fp[j]) * (x - xp[j]) / width;
    }

public:
    /**
     * Quantile-transform values to a uniform distribution on `[0, 1]`.
     * Tied values are assigned the average of their forward and backward interpolated quantiles.
     *
     * @param values Values to transform, modified in place.
     * @param max_quantiles Maximum number of quantiles.
     */
    static void quantile_transform(std::vector<double>& values, int max_quantiles = Defaults::max_quantiles) {
        size_t n = values.size();
        if (n == 0) {
            return;
        }

        std::vector<double> sorted(values);
        std::sort(sorted.begin(), sorted.end());

        size_t nq = std::min(static_cast<size_t>(std::max(max_quantiles, 2)), n);
        std::vector<double> references(nq), quantiles(nq);
        for (size_t q = 0; q < nq; ++q) {
            double prob = (nq == 1 ? 0 : static_cast<double>(q) / (nq - 1));
            references[q] = prob;

            double pos = prob * (n - 1);
            size_t lo = std::floor(pos);
            size_t hi = std::min(lo + 1, n - 1);
            quantiles[q] = sorted[lo] + (pos - lo) * (sorted[hi] - sorted[lo]);
        }

        for (size_t q = 1; q < nq; ++q) {
            quantiles[q] = std::max(quantiles[q], quantiles[q - 1]);
        }

        if (quantiles.front() == quantiles.back()) {
            std::fill(values.begin(), values.end(), 0);
            return;
        }

        std::vector<double> neg_quantiles(nq), neg_references(nq);
        for (size_t q = 0; q < nq; ++q) {
            neg_quantiles[q] = -quantiles[nq - q - 1];
            neg_references[q] = -references[nq - q - 1];
        }

        for (auto& v : values) {
            if (v == quantiles.front()) {
                v = 0;
            } else if (v == quantiles.back()) {
                v = 1;
            } else {
                v = 0.5 * (interpolate(v, quantiles, references) - interpolate(-v, neg_quantiles, neg_references));
            }
        }
    }

    /**
     * Linearly rescale values to `[lower, upper]`.
     * If all values are equal, they are set to `lower`.
     *
     * @param values Values to rescale, modified in place.
     * @param lower Lower bound.
     * @param upper Upper bound.
     */
    static void minmax_scale(std::vector<double>& values, double lower, double upper) {
        if (values.empty()) {
            return;
        }

        auto range = std::minmax_element(values.begin(), values.end());
        double lo = *(range.first), hi = *(range.second);
        double width = hi - lo;
        if (width == 0) {
            width = 1;
        }

        for (auto& v : values) {
            v = (v - lo) / width * (upper - lower) + lower;
        }
    }

    /**
     * @param color An RGBA color with channels in `[0, 1]`.
     * @return Hex string of the form `#rrggbbaa`.
     */
    static std::string to_hex(const std::array<double, 4>& color) {
        static const char digits[] = "0123456789abcdef";
        std::string output = "#";
        for (auto c : color) {
            int v = std::lround(std::min(1.0, std::max(0.0, c)) * 255);
            output += digits[v / 16];
            output += digits[v % 16];
        }
        return output;
    }

public:
    /**
     * @param ndim Number of embedding dimensions.
     * @param nobs Number of observations.
     * @param[in] embedding Pointer to a column-major array with dimensions in the rows and observations in the columns.
     * @param[in] density Pointer to an array of length `nobs` containing the point density for each observation.
     *
     * @return RGBA colors for all observations.
     */
    std::vector<std::array<double, 4> > run(size_t ndim, size_t nobs, const double* embedding, const double* density) const {
        if (vmin > vmax) {
            throw std::runtime_error("lower bound of the color range should not be greater than the upper bound");
        }

        std::vector<std::array<double, 4> > output(nobs);
        size_t nchannels = std::min(ndim, static_cast<size_t>(3));
        std::vector<double> buffer(nobs);

        for (size_t d = 0; d < nchannels; ++d) {
            for (size_t o = 0; o < nobs; ++o) {
                buffer[o] = embedding[o * ndim + d];
            }
            quantile_transform(buffer, max_quantiles);
            minmax_scale(buffer, vmin, vmax);
            for (size_t o = 0; o < nobs; ++o) {
                output[o][d] = buffer[o];
            }
        }

        for (size_t d = nchannels; d < 3; ++d) {
            for (auto& o : output) {
                o[d] = 0;
            }
        }

        double max_density = 0;
        for (size_t o = 0; o < nobs; ++o) {
            max_density = std::max(max_density, density[o]);
        }
        for (size_t o = 0; o < nobs; ++o) {
            output[o][3] = (max_density > 0 ? density[o] / max_density : 0);
        }

        return output;
    }
};

}

#endif
