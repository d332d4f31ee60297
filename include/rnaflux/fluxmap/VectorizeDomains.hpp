#ifndef RNAFLUX_VECTORIZE_DOMAINS_HPP
#define RNAFLUX_VECTORIZE_DOMAINS_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "tatami/tatami.hpp"

#include "../data/RasterPoints.hpp"
#include "../data/SpatialData.hpp"
#include "../geometry/TraceLabelImage.hpp"

/**
 * @file VectorizeDomains.hpp
 *
 * @brief Convert per-pixel domain labels into per-cell domain polygons.
 */

namespace rnaflux {

/**
 * @brief Convert per-pixel domain labels into per-cell domain polygons.
 *
 * For each cell, the raster points are mapped back to their integer grid indices by dividing their coordinates by the raster step.
 * This yields a small label image that is traced into polygons with `TraceLabelImage`,
 * where all disjoint regions with the same label in a cell are combined into a single `MultiPolygon`.
 * The polygons are then rescaled from grid units back to the original coordinates.
 * Each pixel covers a square of side length equal to the step, centered on its raster point.
 *
 * The output contains one layer per label from 1 to the number of clusters,
 * and every layer has an entry for every cell, which is an empty `MultiPolygon` if the cell does not contain that label.
 * Cells without any raster points only contain empty geometries.
 * The same applies to cells whose label image cannot be traced, which are reported in `Results::failed_cells` instead of aborting the run.
 */
class VectorizeDomains {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;

        /**
         * See `set_max_pixels()` for details.
         */
        static constexpr size_t max_pixels = TraceLabelImage::Defaults::max_pixels;
    };

private:
    int nthreads = Defaults::num_threads;
    size_t max_pixels = Defaults::max_pixels;

public:
    /**
     * @param n Number of threads to use.
     * @return A reference to this `VectorizeDomains` object.
     */
    VectorizeDomains& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * @param m Maximum number of pixels in the bounding box of each cell's label image, see `TraceLabelImage::set_max_pixels()`.
     * @return A reference to this `VectorizeDomains` object.
     */
    VectorizeDomains& set_max_pixels(size_t m = Defaults::max_pixels) {
        max_pixels = m;
        return *this;
    }

    /**
     * @brief Domain polygons for all cells.
     */
    struct Results {
        /**
         * Vector of length equal to the number of labels, containing the domain layer for each label in increasing order.
         */
        std::vector<DomainLayer> domains;

        /**
         * Cells that could not be traced, as pairs of the cell index and the error message.
         * These cells only contain empty geometries in `domains`.
         */
        std::vector<std::pair<int, std::string> > failed_cells;
    };

public:
    /**
     * @param points Raster points, sorted by cell.
     * @param[in] labels Pointer to an array of length equal to the number of raster points, containing the domain label of each point in `[0, num_labels]`.
     * Points with a label of zero are treated as unassigned.
     * @param num_labels Number of domain labels.
     * @param ncells Number of cells.
     *
     * @return Domain layers for each label, along with any cells that failed.
     */
    Results run(const RasterPoints& points, const int* labels, int num_labels, size_t ncells) const {
        if (!(points.step > 0)) {
            throw std::runtime_error("raster step size should be positive");
        }
        for (auto c : points.cell) {
            if (c < 0 || static_cast<size_t>(c) >= ncells) {
                throw std::runtime_error("cell indices of raster points should lie in [0, number of cells)");
            }
        }
        for (size_t p = 0, end = points.size(); p < end; ++p) {
            if (labels[p] < 0 || labels[p] > num_labels) {
                throw std::runtime_error("domain labels should lie in [0, number of labels]");
            }
        }

        Results output;
        auto& domains = output.domains;
        domains.resize(num_labels);
        for (int l = 0; l < num_labels; ++l) {
            domains[l].label = l + 1;
            domains[l].geometry.resize(ncells);
        }

        std::vector<char> failed(ncells);
        std::vector<std::string> errors(ncells);

        auto offsets = points.offsets(ncells);
        double step = points.step;

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            std::vector<long long> ix, iy;
            TraceLabelImage tracer;
            tracer.set_max_pixels(max_pixels);

            for (size_t c = start, end = start + length; c < end; ++c) {
                size_t first = offsets[c], last = offsets[c + 1];
                if (first == last) {
                    continue;
                }

                ix.clear();
                iy.clear();
                for (size_t p = first; p < last; ++p) {
                    ix.push_back(std::llround(points.x[p] / step));
                    iy.push_back(std::llround(points.y[p] / step));
                }

                TraceLabelImage::Results traced;
                try {
                    traced = tracer.run(last - first, ix.data(), iy.data(), labels + first);
                } catch (std::exception& e) {
                    failed[c] = 1;
                    errors[c] = e.what();
                    continue;
                }

                for (size_t l = 0, lend = traced.labels.size(); l < lend; ++l) {
                    auto& shape = traced.shapes[l];
                    scale(shape, step);
                    domains[traced.labels[l] - 1].geometry[c] = std::move(shape);
                }
            }
        }, ncells, nthreads);

        for (size_t c = 0; c < ncells; ++c) {
            if (failed[c]) {
                output.failed_cells.emplace_back(c, std::move(errors[c]));
            }
        }

        return output;
    }
};

}

#endif
