#ifndef RNAFLUX_RASTER_POINTS_HPP
#define RNAFLUX_RASTER_POINTS_HPP

#include <vector>
#include <cstddef>

/**
 * @file RasterPoints.hpp
 *
 * @brief Table of raster points inside cells.
 */

namespace rnaflux {

/**
 * @brief Struct-of-arrays table of raster points.
 *
 * Raster points ("pixels") are synthetic points on a regular grid confined to each cell's boundary, see `RasterizeCells`.
 * Points of the same cell are stored contiguously, in increasing order of cell index.
 * All per-pixel fields computed downstream (flux, embeddings, colors, domain labels) are stored in the same order.
 */
struct RasterPoints {
    /**
     * Index of the cell containing each point.
     */
    std::vector<int> cell;

    /**
     * x-coordinate of each point.
     */
    std::vector<double> x;

    /**
     * y-coordinate of each point.
     */
    std::vector<double> y;

    /**
     * Grid spacing used to generate the points.
     */
    double step = 1;

    size_t size() const {
        return x.size();
    }

    void push_back(int c, double x_, double y_) {
        cell.push_back(c);
        x.push_back(x_);
        y.push_back(y_);
    }

    /**
     * @param ncells Number of cells.
     * @return Vector of length `ncells + 1` containing the offsets of each cell's points, assuming that points are sorted by cell.
     * Points for cell `c` lie in `[offsets[c], offsets[c + 1])`.
     */
    std::vector<size_t> offsets(size_t ncells) const {
        std::vector<size_t> output(ncells + 1);
        for (auto c : cell) {
            ++output[c + 1];
        }
        for (size_t c = 0; c < ncells; ++c) {
            output[c + 1] += output[c];
        }
        return output;
    }
};

}

#endif
