#ifndef RNAFLUX_CELL_SHAPES_HPP
#define RNAFLUX_CELL_SHAPES_HPP

#include <vector>
#include <string>
#include <stdexcept>
#include <cmath>

#include "../geometry/Polygon.hpp"

/**
 * @file CellShapes.hpp
 *
 * @brief Table of cell and nucleus boundaries.
 */

namespace rnaflux {

/**
 * @brief Struct-of-arrays table of cell geometries.
 *
 * Each cell has a stable identifier, a boundary polygon and an optional nucleus polygon (empty if absent).
 * Cells are addressed by their position in this table throughout **rnaflux**.
 */
struct CellShapes {
    /**
     * Identifier for each cell.
     */
    std::vector<std::string> ids;

    /**
     * Boundary of each cell.
     */
    std::vector<Polygon> boundary;

    /**
     * Nucleus of each cell.
     * This may be empty, in which case no cells have nuclei; 
     * otherwise, it should be of the same length as `boundary`, with empty polygons for cells without a nucleus.
     */
    std::vector<Polygon> nucleus;

    /**
     * Per-cell radius, see `compute_radius()`.
     * This is empty until `compute_radius()` is called.
     */
    std::vector<double> radius;

    /**
     * @return Number of cells.
     */
    size_t size() const {
        return boundary.size();
    }

    /**
     * @param id Identifier of the cell.
     * @param b Boundary of the cell.
     * @param n Nucleus of the cell, possibly empty.
     */
    void push_back(std::string id, Polygon b, Polygon n = Polygon()) {
        ids.push_back(std::move(id));
        boundary.push_back(std::move(b));
        nucleus.push_back(std::move(n));
    }

    /**
     * Compute the radius of each cell boundary, defined as the mean distance from the centroid to the boundary vertices.
     * The results are stored in `radius`.
     */
    void compute_radius() {
        radius.resize(boundary.size());
        for (size_t c = 0, end = boundary.size(); c < end; ++c) {
            radius[c] = rnaflux::radius(boundary[c]);
        }
    }

    /**
     * @return Mean radius across all cells with non-empty boundaries.
     * If `radius` is not yet filled, radii are computed on the fly without being stored.
     */
    double mean_radius() const {
        bool cached = (radius.size() == boundary.size());
        double total = 0;
        size_t n = 0;
        for (size_t c = 0, end = boundary.size(); c < end; ++c) {
            auto r = (cached ? radius[c] : rnaflux::radius(boundary[c]));
            if (!std::isnan(r)) {
                total += r;
                ++n;
            }
        }

        if (n == 0) {
            throw std::runtime_error("cannot compute the mean radius without any non-empty cell boundaries");
        }
        return total / n;
    }
};

}

#endif
