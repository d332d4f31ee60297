#ifndef RNAFLUX_RASTERIZE_CELLS_HPP
#define RNAFLUX_RASTERIZE_CELLS_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <cmath>
#include <stdexcept>

#include "tatami/tatami.hpp"

#include "Polygon.hpp"
#include "../data/CellShapes.hpp"
#include "../data/RasterPoints.hpp"
#include "../utils/logging.hpp"

/**
 * @file RasterizeCells.hpp
 *
 * @brief Sample a regular grid of points inside each cell.
 */

namespace rnaflux {

/**
 * @brief Sample a regular grid of points inside each cell.
 *
 * For each cell, we generate all points of the form `(i * step, j * step)` for integer `i` and `j` that lie inside or on the boundary of the cell polygon.
 * The grid is anchored at the origin rather than at each cell's bounding box,
 * so that points from different cells share the same integer index space and can be compared or rendered into a common image.
 *
 * Cells that are too small to contain any grid node are represented by a single point at the grid node nearest to their centroid.
 * Cells with empty boundaries do not yield any points and are reported in `Results::empty_cells`.
 *
 * The output table must be regenerated whenever the step size or the cell geometries change.
 */
class RasterizeCells {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_step()` for details.
         */
        static constexpr double step = 1;

        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;
    };

private:
    double step = Defaults::step;
    int nthreads = Defaults::num_threads;
    Logger logger = default_logger();

public:
    /**
     * @param s Spacing between grid points, in the same units as the cell coordinates.
     * This should be positive.
     *
     * @return A reference to this `RasterizeCells` object.
     */
    RasterizeCells& set_step(double s = Defaults::step) {
        step = s;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `RasterizeCells` object.
     */
    RasterizeCells& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * @param l Logger for warnings about empty cells.
     * @return A reference to this `RasterizeCells` object.
     */
    RasterizeCells& set_logger(Logger l) {
        logger = std::move(l);
        return *this;
    }

public:
    /**
     * Grid points for a single polygon.
     *
     * @param poly The polygon.
     * @param step Grid spacing.
     * @param[out] xs x-coordinates of the grid points inside `poly`, appended to the existing contents.
     * @param[out] ys y-coordinates of the grid points inside `poly`, appended to the existing contents.
     *
     * @return Whether any grid node was found inside the polygon.
     * If `false`, `xs` and `ys` will contain the single snapped centroid, unless `poly` is empty.
     */
    static bool rasterize(const Polygon& poly, double step, std::vector<double>& xs, std::vector<double>& ys) {
        if (poly.empty()) {
            return false;
        }

        auto box = bounds(poly);
        long long ifirst = std::ceil(box.xmin / step), ilast = std::floor(box.xmax / step);
        long long jfirst = std::ceil(box.ymin / step), jlast = std::floor(box.ymax / step);

        bool found = false;
        for (long long j = jfirst; j <= jlast; ++j) {
            double cury = j * step;
            for (long long i = ifirst; i <= ilast; ++i) {
                Point candidate(i * step, cury);
                if (covers(poly, candidate)) {
                    xs.push_back(candidate.x);
                    ys.push_back(candidate.y);
                    found = true;
                }
            }
        }

        if (!found) {
            auto center = centroid(poly);
            xs.push_back(std::round(center.x / step) * step);
            ys.push_back(std::round(center.y / step) * step);
        }

        return found;
    }

public:
    /**
     * @brief Results of the rasterization.
     */
    struct Results {
        /**
         * Raster points for all cells, sorted by cell index.
         */
        RasterPoints points;

        /**
         * Indices of cells with empty boundaries, which have no raster points.
         */
        std::vector<int> empty_cells;

        /**
         * Indices of cells that were smaller than a grid cell and are represented by their snapped centroid.
         */
        std::vector<int> snapped_cells;
    };

    /**
     * @param cells Cell geometries.
     * @return Raster points for all cells.
     */
    Results run(const CellShapes& cells) const {
        if (!(step > 0)) {
            throw std::runtime_error("raster step size should be positive");
        }

        size_t ncells = cells.size();
        std::vector<std::vector<double> > allx(ncells), ally(ncells);
        std::vector<char> found(ncells);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t c = start, end = start + length; c < end; ++c) {
                found[c] = rasterize(cells.boundary[c], step, allx[c], ally[c]);
            }
        }, ncells, nthreads);

        Results output;
        auto& points = output.points;
        points.step = step;

        for (size_t c = 0; c < ncells; ++c) {
            const auto& curx = allx[c];
            if (curx.empty()) {
                output.empty_cells.push_back(c);
                logger->warn("cell '{}' has an empty boundary and will be skipped", cells.ids[c]);
                continue;
            }

            if (!found[c]) {
                output.snapped_cells.push_back(c);
            }

            const auto& cury = ally[c];
            for (size_t p = 0, pend = curx.size(); p < pend; ++p) {
                points.push_back(c, curx[p], cury[p]);
            }

            std::vector<double>().swap(allx[c]);
            std::vector<double>().swap(ally[c]);
        }

        if (!output.snapped_cells.empty()) {
            logger->debug("{} cell(s) were smaller than the raster step and were represented by their centroid", output.snapped_cells.size());
        }

        return output;
    }
};

}

#endif
