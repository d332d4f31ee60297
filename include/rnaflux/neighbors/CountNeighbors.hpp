#ifndef RNAFLUX_COUNT_NEIGHBORS_HPP
#define RNAFLUX_COUNT_NEIGHBORS_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <algorithm>
#include <memory>
#include <stdexcept>

#include "Eigen/Sparse"
#include "knncolle/knncolle.hpp"
#include "tatami/tatami.hpp"

#include "GridIndex.hpp"

/**
 * @file CountNeighbors.hpp
 *
 * @brief Count neighboring transcripts of each gene around reference points.
 */

namespace rnaflux {

/**
 * @brief Count neighboring transcripts of each gene around reference points.
 *
 * Given a set of labelled query points (typically transcripts) and a set of reference points (typically raster points),
 * we count the number of query points of each gene within the neighborhood of each reference point.
 * The neighborhood is either defined as the `k` nearest query points (via `set_num_neighbors()`)
 * or all query points within a fixed distance (via `set_radius()`).
 * Exactly one of these must be specified.
 *
 * The nearest neighbor search uses vantage point trees from the [**knncolle**](https://github.com/LTLA/knncolle) library,
 * while the fixed-radius search uses a `GridIndex`.
 * Reference points without any neighbors yield all-zero rows.
 */
class CountNeighbors {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_neighbors()` for details.
         */
        static constexpr int num_neighbors = 0;

        /**
         * See `set_radius()` for details.
         */
        static constexpr double radius = 0;

        /**
         * See `set_binary()` for details.
         */
        static constexpr bool binary = false;

        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;
    };

private:
    int num_neighbors = Defaults::num_neighbors;
    double radius = Defaults::radius;
    bool binary = Defaults::binary;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param k Number of nearest query points to use as the neighborhood.
     * A value of zero indicates that nearest neighbors should not be used.
     *
     * @return A reference to this `CountNeighbors` object.
     */
    CountNeighbors& set_num_neighbors(int k = Defaults::num_neighbors) {
        num_neighbors = k;
        return *this;
    }

    /**
     * @param r Radius of the neighborhood around each reference point.
     * A value of zero indicates that a fixed radius should not be used.
     *
     * @return A reference to this `CountNeighbors` object.
     */
    CountNeighbors& set_radius(double r = Defaults::radius) {
        radius = r;
        return *this;
    }

    /**
     * @param b Whether to report the presence or absence of each gene rather than its count.
     *
     * @return A reference to this `CountNeighbors` object.
     */
    CountNeighbors& set_binary(bool b = Defaults::binary) {
        binary = b;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `CountNeighbors` object.
     */
    CountNeighbors& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

public:
    /**
     * Row-major sparse matrix of counts, with reference points in the rows and genes in the columns.
     */
    typedef Eigen::SparseMatrix<double, Eigen::RowMajor> Counts;

private:
    void check_mode() const {
        if (num_neighbors < 0 || radius < 0) {
            throw std::runtime_error("number of neighbors and radius should be non-negative");
        }
        if (num_neighbors > 0 && radius > 0) {
            throw std::runtime_error("only one of the number of neighbors or the radius should be specified");
        }
        if (num_neighbors == 0 && radius == 0) {
            throw std::runtime_error("one of the number of neighbors or the radius must be specified");
        }
    }

    template<class Search_>
    Counts assemble(const int* qgene, int ngenes, size_t nref, Search_ search) const {
        std::vector<std::vector<std::pair<int, double> > > rows(nref);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            std::vector<double> buffer(ngenes);
            std::vector<int> touched;

            for (size_t r = start, end = start + length; r < end; ++r) {
                search(r, [&](int q) -> void {
                    auto g = qgene[q];
                    if (buffer[g] == 0) {
                        touched.push_back(g);
                    }
                    buffer[g] += 1;
                });

                std::sort(touched.begin(), touched.end());
                auto& current = rows[r];
                current.reserve(touched.size());
                for (auto g : touched) {
                    current.emplace_back(g, binary ? 1.0 : buffer[g]);
                    buffer[g] = 0;
                }
                touched.clear();
            }
        }, nref, nthreads);

        Counts output(nref, ngenes);
        std::vector<int> nnz(nref);
        for (size_t r = 0; r < nref; ++r) {
            nnz[r] = rows[r].size();
        }
        output.reserve(nnz);
        for (size_t r = 0; r < nref; ++r) {
            for (const auto& x : rows[r]) {
                output.insert(r, x.first) = x.second;
            }
        }
        output.makeCompressed();
        return output;
    }

public:
    /**
     * Count neighbors with a pre-built nearest neighbor index.
     * This requires `set_num_neighbors()` to be positive.
     *
     * @param index Pointer to a 2-dimensional `knncolle::Base` index constructed from the query points.
     * @param[in] qgene Pointer to an array of length equal to the number of query points, containing the gene code of each point in `[0, ngenes)`.
     * @param ngenes Number of genes.
     * @param nref Number of reference points.
     * @param[in] rx Pointer to an array of length `nref`, containing the x-coordinates of the reference points.
     * @param[in] ry Pointer to an array of length `nref`, containing the y-coordinates of the reference points.
     *
     * @return Sparse matrix of counts.
     */
    Counts run(const knncolle::Base<int, double>* index, const int* qgene, int ngenes, size_t nref, const double* rx, const double* ry) const {
        check_mode();
        if (num_neighbors == 0) {
            throw std::runtime_error("number of neighbors must be positive when searching with a nearest neighbor index");
        }

        int k = std::min(static_cast<size_t>(num_neighbors), static_cast<size_t>(index->nobs()));
        return assemble(qgene, ngenes, nref, [&](size_t r, auto fun) -> void {
            if (k == 0) {
                return;
            }
            double query[2] = { rx[r], ry[r] };
            auto neighbors = index->find_nearest_neighbors(query, k);
            for (const auto& n : neighbors) {
                fun(n.first);
            }
        });
    }

    /**
     * Count neighbors with a pre-built grid index.
     * This requires `set_radius()` to be positive and no greater than the bucket width of `index`.
     *
     * @param index Grid index constructed from the query points.
     * @param[in] qgene Pointer to an array of length equal to the number of query points, containing the gene code of each point in `[0, ngenes)`.
     * @param ngenes Number of genes.
     * @param nref Number of reference points.
     * @param[in] rx Pointer to an array of length `nref`, containing the x-coordinates of the reference points.
     * @param[in] ry Pointer to an array of length `nref`, containing the y-coordinates of the reference points.
     *
     * @return Sparse matrix of counts.
     */
    Counts run(const GridIndex& index, const int* qgene, int ngenes, size_t nref, const double* rx, const double* ry) const {
        check_mode();
        if (radius == 0) {
            throw std::runtime_error("radius must be positive when searching with a grid index");
        }

        return assemble(qgene, ngenes, nref, [&](size_t r, auto fun) -> void {
            index.visit_within(rx[r], ry[r], radius, [&](int q, double) -> void {
                fun(q);
            });
        });
    }

    /**
     * Count neighbors after building the appropriate index from the query points.
     *
     * @param nquery Number of query points.
     * @param[in] qx Pointer to an array of length `nquery`, containing the x-coordinates of the query points.
     * @param[in] qy Pointer to an array of length `nquery`, containing the y-coordinates of the query points.
     * @param[in] qgene Pointer to an array of length `nquery`, containing the gene code of each query point in `[0, ngenes)`.
     * @param ngenes Number of genes.
     * @param nref Number of reference points.
     * @param[in] rx Pointer to an array of length `nref`, containing the x-coordinates of the reference points.
     * @param[in] ry Pointer to an array of length `nref`, containing the y-coordinates of the reference points.
     *
     * @return Sparse matrix of counts.
     */
    Counts run(size_t nquery, const double* qx, const double* qy, const int* qgene, int ngenes, size_t nref, const double* rx, const double* ry) const {
        check_mode();

        if (radius > 0) {
            GridIndex index(nquery, qx, qy, radius);
            return run(index, qgene, ngenes, nref, rx, ry);
        }

        if (nquery == 0) {
            Counts output(nref, ngenes);
            output.makeCompressed();
            return output;
        }

        std::vector<double> coords(nquery * 2);
        for (size_t q = 0; q < nquery; ++q) {
            coords[2 * q] = qx[q];
            coords[2 * q + 1] = qy[q];
        }
        knncolle::VpTreeEuclidean<int, double> index(2, nquery, coords.data());
        return run(&index, qgene, ngenes, nref, rx, ry);
    }
};

}

#endif
