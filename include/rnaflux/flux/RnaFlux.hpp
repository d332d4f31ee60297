#ifndef RNAFLUX_RNAFLUX_HPP
#define RNAFLUX_RNAFLUX_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <string>
#include <memory>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "Eigen/Dense"
#include "Eigen/Sparse"
#include "tatami/tatami.hpp"

#include "../data/SpatialData.hpp"
#include "../geometry/RasterizeCells.hpp"
#include "../neighbors/CountNeighbors.hpp"
#include "../utils/logging.hpp"
#include "CellComposition.hpp"
#include "TruncatedSvd.hpp"
#include "FluxColor.hpp"

/**
 * @file RnaFlux.hpp
 *
 * @brief Compute the RNA flux embedding of each raster point.
 */

namespace rnaflux {

/**
 * @brief Compute the RNA flux embedding of each raster point.
 *
 * The flux of a raster point is the difference between the gene composition of its neighborhood and the gene composition of its cell.
 * For each cell, we:
 *
 * 1. Count the transcripts of each gene around each raster point of the cell, using either a fixed radius or the nearest neighbors (see `CountNeighbors`).
 * 2. Divide the counts by their total to obtain the neighborhood composition, and subtract the composition of the cell.
 * 3. Scale each gene to unit variance across the cell's raster points, without centering.
 *
 * Raster points without any neighboring transcripts have no local signal and are assigned an all-zero flux vector.
 * They are also ignored when computing the per-gene variances.
 * The total neighbor count for each raster point is reported as its density.
 *
 * The flux vectors of all cells are then combined into a single matrix and reduced to `min(G - 1, 10)` dimensions with a `TruncatedSvd`,
 * where `G` is the number of genes in the vocabulary.
 * Finally, each raster point is assigned a display color from the first three dimensions of its embedding with `FluxColor`.
 *
 * If the flux has already been computed for a dataset, `run()` does nothing unless `set_recompute()` is enabled.
 * Otherwise, all fields are computed from scratch and replace the previous `FluxState` in a single assignment,
 * so readers never observe a partially updated state.
 * Downstream results (`FluxMapState` and `EnrichmentState`) are discarded as they refer to the old raster points.
 */
class RnaFlux {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_radius_fraction()` for details.
         */
        static constexpr double radius_fraction = 0.25;

        /**
         * See `set_resolution()` for details.
         */
        static constexpr double resolution = 0.1;

        /**
         * See `set_train_size()` for details.
         */
        static constexpr double train_size = 1;

        /**
         * See `set_seed()` for details.
         */
        static constexpr uint64_t seed = 11;

        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;

        /**
         * See `set_recompute()` for details.
         */
        static constexpr bool recompute = false;

        /**
         * See `set_min_expressed_genes()` for details.
         */
        static constexpr int min_expressed_genes = 4;

        /**
         * See `set_min_gene_count()` for details.
         */
        static constexpr int min_gene_count = 0;

        /**
         * Maximum number of components in the embedding.
         */
        static constexpr int max_components = 10;

        /**
         * Minimum number of genes in the vocabulary.
         */
        static constexpr int min_genes = 5;
    };

private:
    enum class Neighborhood { FRACTION, ABSOLUTE, NEAREST };

    Neighborhood mode = Neighborhood::FRACTION;
    double radius_value = Defaults::radius_fraction;
    int num_neighbors = 0;

    double resolution = Defaults::resolution;
    double train_size = Defaults::train_size;
    uint64_t seed = Defaults::seed;
    int nthreads = Defaults::num_threads;
    bool recompute = Defaults::recompute;
    int min_expressed_genes = Defaults::min_expressed_genes;
    int min_gene_count = Defaults::min_gene_count;
    Logger logger = default_logger();

public:
    /**
     * Define the neighborhood of each raster point as a circle with a radius proportional to the mean cell radius.
     * This overrides any previous call to `set_radius_absolute()` or `set_num_neighbors()`.
     *
     * @param f Radius as a fraction of the mean cell radius, see `CellShapes::mean_radius()`.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_radius_fraction(double f = Defaults::radius_fraction) {
        mode = Neighborhood::FRACTION;
        radius_value = f;
        return *this;
    }

    /**
     * Define the neighborhood of each raster point as a circle with a fixed radius.
     * This overrides any previous call to `set_radius_fraction()` or `set_num_neighbors()`.
     *
     * @param r Radius, in the same units as the coordinates.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_radius_absolute(double r) {
        mode = Neighborhood::ABSOLUTE;
        radius_value = r;
        return *this;
    }

    /**
     * Define the neighborhood of each raster point as its nearest transcripts in the same cell.
     * This overrides any previous call to `set_radius_fraction()` or `set_radius_absolute()`.
     *
     * @param k Number of nearest neighbors.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_num_neighbors(int k) {
        mode = Neighborhood::NEAREST;
        num_neighbors = k;
        return *this;
    }

    /**
     * @param r Resolution of the raster grid, i.e., the inverse of the spacing between raster points.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_resolution(double r = Defaults::resolution) {
        resolution = r;
        return *this;
    }

    /**
     * @param t Proportion of raster points used to fit the SVD, see `TruncatedSvd::set_train_size()`.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_train_size(double t = Defaults::train_size) {
        train_size = t;
        return *this;
    }

    /**
     * @param s Seed for the SVD.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_seed(uint64_t s = Defaults::seed) {
        seed = s;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * @param r Whether to recompute the flux if it is already present in the dataset.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_recompute(bool r = Defaults::recompute) {
        recompute = r;
        return *this;
    }

    /**
     * @param m Minimum number of expressed genes in a cell.
     * Cells below this threshold are still used but are reported with a warning, as their flux is dominated by noise.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_min_expressed_genes(int m = Defaults::min_expressed_genes) {
        min_expressed_genes = m;
        return *this;
    }

    /**
     * @param m Minimum total number of transcripts for a gene to be included in the vocabulary.
     *
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_min_gene_count(int m = Defaults::min_gene_count) {
        min_gene_count = m;
        return *this;
    }

    /**
     * @param l Logger for progress messages and warnings.
     * @return A reference to this `RnaFlux` object.
     */
    RnaFlux& set_logger(Logger l) {
        logger = std::move(l);
        return *this;
    }

public:
    /**
     * @brief Flux vectors for the raster points of a single cell.
     */
    struct CellFlux {
        /**
         * Row-major sparse matrix of flux vectors, with one row per raster point and one column per gene.
         */
        Eigen::SparseMatrix<double, Eigen::RowMajor> flux;

        /**
         * Total number of neighboring transcripts for each raster point.
         */
        std::vector<double> density;
    };

    /**
     * Compute the flux vectors for a single cell.
     *
     * @param counter Neighbor counter, configured with either a radius or a number of neighbors.
     * @param ntx Number of transcripts in the cell.
     * @param[in] tx Pointer to an array of length `ntx`, containing the x-coordinates of the transcripts.
     * @param[in] ty Pointer to an array of length `ntx`, containing the y-coordinates of the transcripts.
     * @param[in] tgene Pointer to an array of length `ntx`, containing the gene code of each transcript in `[0, ngenes)`.
     * @param ngenes Number of genes.
     * @param nraster Number of raster points in the cell.
     * @param[in] rx Pointer to an array of length `nraster`, containing the x-coordinates of the raster points.
     * @param[in] ry Pointer to an array of length `nraster`, containing the y-coordinates of the raster points.
     * @param[in] composition Pointer to an array of length `ngenes`, containing the gene composition of the cell.
     *
     * @return Flux vectors and densities for all raster points.
     */
    static CellFlux compute_cell(
        const CountNeighbors& counter,
        size_t ntx,
        const double* tx,
        const double* ty,
        const int* tgene,
        int ngenes,
        size_t nraster,
        const double* rx,
        const double* ry,
        const double* composition)
    {
        auto counts = counter.run(ntx, tx, ty, tgene, ngenes, nraster, rx, ry);

        CellFlux output;
        output.density.resize(nraster);
        Eigen::MatrixXd flux = Eigen::MatrixXd::Zero(nraster, ngenes);
        std::vector<char> has_neighbors(nraster);
        size_t nvalid = 0;

        for (size_t r = 0; r < nraster; ++r) {
            double total = counts.row(r).sum();
            output.density[r] = total;
            if (total == 0) {
                continue;
            }

            has_neighbors[r] = 1;
            ++nvalid;
            auto row = flux.row(r);
            for (int g = 0; g < ngenes; ++g) {
                row[g] = -composition[g];
            }
            for (decltype(counts)::InnerIterator it(counts, r); it; ++it) {
                row[it.col()] += it.value() / total;
            }
        }

        // Population standard deviation of each gene, ignoring raster points without neighbors.
        if (nvalid) {
            for (int g = 0; g < ngenes; ++g) {
                auto col = flux.col(g);
                double mean = 0;
                for (size_t r = 0; r < nraster; ++r) {
                    if (has_neighbors[r]) {
                        mean += col[r];
                    }
                }
                mean /= nvalid;

                double var = 0;
                for (size_t r = 0; r < nraster; ++r) {
                    if (has_neighbors[r]) {
                        double delta = col[r] - mean;
                        var += delta * delta;
                    }
                }
                var /= nvalid;

                if (var > 0) {
                    col /= std::sqrt(var);
                }
            }
        }

        output.flux = flux.sparseView();
        output.flux.makeCompressed();
        return output;
    }

    /**
     * Choose the gene vocabulary from the transcripts inside cells.
     *
     * @param transcripts Table of transcripts.
     * @param ncells Number of cells.
     * @param min_count Minimum number of transcripts for a gene to be retained.
     *
     * @return Codes of the retained genes, in category order.
     */
    static std::vector<int> choose_genes(const Transcripts& transcripts, size_t ncells, int min_count) {
        std::vector<int> totals(transcripts.gene_names.size());
        for (size_t t = 0, end = transcripts.size(); t < end; ++t) {
            auto c = transcripts.cell[t];
            if (c >= 0 && static_cast<size_t>(c) < ncells) {
                ++totals[transcripts.gene[t]];
            }
        }

        std::vector<int> output;
        for (size_t g = 0; g < totals.size(); ++g) {
            if (totals[g] >= min_count) {
                output.push_back(g);
            }
        }
        return output;
    }

public:
    /**
     * @brief Summary of the flux calculation.
     *
     * The computed fields themselves are stored in `SpatialData::flux`.
     */
    struct Results {
        /**
         * Whether the flux was computed.
         * This is `false` if the flux was already present and recomputation was not requested.
         */
        bool computed = false;

        /**
         * Indices of cells with empty boundaries, which have no raster points.
         */
        std::vector<int> empty_cells;

        /**
         * Indices of cells with fewer expressed genes than `set_min_expressed_genes()`.
         */
        std::vector<int> low_gene_cells;

        /**
         * Cells for which the flux calculation failed, along with the error message.
         * These cells are excluded from the stored raster points.
         */
        std::vector<std::pair<int, std::string> > failed_cells;
    };

private:
    CountNeighbors configure_counter(const CellShapes& cells, double& radius_used) const {
        CountNeighbors counter;
        counter.set_num_threads(1);

        radius_used = 0;
        if (mode == Neighborhood::NEAREST) {
            if (num_neighbors <= 0) {
                throw std::runtime_error("number of neighbors should be positive");
            }
            counter.set_num_neighbors(num_neighbors);
        } else {
            if (!(radius_value > 0)) {
                throw std::runtime_error("neighborhood radius should be positive");
            }
            radius_used = (mode == Neighborhood::FRACTION ? radius_value * cells.mean_radius() : radius_value);
            counter.set_radius(radius_used);
        }

        return counter;
    }

public:
    /**
     * Compute the flux embedding and store it in `data.flux`.
     *
     * @param data The dataset.
     * This should contain at least 5 genes with transcripts inside cells.
     *
     * @return Summary of the calculation.
     */
    Results run(SpatialData& data) const {
        Results output;
        if (data.flux && !recompute) {
            logger->debug("flux is already computed, set 'recompute' to recompute it");
            return output;
        }

        if (!(resolution > 0)) {
            throw std::runtime_error("raster resolution should be positive");
        }
        if (!(train_size > 0 && train_size <= 1)) {
            throw std::runtime_error("training size should lie in (0, 1]");
        }

        const auto& transcripts = data.transcripts;
        transcripts.validate();
        auto& cells = data.cells;
        size_t ncells = cells.size();

        auto genes = choose_genes(transcripts, ncells, min_gene_count);
        int ngenes = genes.size();
        if (ngenes < Defaults::min_genes) {
            throw std::runtime_error("at least " + std::to_string(Defaults::min_genes) + " genes are required to compute the flux, found " + std::to_string(ngenes));
        }
        if (data.counts && static_cast<size_t>(data.counts->nrow()) != transcripts.gene_names.size()) {
            throw std::runtime_error("number of rows in the count matrix should be equal to the number of gene names");
        }
        if (data.counts && static_cast<size_t>(data.counts->ncol()) != ncells) {
            throw std::runtime_error("number of columns in the count matrix should be equal to the number of cells");
        }

        double radius_used = 0;
        auto counter = configure_counter(cells, radius_used);
        if (cells.radius.size() != ncells) {
            cells.compute_radius();
        }

        RasterizeCells rasterizer;
        rasterizer.set_step(1 / resolution).set_num_threads(nthreads).set_logger(logger);
        auto raster = rasterizer.run(cells);
        output.empty_cells = std::move(raster.empty_cells);
        const auto& points = raster.points;
        auto offsets = points.offsets(ncells);

        Eigen::MatrixXd composition;
        CellComposition composer;
        composer.set_num_threads(nthreads);
        if (data.counts) {
            composition = composer.run(data.counts.get(), genes);
        } else {
            composition = composer.run(transcripts, genes, ncells);
        }

        std::vector<int> remap(transcripts.gene_names.size(), -1);
        for (int g = 0; g < ngenes; ++g) {
            remap[genes[g]] = g;
        }
        auto membership = transcripts.by_cell(ncells);

        logger->info("embedding raster points of {} cells", ncells);
        std::vector<CellFlux> per_cell(ncells);
        std::vector<std::string> errors(ncells);
        std::vector<char> failed(ncells), low_genes(ncells);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            std::vector<double> tx, ty;
            std::vector<int> tgene;
            std::vector<char> seen(ngenes);

            for (size_t c = start, end = start + length; c < end; ++c) {
                size_t first = offsets[c], last = offsets[c + 1];
                if (first == last) {
                    continue;
                }

                tx.clear();
                ty.clear();
                tgene.clear();
                std::fill(seen.begin(), seen.end(), 0);
                int nexpressed = 0;

                for (auto t : membership[c]) {
                    auto g = remap[transcripts.gene[t]];
                    if (g < 0) {
                        continue;
                    }
                    tx.push_back(transcripts.x[t]);
                    ty.push_back(transcripts.y[t]);
                    tgene.push_back(g);
                    if (!seen[g]) {
                        seen[g] = 1;
                        ++nexpressed;
                    }
                }
                low_genes[c] = (nexpressed < min_expressed_genes);

                try {
                    per_cell[c] = compute_cell(
                        counter,
                        tx.size(), tx.data(), ty.data(), tgene.data(), ngenes,
                        last - first, points.x.data() + first, points.y.data() + first,
                        composition.col(c).data()
                    );
                } catch (std::exception& e) {
                    failed[c] = 1;
                    errors[c] = e.what();
                }
            }
        }, ncells, nthreads);

        for (size_t c = 0; c < ncells; ++c) {
            if (low_genes[c] && offsets[c] != offsets[c + 1]) {
                output.low_gene_cells.push_back(c);
                logger->warn("cell '{}' has fewer than {} expressed genes, its flux may be unreliable", cells.ids[c], min_expressed_genes);
            }
            if (failed[c]) {
                output.failed_cells.emplace_back(c, errors[c]);
                logger->warn("failed to compute the flux for cell '{}': {}", cells.ids[c], errors[c]);
            }
        }

        // Stacking all cells into a single matrix.
        FluxState state;
        state.raster.step = points.step;
        state.radius = radius_used;
        state.num_neighbors = (mode == Neighborhood::NEAREST ? num_neighbors : 0);
        for (auto g : genes) {
            state.genes.push_back(transcripts.gene_names[g]);
        }

        std::vector<int> nnz;
        for (size_t c = 0; c < ncells; ++c) {
            if (failed[c]) {
                continue;
            }
            const auto& current = per_cell[c];
            for (size_t p = offsets[c], end = offsets[c + 1]; p < end; ++p) {
                state.raster.push_back(c, points.x[p], points.y[p]);
                auto local = p - offsets[c];
                nnz.push_back(current.flux.outerIndexPtr()[local + 1] - current.flux.outerIndexPtr()[local]);
                state.density.push_back(current.density[local]);
            }
        }

        size_t npixels = state.raster.size();
        state.flux.resize(npixels, ngenes);
        state.flux.reserve(nnz);
        {
            size_t row = 0;
            for (size_t c = 0; c < ncells; ++c) {
                if (failed[c] || offsets[c] == offsets[c + 1]) {
                    continue;
                }
                const auto& current = per_cell[c].flux;
                for (Eigen::Index r = 0, end = current.rows(); r < end; ++r, ++row) {
                    for (Eigen::SparseMatrix<double, Eigen::RowMajor>::InnerIterator it(current, r); it; ++it) {
                        double val = it.value();
                        if (!std::isnan(val)) {
                            state.flux.insert(row, it.col()) = val;
                        }
                    }
                }
                per_cell[c] = CellFlux();
            }
        }
        state.flux.makeCompressed();

        logger->info("reducing flux of {} raster points to {} dimensions", npixels, std::min(ngenes - 1, static_cast<int>(Defaults::max_components)));
        TruncatedSvd svd;
        svd.set_rank(std::min(ngenes - 1, static_cast<int>(Defaults::max_components)))
            .set_train_size(train_size)
            .set_seed(seed)
            .set_num_threads(nthreads);
        auto reduced = svd.run(state.flux);
        state.embedding = std::move(reduced.embedding);
        state.variance_ratio = std::move(reduced.basis.variance_ratio);

        FluxColor colorizer;
        state.color = colorizer.run(state.embedding.rows(), npixels, state.embedding.data(), state.density.data());
        state.color_hex.reserve(npixels);
        for (const auto& col : state.color) {
            state.color_hex.push_back(FluxColor::to_hex(col));
        }

        logger->info("saving flux for {} raster points", npixels);
        data.flux = std::make_shared<const FluxState>(std::move(state));
        data.fluxmap.reset();
        data.enrichment.reset();

        output.computed = true;
        return output;
    }
};

}

#endif
