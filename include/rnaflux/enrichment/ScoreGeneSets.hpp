#ifndef RNAFLUX_SCORE_GENE_SETS_HPP
#define RNAFLUX_SCORE_GENE_SETS_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <string>
#include <memory>
#include <random>
#include <numeric>
#include <algorithm>
#include <unordered_map>
#include <cmath>
#include <stdexcept>

#include "Eigen/Dense"
#include "Eigen/Sparse"
#include "aarand/aarand.hpp"
#include "tatami/tatami.hpp"

#include "../data/SpatialData.hpp"
#include "../utils/logging.hpp"
#include "GeneSetNetwork.hpp"
#include "GeneSetCoverage.hpp"

/**
 * @file ScoreGeneSets.hpp
 *
 * @brief Score the enrichment of gene sets in the flux of each raster point.
 */

namespace rnaflux {

/**
 * @brief Score the enrichment of gene sets in the flux of each raster point.
 *
 * For each raster point and source in a `GeneSetNetwork`, the enrichment score is the weighted sum of the flux values of the source's target genes.
 * Targets that are not part of the flux vocabulary are ignored, and sources with fewer than `set_min_size()` remaining targets are removed.
 *
 * To assess significance, we repeatedly shuffle the assignment of weights to genes and recompute the weighted sums, yielding a null distribution for each score.
 * The p-value is the proportion of permutations where the absolute null score exceeds the absolute observed score, with a floor of one over the number of permutations.
 * The normalized score is the observed score minus the mean of the null distribution, divided by its standard deviation;
 * the corrected score is the observed score multiplied by `-log10(p)`.
 * Scores with a null standard deviation of zero (e.g., for raster points with an all-zero flux vector) have a normalized score of zero.
 *
 * The normalized score is used as the `flux_<source>` column of the raster point table.
 */
class ScoreGeneSets {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_min_size()` for details.
         */
        static constexpr int min_size = 0;

        /**
         * See `set_num_permutations()` for details.
         */
        static constexpr int num_permutations = 1000;

        /**
         * See `set_seed()` for details.
         */
        static constexpr uint64_t seed = 42;

        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;
    };

private:
    int min_size = Defaults::min_size;
    int num_permutations = Defaults::num_permutations;
    uint64_t seed = Defaults::seed;
    int nthreads = Defaults::num_threads;
    Logger logger = default_logger();

public:
    /**
     * @param m Minimum number of targets in the flux vocabulary for a source to be scored.
     *
     * @return A reference to this `ScoreGeneSets` object.
     */
    ScoreGeneSets& set_min_size(int m = Defaults::min_size) {
        min_size = m;
        return *this;
    }

    /**
     * @param n Number of permutations.
     * If zero, only the weighted sums are computed.
     *
     * @return A reference to this `ScoreGeneSets` object.
     */
    ScoreGeneSets& set_num_permutations(int n = Defaults::num_permutations) {
        num_permutations = n;
        return *this;
    }

    /**
     * @param s Seed for the permutations.
     *
     * @return A reference to this `ScoreGeneSets` object.
     */
    ScoreGeneSets& set_seed(uint64_t s = Defaults::seed) {
        seed = s;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `ScoreGeneSets` object.
     */
    ScoreGeneSets& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * @param l Logger for progress messages and warnings.
     * @return A reference to this `ScoreGeneSets` object.
     */
    ScoreGeneSets& set_logger(Logger l) {
        logger = std::move(l);
        return *this;
    }

private:
    void permute(const Eigen::SparseMatrix<double, Eigen::RowMajor>& flux, const Eigen::MatrixXd& weights, EnrichmentState& state) const {
        size_t npixels = flux.rows();
        size_t ngenes = weights.rows();
        size_t nsources = weights.cols();

        // Same sequence of permutations for all raster points.
        std::vector<std::vector<int> > permutations(num_permutations);
        {
            std::mt19937_64 rng(seed);
            std::vector<int> idx(ngenes);
            std::iota(idx.begin(), idx.end(), 0);
            for (auto& p : permutations) {
                aarand::shuffle(idx.data(), ngenes, rng);
                p = idx;
            }
        }

        state.norm.resize(npixels, nsources);
        state.corr.resize(npixels, nsources);
        state.pvalue.resize(npixels, nsources);
        double times = num_permutations;

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            std::vector<double> sums(nsources), sumsq(nsources), null(nsources);
            std::vector<int> exceed(nsources);

            for (size_t r = start, end = start + length; r < end; ++r) {
                std::fill(sums.begin(), sums.end(), 0);
                std::fill(sumsq.begin(), sumsq.end(), 0);
                std::fill(exceed.begin(), exceed.end(), 0);

                for (const auto& perm : permutations) {
                    std::fill(null.begin(), null.end(), 0);
                    for (Eigen::SparseMatrix<double, Eigen::RowMajor>::InnerIterator it(flux, r); it; ++it) {
                        auto wrow = perm[it.col()];
                        for (size_t s = 0; s < nsources; ++s) {
                            null[s] += it.value() * weights(wrow, s);
                        }
                    }

                    for (size_t s = 0; s < nsources; ++s) {
                        sums[s] += null[s];
                        sumsq[s] += null[s] * null[s];
                        exceed[s] += (std::abs(null[s]) > std::abs(state.estimate(r, s)));
                    }
                }

                for (size_t s = 0; s < nsources; ++s) {
                    double est = state.estimate(r, s);
                    double p = (exceed[s] ? exceed[s] / times : 1 / times);
                    state.pvalue(r, s) = p;
                    state.corr(r, s) = est * -std::log10(p);

                    double mean = sums[s] / times;
                    double var = sumsq[s] / times - mean * mean;
                    state.norm(r, s) = (var > 0 ? (est - mean) / std::sqrt(var) : 0);
                }
            }
        }, npixels, nthreads);
    }

public:
    /**
     * @param flux Results of `RnaFlux::run()`.
     * @param network Gene set network, with targets matched to `FluxState::genes` by name.
     *
     * @return Enrichment scores for each raster point.
     * `EnrichmentState::coverage` is left empty.
     */
    EnrichmentState run(const FluxState& flux, const GeneSetNetwork& network) const {
        network.validate();
        if (num_permutations < 0) {
            throw std::runtime_error("number of permutations should be non-negative");
        }

        std::unordered_map<std::string, int> vocabulary;
        for (size_t g = 0; g < flux.genes.size(); ++g) {
            vocabulary[flux.genes[g]] = g;
        }

        EnrichmentState state;
        std::vector<std::vector<std::pair<int, double> > > chosen;
        size_t unknown = 0;

        for (const auto& group : network.by_source()) {
            std::vector<std::pair<int, double> > used;
            for (auto e : group.second) {
                auto it = vocabulary.find(network.target[e]);
                if (it == vocabulary.end()) {
                    ++unknown;
                } else {
                    used.emplace_back(it->second, network.weight[e]);
                }
            }

            if (static_cast<int>(used.size()) < min_size) {
                continue;
            }
            state.sources.push_back(group.first);
            state.set_sizes.push_back(group.second.size());
            state.num_used.push_back(used.size());
            chosen.push_back(std::move(used));
        }

        if (unknown) {
            logger->warn("{} edge(s) of the gene set network have targets outside of the flux vocabulary", unknown);
        }
        if (state.sources.empty()) {
            throw std::runtime_error("no sources in the gene set network have at least " + std::to_string(min_size) + " targets in the flux vocabulary");
        }

        size_t nsources = state.sources.size();
        Eigen::MatrixXd weights = Eigen::MatrixXd::Zero(flux.genes.size(), nsources);
        for (size_t s = 0; s < nsources; ++s) {
            for (const auto& x : chosen[s]) {
                weights(x.first, s) = x.second;
            }
        }

        logger->info("scoring {} gene sets in {} raster points", nsources, flux.raster.size());
        state.estimate = flux.flux * weights;
        if (num_permutations > 0) {
            permute(flux.flux, weights, state);
        }

        return state;
    }

    /**
     * Score gene sets and store the results in `data.enrichment`.
     * If the dataset contains a count matrix, the per-cell coverage of each source is also computed with `GeneSetCoverage`.
     *
     * @param data The dataset.
     * This should already contain the flux from `RnaFlux::run()`.
     * @param network Gene set network.
     */
    void run(SpatialData& data, const GeneSetNetwork& network) const {
        if (!data.flux) {
            throw std::runtime_error("flux embedding has not been computed, run 'RnaFlux::run()' first");
        }

        auto state = run(*(data.flux), network);
        if (data.counts) {
            GeneSetCoverage coverage;
            coverage.set_num_threads(nthreads);
            state.coverage = coverage.run(data.counts.get(), data.transcripts.gene_names, network, state.sources);
        }

        data.enrichment = std::make_shared<const EnrichmentState>(std::move(state));
    }
};

}

#endif
