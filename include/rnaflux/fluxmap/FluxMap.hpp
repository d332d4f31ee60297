#ifndef RNAFLUX_FLUXMAP_HPP
#define RNAFLUX_FLUXMAP_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <memory>
#include <random>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

#include "Eigen/Dense"
#include "aarand/aarand.hpp"
#include "tatami/tatami.hpp"

#include "../data/SpatialData.hpp"
#include "../utils/errors.hpp"
#include "../utils/logging.hpp"
#include "SelfOrganizingMap.hpp"
#include "FindElbow.hpp"
#include "VectorizeDomains.hpp"

/**
 * @file FluxMap.hpp
 *
 * @brief Cluster flux embeddings into spatial domains.
 */

namespace rnaflux {

/**
 * @brief Cluster flux embeddings into spatial domains.
 *
 * Raster points are clustered by training a one-dimensional `SelfOrganizingMap` on their flux embeddings,
 * where each unit of the map corresponds to a domain.
 * If several candidate numbers of units are supplied, a map is trained for each candidate
 * and the best number is chosen with `FindElbow` on the quantization errors.
 * Quantization errors are always computed on all raster points, even when the maps are trained on a subsample,
 * so that errors are comparable across candidates regardless of which points were sampled.
 *
 * Each raster point is then assigned to its best matching unit in the chosen map, giving labels from 1 to the number of units;
 * label 0 is reserved for "unassigned".
 * The labels are traced into per-cell domain polygons with `VectorizeDomains`,
 * and each transcript is labelled with the domain of its own cell that contains it.
 *
 * All results replace the previous `FluxMapState` in a single assignment.
 * If no elbow can be found, an `ElbowNotFound` exception is thrown and the dataset is left untouched.
 */
class FluxMap {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_clusters()` for details.
         */
        static std::vector<int> num_clusters() {
            return std::vector<int>{ 2, 3, 4, 5, 6, 7, 8 };
        }

        /**
         * See `set_num_iterations()` for details.
         */
        static constexpr int num_iterations = 1000;

        /**
         * See `set_train_size()` for details.
         */
        static constexpr double train_size = 0.2;

        /**
         * See `set_seed()` for details.
         */
        static constexpr uint64_t seed = 11;

        /**
         * See `set_sigma()` for details.
         */
        static constexpr double sigma = 1;

        /**
         * See `set_learning_rate()` for details.
         */
        static constexpr double learning_rate = 0.5;

        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;

        /**
         * See `set_max_pixels()` for details.
         */
        static constexpr size_t max_pixels = VectorizeDomains::Defaults::max_pixels;
    };

private:
    std::vector<int> num_clusters = Defaults::num_clusters();
    int num_iterations = Defaults::num_iterations;
    double train_size = Defaults::train_size;
    uint64_t seed = Defaults::seed;
    double sigma = Defaults::sigma;
    double learning_rate = Defaults::learning_rate;
    int nthreads = Defaults::num_threads;
    size_t max_pixels = Defaults::max_pixels;
    Logger logger = default_logger();

public:
    /**
     * @param k Candidate numbers of clusters.
     * These are sorted and deduplicated before use.
     *
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_num_clusters(std::vector<int> k = Defaults::num_clusters()) {
        num_clusters = std::move(k);
        return *this;
    }

    /**
     * @param k Fixed number of clusters, in which case no elbow search is performed.
     *
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_num_clusters(int k) {
        num_clusters = std::vector<int>{ k };
        return *this;
    }

    /**
     * @param first Smallest candidate number of clusters.
     * @param last Largest candidate number of clusters, inclusive.
     *
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_num_clusters_range(int first, int last) {
        num_clusters.clear();
        for (int k = first; k <= last; ++k) {
            num_clusters.push_back(k);
        }
        return *this;
    }

    /**
     * @param n Number of training steps for each self-organizing map.
     *
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_num_iterations(int n = Defaults::num_iterations) {
        num_iterations = n;
        return *this;
    }

    /**
     * @param t Proportion of raster points to use for training, in `(0, 1]`.
     * Points are sampled without replacement.
     *
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_train_size(double t = Defaults::train_size) {
        train_size = t;
        return *this;
    }

    /**
     * @param s Seed for the subsampling and the map initialization.
     *
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_seed(uint64_t s = Defaults::seed) {
        seed = s;
        return *this;
    }

    /**
     * @param s Initial neighborhood width, see `SelfOrganizingMap::set_sigma()`.
     *
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_sigma(double s = Defaults::sigma) {
        sigma = s;
        return *this;
    }

    /**
     * @param l Initial learning rate, see `SelfOrganizingMap::set_learning_rate()`.
     *
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_learning_rate(double l = Defaults::learning_rate) {
        learning_rate = l;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * @param m Maximum number of pixels in each cell's label image, see `VectorizeDomains::set_max_pixels()`.
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_max_pixels(size_t m = Defaults::max_pixels) {
        max_pixels = m;
        return *this;
    }

    /**
     * @param l Logger for progress messages and warnings.
     * @return A reference to this `FluxMap` object.
     */
    FluxMap& set_logger(Logger l) {
        logger = std::move(l);
        return *this;
    }

public:
    /**
     * Label each transcript with the domain that contains it.
     * Only the domains of the transcript's own cell are considered.
     * If a transcript lies on the shared boundary of several domains, the smallest label is used.
     *
     * @param transcripts Table of transcripts.
     * @param domains Domain layers, as stored in `VectorizeDomains::Results::domains`.
     * @param ncells Number of cells.
     * @param nthreads Number of threads to use.
     *
     * @return Domain label of each transcript, or 0 if it is not inside any domain.
     */
    static std::vector<int> label_transcripts(const Transcripts& transcripts, const std::vector<DomainLayer>& domains, size_t ncells, int nthreads = 1) {
        std::vector<int> output(transcripts.size());
        auto membership = transcripts.by_cell(ncells);

        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t c = start, end = start + length; c < end; ++c) {
                for (auto t : membership[c]) {
                    Point location(transcripts.x[t], transcripts.y[t]);
                    for (const auto& layer : domains) {
                        if (covers(layer.geometry[c], location)) {
                            output[t] = layer.label;
                            break;
                        }
                    }
                }
            }
        }, ncells, nthreads);

        return output;
    }

public:
    /**
     * @brief Summary of the clustering.
     *
     * The domain labels and shapes are stored in `SpatialData::fluxmap`.
     */
    struct Results {
        /**
         * Candidate numbers of clusters, in increasing order.
         */
        std::vector<int> candidates;

        /**
         * Quantization error of the map for each entry of `candidates`, computed on all raster points.
         */
        std::vector<double> quantization_errors;

        /**
         * Chosen number of clusters.
         */
        int best_k = 0;

        /**
         * Prototypes of the chosen map, with one row per embedding dimension and one column per unit.
         */
        Eigen::MatrixXd prototypes;

        /**
         * Indices of the raster points used for training, sorted in increasing order.
         */
        std::vector<int> training;

        /**
         * Cells whose domains could not be vectorized, as pairs of the cell index and the error message.
         * These cells have empty domain geometries and their transcripts are unlabelled.
         */
        std::vector<std::pair<int, std::string> > failed_cells;
    };

private:
    std::vector<int> validate_candidates() const {
        auto candidates = num_clusters;
        if (candidates.empty()) {
            throw std::runtime_error("at least one candidate number of clusters should be supplied");
        }
        std::sort(candidates.begin(), candidates.end());
        candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
        if (candidates.front() < 1) {
            throw std::runtime_error("candidate numbers of clusters should be positive");
        }
        return candidates;
    }

public:
    /**
     * Cluster the flux embeddings and store the domains in `data.fluxmap`.
     *
     * @param data The dataset.
     * This should already contain the flux embedding from `RnaFlux::run()`.
     *
     * @return Summary of the clustering.
     */
    Results run(SpatialData& data) const {
        if (!data.flux) {
            throw std::runtime_error("flux embedding has not been computed, run 'RnaFlux::run()' first");
        }
        if (!(train_size > 0 && train_size <= 1)) {
            throw std::runtime_error("training size should lie in (0, 1]");
        }

        Results output;
        output.candidates = validate_candidates();

        auto flux = data.flux;
        const auto& embedding = flux->embedding;
        size_t ndim = embedding.rows();
        size_t nobs = embedding.cols();
        if (nobs == 0) {
            throw std::runtime_error("no raster points are available for clustering");
        }

        // Choosing the training subset.
        size_t ntrain = (train_size == 1 ? nobs : static_cast<size_t>(train_size * nobs));
        ntrain = std::max(ntrain, static_cast<size_t>(1));
        output.training.resize(ntrain);
        Eigen::MatrixXd subsetted;
        const double* training = embedding.data();

        if (ntrain == nobs) {
            std::iota(output.training.begin(), output.training.end(), 0);
        } else {
            std::mt19937_64 rng(seed);
            aarand::sample(nobs, ntrain, output.training.data(), rng);
            subsetted.resize(ndim, ntrain);
            for (size_t i = 0; i < ntrain; ++i) {
                subsetted.col(i) = embedding.col(output.training[i]);
            }
            training = subsetted.data();
        }

        logger->info("optimizing the number of clusters over {} candidate(s)", output.candidates.size());
        SelfOrganizingMap som;
        som.set_num_iterations(num_iterations)
            .set_sigma(sigma)
            .set_learning_rate(learning_rate)
            .set_seed(seed);

        size_t ncandidates = output.candidates.size();
        std::vector<Eigen::MatrixXd> maps(ncandidates);
        output.quantization_errors.resize(ncandidates);

        // Each candidate is trained independently, so the errors stay in ascending order of k regardless of scheduling.
        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t i = start, end = start + length; i < end; ++i) {
                maps[i] = som.train(output.candidates[i], ndim, ntrain, training);
                output.quantization_errors[i] = SelfOrganizingMap::quantization_error(maps[i], nobs, embedding.data());
            }
        }, ncandidates, nthreads);

        for (size_t i = 0; i < ncandidates; ++i) {
            logger->debug("quantization error for k = {}: {}", output.candidates[i], output.quantization_errors[i]);
        }

        size_t chosen = 0;
        if (ncandidates > 1) {
            std::vector<double> ks(output.candidates.begin(), output.candidates.end());
            auto elbow = FindElbow().run(ks, output.quantization_errors);
            if (!elbow.found) {
                throw ElbowNotFound(output.candidates);
            }
            chosen = elbow.index;
        }
        output.best_k = output.candidates[chosen];
        output.prototypes = std::move(maps[chosen]);

        logger->info("assigning raster points to {} clusters", output.best_k);
        FluxMapState state;
        state.num_clusters = output.best_k;
        state.labels.resize(nobs);
        SelfOrganizingMap::assign(output.prototypes, nobs, embedding.data(), state.labels.data(), nthreads);
        for (auto& l : state.labels) {
            ++l;
        }

        logger->info("vectorizing domains");
        size_t ncells = data.cells.size();
        VectorizeDomains vectorizer;
        vectorizer.set_num_threads(nthreads).set_max_pixels(max_pixels);
        auto vectorized = vectorizer.run(flux->raster, state.labels.data(), output.best_k, ncells);
        for (const auto& f : vectorized.failed_cells) {
            logger->warn("failed to vectorize the domains of cell '{}': {}", data.cells.ids[f.first], f.second);
        }
        output.failed_cells = std::move(vectorized.failed_cells);
        state.domains = std::move(vectorized.domains);
        state.transcript_labels = label_transcripts(data.transcripts, state.domains, ncells, nthreads);

        logger->info("saving {} domain layers", state.domains.size());
        data.fluxmap = std::make_shared<const FluxMapState>(std::move(state));
        return output;
    }
};

}

#endif
