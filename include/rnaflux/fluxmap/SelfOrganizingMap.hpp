#ifndef RNAFLUX_SELF_ORGANIZING_MAP_HPP
#define RNAFLUX_SELF_ORGANIZING_MAP_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <random>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "Eigen/Dense"
#include "aarand/aarand.hpp"
#include "tatami/tatami.hpp"

/**
 * @file SelfOrganizingMap.hpp
 *
 * @brief One-dimensional self-organizing map.
 */

namespace rnaflux {

/**
 * @brief One-dimensional self-organizing map.
 *
 * The map consists of a line of `k` units, each with a prototype vector in the same space as the observations.
 * Prototypes are initialized to randomly chosen observations.
 * At each training step `t`, observation `t % n` is presented to the map (i.e., in fixed order, cycling through the observations);
 * its best matching unit `c` is the unit with the closest prototype by Euclidean distance,
 * and every unit `j` is moved towards the observation by a factor of `eta(t) * exp(-(j - c)^2 / (2 * sigma(t)^2))`.
 * Both the learning rate `eta` and the neighborhood width `sigma` decay asymptotically, i.e., `x(t) = x(0) / (1 + 2 * t / T)` for `T` training steps.
 *
 * Given the same seed and observations, the trained prototypes are identical across runs.
 */
class SelfOrganizingMap {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_iterations()` for details.
         */
        static constexpr int num_iterations = 1000;

        /**
         * See `set_sigma()` for details.
         */
        static constexpr double sigma = 1;

        /**
         * See `set_learning_rate()` for details.
         */
        static constexpr double learning_rate = 0.5;

        /**
         * See `set_seed()` for details.
         */
        static constexpr uint64_t seed = 11;
    };

private:
    int num_iterations = Defaults::num_iterations;
    double sigma = Defaults::sigma;
    double learning_rate = Defaults::learning_rate;
    uint64_t seed = Defaults::seed;

public:
    /**
     * @param n Number of training steps.
     *
     * @return A reference to this `SelfOrganizingMap` object.
     */
    SelfOrganizingMap& set_num_iterations(int n = Defaults::num_iterations) {
        num_iterations = n;
        return *this;
    }

    /**
     * @param s Initial width of the Gaussian neighborhood, in units of map positions.
     *
     * @return A reference to this `SelfOrganizingMap` object.
     */
    SelfOrganizingMap& set_sigma(double s = Defaults::sigma) {
        sigma = s;
        return *this;
    }

    /**
     * @param l Initial learning rate.
     *
     * @return A reference to this `SelfOrganizingMap` object.
     */
    SelfOrganizingMap& set_learning_rate(double l = Defaults::learning_rate) {
        learning_rate = l;
        return *this;
    }

    /**
     * @param s Seed for the prototype initialization.
     *
     * @return A reference to this `SelfOrganizingMap` object.
     */
    SelfOrganizingMap& set_seed(uint64_t s = Defaults::seed) {
        seed = s;
        return *this;
    }

public:
    /**
     * @param prototypes Column-major matrix of prototypes, with one row per dimension and one column per unit.
     * @param[in] obs Pointer to an array of length equal to the number of rows of `prototypes`, containing the observation.
     * @param[out] distance Euclidean distance from `obs` to the prototype of the best matching unit.
     *
     * @return Index of the best matching unit.
     * Ties are broken in favor of the lower index.
     */
    static int winner(const Eigen::MatrixXd& prototypes, const double* obs, double& distance) {
        Eigen::Map<const Eigen::VectorXd> x(obs, prototypes.rows());
        int best = 0;
        double best_d2 = std::numeric_limits<double>::infinity();
        for (Eigen::Index u = 0, end = prototypes.cols(); u < end; ++u) {
            double d2 = (prototypes.col(u) - x).squaredNorm();
            if (d2 < best_d2) {
                best_d2 = d2;
                best = u;
            }
        }
        distance = std::sqrt(best_d2);
        return best;
    }

    /**
     * @param prototypes Column-major matrix of prototypes, with one row per dimension and one column per unit.
     * @param[in] obs Pointer to an array of length equal to the number of rows of `prototypes`, containing the observation.
     *
     * @return Index of the best matching unit.
     */
    static int winner(const Eigen::MatrixXd& prototypes, const double* obs) {
        double distance;
        return winner(prototypes, obs, distance);
    }

    /**
     * Train the map.
     *
     * @param k Number of units.
     * @param ndim Number of dimensions.
     * @param nobs Number of observations.
     * This should be positive.
     * @param[in] data Pointer to a column-major array with dimensions in the rows and observations in the columns.
     *
     * @return Column-major matrix of trained prototypes, with one row per dimension and one column per unit.
     */
    Eigen::MatrixXd train(int k, size_t ndim, size_t nobs, const double* data) const {
        if (k < 1) {
            throw std::runtime_error("number of units should be positive");
        }
        if (nobs == 0) {
            throw std::runtime_error("at least one observation is required to train a self-organizing map");
        }
        if (num_iterations < 0) {
            throw std::runtime_error("number of iterations should be non-negative");
        }

        Eigen::MatrixXd prototypes(ndim, k);
        std::mt19937_64 rng(seed);
        for (int u = 0; u < k; ++u) {
            auto chosen = aarand::discrete_uniform(rng, nobs);
            prototypes.col(u) = Eigen::Map<const Eigen::VectorXd>(data + chosen * ndim, ndim);
        }

        double half = num_iterations / 2.0;
        std::vector<double> influence(k);

        for (int t = 0; t < num_iterations; ++t) {
            const double* current = data + (static_cast<size_t>(t) % nobs) * ndim;
            int best = winner(prototypes, current);

            double decay = 1 + t / half;
            double eta = learning_rate / decay;
            double sig = sigma / decay;
            double denom = 2 * sig * sig;

            Eigen::Map<const Eigen::VectorXd> x(current, ndim);
            for (int u = 0; u < k; ++u) {
                double delta = u - best;
                double g = std::exp(-delta * delta / denom) * eta;
                prototypes.col(u) += g * (x - prototypes.col(u));
            }
        }

        return prototypes;
    }

    /**
     * Assign observations to their best matching units.
     *
     * @param prototypes Column-major matrix of prototypes, with one row per dimension and one column per unit.
     * @param nobs Number of observations.
     * @param[in] data Pointer to a column-major array with dimensions in the rows and observations in the columns.
     * @param[out] assignments Pointer to an array of length `nobs`, filled with the index of the best matching unit for each observation.
     * @param nthreads Number of threads to use.
     *
     * @return Quantization error, i.e., the mean distance from each observation to the prototype of its best matching unit.
     */
    static double assign(const Eigen::MatrixXd& prototypes, size_t nobs, const double* data, int* assignments, int nthreads = 1) {
        if (nobs == 0) {
            return 0;
        }

        size_t ndim = prototypes.rows();
        std::vector<double> distances(nobs);
        tatami::parallelize([&](size_t, size_t start, size_t length) -> void {
            for (size_t o = start, end = start + length; o < end; ++o) {
                assignments[o] = winner(prototypes, data + o * ndim, distances[o]);
            }
        }, nobs, nthreads);

        double total = 0;
        for (auto d : distances) {
            total += d;
        }
        return total / nobs;
    }

    /**
     * @param prototypes Column-major matrix of prototypes, with one row per dimension and one column per unit.
     * @param nobs Number of observations.
     * @param[in] data Pointer to a column-major array with dimensions in the rows and observations in the columns.
     * @param nthreads Number of threads to use.
     *
     * @return Quantization error, i.e., the mean distance from each observation to the prototype of its best matching unit.
     */
    static double quantization_error(const Eigen::MatrixXd& prototypes, size_t nobs, const double* data, int nthreads = 1) {
        std::vector<int> assignments(nobs);
        return assign(prototypes, nobs, data, assignments.data(), nthreads);
    }
};

}

#endif
