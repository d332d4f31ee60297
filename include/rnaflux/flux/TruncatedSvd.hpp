#ifndef RNAFLUX_TRUNCATED_SVD_HPP
#define RNAFLUX_TRUNCATED_SVD_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <random>
#include <cmath>
#include <algorithm>
#include <numeric>
#include <stdexcept>

#include "Eigen/Dense"
#include "Eigen/Sparse"
#include "irlba/irlba.hpp"
#include "aarand/aarand.hpp"

/**
 * @file TruncatedSvd.hpp
 *
 * @brief Truncated singular value decomposition of a sparse observation-by-feature matrix.
 */

namespace rnaflux {

/**
 * @brief Truncated singular value decomposition of a sparse observation-by-feature matrix.
 *
 * Unlike a PCA, the input matrix is not centered, so sparse inputs stay sparse and all-zero observations are projected to the origin.
 * The decomposition is computed with the [**CppIrlba**](https://github.com/LTLA/CppIrlba) library,
 * optionally on a random subset of observations to reduce the cost of the fit.
 * All observations are then projected onto the fitted right singular vectors to obtain the embedding.
 *
 * The proportion of variance explained by each component is defined as the variance of the projected training observations along that component,
 * divided by the total variance of the (uncentered) training matrix.
 * Note that these proportions do not have to be decreasing as the input is not centered.
 */
class TruncatedSvd {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_rank()` for details.
         */
        static constexpr int rank = 10;

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
    };

private:
    int rank = Defaults::rank;
    double train_size = Defaults::train_size;
    uint64_t seed = Defaults::seed;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param r Number of components to compute.
     * This should be less than the number of features.
     *
     * @return A reference to this `TruncatedSvd` object.
     */
    TruncatedSvd& set_rank(int r = Defaults::rank) {
        rank = r;
        return *this;
    }

    /**
     * @param t Proportion of observations to use for fitting, in `(0, 1]`.
     * Observations are sampled without replacement.
     *
     * @return A reference to this `TruncatedSvd` object.
     */
    TruncatedSvd& set_train_size(double t = Defaults::train_size) {
        train_size = t;
        return *this;
    }

    /**
     * @param s Seed for the subsampling and the initial vector of the IRLBA.
     *
     * @return A reference to this `TruncatedSvd` object.
     */
    TruncatedSvd& set_seed(uint64_t s = Defaults::seed) {
        seed = s;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `TruncatedSvd` object.
     */
    TruncatedSvd& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

public:
    /**
     * Row-major sparse matrix with observations in the rows and features in the columns.
     */
    typedef Eigen::SparseMatrix<double, Eigen::RowMajor> Matrix;

    /**
     * @brief Fitted basis of the decomposition.
     */
    struct Basis {
        /**
         * Right singular vectors, as a matrix with one row per feature and one column per component.
         */
        Eigen::MatrixXd rotation;

        /**
         * Singular values of the training matrix.
         */
        Eigen::VectorXd singular_values;

        /**
         * Proportion of variance in the training matrix explained by each component.
         */
        std::vector<double> variance_ratio;

        /**
         * Indices of the observations used for training, sorted in increasing order.
         */
        std::vector<int> training;
    };

    /**
     * @param mat Matrix of observations.
     * @param subset Sorted indices of rows to retain.
     * @return Matrix containing only the selected rows.
     */
    static Matrix select_rows(const Matrix& mat, const std::vector<int>& subset) {
        Matrix output(subset.size(), mat.cols());
        std::vector<int> nnz;
        nnz.reserve(subset.size());
        for (auto r : subset) {
            nnz.push_back(mat.outerIndexPtr()[r + 1] - mat.outerIndexPtr()[r]);
        }
        output.reserve(nnz);

        for (size_t i = 0, end = subset.size(); i < end; ++i) {
            for (Matrix::InnerIterator it(mat, subset[i]); it; ++it) {
                output.insert(i, it.col()) = it.value();
            }
        }

        output.makeCompressed();
        return output;
    }

private:
    // Making the largest loading positive for each component, for reproducible signs.
    static void flip_signs(Eigen::MatrixXd& rotation) {
        for (Eigen::Index c = 0, end = rotation.cols(); c < end; ++c) {
            auto col = rotation.col(c);
            Eigen::Index best;
            col.cwiseAbs().maxCoeff(&best);
            if (col[best] < 0) {
                col *= -1;
            }
        }
    }

    static std::vector<double> column_variances(const Eigen::MatrixXd& x) {
        std::vector<double> output(x.cols());
        double n = x.rows();
        for (Eigen::Index c = 0, end = x.cols(); c < end; ++c) {
            auto col = x.col(c);
            double mean = col.sum() / n;
            output[c] = (col.array() - mean).square().sum() / n;
        }
        return output;
    }

    static double total_variance(const Matrix& mat) {
        double n = mat.rows();
        std::vector<double> sums(mat.cols()), sumsq(mat.cols());
        for (Eigen::Index r = 0, end = mat.rows(); r < end; ++r) {
            for (Matrix::InnerIterator it(mat, r); it; ++it) {
                sums[it.col()] += it.value();
                sumsq[it.col()] += it.value() * it.value();
            }
        }

        double output = 0;
        for (size_t c = 0; c < sums.size(); ++c) {
            double mean = sums[c] / n;
            output += std::max(0.0, sumsq[c] / n - mean * mean);
        }
        return output;
    }

public:
    /**
     * Fit the decomposition.
     *
     * @param mat Matrix of observations.
     * @return The fitted basis.
     */
    Basis fit(const Matrix& mat) const {
        if (!(train_size > 0 && train_size <= 1)) {
            throw std::runtime_error("training size should lie in (0, 1]");
        }
        if (rank < 1 || rank >= mat.cols()) {
            throw std::runtime_error("rank should be positive and less than the number of features");
        }

        Basis output;
        size_t nobs = mat.rows();
        size_t ntrain = (train_size == 1 ? nobs : static_cast<size_t>(train_size * nobs));
        if (ntrain <= static_cast<size_t>(rank)) {
            throw std::runtime_error("number of training observations should be greater than the rank");
        }

        output.training.resize(ntrain);
        if (ntrain == nobs) {
            std::iota(output.training.begin(), output.training.end(), 0);
        } else {
            std::mt19937_64 rng(seed);
            aarand::sample(nobs, ntrain, output.training.data(), rng);
        }

        Matrix subsetted;
        const Matrix* training = &mat;
        if (ntrain != nobs) {
            subsetted = select_rows(mat, output.training);
            training = &subsetted;
        }

        irlba::EigenThreadScope t(nthreads);
        irlba::Irlba irb;
        irb.set_number(rank);
        irb.set_seed(seed);

        Eigen::MatrixXd u, v;
        Eigen::VectorXd d;
        irb.run(*training, u, v, d);

        flip_signs(v);
        output.rotation = std::move(v);
        output.singular_values = std::move(d);

        Eigen::MatrixXd projected = (*training) * output.rotation;
        auto explained = column_variances(projected);
        double total = total_variance(*training);

        output.variance_ratio.resize(explained.size());
        for (size_t c = 0; c < explained.size(); ++c) {
            output.variance_ratio[c] = (total > 0 ? explained[c] / total : 0);
        }

        return output;
    }

    /**
     * Project observations onto a fitted basis.
     *
     * @param mat Matrix of observations, with the same features as the matrix used in `fit()`.
     * @param basis Basis returned by `fit()`.
     *
     * @return Column-major matrix of embeddings with one row per component and one column per observation.
     */
    static Eigen::MatrixXd transform(const Matrix& mat, const Basis& basis) {
        if (mat.cols() != basis.rotation.rows()) {
            throw std::runtime_error("number of features should be the same as that used to fit the basis");
        }
        Eigen::MatrixXd projected = mat * basis.rotation;
        return projected.adjoint();
    }

    /**
     * @brief Results of the decomposition.
     */
    struct Results {
        /**
         * Fitted basis.
         */
        Basis basis;

        /**
         * Embedding of all observations, with one row per component and one column per observation.
         */
        Eigen::MatrixXd embedding;
    };

    /**
     * Fit the decomposition and project all observations.
     *
     * @param mat Matrix of observations.
     * @return The fitted basis and the embedding.
     */
    Results run(const Matrix& mat) const {
        Results output;
        output.basis = fit(mat);
        output.embedding = transform(mat, output.basis);
        return output;
    }
};

}

#endif
