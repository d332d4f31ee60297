#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "rnaflux/fluxmap/SelfOrganizingMap.hpp"
#include "../utils/compare_almost_equal.h"

#include <random>
#include <cmath>

class SelfOrganizingMapTest : public ::testing::Test {
protected:
    static constexpr size_t ndim = 3;
    size_t nobs = 200;
    std::vector<double> data;

    void SetUp() {
        std::mt19937_64 rng(42);
        std::normal_distribution<> norm;
        data.resize(ndim * nobs);
        for (size_t o = 0; o < nobs; ++o) {
            double shift = (o % 2 ? 10 : 0);
            for (size_t d = 0; d < ndim; ++d) {
                data[o * ndim + d] = norm(rng) + shift;
            }
        }
    }
};

TEST_F(SelfOrganizingMapTest, Winner) {
    Eigen::MatrixXd prototypes(2, 3);
    prototypes << 0, 1, 1,
                  0, 0, 0;

    std::vector<double> obs{ 0.9, 0 };
    double distance;
    EXPECT_EQ(rnaflux::SelfOrganizingMap::winner(prototypes, obs.data(), distance), 1); // ties go to the lower index.
    compare_almost_equal(distance, 0.1);

    obs[0] = -2;
    EXPECT_EQ(rnaflux::SelfOrganizingMap::winner(prototypes, obs.data(), distance), 0);
    EXPECT_EQ(distance, 2);
}

TEST_F(SelfOrganizingMapTest, Initialization) {
    rnaflux::SelfOrganizingMap som;
    som.set_num_iterations(0);
    auto prototypes = som.train(4, ndim, nobs, data.data());
    ASSERT_EQ(prototypes.rows(), ndim);
    ASSERT_EQ(prototypes.cols(), 4);

    // Without training, each prototype is one of the observations.
    for (int u = 0; u < 4; ++u) {
        bool found = false;
        for (size_t o = 0; o < nobs && !found; ++o) {
            Eigen::Map<const Eigen::VectorXd> x(data.data() + o * ndim, ndim);
            found = (x == prototypes.col(u));
        }
        EXPECT_TRUE(found);
    }
}

TEST_F(SelfOrganizingMapTest, Reproducible) {
    rnaflux::SelfOrganizingMap som;
    auto ref = som.train(3, ndim, nobs, data.data());
    EXPECT_EQ(ref, som.train(3, ndim, nobs, data.data()));

    som.set_seed(99);
    EXPECT_NE(ref, som.train(3, ndim, nobs, data.data()));
}

TEST_F(SelfOrganizingMapTest, Convergence) {
    // A single unit is always the winner, so it is pulled towards the observations.
    rnaflux::SelfOrganizingMap som;
    auto prototypes = som.train(1, ndim, nobs, data.data());
    for (size_t d = 0; d < ndim; ++d) {
        EXPECT_GT(prototypes(d, 0), 2);
        EXPECT_LT(prototypes(d, 0), 8);
    }

    // Identical observations give a stationary map.
    std::vector<double> constant(ndim * 10, 3.5);
    prototypes = som.train(2, ndim, 10, constant.data());
    EXPECT_EQ(prototypes, Eigen::MatrixXd(Eigen::MatrixXd::Constant(ndim, 2, 3.5)));
    EXPECT_EQ(rnaflux::SelfOrganizingMap::quantization_error(prototypes, 10, constant.data()), 0);
}

TEST_F(SelfOrganizingMapTest, Assign) {
    rnaflux::SelfOrganizingMap som;
    auto prototypes = som.train(5, ndim, nobs, data.data());

    std::vector<int> assigned(nobs);
    double qe = rnaflux::SelfOrganizingMap::assign(prototypes, nobs, data.data(), assigned.data());

    double expected = 0;
    for (size_t o = 0; o < nobs; ++o) {
        Eigen::Map<const Eigen::VectorXd> x(data.data() + o * ndim, ndim);
        double best = std::numeric_limits<double>::infinity();
        for (int u = 0; u < 5; ++u) {
            best = std::min(best, (prototypes.col(u) - x).norm());
        }
        EXPECT_EQ((prototypes.col(assigned[o]) - x).norm(), best);
        expected += best;
    }
    compare_almost_equal(qe, expected / nobs);
    compare_almost_equal(qe, rnaflux::SelfOrganizingMap::quantization_error(prototypes, nobs, data.data()));

    // Same results in parallel.
    std::vector<int> assigned_par(nobs);
    double qe_par = rnaflux::SelfOrganizingMap::assign(prototypes, nobs, data.data(), assigned_par.data(), 3);
    EXPECT_EQ(assigned, assigned_par);
    EXPECT_EQ(qe, qe_par);

    EXPECT_EQ(rnaflux::SelfOrganizingMap::assign(prototypes, 0, data.data(), assigned.data()), 0);
}

TEST_F(SelfOrganizingMapTest, Errors) {
    rnaflux::SelfOrganizingMap som;
    EXPECT_ANY_THROW(som.train(0, ndim, nobs, data.data()));
    EXPECT_ANY_THROW(som.train(2, ndim, 0, data.data()));
    som.set_num_iterations(-1);
    EXPECT_ANY_THROW(som.train(2, ndim, nobs, data.data()));
}
