#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "rnaflux/flux/RnaFlux.hpp"
#include "../data/Simulator.hpp"
#include "../utils/compare_almost_equal.h"

#include <numeric>
#include <cmath>

TEST(RnaFlux, ComputeCell) {
    std::vector<double> tx{ 0, 0.1, -0.1, 0, 10, 10.1 };
    std::vector<double> ty{ 0, 0, 0, 0.1, 0, 0 };
    std::vector<int> tgene{ 0, 0, 0, 1, 0, 1 };
    std::vector<double> rx{ 0, 10, 100 }, ry{ 0, 0, 100 };
    std::vector<double> composition{ 0.5, 0.5 };

    rnaflux::CountNeighbors counter;
    counter.set_radius(1);
    auto res = rnaflux::RnaFlux::compute_cell(counter, tx.size(), tx.data(), ty.data(), tgene.data(), 2, rx.size(), rx.data(), ry.data(), composition.data());

    EXPECT_EQ(res.density, std::vector<double>({ 4, 2, 0 }));

    Eigen::MatrixXd flux(res.flux);
    ASSERT_EQ(flux.rows(), 3);
    ASSERT_EQ(flux.cols(), 2);

    // Differences from the cell composition are (0.25, -0.25) and (0, 0), each with a standard deviation of 0.125.
    compare_almost_equal(flux(0, 0), 2.0);
    compare_almost_equal(flux(0, 1), -2.0);
    EXPECT_EQ(flux(1, 0), 0);
    EXPECT_EQ(flux(1, 1), 0);

    // Raster points without neighbors have an all-zero flux.
    EXPECT_EQ(flux(2, 0), 0);
    EXPECT_EQ(flux(2, 1), 0);
}

TEST(RnaFlux, ChooseGenes) {
    rnaflux::Transcripts tx;
    tx.gene_names = { "A", "B", "C" };
    tx.push_back(0, 0, 0, 0);
    tx.push_back(0, 0, 0, 0);
    tx.push_back(0, 2, 0, 0);
    tx.push_back(-1, 1, 0, 0);
    tx.push_back(5, 1, 0, 0); // not a valid cell.

    EXPECT_EQ(rnaflux::RnaFlux::choose_genes(tx, 1, 0), std::vector<int>({ 0, 1, 2 }));
    EXPECT_EQ(rnaflux::RnaFlux::choose_genes(tx, 1, 1), std::vector<int>({ 0, 2 }));
    EXPECT_EQ(rnaflux::RnaFlux::choose_genes(tx, 1, 2), std::vector<int>({ 0 }));
}

class RnaFluxTest : public ::testing::Test {
protected:
    rnaflux::SpatialData data;

    void SetUp() {
        Simulator sim;
        sim.polarization = 0.8;
        data = sim.dataset(3);
    }

    static rnaflux::RnaFlux default_runner() {
        rnaflux::RnaFlux runner;
        runner.set_resolution(1).set_radius_absolute(5).set_logger(rnaflux::null_logger());
        return runner;
    }
};

TEST_F(RnaFluxTest, Basic) {
    auto runner = default_runner();
    auto res = runner.run(data);
    EXPECT_TRUE(res.computed);
    EXPECT_TRUE(res.failed_cells.empty());
    EXPECT_TRUE(res.empty_cells.empty());
    EXPECT_TRUE(res.low_gene_cells.empty());

    ASSERT_TRUE(data.flux != nullptr);
    const auto& state = *(data.flux);
    size_t npixels = 3 * 21 * 21;
    EXPECT_EQ(state.raster.size(), npixels);
    EXPECT_EQ(state.raster.step, 1);
    EXPECT_EQ(state.radius, 5);
    EXPECT_EQ(state.num_neighbors, 0);
    EXPECT_EQ(state.genes, data.transcripts.gene_names);

    EXPECT_EQ(state.flux.rows(), npixels);
    EXPECT_EQ(state.flux.cols(), 6);
    EXPECT_EQ(state.num_components(), 5);
    EXPECT_EQ(state.embedding.cols(), npixels);
    EXPECT_EQ(state.density.size(), npixels);
    EXPECT_EQ(state.color.size(), npixels);
    EXPECT_EQ(state.color_hex.size(), npixels);

    ASSERT_EQ(state.variance_ratio.size(), 5);
    double total = std::accumulate(state.variance_ratio.begin(), state.variance_ratio.end(), 0.0);
    EXPECT_LE(total, 1 + 1e-8);

    for (size_t p = 0; p < npixels; ++p) {
        EXPECT_EQ(state.color_hex[p], rnaflux::FluxColor::to_hex(state.color[p]));
        EXPECT_GE(state.color[p][3], 0);
        EXPECT_LE(state.color[p][3], 1);
    }
}

TEST_F(RnaFluxTest, Density) {
    auto runner = default_runner();
    runner.run(data);
    const auto& state = *(data.flux);
    const auto& tx = data.transcripts;

    for (size_t p = 0; p < state.raster.size(); p += 37) {
        double expected = 0;
        for (size_t t = 0; t < tx.size(); ++t) {
            if (tx.cell[t] == state.raster.cell[p] && std::hypot(tx.x[t] - state.raster.x[p], tx.y[t] - state.raster.y[p]) <= 5) {
                ++expected;
            }
        }
        EXPECT_EQ(state.density[p], expected);
    }
}

TEST_F(RnaFluxTest, UnitVariance) {
    auto runner = default_runner();
    runner.set_radius_absolute(2);
    runner.run(data);
    const auto& state = *(data.flux);
    Eigen::MatrixXd flux(state.flux);

    auto offsets = state.raster.offsets(3);
    for (int c = 0; c < 3; ++c) {
        for (int g = 0; g < 6; ++g) {
            double mean = 0, n = 0;
            for (size_t p = offsets[c]; p < offsets[c + 1]; ++p) {
                if (state.density[p] > 0) {
                    mean += flux(p, g);
                    ++n;
                } else {
                    EXPECT_EQ(flux(p, g), 0);
                }
            }
            mean /= n;

            double var = 0;
            for (size_t p = offsets[c]; p < offsets[c + 1]; ++p) {
                if (state.density[p] > 0) {
                    var += (flux(p, g) - mean) * (flux(p, g) - mean);
                }
            }
            var /= n;
            compare_almost_equal(var, 1.0, 1e-6);
        }
    }
}

TEST_F(RnaFluxTest, Idempotence) {
    auto runner = default_runner();
    runner.run(data);
    auto first = data.flux;

    auto res = runner.run(data);
    EXPECT_FALSE(res.computed);
    EXPECT_EQ(first.get(), data.flux.get());

    // Recomputation fully replaces the state, leaving old readers untouched.
    runner.set_recompute(true);
    res = runner.run(data);
    EXPECT_TRUE(res.computed);
    EXPECT_NE(first.get(), data.flux.get());
    EXPECT_EQ(first->embedding, data.flux->embedding);
    EXPECT_EQ(first->density, data.flux->density);
    EXPECT_EQ(first->color, data.flux->color);
    EXPECT_EQ(first->variance_ratio, data.flux->variance_ratio);
}

TEST_F(RnaFluxTest, RecomputeResetsDownstream) {
    auto runner = default_runner();
    runner.run(data);
    data.fluxmap.reset(new rnaflux::FluxMapState);
    data.enrichment.reset(new rnaflux::EnrichmentState);

    runner.set_recompute(true).set_resolution(0.5);
    runner.run(data);
    EXPECT_EQ(data.flux->raster.step, 2);
    EXPECT_EQ(data.fluxmap, nullptr);
    EXPECT_EQ(data.enrichment, nullptr);
}

TEST_F(RnaFluxTest, Parallel) {
    auto runner = default_runner();
    runner.run(data);
    auto ref = data.flux;

    runner.set_num_threads(3).set_recompute(true);
    runner.run(data);
    EXPECT_EQ(ref->raster.x, data.flux->raster.x);
    EXPECT_EQ(ref->density, data.flux->density);
    EXPECT_EQ(Eigen::MatrixXd(ref->flux), Eigen::MatrixXd(data.flux->flux));
    compare_almost_equal(ref->embedding.cwiseAbs().eval(), data.flux->embedding.cwiseAbs().eval(), 1e-6);
}

TEST_F(RnaFluxTest, RadiusModes) {
    // Default radius is a quarter of the mean cell radius.
    rnaflux::RnaFlux runner;
    runner.set_resolution(1).set_logger(rnaflux::null_logger());
    runner.run(data);
    compare_almost_equal(data.flux->radius, 0.25 * std::sqrt(200.0));
    EXPECT_EQ(data.cells.radius.size(), 3);

    runner.set_recompute(true).set_radius_fraction(0.5);
    runner.run(data);
    compare_almost_equal(data.flux->radius, 0.5 * std::sqrt(200.0));

    runner.set_num_neighbors(10);
    runner.run(data);
    EXPECT_EQ(data.flux->radius, 0);
    EXPECT_EQ(data.flux->num_neighbors, 10);
    for (auto d : data.flux->density) {
        EXPECT_EQ(d, 10);
    }

    // Last setter wins.
    runner.set_num_neighbors(10).set_radius_absolute(3);
    runner.run(data);
    EXPECT_EQ(data.flux->radius, 3);
    EXPECT_EQ(data.flux->num_neighbors, 0);
}

TEST_F(RnaFluxTest, CountMatrixOptional) {
    auto runner = default_runner();
    runner.run(data);
    auto ref = data.flux;

    // Compositions tallied from the transcripts are the same as those from the count matrix.
    data.counts.reset();
    runner.set_recompute(true);
    runner.run(data);
    EXPECT_EQ(Eigen::MatrixXd(ref->flux), Eigen::MatrixXd(data.flux->flux));
}

TEST(RnaFlux, ExtracellularTranscripts) {
    Simulator sim;
    auto ref = sim.dataset(2);
    sim.extracellular = 50;
    auto data = sim.dataset(2);

    rnaflux::RnaFlux runner;
    runner.set_resolution(1).set_radius_absolute(5).set_logger(rnaflux::null_logger());
    runner.run(ref);
    runner.run(data);
    EXPECT_EQ(ref.flux->density, data.flux->density);
    EXPECT_EQ(ref.flux->embedding, data.flux->embedding);
}

TEST(RnaFlux, LowGeneCells) {
    Simulator sim;
    auto data = sim.dataset(3);

    // Third cell only expresses two genes.
    auto& tx = data.transcripts;
    for (size_t t = 0; t < tx.size(); ++t) {
        if (tx.cell[t] == 2) {
            tx.gene[t] = tx.gene[t] % 2;
        }
    }
    data.counts = Simulator::counts(tx, 3);

    rnaflux::RnaFlux runner;
    runner.set_resolution(1).set_radius_absolute(5).set_logger(rnaflux::null_logger());
    auto res = runner.run(data);
    ASSERT_EQ(res.low_gene_cells.size(), 1);
    EXPECT_EQ(res.low_gene_cells[0], 2);

    // Cell is still used.
    EXPECT_EQ(data.flux->raster.size(), 3 * 21 * 21);
}

TEST(RnaFlux, EmptyCells) {
    Simulator sim;
    auto data = sim.dataset(3);
    data.cells.boundary[1] = rnaflux::Polygon();

    rnaflux::RnaFlux runner;
    runner.set_resolution(1).set_radius_absolute(5).set_logger(rnaflux::null_logger());
    auto res = runner.run(data);
    ASSERT_EQ(res.empty_cells.size(), 1);
    EXPECT_EQ(res.empty_cells[0], 1);

    EXPECT_EQ(data.flux->raster.size(), 2 * 21 * 21);
    auto offsets = data.flux->raster.offsets(3);
    EXPECT_EQ(offsets[1], offsets[2]);
}

TEST(RnaFlux, Errors) {
    Simulator sim;
    sim.ngenes = 4;
    auto data = sim.dataset(2);

    rnaflux::RnaFlux runner;
    runner.set_resolution(1).set_radius_absolute(5).set_logger(rnaflux::null_logger());
    EXPECT_ANY_THROW(runner.run(data));
    EXPECT_EQ(data.flux, nullptr);

    sim.ngenes = 6;
    data = sim.dataset(2);
    runner.set_min_gene_count(100000);
    EXPECT_ANY_THROW(runner.run(data));

    runner.set_min_gene_count(0).set_train_size(1.5);
    EXPECT_ANY_THROW(runner.run(data));

    runner.set_train_size(1).set_resolution(0);
    EXPECT_ANY_THROW(runner.run(data));

    runner.set_resolution(1).set_radius_absolute(-1);
    EXPECT_ANY_THROW(runner.run(data));

    runner.set_num_neighbors(0);
    EXPECT_ANY_THROW(runner.run(data));
    EXPECT_EQ(data.flux, nullptr);
}
