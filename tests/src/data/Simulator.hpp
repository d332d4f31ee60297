#ifndef RNAFLUXTEST_SIMULATOR_HPP
#define RNAFLUXTEST_SIMULATOR_HPP

#include <vector>
#include <string>
#include <random>
#include <memory>
#include "tatami/tatami.hpp"

#include "rnaflux/data/SpatialData.hpp"

inline rnaflux::Polygon make_square(double x0, double y0, double side) {
    rnaflux::Polygon output;
    output.exterior = rnaflux::Ring{ { x0, y0 }, { x0 + side, y0 }, { x0 + side, y0 + side }, { x0, y0 + side } };
    return output;
}

struct Simulator {
    size_t seed = 1234567890;

    // Each cell is a square of this side length, placed side by side along the x-axis with a gap.
    double side = 20;
    double gap = 10;

    int ngenes = 6;
    int per_cell = 200;

    // Probability that a transcript of the first half of the genes is placed in the left half of its cell,
    // and vice versa for the second half of the genes. A value of 0.5 gives uniformly distributed genes.
    double polarization = 0.5;

    // Number of transcripts that lie outside of any cell.
    int extracellular = 0;

    rnaflux::SpatialData dataset(int ncells) const {
        rnaflux::SpatialData output;
        std::mt19937_64 rng(seed);
        std::uniform_real_distribution<> unif(0, 1);
        std::uniform_int_distribution<> gene_dist(0, ngenes - 1);

        auto& tx = output.transcripts;
        for (int g = 0; g < ngenes; ++g) {
            tx.gene_names.push_back("gene" + std::to_string(g));
        }

        for (int c = 0; c < ncells; ++c) {
            double x0 = c * (side + gap);
            output.cells.push_back("cell" + std::to_string(c), make_square(x0, 0, side));

            for (int t = 0; t < per_cell; ++t) {
                int g = gene_dist(rng);
                bool first_half = (g < ngenes / 2);
                bool left = (unif(rng) < polarization) == first_half;
                double x = x0 + (left ? 0 : side / 2) + unif(rng) * side / 2;
                double y = unif(rng) * side;
                tx.push_back(c, g, x, y);
            }
        }

        for (int t = 0; t < extracellular; ++t) {
            tx.push_back(-1, gene_dist(rng), -100 * unif(rng) - 1, unif(rng) * side);
        }

        output.counts = counts(tx, ncells);
        return output;
    }

    static std::shared_ptr<const tatami::Matrix<double, int> > counts(const rnaflux::Transcripts& tx, int ncells) {
        size_t ngenes = tx.gene_names.size();
        std::vector<double> values(ngenes * ncells);
        for (size_t t = 0; t < tx.size(); ++t) {
            if (tx.cell[t] >= 0) {
                values[static_cast<size_t>(tx.gene[t]) * ncells + tx.cell[t]] += 1;
            }
        }
        return std::shared_ptr<const tatami::Matrix<double, int> >(new tatami::DenseRowMatrix<double, int>(ngenes, ncells, std::move(values)));
    }
};

#endif
