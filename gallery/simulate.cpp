#include "rnaflux/rnaflux.hpp"
#include "spdlog/spdlog.h"
#include <iostream>
#include <random>
#include <string>

/**
 * Runs the full analysis on a mocked-up dataset of square cells, where each
 * half of the genes is enriched on one side of the cell. It can be run with:
 *
 * ./build/rnaflux_simulate 4 1000
 *
 * to use 4 threads and a seed of 1000 for the simulation.
 */

int main(int argc, char * argv[]) {
    if (argc < 3) {
        std::cerr << "COMMAND [Threads] [seed]" << std::endl;
        return 1;
    }

    int nthreads = std::stoi(std::string(argv[1]));
    int seed = std::stoi(std::string(argv[2]));
    spdlog::set_level(spdlog::level::info);

    // Mock up the cells and their transcripts.
    int ncells = 20, ngenes = 10, per_cell = 500;
    double side = 20;

    rnaflux::SpatialData data;
    for (int g = 0; g < ngenes; ++g) {
        data.transcripts.gene_names.push_back("gene" + std::to_string(g));
    }

    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<> udist;
    std::uniform_int_distribution<> gdist(0, ngenes - 1);

    for (int c = 0; c < ncells; ++c) {
        double x0 = (c % 5) * side * 1.5, y0 = (c / 5) * side * 1.5;
        rnaflux::Polygon boundary;
        boundary.exterior = rnaflux::Ring{ { x0, y0 }, { x0 + side, y0 }, { x0 + side, y0 + side }, { x0, y0 + side } };
        data.cells.push_back("cell" + std::to_string(c), std::move(boundary));

        for (int t = 0; t < per_cell; ++t) {
            int g = gdist(rng);
            bool left = (udist(rng) < 0.8) == (g < ngenes / 2);
            double x = x0 + (left ? 0 : side / 2) + udist(rng) * side / 2;
            data.transcripts.push_back(c, g, x, y0 + udist(rng) * side);
        }
    }

    try {
        auto flux_res = rnaflux::RnaFlux().set_resolution(0.5).set_num_threads(nthreads).run(data);
        std::cout << "Computed the flux for " << data.flux->raster.size() << " raster points, skipping "
            << flux_res.failed_cells.size() << " cells" << std::endl;

        std::cout << "Variance explained by each component is ";
        for (size_t i = 0; i < data.flux->variance_ratio.size(); ++i) {
            if (i) {
                std::cout << ", ";
            }
            std::cout << data.flux->variance_ratio[i];
        }
        std::cout << std::endl;

        rnaflux::FluxMap fluxmap;
        fluxmap.set_num_threads(nthreads);
        rnaflux::FluxMap::Results map_res;
        try {
            map_res = fluxmap.run(data);
        } catch (rnaflux::ElbowNotFound& e) {
            std::cerr << e.what() << std::endl;
            map_res = fluxmap.set_num_clusters(3).run(data);
        }
        std::cout << "Detected " << map_res.best_k << " domains" << std::endl;

        rnaflux::GeneSetNetwork network;
        for (int g = 0; g < ngenes; ++g) {
            network.push_back(g < ngenes / 2 ? "left" : "right", data.transcripts.gene_names[g]);
        }
        rnaflux::ScoreGeneSets().set_num_threads(nthreads).run(data, network);

        const auto& enrichment = *(data.enrichment);
        for (size_t s = 0; s < enrichment.sources.size(); ++s) {
            std::cout << "Mean score for '" << rnaflux::column_name(rnaflux::RasterField::ENRICHMENT, s, &enrichment.sources)
                << "' is " << enrichment.norm.col(s).mean() << std::endl;
        }
    } catch (std::exception& e) {
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
