#ifndef RNAFLUX_GENE_SET_COVERAGE_HPP
#define RNAFLUX_GENE_SET_COVERAGE_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <string>
#include <unordered_map>
#include <stdexcept>

#include "Eigen/Dense"
#include "tatami/tatami.hpp"

#include "GeneSetNetwork.hpp"

/**
 * @file GeneSetCoverage.hpp
 *
 * @brief Count the detected genes of each gene set in each cell.
 */

namespace rnaflux {

/**
 * @brief Count the detected genes of each gene set in each cell.
 *
 * A gene is considered to be detected in a cell if its count is at least `set_min_count()`.
 * For each cell and gene set, we report the number of detected genes that are targets of that set.
 * This is useful for judging whether an enrichment score in a cell is supported by enough genes.
 */
class GeneSetCoverage {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_min_count()` for details.
         */
        static constexpr double min_count = 5;

        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;
    };

private:
    double min_count = Defaults::min_count;
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param m Minimum count for a gene to be detected in a cell.
     *
     * @return A reference to this `GeneSetCoverage` object.
     */
    GeneSetCoverage& set_min_count(double m = Defaults::min_count) {
        min_count = m;
        return *this;
    }

    /**
     * @param n Number of threads to use.
     * @return A reference to this `GeneSetCoverage` object.
     */
    GeneSetCoverage& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

public:
    /**
     * @param counts Pointer to a gene-by-cell count matrix.
     * @param gene_names Names of the rows of `counts`.
     * @param network Gene set network.
     * @param sources Names of the sources to report.
     *
     * @return Column-major matrix with one row per cell and one column per entry of `sources`.
     */
    Eigen::MatrixXi run(const tatami::Matrix<double, int>* counts, const std::vector<std::string>& gene_names, const GeneSetNetwork& network, const std::vector<std::string>& sources) const {
        int NR = counts->nrow();
        if (static_cast<size_t>(NR) != gene_names.size()) {
            throw std::runtime_error("number of rows in the count matrix should be equal to the number of gene names");
        }

        std::unordered_map<std::string, int> gene_index, source_index;
        for (int g = 0; g < NR; ++g) {
            gene_index[gene_names[g]] = g;
        }
        for (size_t s = 0; s < sources.size(); ++s) {
            source_index[sources[s]] = s;
        }

        // Sets of row indices for each source; targets absent from the matrix are never detected.
        std::vector<std::vector<int> > members(sources.size());
        for (size_t e = 0, end = network.size(); e < end; ++e) {
            auto sIt = source_index.find(network.source[e]);
            auto gIt = gene_index.find(network.target[e]);
            if (sIt != source_index.end() && gIt != gene_index.end()) {
                members[sIt->second].push_back(gIt->second);
            }
        }

        int NC = counts->ncol();
        Eigen::MatrixXi output = Eigen::MatrixXi::Zero(NC, sources.size());

        tatami::parallelize([&](size_t, int start, int length) -> void {
            auto ext = tatami::consecutive_extractor<false, false>(counts, start, length);
            std::vector<double> buffer(NR);
            for (int c = start, end = start + length; c < end; ++c) {
                auto ptr = ext->fetch(c, buffer.data());
                for (size_t s = 0; s < members.size(); ++s) {
                    int detected = 0;
                    for (auto g : members[s]) {
                        detected += (ptr[g] >= min_count);
                    }
                    output(c, s) = detected;
                }
            }
        }, NC, nthreads);

        return output;
    }
};

}

#endif
