#ifndef RNAFLUX_CELL_COMPOSITION_HPP
#define RNAFLUX_CELL_COMPOSITION_HPP

#include "../utils/macros.hpp"

#include <vector>
#include <numeric>
#include <stdexcept>

#include "Eigen/Dense"
#include "tatami/tatami.hpp"

#include "../data/Transcripts.hpp"

/**
 * @file CellComposition.hpp
 *
 * @brief Compute the gene composition of each cell.
 */

namespace rnaflux {

/**
 * @brief Compute the gene composition of each cell.
 *
 * The composition of a cell is the vector of relative abundances of each gene, i.e., the counts divided by the total count for that cell.
 * Cells with a total count of zero are assigned a composition of all zeros rather than NaNs.
 * Counts can be obtained from a gene-by-cell count matrix or tallied directly from the transcripts.
 */
class CellComposition {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_num_threads()` for details.
         */
        static constexpr int num_threads = 1;
    };

private:
    int nthreads = Defaults::num_threads;

public:
    /**
     * @param n Number of threads to use.
     * @return A reference to this `CellComposition` object.
     */
    CellComposition& set_num_threads(int n = Defaults::num_threads) {
        nthreads = n;
        return *this;
    }

    /**
     * Normalize each column of a count matrix to sum to unity.
     * Columns with a sum of zero are left as zeros.
     *
     * @param counts Gene-by-cell matrix of counts, modified in place.
     */
    static void normalize(Eigen::MatrixXd& counts) {
        for (Eigen::Index c = 0, end = counts.cols(); c < end; ++c) {
            auto col = counts.col(c);
            double total = col.sum();
            if (total != 0) {
                col /= total;
            }
        }
    }

public:
    /**
     * @param counts Pointer to a gene-by-cell count matrix.
     * @param genes Rows of `counts` to use, defining the gene vocabulary.
     *
     * @return Column-major matrix of compositions, with one row per entry of `genes` and one column per cell.
     */
    Eigen::MatrixXd run(const tatami::Matrix<double, int>* counts, const std::vector<int>& genes) const {
        int NR = counts->nrow();
        for (auto g : genes) {
            if (g < 0 || g >= NR) {
                throw std::runtime_error("gene indices should lie within the rows of the count matrix");
            }
        }

        int NC = counts->ncol();
        Eigen::MatrixXd output(genes.size(), NC);

        tatami::parallelize([&](size_t, int start, int length) -> void {
            auto ext = tatami::consecutive_extractor<false, false>(counts, start, length);
            std::vector<double> buffer(NR);
            for (int c = start, end = start + length; c < end; ++c) {
                auto ptr = ext->fetch(c, buffer.data());
                auto col = output.col(c);
                for (size_t g = 0, gend = genes.size(); g < gend; ++g) {
                    col[g] = ptr[genes[g]];
                }
            }
        }, NC, nthreads);

        normalize(output);
        return output;
    }

    /**
     * @param transcripts Table of transcripts.
     * @param genes Gene codes to use, defining the gene vocabulary.
     * @param ncells Number of cells.
     * Transcripts outside of `[0, ncells)` or with genes not in `genes` are ignored.
     *
     * @return Column-major matrix of compositions, with one row per entry of `genes` and one column per cell.
     */
    Eigen::MatrixXd run(const Transcripts& transcripts, const std::vector<int>& genes, size_t ncells) const {
        std::vector<int> remap(transcripts.gene_names.size(), -1);
        for (size_t g = 0, end = genes.size(); g < end; ++g) {
            remap[genes[g]] = g;
        }

        Eigen::MatrixXd output = Eigen::MatrixXd::Zero(genes.size(), ncells);
        for (size_t t = 0, end = transcripts.size(); t < end; ++t) {
            auto c = transcripts.cell[t];
            if (c < 0 || static_cast<size_t>(c) >= ncells) {
                continue;
            }
            auto g = remap[transcripts.gene[t]];
            if (g >= 0) {
                output(g, c) += 1;
            }
        }

        normalize(output);
        return output;
    }
};

}

#endif
