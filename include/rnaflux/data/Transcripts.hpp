#ifndef RNAFLUX_TRANSCRIPTS_HPP
#define RNAFLUX_TRANSCRIPTS_HPP

#include <vector>
#include <string>
#include <stdexcept>

/**
 * @file Transcripts.hpp
 *
 * @brief Table of detected transcripts.
 */

namespace rnaflux {

/**
 * @brief Struct-of-arrays table of transcript locations.
 *
 * Each transcript is a single detected RNA molecule with a 2-dimensional position and a gene identity.
 * Gene identities are categorical codes into `gene_names`, so the order of `gene_names` defines the order of the gene vocabulary.
 * Cell assignments are indices into the associated `CellShapes` table,
 * where a negative value indicates that the transcript does not lie inside any cell.
 */
struct Transcripts {
    /**
     * Index of the cell containing each transcript, or -1 for extracellular transcripts.
     */
    std::vector<int> cell;

    /**
     * Gene code for each transcript, indexing into `gene_names`.
     */
    std::vector<int> gene;

    /**
     * x-coordinate of each transcript.
     */
    std::vector<double> x;

    /**
     * y-coordinate of each transcript.
     */
    std::vector<double> y;

    /**
     * Names of the gene categories, in category order.
     */
    std::vector<std::string> gene_names;

    /**
     * @return Number of transcripts.
     */
    size_t size() const {
        return x.size();
    }

    /**
     * Add a transcript to the table.
     *
     * @param c Cell index, or -1 for none.
     * @param g Gene code.
     * @param x_ x-coordinate.
     * @param y_ y-coordinate.
     */
    void push_back(int c, int g, double x_, double y_) {
        cell.push_back(c);
        gene.push_back(g);
        x.push_back(x_);
        y.push_back(y_);
    }

    /**
     * Check that all columns are of the same length and that gene codes are valid.
     * An error is raised otherwise.
     */
    void validate() const {
        size_t n = x.size();
        if (y.size() != n || cell.size() != n || gene.size() != n) {
            throw std::runtime_error("all columns of the transcript table should have the same length");
        }

        int ngenes = gene_names.size();
        for (auto g : gene) {
            if (g < 0 || g >= ngenes) {
                throw std::runtime_error("gene codes should lie in [0, number of gene names)");
            }
        }
    }

    /**
     * Group transcripts by cell.
     * Transcripts outside of any cell, or assigned to a cell index not less than `ncells`, are ignored.
     *
     * @param ncells Number of cells in the associated `CellShapes`.
     * @return Vector of length `ncells`, containing the indices of the transcripts in each cell.
     */
    std::vector<std::vector<int> > by_cell(size_t ncells) const {
        std::vector<std::vector<int> > output(ncells);
        for (size_t t = 0, end = cell.size(); t < end; ++t) {
            auto c = cell[t];
            if (c >= 0 && static_cast<size_t>(c) < ncells) {
                output[c].push_back(t);
            }
        }
        return output;
    }
};

}

#endif
