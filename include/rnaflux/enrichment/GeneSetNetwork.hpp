#ifndef RNAFLUX_GENE_SET_NETWORK_HPP
#define RNAFLUX_GENE_SET_NETWORK_HPP

#include <vector>
#include <string>
#include <map>
#include <set>
#include <utility>
#include <stdexcept>

/**
 * @file GeneSetNetwork.hpp
 *
 * @brief Weighted network of gene sets.
 */

namespace rnaflux {

/**
 * @brief Weighted network of gene sets.
 *
 * Each edge links a source (i.e., a gene set, such as a subcellular compartment) to a target gene with a weight.
 * Each source-target pair should occur at most once.
 */
struct GeneSetNetwork {
    /**
     * Name of the source of each edge.
     */
    std::vector<std::string> source;

    /**
     * Name of the target gene of each edge.
     */
    std::vector<std::string> target;

    /**
     * Weight of each edge.
     */
    std::vector<double> weight;

    /**
     * @return Number of edges.
     */
    size_t size() const {
        return source.size();
    }

    /**
     * @param s Source name.
     * @param t Target gene name.
     * @param w Weight.
     */
    void push_back(std::string s, std::string t, double w = 1) {
        source.push_back(std::move(s));
        target.push_back(std::move(t));
        weight.push_back(w);
    }

    /**
     * Check that all columns are of the same length and that there are no duplicated edges.
     * An error is raised otherwise.
     */
    void validate() const {
        size_t n = source.size();
        if (target.size() != n || weight.size() != n) {
            throw std::runtime_error("all columns of the gene set network should have the same length");
        }

        std::set<std::pair<std::string, std::string> > seen;
        for (size_t e = 0; e < n; ++e) {
            if (!seen.insert(std::make_pair(source[e], target[e])).second) {
                throw std::runtime_error("duplicated edge from '" + source[e] + "' to '" + target[e] + "' in the gene set network");
            }
        }
    }

    /**
     * @return Edge indices for each source, with sources sorted by name.
     */
    std::map<std::string, std::vector<size_t> > by_source() const {
        std::map<std::string, std::vector<size_t> > output;
        for (size_t e = 0, end = source.size(); e < end; ++e) {
            output[source[e]].push_back(e);
        }
        return output;
    }
};

}

#endif
