#ifndef RNAFLUX_ERRORS_HPP
#define RNAFLUX_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file errors.hpp
 * @brief Exception types for **rnaflux**.
 */

namespace rnaflux {

/**
 * @brief No elbow was found in the quantization error curve.
 *
 * Thrown by `FluxMap::run()` when multiple candidate cluster numbers were supplied and the elbow heuristic could not choose among them.
 * No domain labels or shapes are written to the dataset in this case.
 * Callers should retry with a fixed number of clusters or a different range.
 */
class ElbowNotFound : public std::runtime_error {
public:
    /**
     * @param candidates Candidate numbers of clusters that were tested.
     */
    ElbowNotFound(std::vector<int> candidates) : 
        std::runtime_error(build_message(candidates)), 
        candidates_(std::move(candidates)) 
    {}

    /**
     * @return Candidate numbers of clusters that failed to produce an elbow.
     */
    const std::vector<int>& candidates() const {
        return candidates_;
    }

private:
    std::vector<int> candidates_;

    static std::string build_message(const std::vector<int>& candidates) {
        std::string msg = "no elbow found in the quantization error for k in {";
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (i) {
                msg += ", ";
            }
            msg += std::to_string(candidates[i]);
        }
        msg += "}, rerun with a fixed k or a different range";
        return msg;
    }
};

}

#endif
