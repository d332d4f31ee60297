#ifndef RNAFLUX_COLUMNS_HPP
#define RNAFLUX_COLUMNS_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <limits>

#include "SpatialData.hpp"

/**
 * @file columns.hpp
 *
 * @brief Mapping between typed fields and serialized column names.
 *
 * @details
 * **rnaflux** stores its results in typed state objects, but interchange with other tools uses flat tables with prefixed column names.
 * The raster point table uses one column per gene for the flux vector, `flux_embed_<i>` for each embedding component,
 * `flux_color` for the display color, `fluxmap` for the domain label and `flux_<source>` for each enrichment score.
 * Domain shapes are stored as layers named `fluxmap<label>_boundaries`.
 */

namespace rnaflux {

/**
 * Fields of the raster point table.
 */
enum class RasterField {
    FLUX,
    FLUX_EMBED,
    FLUX_COLOR,
    FLUXMAP,
    ENRICHMENT
};

/**
 * @param field A raster field.
 * @param i Index of the sub-column, e.g., the embedding component or the enrichment source.
 * Ignored for fields with a single column.
 * @param names Names of the sub-columns, used for `FLUX` (gene names) and `ENRICHMENT` (source names).
 *
 * @return Serialized column name.
 */
inline std::string column_name(RasterField field, size_t i = 0, const std::vector<std::string>* names = NULL) {
    switch (field) {
        case RasterField::FLUX:
            if (!names || i >= names->size()) {
                throw std::runtime_error("gene names are required for flux columns");
            }
            return (*names)[i];
        case RasterField::FLUX_EMBED:
            return "flux_embed_" + std::to_string(i);
        case RasterField::FLUX_COLOR:
            return "flux_color";
        case RasterField::FLUXMAP:
            return "fluxmap";
        case RasterField::ENRICHMENT:
            if (!names || i >= names->size()) {
                throw std::runtime_error("source names are required for enrichment columns");
            }
            return "flux_" + (*names)[i];
    }
    return "";
}

/**
 * @param label Domain label.
 * @return Name of the shape layer for this label.
 */
inline std::string domain_layer_name(int label) {
    return "fluxmap" + std::to_string(label) + "_boundaries";
}

/**
 * Parse the component index from a serialized embedding column name.
 * Columns are ordered numerically by this index, so `flux_embed_10` comes after `flux_embed_9`.
 *
 * @param name Column name.
 * @return Component index, or -1 if `name` is not an embedding column or its index does not fit in an `int`.
 */
inline int embedding_column_index(const std::string& name) {
    const std::string prefix = "flux_embed_";
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return -1;
    }

    int output = 0;
    for (size_t i = prefix.size(); i < name.size(); ++i) {
        char c = name[i];
        if (c < '0' || c > '9') {
            return -1;
        }
        int digit = c - '0';
        if (output > (std::numeric_limits<int>::max() - digit) / 10) {
            return -1;
        }
        output = output * 10 + digit;
    }
    return output;
}

/**
 * @param state Results of the flux calculation.
 * @return Serialized names of all columns of the raster point table, excluding the coordinates and cell identities.
 */
inline std::vector<std::string> raster_column_names(const FluxState& state) {
    std::vector<std::string> output;
    for (size_t g = 0; g < state.genes.size(); ++g) {
        output.push_back(column_name(RasterField::FLUX, g, &state.genes));
    }
    for (size_t i = 0, end = state.num_components(); i < end; ++i) {
        output.push_back(column_name(RasterField::FLUX_EMBED, i));
    }
    output.push_back(column_name(RasterField::FLUX_COLOR));
    return output;
}

}

#endif
