#ifndef RNAFLUX_SPATIAL_DATA_HPP
#define RNAFLUX_SPATIAL_DATA_HPP

#include <vector>
#include <array>
#include <string>
#include <memory>

#include "Eigen/Dense"
#include "Eigen/Sparse"
#include "tatami/tatami.hpp"

#include "Transcripts.hpp"
#include "CellShapes.hpp"
#include "RasterPoints.hpp"
#include "../geometry/Polygon.hpp"

/**
 * @file SpatialData.hpp
 *
 * @brief Container for a spatial transcriptomics dataset and its derived fields.
 */

namespace rnaflux {

/**
 * @brief Fields persisted by `RnaFlux::run()`.
 */
struct FluxState {
    /**
     * Raster points at which the flux was computed.
     * Only cells that contributed at least one raster point (and did not fail) are present.
     */
    RasterPoints raster;

    /**
     * Ordered gene vocabulary, defining the columns of `flux`.
     */
    std::vector<std::string> genes;

    /**
     * Row-major sparse matrix of flux vectors, with one row per raster point and one column per gene in `genes`.
     */
    Eigen::SparseMatrix<double, Eigen::RowMajor> flux;

    /**
     * Flux embedding as a column-major matrix with one row per component and one column per raster point.
     */
    Eigen::MatrixXd embedding;

    /**
     * Proportion of variance explained by each component of `embedding`.
     */
    std::vector<double> variance_ratio;

    /**
     * Total number of neighboring transcripts around each raster point.
     */
    std::vector<double> density;

    /**
     * RGBA color for each raster point, with all channels in [0, 1].
     */
    std::vector<std::array<double, 4> > color;

    /**
     * Hex string of the form `#rrggbbaa` for each entry of `color`.
     */
    std::vector<std::string> color_hex;

    /**
     * Neighborhood radius used for the flux, or zero if nearest neighbors were used.
     */
    double radius = 0;

    /**
     * Number of nearest neighbors used for the flux, or zero if a radius was used.
     */
    int num_neighbors = 0;

    /**
     * @return Number of embedding components.
     */
    size_t num_components() const {
        return embedding.rows();
    }
};

/**
 * @brief Polygons for a single domain label across all cells.
 */
struct DomainLayer {
    /**
     * Domain label, starting from 1.
     */
    int label = 0;

    /**
     * Geometry of this domain in each cell, indexed by cell.
     * Cells without this domain contain an empty `MultiPolygon`.
     */
    std::vector<MultiPolygon> geometry;
};

/**
 * @brief Fields persisted by `FluxMap::run()`.
 */
struct FluxMapState {
    /**
     * Number of clusters in the selected self-organizing map.
     */
    int num_clusters = 0;

    /**
     * Domain label for each raster point in `FluxState::raster`, in `[1, num_clusters]`.
     */
    std::vector<int> labels;

    /**
     * Domain polygons, one layer per label in increasing order.
     */
    std::vector<DomainLayer> domains;

    /**
     * Label of the domain polygon containing each transcript, or 0 if the transcript is not inside any domain of its cell.
     */
    std::vector<int> transcript_labels;
};

/**
 * @brief Fields persisted by `ScoreGeneSets::run()`.
 */
struct EnrichmentState {
    /**
     * Names of the gene sets that were scored.
     */
    std::vector<std::string> sources;

    /**
     * Number of target genes of each source that are present in the flux vocabulary.
     */
    std::vector<int> num_used;

    /**
     * Weighted-sum enrichment score, as a column-major matrix with one row per raster point and one column per source.
     */
    Eigen::MatrixXd estimate;

    /**
     * Permutation-normalized score, same dimensions as `estimate`.
     * Empty if no permutations were performed.
     */
    Eigen::MatrixXd norm;

    /**
     * Corrected score, defined as `estimate * -log10(pvalue)`, same dimensions as `estimate`.
     * Empty if no permutations were performed.
     */
    Eigen::MatrixXd corr;

    /**
     * Empirical p-values, same dimensions as `estimate`.
     * Empty if no permutations were performed.
     */
    Eigen::MatrixXd pvalue;

    /**
     * Number of target genes of each source in the network, including genes absent from the flux vocabulary.
     */
    std::vector<int> set_sizes;

    /**
     * Number of detected genes in each source for each cell, as a column-major matrix with one row per cell and one column per source.
     * Empty if the dataset does not contain a count matrix.
     */
    Eigen::MatrixXi coverage;
};

/**
 * @brief A spatial transcriptomics dataset.
 *
 * The transcripts, cell shapes and count matrix are inputs that are not modified by **rnaflux**,
 * except for `CellShapes::radius`, which is filled by `RnaFlux::run()` if it is not already present.
 * Each analysis step stores its results in an immutable state object that is replaced in full when the step is re-run.
 * Readers holding a pointer to a previous state object will continue to see a consistent (old) view.
 */
struct SpatialData {
    /**
     * Transcript locations.
     */
    Transcripts transcripts;

    /**
     * Cell geometries.
     */
    CellShapes cells;

    /**
     * Gene-by-cell count matrix, optional.
     * Rows should correspond to `Transcripts::gene_names` and columns to cells in `cells`.
     */
    std::shared_ptr<const tatami::Matrix<double, int> > counts;

    /**
     * Results of `RnaFlux::run()`, or `NULL` if the flux has not been computed.
     */
    std::shared_ptr<const FluxState> flux;

    /**
     * Results of `FluxMap::run()`, or `NULL` if domains have not been computed.
     */
    std::shared_ptr<const FluxMapState> fluxmap;

    /**
     * Results of `ScoreGeneSets::run()`, or `NULL` if enrichment has not been computed.
     */
    std::shared_ptr<const EnrichmentState> enrichment;
};

}

#endif
