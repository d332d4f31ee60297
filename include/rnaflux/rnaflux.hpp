#ifndef RNAFLUX_RNAFLUX_UMBRELLA_HPP
#define RNAFLUX_RNAFLUX_UMBRELLA_HPP

#include "utils/macros.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

#include "data/Transcripts.hpp"
#include "data/CellShapes.hpp"
#include "data/RasterPoints.hpp"
#include "data/SpatialData.hpp"
#include "data/columns.hpp"

#include "geometry/Polygon.hpp"
#include "geometry/RasterizeCells.hpp"
#include "geometry/TraceLabelImage.hpp"

#include "neighbors/GridIndex.hpp"
#include "neighbors/CountNeighbors.hpp"

#include "flux/CellComposition.hpp"
#include "flux/TruncatedSvd.hpp"
#include "flux/FluxColor.hpp"
#include "flux/RnaFlux.hpp"

#include "fluxmap/SelfOrganizingMap.hpp"
#include "fluxmap/FindElbow.hpp"
#include "fluxmap/VectorizeDomains.hpp"
#include "fluxmap/FluxMap.hpp"

#include "enrichment/GeneSetNetwork.hpp"
#include "enrichment/GeneSetCoverage.hpp"
#include "enrichment/ScoreGeneSets.hpp"

/**
 * @file rnaflux.hpp
 * @brief Umbrella header for all **rnaflux** functionality.
 */

/**
 * @namespace rnaflux
 * @brief Subcellular RNA localization analyses for spatial transcriptomics.
 */
namespace rnaflux {}

#endif
