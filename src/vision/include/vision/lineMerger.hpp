#pragma once

#include "vision/result.hpp"
#include "vision/scanConfig.hpp"
#include "vision/types.hpp"

#include <vector>

namespace cubescan::vision {

//! Greedy 1D clustering of family members by offset. Neighbours (in offset order) closer than mergeDistance share a cluster.
//! \return Cluster representatives (mean offset and mean aligned angle) in ascending offset order.
std::vector<GridLine> clusterByOffset(const LineFamily& family, double mergeDistance);

/*! Collapse the family into the 4 grid boundary lines.
 * If more than 4 clusters remain, the merge distance is relaxed (config.mergeRelaxationFactor) up to config.maxMergeRelaxations times.
 * \param [in]  family   Lines of one orientation.
 * \param [in]  config   Merge distance and relaxation policy.
 * \param [out] clusters Optional. Receives the clusters of the last attempt, also on failure.
 * \return      4 grid lines ordered by offset or WrongLineCount.
 */
Result<GridLines> mergeLines(const LineFamily& family, const MergeConfig& config, std::vector<GridLine>* clusters = nullptr);

} // namespace cubescan::vision
