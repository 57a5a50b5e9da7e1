#pragma once

#include "vision/result.hpp"
#include "vision/scanConfig.hpp"
#include "vision/types.hpp"

#include <opencv2/core/types.hpp>

namespace cubescan::vision {

//! Lines through the cell centres: midline k lies halfway between grid lines k and k+1.
CentreLines findCentreLines(const GridLines& gridLines);

//! Intersection of two lines. DegenerateGeometry if |sin| of their angle is below minDeterminant.
Result<cv::Point2d> intersect(const Line& a, const Line& b, double minDeterminant);

/*! Cell centres as intersections of the horizontal and vertical centre lines.
 * \param [in] horizontal Centre lines ordered top to bottom.
 * \param [in] vertical   Centre lines ordered left to right.
 * \param [in] imageSize  All points must lie inside.
 * \return     Row-major points (index = 3 * row + column) or DegenerateGeometry / OutOfBounds.
 */
Result<GridPoints> findCentrePoints(const CentreLines& horizontal, const CentreLines& vertical, const cv::Size& imageSize, const GridConfig& config);

} // namespace cubescan::vision
