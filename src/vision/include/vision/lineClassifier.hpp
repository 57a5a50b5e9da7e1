#pragma once

#include "vision/result.hpp"
#include "vision/scanConfig.hpp"
#include "vision/types.hpp"

#include <vector>

namespace cubescan::vision {

//! Raw lines split into the two dominant, roughly orthogonal orientations of the face.
struct OrthogonalLines {
	LineFamily horizontal;       //!< Offsets increase from top to bottom.
	LineFamily vertical;         //!< Offsets increase from left to right.
	std::vector<Line> discarded; //!< Lines not close to either orientation.
};

/*! Find the two dominant line orientations roughly 90 degrees apart and assign every line to the closer one.
 *
 * The face may be rotated in the image, so orientations are discovered from an axial angle histogram instead of
 * assuming image axes. The pair of histogram bins ~90 degrees apart with the largest combined support wins.
 *
 * \param [in] lines  Raw line detections.
 * \param [in] config Histogram resolution and tolerances.
 * \return     Both families or InsufficientLines / NotOrthogonal.
 */
Result<OrthogonalLines> classifyOrthogonal(const std::vector<Line>& lines, const ClassifierConfig& config);

} // namespace cubescan::vision
