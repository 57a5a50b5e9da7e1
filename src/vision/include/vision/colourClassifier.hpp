#pragma once

#include "vision/scanConfig.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <array>
#include <string>
#include <string_view>

namespace cubescan::vision {

//! Closest reference colour of a sample.
struct ColourMatch {
	CubeColour colour;
	double distance; //!< CIE76 distance (euclidean in L*a*b*).
};

using FaceSamples = std::array<ColourSample, FACELET_COUNT>;

std::string_view toString(CubeColour colour); //!< Lower case name, e.g. "orange".
char colourInitial(CubeColour colour);        //!< Upper case initial, e.g. 'O'.

//! 3 lines of 3 space separated colour names.
std::string formatFace(const FaceColours& colours);

cv::Vec3b referenceColour(CubeColour colour); //!< BGR reference of a face colour.
cv::Vec3d toLab(const cv::Vec3d& bgr);        //!< BGR in [0, 255] to CIE L*a*b*.

//! Reference colour closest to a L*a*b* value.
//! \note Distances equal within 1e-9 resolve to the colour declared first in CubeColour.
ColourMatch nearestColour(const cv::Vec3d& lab);

//! Root mean square colour of the square patch of the given radius around point (clipped to the image).
ColourSample sampleColour(const cv::Mat& image, const GridPoint& point, int radius);

/*! Classify all facelets of a face.
 * \param [in]  image   BGR image the points were detected in.
 * \param [in]  points  Cell centres inside the image.
 * \param [out] samples Optional. Receives the averaged colour of every cell.
 * \note        Never fails. Every sample is assigned its nearest reference colour.
 */
FaceColours classifyFace(const cv::Mat& image, const GridPoints& points, const SampleConfig& config, FaceSamples* samples = nullptr);

} // namespace cubescan::vision
