#pragma once

#include "vision/lineDetector.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace cubescan::vision::gtest {

//! Ideal 3x3 face in image coordinates.
struct FaceGeometry {
	cv::Point2d centre;
	double cellSize;
	double angle; //!< Rotation (radians, clockwise on screen) about the centre.
};

//! Boundary lines of the face. Each boundary is reported `copies` times, neighbouring copies `spread` pixels apart.
std::vector<Line> faceLines(const FaceGeometry& face, int copies = 3, double spread = 2.0);

//! Only the first `boundaries` boundaries (0..4) of each orientation.
std::vector<Line> partialFaceLines(const FaceGeometry& face, int boundaries, int copies = 3, double spread = 2.0);

//! Expected centre of cell (row, col).
cv::Point2d cellCentre(const FaceGeometry& face, std::size_t row, std::size_t col);

//! Face photo stand-in: squares of the given colours separated by black gaps on a black background.
cv::Mat drawFace(const FaceColours& colours, int cellSize = 100, int gap = 12, int margin = 60);

//! Detector returning a fixed set of lines for an empty edge map of the image size.
class MockLineDetector : public ILineDetector {
public:
	explicit MockLineDetector(std::vector<Line> lines);

	cv::Mat detectEdges(const cv::Mat& image) const override;
	std::vector<Line> detectLines(const cv::Mat& edges) const override;

private:
	std::vector<Line> m_lines;
};

} // namespace cubescan::vision::gtest
