#pragma once

#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace cubescan::vision::debugging {

//! Copy of the image (converted to BGR) with the lines drawn across it.
cv::Mat drawLines(const cv::Mat& image, const std::vector<Line>& lines, const cv::Scalar& colour = cv::Scalar(0, 0, 255));

//! Copy of the image with the grid lines of both families drawn across it.
cv::Mat drawGridLines(const cv::Mat& image, const std::vector<GridLine>& horizontal, const std::vector<GridLine>& vertical);

//! Copy of the image with filled circles at the points.
cv::Mat drawPoints(const cv::Mat& image, const GridPoints& points);

//! Copy of the image with the sample patches outlined in their classified colour.
cv::Mat drawSamples(const cv::Mat& image, const GridPoints& points, const FaceColours& colours, int radius);

} // namespace cubescan::vision::debugging
