#include "drawing.hpp"

#include "vision/colourClassifier.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>

namespace cubescan::vision::debugging {

static const cv::Scalar HORIZONTAL_COLOUR(0, 0, 255); // Red
static const cv::Scalar VERTICAL_COLOUR(255, 0, 0);   // Blue
static const cv::Scalar POINT_COLOUR(255, 0, 255);    // Magenta

static cv::Mat toBgr(const cv::Mat& image) {
	cv::Mat bgr;
	if (image.channels() == 1) {
		cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
	} else {
		bgr = image.clone();
	}
	return bgr;
}

//! Draw a line long enough to cross the whole image.
static void drawInfiniteLine(cv::Mat& canvas, const Line& line, const cv::Scalar& colour) {
	const double extent = static_cast<double>(canvas.cols + canvas.rows);

	const cv::Point2d foot = line.normal() * line.rho;
	const cv::Point2d dir  = line.direction();

	const cv::Point p1(static_cast<int>(std::lround(foot.x + extent * dir.x)), static_cast<int>(std::lround(foot.y + extent * dir.y)));
	const cv::Point p2(static_cast<int>(std::lround(foot.x - extent * dir.x)), static_cast<int>(std::lround(foot.y - extent * dir.y)));
	cv::line(canvas, p1, p2, colour, 2);
}

cv::Mat drawLines(const cv::Mat& image, const std::vector<Line>& lines, const cv::Scalar& colour) {
	cv::Mat drawnLines = toBgr(image);
	for (const auto& line : lines) {
		drawInfiniteLine(drawnLines, line, colour);
	}
	return drawnLines;
}

cv::Mat drawGridLines(const cv::Mat& image, const std::vector<GridLine>& horizontal, const std::vector<GridLine>& vertical) {
	cv::Mat drawnLines = toBgr(image);
	for (const auto& gridLine : horizontal) {
		drawInfiniteLine(drawnLines, gridLine.line, HORIZONTAL_COLOUR);
	}
	for (const auto& gridLine : vertical) {
		drawInfiniteLine(drawnLines, gridLine.line, VERTICAL_COLOUR);
	}
	return drawnLines;
}

cv::Mat drawPoints(const cv::Mat& image, const GridPoints& points) {
	cv::Mat drawnPoints = toBgr(image);
	for (const auto& p : points) {
		cv::circle(drawnPoints, cv::Point(static_cast<int>(p.x), static_cast<int>(p.y)), 3, POINT_COLOUR, -1);
	}
	return drawnPoints;
}

cv::Mat drawSamples(const cv::Mat& image, const GridPoints& points, const FaceColours& colours, int radius) {
	cv::Mat drawnSamples = drawPoints(image, points);
	for (std::size_t i = 0; i < points.size(); ++i) {
		const cv::Point centre(static_cast<int>(points[i].x), static_cast<int>(points[i].y));
		const cv::Vec3b ref = referenceColour(colours[i]);

		// Black outline keeps white/yellow patches visible.
		cv::rectangle(drawnSamples, centre - cv::Point(radius, radius), centre + cv::Point(radius, radius), cv::Scalar(0, 0, 0), 4);
		cv::rectangle(drawnSamples, centre - cv::Point(radius, radius), centre + cv::Point(radius, radius), cv::Scalar(ref[0], ref[1], ref[2]), 2);
	}
	return drawnSamples;
}

} // namespace cubescan::vision::debugging
