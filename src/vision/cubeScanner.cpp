#include "vision/cubeScanner.hpp"

#include "vision/colourClassifier.hpp"
#include "vision/gridSolver.hpp"
#include "vision/lineClassifier.hpp"
#include "vision/lineMerger.hpp"

#include "Logging.hpp"
#include "drawing.hpp"

#include <format>

namespace cubescan::vision {

//! Ends the scan with the given error.
static ScanOutput failed(ScanError error, IntermediateImages images, const char* stage) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[CubeScanner] Scan failed in {}: {}.", stage, toString(error)));
	return {error, std::move(images)};
}

CubeScanner::CubeScanner(ScanConfig config) : CubeScanner(config, std::make_unique<HoughLineDetector>(config.edges, config.hough)) {
}

CubeScanner::CubeScanner(ScanConfig config, std::unique_ptr<ILineDetector> detector) : m_config(config), m_detector(std::move(detector)) {
	CV_Assert(m_detector != nullptr);
}

const ScanConfig& CubeScanner::config() const {
	return m_config;
}

ScanOutput CubeScanner::scan(const cv::Mat& image, uint32_t imageMask) const {
	CV_Assert(!image.empty() && image.type() == CV_8UC3);

	IntermediateImages images{};

	// 1. Edges and raw lines
	const cv::Mat edges = m_detector->detectEdges(image);
	if (imageMask & DI_Edges)
		images.edges = edges.clone();

	const std::vector<Line> lines = m_detector->detectLines(edges);
	if (imageMask & DI_Lines)
		images.lines = debugging::drawLines(image, lines);

	// 2. Horizontal and vertical families
	const auto orthogonal = classifyOrthogonal(lines, m_config.classifier);
	if (!orthogonal) {
		return failed(orthogonal.error(), std::move(images), "line classification");
	}
	const auto& families = orthogonal.value();
	if (imageMask & DI_OrthogonalLines) {
		images.orthogonalLines = debugging::drawLines(image, families.horizontal.lines());
		images.orthogonalLines = debugging::drawLines(images.orthogonalLines, families.vertical.lines(), cv::Scalar(255, 0, 0));
	}

	// 3. Merge to 4 grid lines per family
	std::vector<GridLine> horizontalClusters, verticalClusters;
	const auto horizontal = mergeLines(families.horizontal, m_config.merge, &horizontalClusters);
	const auto vertical   = mergeLines(families.vertical, m_config.merge, &verticalClusters);
	if (imageMask & DI_CombinedLines)
		images.combinedLines = debugging::drawGridLines(image, horizontalClusters, verticalClusters);

	if (!horizontal) {
		return failed(horizontal.error(), std::move(images), "horizontal line merge");
	}
	if (!vertical) {
		return failed(vertical.error(), std::move(images), "vertical line merge");
	}

	// 4. Cell centres
	const CentreLines horizontalCentres = findCentreLines(horizontal.value());
	const CentreLines verticalCentres   = findCentreLines(vertical.value());
	if (imageMask & DI_CentreLines) {
		images.centreLines = debugging::drawGridLines(image, {horizontalCentres.begin(), horizontalCentres.end()},
		                                              {verticalCentres.begin(), verticalCentres.end()});
	}

	const auto points = findCentrePoints(horizontalCentres, verticalCentres, image.size(), m_config.grid);
	if (!points) {
		return failed(points.error(), std::move(images), "grid solver");
	}

	// 5. Colours
	const FaceColours colours = classifyFace(image, points.value(), m_config.sample);
	if (imageMask & DI_CentrePoints)
		images.centrePoints = debugging::drawSamples(image, points.value(), colours, m_config.sample.sampleRadius);

	Logger().Log(Logging::LogLevel::Info, std::format("[CubeScanner] Scanned face:\n{}", formatFace(colours)));
	return {colours, std::move(images)};
}

} // namespace cubescan::vision
