#include "vision/gridSolver.hpp"

#include "Logging.hpp"

#include <cmath>
#include <format>

namespace cubescan::vision {

CentreLines findCentreLines(const GridLines& gridLines) {
	CentreLines centres{};
	for (std::size_t k = 0; k < FACE_SIZE; ++k) {
		const auto& first  = gridLines[k];
		const auto& second = gridLines[k + 1];

		const double offset = 0.5 * (first.offset + second.offset);
		const double angle  = 0.5 * (first.angle + second.angle);
		centres[k]          = {Line{offset, angle}.canonical(), offset, angle, first.support + second.support};
	}
	return centres;
}

Result<cv::Point2d> intersect(const Line& a, const Line& b, double minDeterminant) {
	const double cosA = std::cos(a.theta);
	const double sinA = std::sin(a.theta);
	const double cosB = std::cos(b.theta);
	const double sinB = std::sin(b.theta);

	const double det = cosA * sinB - sinA * cosB;
	if (!(std::abs(det) >= minDeterminant)) {
		return ScanError::DegenerateGeometry;
	}

	return cv::Point2d{(sinB * a.rho - sinA * b.rho) / det, (cosA * b.rho - cosB * a.rho) / det};
}

Result<GridPoints> findCentrePoints(const CentreLines& horizontal, const CentreLines& vertical, const cv::Size& imageSize, const GridConfig& config) {
	auto logger = Logger();

	GridPoints points{};
	for (std::size_t row = 0; row < FACE_SIZE; ++row) {
		for (std::size_t col = 0; col < FACE_SIZE; ++col) {
			const auto point = intersect(horizontal[row].line, vertical[col].line, config.minIntersectionDeterminant);
			if (!point) {
				logger.Log(Logging::LogLevel::Warning, std::format("[GridSolver] Centre lines of cell ({}, {}) are parallel.", row, col));
				return point.error();
			}

			const auto& p = point.value();
			if (!(p.x >= 0.0 && p.x < imageSize.width && p.y >= 0.0 && p.y < imageSize.height)) {
				logger.Log(Logging::LogLevel::Warning, std::format("[GridSolver] Cell ({}, {}) centre ({:.1f}, {:.1f}) outside of {}x{} image.", row, col, p.x, p.y,
				                                                   imageSize.width, imageSize.height));
				return ScanError::OutOfBounds;
			}
			points[FACE_SIZE * row + col] = p;
		}
	}
	return points;
}

} // namespace cubescan::vision
