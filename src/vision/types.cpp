#include "vision/types.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cubescan::vision {

//! Express the line with an angle within pi/2 of the reference (flips rho when the angle moves by pi).
static Line alignTo(const Line& line, double reference) {
	double theta = line.theta;
	double rho   = line.rho;

	while (theta - reference > CV_PI / 2) {
		theta -= CV_PI;
		rho = -rho;
	}
	while (theta - reference <= -CV_PI / 2) {
		theta += CV_PI;
		rho = -rho;
	}
	return {rho, theta};
}

Line Line::fromPoints(const cv::Point2d& p1, const cv::Point2d& p2) {
	const cv::Point2d d = p2 - p1;
	const double length = std::hypot(d.x, d.y);
	if (length <= 0.0) {
		throw std::invalid_argument("Line requires two distinct points.");
	}

	const cv::Point2d n(-d.y / length, d.x / length);
	return Line{n.dot(p1), std::atan2(n.y, n.x)}.canonical();
}

Line Line::canonical() const {
	double t = theta;
	double r = rho;
	while (t < 0.0) {
		t += CV_PI;
		r = -r;
	}
	while (t >= CV_PI) {
		t -= CV_PI;
		r = -r;
	}
	return {r, t};
}

cv::Point2d Line::normal() const {
	return {std::cos(theta), std::sin(theta)};
}

cv::Point2d Line::direction() const {
	return {-std::sin(theta), std::cos(theta)};
}

double angularDistance(double a, double b) {
	const double d = std::fmod(std::abs(a - b), CV_PI);
	return std::min(d, CV_PI - d);
}

LineFamily::LineFamily(std::vector<Line> lines, double referenceAngle) : m_lines(std::move(lines)), m_referenceAngle(referenceAngle) {
	if (m_lines.empty()) {
		throw std::invalid_argument("LineFamily must contain at least one line.");
	}
}

const std::vector<Line>& LineFamily::lines() const {
	return m_lines;
}

double LineFamily::referenceAngle() const {
	return m_referenceAngle;
}

std::size_t LineFamily::size() const {
	return m_lines.size();
}

double LineFamily::offsetOf(const Line& line) const {
	return alignTo(line, m_referenceAngle).rho;
}

double LineFamily::alignedAngle(const Line& line) const {
	return alignTo(line, m_referenceAngle).theta;
}

} // namespace cubescan::vision
