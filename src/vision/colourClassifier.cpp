#include "vision/colourClassifier.hpp"

#include "Logging.hpp"

#include <opencv2/imgproc.hpp>

#include <cctype>
#include <cmath>
#include <format>

namespace cubescan::vision {

static constexpr std::array<CubeColour, CUBE_COLOUR_COUNT> ALL_COLOURS = {
	CubeColour::White, CubeColour::Red, CubeColour::Orange, CubeColour::Yellow, CubeColour::Green, CubeColour::Blue};

static constexpr double TIE_EPS = 1e-9;

//! L*a*b* values of all reference colours. Computed once.
static const std::array<cv::Vec3d, CUBE_COLOUR_COUNT>& referenceLab() {
	static const std::array<cv::Vec3d, CUBE_COLOUR_COUNT> table = [] {
		std::array<cv::Vec3d, CUBE_COLOUR_COUNT> lab{};
		for (std::size_t i = 0; i < ALL_COLOURS.size(); ++i) {
			lab[i] = toLab(cv::Vec3d(referenceColour(ALL_COLOURS[i])));
		}
		return lab;
	}();
	return table;
}

std::string_view toString(CubeColour colour) {
	switch (colour) {
	case CubeColour::White:
		return "white";
	case CubeColour::Red:
		return "red";
	case CubeColour::Orange:
		return "orange";
	case CubeColour::Yellow:
		return "yellow";
	case CubeColour::Green:
		return "green";
	case CubeColour::Blue:
		return "blue";
	}
	return "unknown";
}

char colourInitial(CubeColour colour) {
	const auto name = toString(colour);
	return static_cast<char>(std::toupper(static_cast<unsigned char>(name.front())));
}

std::string formatFace(const FaceColours& colours) {
	std::string out;
	for (std::size_t row = 0; row < FACE_SIZE; ++row) {
		for (std::size_t col = 0; col < FACE_SIZE; ++col) {
			out += std::format("{:<7}", toString(colours[FACE_SIZE * row + col]));
		}
		// Trim the padding of the last column.
		out.erase(out.find_last_not_of(' ') + 1);
		out += '\n';
	}
	return out;
}

// Reference values measured on a cube under daylight.
cv::Vec3b referenceColour(CubeColour colour) {
	switch (colour) {
	case CubeColour::White:
		return {255, 255, 255};
	case CubeColour::Red:
		return {52, 18, 183};
	case CubeColour::Orange:
		return {0, 88, 255};
	case CubeColour::Yellow:
		return {0, 213, 255};
	case CubeColour::Green:
		return {72, 155, 0};
	case CubeColour::Blue:
		return {173, 70, 0};
	}
	return {0, 0, 0};
}

cv::Vec3d toLab(const cv::Vec3d& bgr) {
	// Floating point input in [0, 1] gives L in [0, 100] and unscaled a, b.
	cv::Mat in(1, 1, CV_32FC3, cv::Scalar(bgr[0] / 255., bgr[1] / 255., bgr[2] / 255.));
	cv::Mat out;
	cv::cvtColor(in, out, cv::COLOR_BGR2Lab);

	const auto lab = out.at<cv::Vec3f>(0, 0);
	return {lab[0], lab[1], lab[2]};
}

ColourMatch nearestColour(const cv::Vec3d& lab) {
	const auto& references = referenceLab();

	ColourMatch best{ALL_COLOURS[0], cv::norm(lab - references[0])};
	for (std::size_t i = 1; i < ALL_COLOURS.size(); ++i) {
		const double distance = cv::norm(lab - references[i]);
		if (distance < best.distance - TIE_EPS) {
			best = {ALL_COLOURS[i], distance};
		}
	}
	return best;
}

ColourSample sampleColour(const cv::Mat& image, const GridPoint& point, int radius) {
	CV_Assert(!image.empty() && image.type() == CV_8UC3 && radius >= 0);

	const int cx = static_cast<int>(std::floor(point.x));
	const int cy = static_cast<int>(std::floor(point.y));

	// Clip the patch at the image border.
	const cv::Rect roi = cv::Rect(cx - radius, cy - radius, 2 * radius + 1, 2 * radius + 1) & cv::Rect(0, 0, image.cols, image.rows);
	CV_Assert(!roi.empty());

	cv::Mat patch;
	image(roi).convertTo(patch, CV_64FC3);

	// Root mean square per channel.
	const cv::Scalar meanSquare = cv::mean(patch.mul(patch));
	const cv::Vec3d bgr(std::sqrt(meanSquare[0]), std::sqrt(meanSquare[1]), std::sqrt(meanSquare[2]));

	return {bgr, toLab(bgr)};
}

FaceColours classifyFace(const cv::Mat& image, const GridPoints& points, const SampleConfig& config, FaceSamples* samples) {
	auto logger = Logger();

	FaceColours colours{};
	for (std::size_t i = 0; i < points.size(); ++i) {
		const ColourSample sample = sampleColour(image, points[i], config.sampleRadius);
		const ColourMatch match   = nearestColour(sample.lab);
		colours[i]                = match.colour;
		if (samples) {
			(*samples)[i] = sample;
		}

		logger.Log(Logging::LogLevel::Debug, std::format("[ColourClassifier] Cell {}: BGR ({:.0f}, {:.0f}, {:.0f}) -> {} (distance {:.2f}).", i, sample.bgr[0], sample.bgr[1],
		                                                 sample.bgr[2], toString(match.colour), match.distance));
	}
	return colours;
}

} // namespace cubescan::vision
