#include "vision/lineClassifier.hpp"

#include "Logging.hpp"
#include "statistics.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace cubescan::vision {

struct AnglePair {
	std::size_t first{0};
	std::size_t second{0};
	int score{0};
};

//! Number of lines within tolerance of every bin centre (bin i is centred at i * binWidth).
static std::vector<int> angleSupport(const std::vector<Line>& lines, std::size_t bins, double binWidth, double tolerance) {
	std::vector<int> support(bins, 0);
	for (std::size_t i = 0; i < bins; ++i) {
		const double centre = static_cast<double>(i) * binWidth;
		for (const auto& line : lines) {
			if (angularDistance(line.theta, centre) <= tolerance) {
				++support[i];
			}
		}
	}
	return support;
}

//! Best supported pair of bins roughly pi/2 apart. Score 0 if there is none.
static AnglePair findOrthogonalPair(const std::vector<int>& support, double binWidth, double orthogonalityTolerance) {
	AnglePair best{};
	for (std::size_t i = 0; i < support.size(); ++i) {
		if (support[i] == 0)
			continue;

		const double target = static_cast<double>(i) * binWidth + CV_PI / 2;

		std::size_t partner = 0;
		int partnerSupport  = 0;
		for (std::size_t j = 0; j < support.size(); ++j) {
			if (angularDistance(static_cast<double>(j) * binWidth, target) > orthogonalityTolerance)
				continue;
			if (support[j] > partnerSupport) {
				partner        = j;
				partnerSupport = support[j];
			}
		}
		if (partnerSupport == 0)
			continue;

		const int score = support[i] + partnerSupport;
		if (score > best.score) {
			best = {i, partner, score};
		}
	}
	return best;
}

//! Axial mean of all lines within tolerance of the given angle.
static double refineCentre(const std::vector<Line>& lines, double centre, double tolerance) {
	std::vector<double> angles;
	for (const auto& line : lines) {
		if (angularDistance(line.theta, centre) <= tolerance) {
			angles.push_back(line.theta);
		}
	}
	return angles.empty() ? centre : axialMean(angles);
}

Result<OrthogonalLines> classifyOrthogonal(const std::vector<Line>& lines, const ClassifierConfig& config) {
	auto logger = Logger();

	if (lines.empty()) {
		logger.Log(Logging::LogLevel::Warning, "[LineClassifier] No lines to classify.");
		return ScanError::InsufficientLines;
	}

	// 1. Axial angle histogram.
	const auto bins       = static_cast<std::size_t>(std::max(1l, std::lround(CV_PI / config.angleBinWidth)));
	const double binWidth = CV_PI / static_cast<double>(bins);
	const auto support    = angleSupport(lines, bins, binWidth, config.angleTolerance);

	// 2. Dominant pair of orientations.
	const AnglePair pair = findOrthogonalPair(support, binWidth, config.orthogonalityTolerance);
	if (pair.score == 0) {
		// Either everything shares one orientation or the clusters are not perpendicular.
		const auto dominant        = static_cast<std::size_t>(std::max_element(support.begin(), support.end()) - support.begin());
		const double dominantAngle = static_cast<double>(dominant) * binWidth;
		const bool hasOtherLines   = std::any_of(lines.begin(), lines.end(),
		                                         [&](const Line& l) { return angularDistance(l.theta, dominantAngle) > config.angleTolerance; });

		logger.Log(Logging::LogLevel::Warning, std::format("[LineClassifier] No orthogonal line clusters among {} lines.", lines.size()));
		return hasOtherLines ? ScanError::NotOrthogonal : ScanError::InsufficientLines;
	}

	// Tied bins form a plateau and the lowest one sits at its edge. Refine in a wide window first, then narrow it.
	double centreA = refineCentre(lines, static_cast<double>(pair.first) * binWidth, 2 * config.angleTolerance);
	double centreB = refineCentre(lines, static_cast<double>(pair.second) * binWidth, 2 * config.angleTolerance);
	centreA        = refineCentre(lines, centreA, config.angleTolerance);
	centreB        = refineCentre(lines, centreB, config.angleTolerance);
	if (std::abs(angularDistance(centreA, centreB) - CV_PI / 2) > config.orthogonalityTolerance) {
		logger.Log(Logging::LogLevel::Warning, std::format("[LineClassifier] Line clusters {:.1f} and {:.1f} degrees are not orthogonal.",
		                                                   centreA * 180. / CV_PI, centreB * 180. / CV_PI));
		return ScanError::NotOrthogonal;
	}

	// 3. Assign each line to the closer cluster.
	std::vector<Line> membersA, membersB, discarded;
	for (const auto& line : lines) {
		const double dA = angularDistance(line.theta, centreA);
		const double dB = angularDistance(line.theta, centreB);

		if (dA <= config.angleTolerance && dA <= dB) {
			membersA.push_back(line);
		} else if (dB <= config.angleTolerance) {
			membersB.push_back(line);
		} else {
			discarded.push_back(line);
		}
	}

	logger.Log(Logging::LogLevel::Debug, std::format("[LineClassifier] Clusters at {:.1f} ({} lines) and {:.1f} ({} lines) degrees. {} discarded.",
	                                                 centreA * 180. / CV_PI, membersA.size(), centreB * 180. / CV_PI, membersB.size(), discarded.size()));

	if (membersA.size() < config.minLinesPerFamily || membersB.size() < config.minLinesPerFamily) {
		logger.Log(Logging::LogLevel::Warning, std::format("[LineClassifier] Need at least {} lines per family.", config.minLinesPerFamily));
		return ScanError::InsufficientLines;
	}

	// 4. The family with a normal closer to the image y axis consists of the horizontal lines.
	const bool aIsHorizontal = angularDistance(centreA, CV_PI / 2) <= angularDistance(centreB, CV_PI / 2);

	// Orient references so offsets grow downwards (horizontal) and to the right (vertical).
	double horizontalRef = aIsHorizontal ? centreA : centreB;
	double verticalRef   = aIsHorizontal ? centreB : centreA;
	if (verticalRef > CV_PI / 2) {
		verticalRef -= CV_PI;
	}

	LineFamily horizontal(aIsHorizontal ? std::move(membersA) : std::move(membersB), horizontalRef);
	LineFamily vertical(aIsHorizontal ? std::move(membersB) : std::move(membersA), verticalRef);

	return OrthogonalLines{std::move(horizontal), std::move(vertical), std::move(discarded)};
}

} // namespace cubescan::vision
