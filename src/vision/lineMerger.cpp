#include "vision/lineMerger.hpp"

#include "Logging.hpp"
#include "statistics.hpp"

#include <algorithm>
#include <format>

namespace cubescan::vision {

struct Member {
	double offset;
	double angle;
};

//! Representative of a cluster: mean offset and mean aligned angle.
static GridLine makeGridLine(const std::vector<double>& offsets, const std::vector<double>& angles) {
	const double offset = mean(offsets);
	const double angle  = mean(angles);
	return {Line{offset, angle}.canonical(), offset, angle, offsets.size()};
}

std::vector<GridLine> clusterByOffset(const LineFamily& family, double mergeDistance) {
	std::vector<Member> members;
	members.reserve(family.size());
	for (const auto& line : family.lines()) {
		members.push_back({family.offsetOf(line), family.alignedAngle(line)});
	}

	// Sort lines by offset
	std::sort(members.begin(), members.end(), [](const Member& a, const Member& b) {
		return a.offset < b.offset || (a.offset == b.offset && a.angle < b.angle);
	});

	std::vector<GridLine> clusters;
	std::vector<double> offsets{members[0].offset};
	std::vector<double> angles{members[0].angle};
	for (std::size_t i = 1; i < members.size(); ++i) {
		if (members[i].offset - members[i - 1].offset > mergeDistance) {
			clusters.push_back(makeGridLine(offsets, angles));
			offsets.clear();
			angles.clear();
		}
		offsets.push_back(members[i].offset);
		angles.push_back(members[i].angle);
	}
	clusters.push_back(makeGridLine(offsets, angles));

	return clusters;
}

Result<GridLines> mergeLines(const LineFamily& family, const MergeConfig& config, std::vector<GridLine>* clusters) {
	auto logger = Logger();

	double mergeDistance = config.mergeDistance;
	auto merged          = clusterByOffset(family, mergeDistance);

	for (unsigned attempt = 0; merged.size() > GRID_LINE_COUNT && attempt < config.maxMergeRelaxations; ++attempt) {
		mergeDistance *= config.mergeRelaxationFactor;
		logger.Log(Logging::LogLevel::Debug, std::format("[LineMerger] {} clusters. Retrying with merge distance {:.1f}px.", merged.size(), mergeDistance));
		merged = clusterByOffset(family, mergeDistance);
	}

	if (clusters) {
		*clusters = merged;
	}

	if (merged.size() != GRID_LINE_COUNT) {
		logger.Log(Logging::LogLevel::Warning, std::format("[LineMerger] Merged {} lines into {} instead of {} grid lines.", family.size(), merged.size(), GRID_LINE_COUNT));
		return ScanError::WrongLineCount;
	}

	GridLines gridLines{};
	std::copy(merged.begin(), merged.end(), gridLines.begin());
	return gridLines;
}

} // namespace cubescan::vision
