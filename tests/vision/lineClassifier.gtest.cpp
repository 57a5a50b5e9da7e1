#include "vision/lineClassifier.hpp"

#include "syntheticFace.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cmath>
#include <vector>

namespace cubescan::vision::gtest {

static constexpr double DEG = CV_PI / 180.;

//! Lines with the given direction (degrees) spread over the image.
static std::vector<Line> parallelLines(double directionDeg, int count) {
	const double a = directionDeg * DEG;
	const cv::Point2d dir(std::cos(a), std::sin(a));
	const cv::Point2d normal(-dir.y, dir.x);

	std::vector<Line> lines;
	for (int i = 0; i < count; ++i) {
		const cv::Point2d p = cv::Point2d(200., 200.) + normal * (40. * i);
		lines.push_back(Line::fromPoints(p - dir * 100., p + dir * 100.));
	}
	return lines;
}

TEST(LineClassifier, AxisAlignedFace) {
	const FaceGeometry face{{200., 200.}, 80., 0.};
	const auto lines = faceLines(face);

	const auto result = classifyOrthogonal(lines, ClassifierConfig{});
	ASSERT_TRUE(result.ok());

	const auto& families = result.value();
	EXPECT_EQ(families.horizontal.size(), 12u);
	EXPECT_EQ(families.vertical.size(), 12u);
	EXPECT_TRUE(families.discarded.empty());
	EXPECT_NEAR(families.horizontal.referenceAngle(), CV_PI / 2, 1e-9);
	EXPECT_NEAR(families.vertical.referenceAngle(), 0., 1e-9);

	for (const auto& line : families.horizontal.lines()) {
		EXPECT_NEAR(line.theta, CV_PI / 2, 1e-9);
	}
}

TEST(LineClassifier, RotatedFace) {
	for (double angleDeg : {-30., -12., 7., 20., 35.}) {
		const FaceGeometry face{{300., 300.}, 80., angleDeg * DEG};
		const auto result = classifyOrthogonal(faceLines(face), ClassifierConfig{});
		ASSERT_TRUE(result.ok()) << "angle " << angleDeg;

		const auto& families = result.value();
		EXPECT_EQ(families.horizontal.size(), 12u);
		EXPECT_EQ(families.vertical.size(), 12u);

		// Offsets grow downwards and to the right.
		EXPECT_GT(std::sin(families.horizontal.referenceAngle()), 0.);
		EXPECT_GT(std::cos(families.vertical.referenceAngle()), 0.);
		EXPECT_NEAR(families.vertical.referenceAngle(), angleDeg * DEG, 1e-9);
	}
}

TEST(LineClassifier, FamiliesAreOrthogonal) {
	const ClassifierConfig config{};

	// Vertical lines slightly off so the clusters are not exactly 90 degrees apart.
	auto lines        = parallelLines(0., 6);
	const auto tilted = parallelLines(92., 6);
	lines.insert(lines.end(), tilted.begin(), tilted.end());

	const auto result = classifyOrthogonal(lines, config);
	ASSERT_TRUE(result.ok());

	const double between = angularDistance(result.value().horizontal.referenceAngle(), result.value().vertical.referenceAngle());
	EXPECT_LE(std::abs(between - CV_PI / 2), config.orthogonalityTolerance);
}

TEST(LineClassifier, DiscardsDiagonals) {
	const FaceGeometry face{{200., 200.}, 80., 0.};
	auto lines           = faceLines(face);
	const auto diagonals = parallelLines(45., 3);
	lines.insert(lines.end(), diagonals.begin(), diagonals.end());

	const auto result = classifyOrthogonal(lines, ClassifierConfig{});
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result.value().discarded.size(), 3u);
	EXPECT_EQ(result.value().horizontal.size() + result.value().vertical.size(), 24u);
}

TEST(LineClassifier, IgnoresStrongerSpuriousCluster) {
	// Many parallel lines at 60 degrees but no partner. The weaker orthogonal pair still wins.
	const FaceGeometry face{{200., 200.}, 80., 0.};
	auto lines          = faceLines(face, 1);
	const auto spurious = parallelLines(60., 10);
	lines.insert(lines.end(), spurious.begin(), spurious.end());

	const auto result = classifyOrthogonal(lines, ClassifierConfig{});
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result.value().horizontal.size(), 4u);
	EXPECT_EQ(result.value().vertical.size(), 4u);
	EXPECT_EQ(result.value().discarded.size(), 10u);
}

TEST(LineClassifier, NoLines) {
	const auto result = classifyOrthogonal({}, ClassifierConfig{});
	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.error(), ScanError::InsufficientLines);
}

TEST(LineClassifier, SingleOrientation) {
	const auto result = classifyOrthogonal(parallelLines(0., 8), ClassifierConfig{});
	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.error(), ScanError::InsufficientLines);
}

TEST(LineClassifier, TooFewLinesInOneFamily) {
	auto lines         = parallelLines(0., 8);
	const auto partner = parallelLines(90., 3);
	lines.insert(lines.end(), partner.begin(), partner.end());

	const auto result = classifyOrthogonal(lines, ClassifierConfig{});
	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.error(), ScanError::InsufficientLines);
}

TEST(LineClassifier, NotOrthogonal) {
	std::vector<Line> lines;
	for (double direction : {0., 30., 60.}) {
		const auto group = parallelLines(direction, 5);
		lines.insert(lines.end(), group.begin(), group.end());
	}

	const auto result = classifyOrthogonal(lines, ClassifierConfig{});
	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.error(), ScanError::NotOrthogonal);
}

} // namespace cubescan::vision::gtest
