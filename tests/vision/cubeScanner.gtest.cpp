#include "vision/colourClassifier.hpp"
#include "vision/cubeScanner.hpp"

#include "syntheticFace.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <memory>

namespace cubescan::vision::gtest {

static const FaceColours ARRANGEMENT = {CubeColour::Red,    CubeColour::White, CubeColour::Blue,  CubeColour::Green, CubeColour::Yellow,
                                        CubeColour::Orange, CubeColour::Blue,  CubeColour::White, CubeColour::Red};

//! Geometry of drawFace with its default layout: 100px cells, 12px gaps and 60px margin on a 444px image.
static const FaceGeometry DRAWN_FACE{{222., 222.}, 112., 0.};

static CubeScanner mockScanner(std::vector<Line> lines) {
	return CubeScanner(ScanConfig{}, std::make_unique<MockLineDetector>(std::move(lines)));
}

static bool allEmpty(const IntermediateImages& images) {
	return images.edges.empty() && images.lines.empty() && images.orthogonalLines.empty() && images.combinedLines.empty() && images.centreLines.empty() &&
	       images.centrePoints.empty();
}

TEST(CubeScanner, ScansDrawnFace) {
	const auto image = drawFace(ARRANGEMENT);
	ASSERT_EQ(image.cols, 444);

	const CubeScanner scanner;
	const auto output = scanner.scan(image);
	ASSERT_TRUE(output.result.ok()) << toString(output.result.error());
	EXPECT_EQ(output.result.value(), ARRANGEMENT);
	EXPECT_TRUE(allEmpty(output.images));
}

TEST(CubeScanner, IsDeterministic) {
	const auto image = drawFace(ARRANGEMENT);
	const CubeScanner scanner;

	const auto first  = scanner.scan(image, DI_CentrePoints);
	const auto second = scanner.scan(image, DI_CentrePoints);
	ASSERT_TRUE(first.result.ok());
	ASSERT_TRUE(second.result.ok());
	EXPECT_EQ(first.result.value(), second.result.value());
	EXPECT_EQ(cv::norm(first.images.centrePoints, second.images.centrePoints, cv::NORM_INF), 0.);
}

TEST(CubeScanner, KnownLinesGiveExactColours) {
	const auto scanner = mockScanner(faceLines(DRAWN_FACE));
	const auto output  = scanner.scan(drawFace(ARRANGEMENT), DI_All);

	ASSERT_TRUE(output.result.ok());
	EXPECT_EQ(output.result.value(), ARRANGEMENT);

	const auto& images = output.images;
	EXPECT_FALSE(images.edges.empty());
	EXPECT_FALSE(images.lines.empty());
	EXPECT_FALSE(images.orthogonalLines.empty());
	EXPECT_FALSE(images.combinedLines.empty());
	EXPECT_FALSE(images.centreLines.empty());
	EXPECT_FALSE(images.centrePoints.empty());
	EXPECT_EQ(images.edges.type(), CV_8UC1);
	EXPECT_EQ(images.centrePoints.cols, 444);
	EXPECT_EQ(images.centrePoints.rows, 444);
	EXPECT_EQ(images.centrePoints.type(), CV_8UC3);
}

TEST(CubeScanner, OnlyRequestedImages) {
	const auto scanner = mockScanner(faceLines(DRAWN_FACE));
	const auto output  = scanner.scan(drawFace(ARRANGEMENT), DI_Edges | DI_CentreLines);

	ASSERT_TRUE(output.result.ok());
	EXPECT_FALSE(output.images.edges.empty());
	EXPECT_FALSE(output.images.centreLines.empty());
	EXPECT_TRUE(output.images.lines.empty());
	EXPECT_TRUE(output.images.orthogonalLines.empty());
	EXPECT_TRUE(output.images.combinedLines.empty());
	EXPECT_TRUE(output.images.centrePoints.empty());
}

TEST(CubeScanner, BlankImage) {
	const cv::Mat blank(200, 200, CV_8UC3, cv::Scalar(0, 0, 0));
	const CubeScanner scanner;

	const auto output = scanner.scan(blank, DI_All);
	ASSERT_FALSE(output.result.ok());
	EXPECT_EQ(output.result.error(), ScanError::InsufficientLines);

	// Stages before the failure still provide their images.
	EXPECT_FALSE(output.images.edges.empty());
	EXPECT_EQ(cv::countNonZero(output.images.edges), 0);
	EXPECT_FALSE(output.images.lines.empty());
	EXPECT_TRUE(output.images.orthogonalLines.empty());
	EXPECT_TRUE(output.images.combinedLines.empty());
}

TEST(CubeScanner, NonOrthogonalLines) {
	std::vector<Line> lines;
	for (double angle : {0., CV_PI / 6, CV_PI / 3}) {
		for (double rho : {100., 150., 200., 250., 300.}) {
			lines.push_back(Line{rho, angle});
		}
	}

	const auto output = mockScanner(lines).scan(drawFace(ARRANGEMENT), DI_All);
	ASSERT_FALSE(output.result.ok());
	EXPECT_EQ(output.result.error(), ScanError::NotOrthogonal);
	EXPECT_TRUE(output.images.orthogonalLines.empty());
}

TEST(CubeScanner, MissingBoundary) {
	const auto output = mockScanner(partialFaceLines(DRAWN_FACE, 3)).scan(drawFace(ARRANGEMENT), DI_All);

	ASSERT_FALSE(output.result.ok());
	EXPECT_EQ(output.result.error(), ScanError::WrongLineCount);
	EXPECT_FALSE(output.images.orthogonalLines.empty());
	EXPECT_FALSE(output.images.combinedLines.empty());
	EXPECT_TRUE(output.images.centreLines.empty());
	EXPECT_TRUE(output.images.centrePoints.empty());
}

TEST(CubeScanner, FaceOutsideImage) {
	const FaceGeometry face{{30., 222.}, 112., 0.};
	const auto output = mockScanner(faceLines(face)).scan(drawFace(ARRANGEMENT), DI_All);

	ASSERT_FALSE(output.result.ok());
	EXPECT_EQ(output.result.error(), ScanError::OutOfBounds);
	EXPECT_FALSE(output.images.centreLines.empty());
	EXPECT_TRUE(output.images.centrePoints.empty());
}

TEST(CubeScanner, RejectsInvalidInput) {
	const CubeScanner scanner;
	EXPECT_THROW(scanner.scan(cv::Mat()), cv::Exception);
	EXPECT_THROW(scanner.scan(cv::Mat(10, 10, CV_8UC1, cv::Scalar(0))), cv::Exception);

	EXPECT_THROW(CubeScanner(ScanConfig{}, nullptr), cv::Exception);
}

TEST(CubeScanner, KeepsConfig) {
	ScanConfig config{};
	config.sample.sampleRadius = 7;
	const CubeScanner scanner(config);
	EXPECT_EQ(scanner.config().sample.sampleRadius, 7);
}

} // namespace cubescan::vision::gtest
