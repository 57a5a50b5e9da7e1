#pragma once

#include <opencv2/core/types.hpp>

#include <array>
#include <cstddef>
#include <vector>

namespace cubescan::vision {

//! Straight line in Hough normal form: x * cos(theta) + y * sin(theta) = rho.
//! \note Canonical form keeps theta in [0, pi). Rho is signed.
struct Line {
	double rho;
	double theta;

	//! Line through two distinct points. Angle is canonicalised to [0, pi).
	static Line fromPoints(const cv::Point2d& p1, const cv::Point2d& p2);

	//! Same line with theta moved to [0, pi) (flips the sign of rho where needed).
	Line canonical() const;

	cv::Point2d normal() const;    //!< Unit normal (cos(theta), sin(theta)).
	cv::Point2d direction() const; //!< Unit direction along the line.
};

//! Axial distance between two line angles, in [0, pi/2].
double angularDistance(double a, double b);

//! Group of lines sharing one dominant orientation.
class LineFamily {
public:
	//! \param [in] referenceAngle Direction of increasing offset. Lines must not be empty.
	LineFamily(std::vector<Line> lines, double referenceAngle);

	const std::vector<Line>& lines() const;
	double referenceAngle() const;
	std::size_t size() const;

	//! Signed distance of the line from the origin, measured along the reference normal.
	double offsetOf(const Line& line) const;

	//! Angle of the line expressed within pi/2 of the reference angle.
	double alignedAngle(const Line& line) const;

private:
	std::vector<Line> m_lines;
	double m_referenceAngle;
};

//! Representative line of a cluster of near-coincident family members.
struct GridLine {
	Line line;           //!< Canonical line.
	double offset;       //!< Signed offset along the family reference normal.
	double angle;        //!< Angle aligned to the family reference.
	std::size_t support; //!< Number of raw lines merged into this one.
};

static constexpr std::size_t GRID_LINE_COUNT = 4u; //!< Boundaries of a 3x3 face.
static constexpr std::size_t FACE_SIZE       = 3u;
static constexpr std::size_t FACELET_COUNT   = FACE_SIZE * FACE_SIZE;

using GridLines   = std::array<GridLine, GRID_LINE_COUNT>; //!< Ordered by ascending offset.
using CentreLines = std::array<GridLine, FACE_SIZE>;       //!< Midlines of consecutive grid lines.
using GridPoint   = cv::Point2d;
using GridPoints  = std::array<GridPoint, FACELET_COUNT>;  //!< Row-major, top left to bottom right.

//! Face colours of a standard cube. Enum order is the classification tie-break order.
enum class CubeColour { White, Red, Orange, Yellow, Green, Blue };

static constexpr std::size_t CUBE_COLOUR_COUNT = 6u;

using FaceColours = std::array<CubeColour, FACELET_COUNT>;

//! Averaged colour around a grid point.
struct ColourSample {
	cv::Vec3d bgr; //!< Per channel average in [0, 255].
	cv::Vec3d lab; //!< CIE L*a*b* of bgr (L in [0, 100]).
};

} // namespace cubescan::vision
