#pragma once

#include "vision/lineDetector.hpp"
#include "vision/result.hpp"
#include "vision/scanConfig.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <memory>

namespace cubescan::vision {

//! Diagnostic images a scan can produce. Combine to request several.
enum DiagnosticImage : uint32_t {
	DI_None            = 0,
	DI_Edges           = 1 << 0, //!< Binary edge map.
	DI_Lines           = 1 << 1, //!< All detected lines.
	DI_OrthogonalLines = 1 << 2, //!< Lines of both orthogonal families.
	DI_CombinedLines   = 1 << 3, //!< Merged lines of both families.
	DI_CentreLines     = 1 << 4, //!< Lines through the cell centres.
	DI_CentrePoints    = 1 << 5, //!< Cell centres and sample patches.
	DI_All             = (1 << 6) - 1
};

//! Intermediate images of a scan. Images of stages after a failure (or not requested) stay empty.
struct IntermediateImages {
	cv::Mat edges;
	cv::Mat lines;
	cv::Mat orthogonalLines;
	cv::Mat combinedLines;
	cv::Mat centreLines;
	cv::Mat centrePoints;
};

struct ScanOutput {
	Result<FaceColours> result; //!< Colours row-major (top left to bottom right) or the reason the scan failed.
	IntermediateImages images;
};

/*! Reads the colours of a single cube face from a photo.
 *
 * Pipeline: edges -> hough lines -> two orthogonal line families -> 4 merged grid lines per family
 *           -> 3x3 cell centres -> nearest reference colour per cell.
 * The first failing stage ends the scan.
 */
class CubeScanner {
public:
	//! Scanner using canny edges and hough lines configured from config.
	explicit CubeScanner(ScanConfig config = {});
	CubeScanner(ScanConfig config, std::unique_ptr<ILineDetector> detector);

	/*! Scan a face.
	 * \param [in] image     Non-empty 8 bit BGR image. Anything else throws cv::Exception.
	 * \param [in] imageMask Combination of DiagnosticImage values to produce.
	 */
	ScanOutput scan(const cv::Mat& image, uint32_t imageMask = DI_None) const;

	const ScanConfig& config() const;

private:
	ScanConfig m_config;
	std::unique_ptr<ILineDetector> m_detector;
};

} // namespace cubescan::vision
