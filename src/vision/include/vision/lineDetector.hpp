#pragma once

#include "vision/scanConfig.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace cubescan::vision {

//! Low level detection primitives the scan pipeline builds on.
class ILineDetector {
public:
	virtual ~ILineDetector() = default;

	//! Binary edge map (CV_8UC1) of a BGR image.
	virtual cv::Mat detectEdges(const cv::Mat& image) const = 0;

	//! Unordered raw line detections in an edge map.
	virtual std::vector<Line> detectLines(const cv::Mat& edges) const = 0;
};

//! Canny edges + standard hough transform.
class HoughLineDetector : public ILineDetector {
public:
	HoughLineDetector(EdgeConfig edgeConfig, HoughConfig houghConfig);

	cv::Mat detectEdges(const cv::Mat& image) const override;
	std::vector<Line> detectLines(const cv::Mat& edges) const override;

private:
	EdgeConfig m_edgeConfig;
	HoughConfig m_houghConfig;
};

} // namespace cubescan::vision
