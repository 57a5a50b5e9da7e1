#include "vision/lineDetector.hpp"

#include "Logging.hpp"

#include <opencv2/imgproc.hpp>

#include <format>

namespace cubescan::vision {

HoughLineDetector::HoughLineDetector(EdgeConfig edgeConfig, HoughConfig houghConfig) : m_edgeConfig(edgeConfig), m_houghConfig(houghConfig) {
}

cv::Mat HoughLineDetector::detectEdges(const cv::Mat& image) const {
	CV_Assert(!image.empty() && image.type() == CV_8UC3);

	cv::Mat gray, blurred, edges;
	cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
	cv::GaussianBlur(gray, blurred, cv::Size(m_edgeConfig.blurKernelSize, m_edgeConfig.blurKernelSize), 0);
	cv::Canny(blurred, edges, m_edgeConfig.cannyLowThreshold, m_edgeConfig.cannyHighThreshold);

	return edges;
}

std::vector<Line> HoughLineDetector::detectLines(const cv::Mat& edges) const {
	CV_Assert(!edges.empty() && edges.type() == CV_8UC1);

	// Returned in order of decreasing accumulator votes.
	std::vector<cv::Vec2f> detected;
	cv::HoughLines(edges, detected, m_houghConfig.rhoResolution, m_houghConfig.thetaResolution, m_houghConfig.threshold);

	if (detected.size() > m_houghConfig.maxLines) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[LineDetector] Keeping the {} strongest of {} detected lines.", m_houghConfig.maxLines, detected.size()));
		detected.resize(m_houghConfig.maxLines);
	}

	std::vector<Line> lines;
	lines.reserve(detected.size());
	for (const auto& l : detected) {
		lines.push_back(Line{static_cast<double>(l[0]), static_cast<double>(l[1])}.canonical());
	}

	Logger().Log(Logging::LogLevel::Debug, std::format("[LineDetector] Detected {} lines.", lines.size()));
	return lines;
}

} // namespace cubescan::vision
