#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <utility>
#include <vector>

namespace cubescan::vision {

//! Collects named intermediate images and arranges them in a single labelled mosaic.
class DebugVisualizer {
public:
	//! \param [in] tileWidth Width each image is scaled to in the mosaic.
	//! \param [in] columns   Tiles per mosaic row.
	explicit DebugVisualizer(int tileWidth = 480, int columns = 3);

	//! Add an image. Empty images are ignored.
	void add(const std::string& name, const cv::Mat& image);
	void clear();

	std::size_t size() const;
	const std::vector<std::pair<std::string, cv::Mat>>& images() const;

	//! All images in a grid (BGR). Empty if nothing was added.
	cv::Mat buildMosaic() const;

private:
	int m_tileWidth;
	int m_columns;
	std::vector<std::pair<std::string, cv::Mat>> m_images;
};

} // namespace cubescan::vision
