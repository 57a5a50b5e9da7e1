#include "vision/debugVisualizer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace cubescan::vision {

DebugVisualizer::DebugVisualizer(int tileWidth, int columns) : m_tileWidth(std::max(1, tileWidth)), m_columns(std::max(1, columns)) {
}

void DebugVisualizer::add(const std::string& name, const cv::Mat& image) {
	if (image.empty())
		return;
	m_images.emplace_back(name, image.clone());
}

void DebugVisualizer::clear() {
	m_images.clear();
}

std::size_t DebugVisualizer::size() const {
	return m_images.size();
}

const std::vector<std::pair<std::string, cv::Mat>>& DebugVisualizer::images() const {
	return m_images;
}

cv::Mat DebugVisualizer::buildMosaic() const {
	if (m_images.empty()) {
		return {};
	}

	// 1. Scale every image to the tile width (keep aspect ratio) and label it.
	std::vector<cv::Mat> tiles;
	int tileHeight = 0;
	for (const auto& [name, image] : m_images) {
		cv::Mat bgr;
		if (image.channels() == 1) {
			cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
		} else {
			bgr = image;
		}

		const double scale = static_cast<double>(m_tileWidth) / bgr.cols;
		cv::Mat tile;
		cv::resize(bgr, tile, cv::Size(m_tileWidth, std::max(1, static_cast<int>(bgr.rows * scale))));
		cv::putText(tile, name, cv::Point(10, 25), cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(0, 255, 0), 2);

		tileHeight = std::max(tileHeight, tile.rows);
		tiles.push_back(tile);
	}

	// 2. Pad to equal height and fill the last row with black tiles.
	for (auto& tile : tiles) {
		if (tile.rows < tileHeight) {
			cv::copyMakeBorder(tile, tile, 0, tileHeight - tile.rows, 0, 0, cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));
		}
	}
	while (tiles.size() % static_cast<std::size_t>(m_columns) != 0) {
		tiles.push_back(cv::Mat(tileHeight, m_tileWidth, CV_8UC3, cv::Scalar(0, 0, 0)));
	}

	// 3. Stack rows horizontally then vertically.
	std::vector<cv::Mat> rows;
	for (std::size_t i = 0; i < tiles.size(); i += static_cast<std::size_t>(m_columns)) {
		cv::Mat row;
		cv::hconcat(std::vector<cv::Mat>(tiles.begin() + static_cast<std::ptrdiff_t>(i), tiles.begin() + static_cast<std::ptrdiff_t>(i) + m_columns), row);
		rows.push_back(row);
	}

	cv::Mat mosaic;
	cv::vconcat(rows, mosaic);
	return mosaic;
}

} // namespace cubescan::vision
