#include "vision/cubeScanner.hpp"
#include "vision/colourClassifier.hpp"
#include "vision/debugVisualizer.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cubescan::tools {

static constexpr int EXIT_SCAN_FAILED = 1;
static constexpr int EXIT_USAGE       = 2;

struct Options {
	std::filesystem::path image;
	std::filesystem::path outDir; //!< Intermediate images are written here if set.
	bool mosaic = false;
	vision::ScanConfig config;
};

static void printUsage() {
	std::cerr << "Usage: cubeScanner <image> [--out=<dir>] [--mosaic] [--<option>=<value> ...]\n"
	             "Options:\n"
	             "  --blur=<px>                     Gaussian kernel size (odd).\n"
	             "  --canny-low=<v> --canny-high=<v> Canny thresholds.\n"
	             "  --hough-threshold=<votes>       Minimum votes per line.\n"
	             "  --max-lines=<n>                 Strongest lines kept.\n"
	             "  --angle-tolerance=<deg>         Max deviation of a line from its family.\n"
	             "  --orthogonality-tolerance=<deg> Max deviation of the families from 90 degrees.\n"
	             "  --min-lines=<n>                 Minimum lines per family.\n"
	             "  --merge-distance=<px>           Max offset gap of merged lines.\n"
	             "  --merge-relaxations=<n>         Re-merge attempts with a larger distance.\n"
	             "  --sample-radius=<px>            Half size of the colour sample patch.\n";
}

static double degrees(double value) {
	return value * CV_PI / 180.;
}

//! Apply a single --key=value option. Returns false for unknown keys. Throws on malformed numbers.
static bool applyOption(std::string_view key, const std::string& value, vision::ScanConfig& config) {
	if (key == "blur")
		config.edges.blurKernelSize = std::stoi(value);
	else if (key == "canny-low")
		config.edges.cannyLowThreshold = std::stod(value);
	else if (key == "canny-high")
		config.edges.cannyHighThreshold = std::stod(value);
	else if (key == "hough-threshold")
		config.hough.threshold = std::stoi(value);
	else if (key == "max-lines")
		config.hough.maxLines = std::stoul(value);
	else if (key == "angle-tolerance")
		config.classifier.angleTolerance = degrees(std::stod(value));
	else if (key == "orthogonality-tolerance")
		config.classifier.orthogonalityTolerance = degrees(std::stod(value));
	else if (key == "min-lines")
		config.classifier.minLinesPerFamily = std::stoul(value);
	else if (key == "merge-distance")
		config.merge.mergeDistance = std::stod(value);
	else if (key == "merge-relaxations")
		config.merge.maxMergeRelaxations = static_cast<unsigned>(std::stoul(value));
	else if (key == "sample-radius")
		config.sample.sampleRadius = std::stoi(value);
	else
		return false;
	return true;
}

static bool parseArguments(int argc, char** argv, Options& options) {
	if (argc < 2) {
		return false;
	}
	options.image = argv[1];

	for (int i = 2; i < argc; ++i) {
		const std::string_view arg = argv[i];
		if (arg == "--mosaic") {
			options.mosaic = true;
			continue;
		}

		const auto eq = arg.find('=');
		if (!arg.starts_with("--") || eq == std::string_view::npos) {
			std::cerr << std::format("Invalid argument '{}'.\n", arg);
			return false;
		}

		const auto key   = arg.substr(2, eq - 2);
		const auto value = std::string(arg.substr(eq + 1));
		if (key == "out") {
			options.outDir = value;
			continue;
		}

		try {
			if (!applyOption(key, value, options.config)) {
				std::cerr << std::format("Unknown option '--{}'.\n", key);
				return false;
			}
		} catch (const std::exception& e) {
			std::cerr << std::format("Invalid value '{}' for '--{}': {}\n", value, key, e.what());
			return false;
		}
	}
	return true;
}

//! Write the non-empty intermediate images as <dir>/<n>_<name>.png.
static void writeImages(const std::filesystem::path& dir, const vision::DebugVisualizer& images) {
	std::error_code ec{};
	std::filesystem::create_directories(dir, ec);
	if (ec) {
		std::cerr << std::format("Could not create directory '{}': {}\n", dir.string(), ec.message());
		return;
	}

	int index = 0;
	for (const auto& [name, image] : images.images()) {
		const auto path = dir / std::format("{}_{}.png", index++, name);
		if (!cv::imwrite(path.string(), image)) {
			std::cerr << std::format("Could not write '{}'.\n", path.string());
		}
	}
}

static int run(const Options& options) {
	const cv::Mat image = cv::imread(options.image.string());
	if (image.empty()) {
		std::cerr << std::format("Failed to load image: {}\n", options.image.string());
		return EXIT_USAGE;
	}

	const bool wantImages = !options.outDir.empty() || options.mosaic;

	vision::CubeScanner scanner(options.config);
	vision::ScanOutput output{vision::ScanError::InsufficientLines, {}};
	try {
		output = scanner.scan(image, wantImages ? vision::DI_All : vision::DI_None);
	} catch (const cv::Exception& e) {
		// Invalid parameters (e.g. an even blur kernel) are rejected by OpenCV.
		std::cerr << std::format("Scan aborted: {}\n", e.what());
		return EXIT_USAGE;
	}

	vision::DebugVisualizer debug;
	debug.add("edges", output.images.edges);
	debug.add("lines", output.images.lines);
	debug.add("orthogonal_lines", output.images.orthogonalLines);
	debug.add("combined_lines", output.images.combinedLines);
	debug.add("centre_lines", output.images.centreLines);
	debug.add("centre_points", output.images.centrePoints);

	if (!options.outDir.empty()) {
		writeImages(options.outDir, debug);
	}
	if (options.mosaic && debug.size() != 0) {
		const auto mosaicPath = (options.outDir.empty() ? std::filesystem::path(".") : options.outDir) / "mosaic.png";
		if (!cv::imwrite(mosaicPath.string(), debug.buildMosaic())) {
			std::cerr << std::format("Could not write '{}'.\n", mosaicPath.string());
		}
	}

	if (!output.result) {
		std::cout << std::format("Scan failed: {}\n", vision::toString(output.result.error()));
		return EXIT_SCAN_FAILED;
	}

	std::cout << vision::formatFace(output.result.value());
	return EXIT_SUCCESS;
}

} // namespace cubescan::tools

int main(int argc, char** argv) {
	cubescan::tools::Options options;
	if (!cubescan::tools::parseArguments(argc, argv, options)) {
		cubescan::tools::printUsage();
		return cubescan::tools::EXIT_USAGE;
	}

	return cubescan::tools::run(options);
}
