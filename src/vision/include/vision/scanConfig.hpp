#pragma once

#include <opencv2/core/cvdef.h>

#include <cstddef>

namespace cubescan::vision {

//! Edge extraction (grayscale -> gaussian blur -> canny).
struct EdgeConfig {
	int blurKernelSize        = 5;  //!< Odd gaussian kernel size in pixels.
	double cannyLowThreshold  = 0.;
	double cannyHighThreshold = 50.;
};

//! Standard hough line transform.
struct HoughConfig {
	double rhoResolution   = 1.;          //!< Accumulator distance resolution in pixels.
	double thetaResolution = CV_PI / 180; //!< Accumulator angle resolution in radians.
	int threshold          = 125;         //!< Minimum votes per line.
	std::size_t maxLines   = 500u;        //!< Strongest lines kept. Guards against noisy edge maps.
};

//! Split of raw lines into two orthogonal families.
struct ClassifierConfig {
	double angleBinWidth          = CV_PI / 180; //!< Histogram resolution.
	double angleTolerance         = CV_PI / 36;  //!< Max angle between a line and its family centre.
	double orthogonalityTolerance = CV_PI / 36;  //!< Max deviation of the family centres from 90 degrees.
	std::size_t minLinesPerFamily = 4u;
};

//! Collapse near-coincident family members into grid lines.
struct MergeConfig {
	double mergeDistance         = 50.; //!< Max offset gap (pixels) between neighbours of one cluster.
	double mergeRelaxationFactor = 1.5; //!< Applied to mergeDistance when too many clusters remain.
	unsigned maxMergeRelaxations = 2u;  //!< 0 disables re-merging.
};

//! Centre line intersection.
struct GridConfig {
	double minIntersectionDeterminant = 1e-3; //!< |sin| of the angle between two intersected lines.
};

//! Colour sampling around the grid points.
struct SampleConfig {
	int sampleRadius = 20; //!< Half side length of the square patch in pixels.
};

//! All tunable parameters of a scan.
struct ScanConfig {
	EdgeConfig edges;
	HoughConfig hough;
	ClassifierConfig classifier;
	MergeConfig merge;
	GridConfig grid;
	SampleConfig sample;
};

} // namespace cubescan::vision
