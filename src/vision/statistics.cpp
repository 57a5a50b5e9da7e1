#include "statistics.hpp"

#include <opencv2/core.hpp>

#include <cmath>
#include <numeric>

namespace cubescan::vision {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double axialMean(const std::vector<double>& angles) {
	// Doubling maps theta and theta + pi onto the same point of the unit circle.
	double sumSin = 0.0;
	double sumCos = 0.0;
	for (double a : angles) {
		sumSin += std::sin(2.0 * a);
		sumCos += std::cos(2.0 * a);
	}

	double result = 0.5 * std::atan2(sumSin, sumCos);
	if (result < 0.0) {
		result += CV_PI;
	}
	if (result >= CV_PI) {
		result = 0.0;
	}
	return result;
}

} // namespace cubescan::vision
