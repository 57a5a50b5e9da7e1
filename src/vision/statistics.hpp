#pragma once

#include <vector>

namespace cubescan::vision {

double mean(const std::vector<double>& v);

//! Mean of line angles where theta and theta + pi describe the same orientation. Result in [0, pi).
double axialMean(const std::vector<double>& angles);

} // namespace cubescan::vision
