#pragma once

#include "Logger/Logger.hpp"

namespace cubescan::vision {

//! Logger of the vision library. Outputs are set up on first use.
Logging::Logger Logger();

} // namespace cubescan::vision
