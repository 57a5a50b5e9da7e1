#include "vision/result.hpp"

namespace cubescan::vision {

std::string_view toString(ScanError error) {
	switch (error) {
	case ScanError::InsufficientLines:
		return "InsufficientLines";
	case ScanError::NotOrthogonal:
		return "NotOrthogonal";
	case ScanError::WrongLineCount:
		return "WrongLineCount";
	case ScanError::DegenerateGeometry:
		return "DegenerateGeometry";
	case ScanError::OutOfBounds:
		return "OutOfBounds";
	}
	return "Unknown";
}

} // namespace cubescan::vision
