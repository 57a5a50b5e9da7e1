#pragma once

#include <string_view>
#include <utility>
#include <variant>

namespace cubescan::vision {

//! Reasons a scan stage can fail on a valid input image.
enum class ScanError {
	InsufficientLines,  //!< Too few lines for one or both families.
	NotOrthogonal,      //!< No pair of line clusters roughly 90 degrees apart.
	WrongLineCount,     //!< Merging did not yield exactly 4 lines per family.
	DegenerateGeometry, //!< Centre lines (nearly) parallel.
	OutOfBounds         //!< Grid point outside of the image.
};

//! Name of the error kind, e.g. "InsufficientLines".
std::string_view toString(ScanError error);

//! Output of a pipeline stage: either a value or the reason the stage failed.
template <typename T>
class Result {
public:
	Result(T value) : m_data(std::move(value)) {
	}
	Result(ScanError error) : m_data(error) {
	}

	bool ok() const {
		return std::holds_alternative<T>(m_data);
	}
	explicit operator bool() const {
		return ok();
	}

	//! \note Throws std::bad_variant_access if the stage failed.
	const T& value() const {
		return std::get<T>(m_data);
	}
	T& value() {
		return std::get<T>(m_data);
	}

	//! \note Throws std::bad_variant_access if the stage succeeded.
	ScanError error() const {
		return std::get<ScanError>(m_data);
	}

private:
	std::variant<T, ScanError> m_data;
};

} // namespace cubescan::vision
