#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <mutex>

namespace cubescan::vision {

static Logging::LogConfig config;

#ifdef NDEBUG
static constexpr bool DEBUG_BUILD = false;
#else
static constexpr bool DEBUG_BUILD = true;
#endif

//! Scan log in the user log directory. Per cell colour decisions are only logged in debug builds.
static void InitializeLogger() {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(DEBUG_BUILD ? Logging::LogLevel::Debug : Logging::LogLevel::Info);

	const auto logDir = Logging::GetDefaultLogDir("CubeScan/Vision");

	std::error_code ec{};
	std::filesystem::create_directories(logDir, ec);
	const bool fileLogging = !ec;
	if (fileLogging) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logDir / "scan.log"));
	}

	// Console keeps warnings visible when there is no log file.
	if (DEBUG_BUILD || !fileLogging) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
	}
}

Logging::Logger Logger() {
	static std::once_flag initFlag;
	std::call_once(initFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace cubescan::vision
