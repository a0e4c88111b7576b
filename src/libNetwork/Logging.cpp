#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace tictac::network {

static Logging::LogConfig config;

//! Transport events go to their own file next to the lobby log. Debug builds also trace them on the console.
static void InitializeLogger() {
	config.SetLogEnabled(true);
#ifdef NDEBUG
	config.SetMinLogLevel(Logging::LogLevel::Info);
#else
	config.SetMinLogLevel(Logging::LogLevel::Any);
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif

	const auto logPath = Logging::GetDefaultLogDir("TicTac/Server");

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (ec) {
		std::cerr << std::format("[Logger] Could not create directory: {}\nTransport events are not written to file.\n", logPath.string());
		return;
	}
	config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "network.txt"));
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace tictac::network
