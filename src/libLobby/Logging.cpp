#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <string_view>

namespace tictac::lobby {

static Logging::LogConfig config;

//! TICTAC_LOG_LEVEL selects the least important level written. Unset or unknown: Info.
static Logging::LogLevel MinLogLevelFromEnvironment() {
	const char* value = std::getenv("TICTAC_LOG_LEVEL");
	if (!value) {
		return Logging::LogLevel::Info;
	}

	const std::string_view level{value};
	if (level == "any") {
		return Logging::LogLevel::Any;
	}
	if (level == "debug") {
		return Logging::LogLevel::Debug;
	}
	if (level == "warning") {
		return Logging::LogLevel::Warning;
	}
	if (level == "error") {
		return Logging::LogLevel::Error;
	}
	return Logging::LogLevel::Info;
}

//! The lobby is the server's voice: always log to the console, file output where the log dir can be created.
static void InitializeLogger() {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(MinLogLevelFromEnvironment());
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());

	const auto logPath = Logging::GetDefaultLogDir("TicTac/Server");

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (ec) {
		std::cerr << std::format("[Logger] Could not create directory: {}\nLobby will only log to console.\n", logPath.string());
		return;
	}
	config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "lobby.txt"));
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace tictac::lobby
