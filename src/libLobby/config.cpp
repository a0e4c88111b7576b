#include "lobby/config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <limits>
#include <string_view>
#include <thread>

namespace tictac::lobby {

std::size_t ServerConfig::defaultIoThreads() {
	return std::max<std::size_t>(std::thread::hardware_concurrency(), 2u);
}

static std::optional<std::size_t> parseNumber(std::string_view text) {
	std::size_t value{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

static std::optional<std::uint16_t> parsePort(std::string_view text) {
	const auto value = parseNumber(text);
	if (!value || *value > std::numeric_limits<std::uint16_t>::max()) {
		return std::nullopt;
	}
	return static_cast<std::uint16_t>(*value);
}

std::optional<ServerConfig> parseArguments(int argc, const char* const* argv) {
	ServerConfig config;
	bool portGiven     = false;
	bool accountsGiven = false;

	for (int i = 1; i < argc; ++i) {
		std::string_view arg = argv[i];
		if (!arg.starts_with("--")) {
			return {};
		}

		// Split --key=value, otherwise take the next argument as value.
		std::string_view key = arg;
		std::string_view value;
		if (const auto eq = arg.find('='); eq != std::string_view::npos) {
			key   = arg.substr(0, eq);
			value = arg.substr(eq + 1);
		} else if (i + 1 < argc) {
			value = argv[++i];
		} else {
			return {};
		}

		if (key == "--port") {
			const auto port = parsePort(value);
			if (!port) {
				return {};
			}
			config.port = *port;
			portGiven   = true;
		} else if (key == "--accounts") {
			if (value.empty()) {
				return {};
			}
			config.accountsFile = std::string{value};
			accountsGiven       = true;
		} else if (key == "--threads") {
			const auto threads = parseNumber(value);
			if (!threads || *threads == 0u) {
				return {};
			}
			config.ioThreads = *threads;
		} else if (key == "--leaderboard") {
			const auto limit = parseNumber(value);
			if (!limit) {
				return {};
			}
			config.leaderboardLimit = *limit;
		} else {
			return {};
		}
	}

	if (!portGiven) {
		if (const char* env = std::getenv("TICTAC_PORT")) {
			const auto port = parsePort(env);
			if (!port) {
				return {};
			}
			config.port = *port;
		}
	}
	if (!accountsGiven) {
		if (const char* env = std::getenv("TICTAC_ACCOUNTS"); env && *env) {
			config.accountsFile = env;
		}
	}

	return config;
}

std::string usage(const std::string& program) {
	return std::format("Usage: {} [--port N] [--accounts PATH] [--threads N] [--leaderboard N]", program);
}

} // namespace tictac::lobby
