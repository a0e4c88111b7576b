#pragma once

#include "network/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tictac::lobby {

struct ServerConfig {
	std::uint16_t port{network::DEFAULT_PORT};
	std::filesystem::path accountsFile{"users.txt"};
	std::size_t ioThreads{defaultIoThreads()};
	std::size_t leaderboardLimit{10u};

	static std::size_t defaultIoThreads(); //!< Hardware concurrency, at least 2.
};

//! Read the server configuration from the command line, then the environment.
//! Flags: --port N, --accounts PATH, --threads N, --leaderboard N. Each also accepted as --flag=value.
//! Environment: TICTAC_PORT and TICTAC_ACCOUNTS for values not given as flags.
//! \returns Empty on unknown flags, missing values or unparsable numbers.
std::optional<ServerConfig> parseArguments(int argc, const char* const* argv);

//! One line usage text for the server executable.
std::string usage(const std::string& program);

} // namespace tictac::lobby
