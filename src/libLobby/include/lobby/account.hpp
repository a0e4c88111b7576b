#pragma once

#include <string>

namespace tictac::lobby {

struct Account {
	std::string username;
	std::string secret; //!< Stored as given. No hashing.
	unsigned wins{0};
	unsigned losses{0};
	unsigned draws{0};

	unsigned totalGames() const {
		return wins + losses + draws;
	}
};

} // namespace tictac::lobby
