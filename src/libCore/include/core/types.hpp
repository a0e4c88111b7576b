#pragma once

#include <cstdint>

namespace tictac {

using Id = unsigned; //!< Board ID used by the core library.

//! Coordinate pair for the board. x is the row, y the column.
struct Coord {
	Id x, y;
};

//! Seat in a match. The first player always opens.
enum class Player { First = 1, Second = 2 };

//! Result of a finished match from the perspective of a single player.
enum class Outcome { Win, Loss, Draw };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::First ? Player::Second : Player::First;
}

} // namespace tictac
