#pragma once

#include "core/types.hpp"

#include <array>
#include <cstddef>

namespace tictac {

//! 3x3 grid. Origin is the top left cell, x selects the row and y the column.
class Board {
public:
	static constexpr std::size_t SIZE = 3u;

	//! Possible ownership values of fields on the board.
	enum class Value { Empty = 0, X = static_cast<int>(Player::First), O = static_cast<int>(Player::Second) };

public:
	Board();

	std::size_t size() const;

	void setAt(Coord c, Value value); //!< Set at given coordinate (x,y) \in [0, 2]
	Value getAt(Coord c) const;       //!< Get value at given coordinate (x,y) \in [0, 2]
	bool isFree(Coord c) const;       //!< Returns whether a certain board coordinate is free or occupied.

	//! Returns whether (x,y) addresses a cell. Accepts signed input straight from the wire.
	static bool isOnBoard(int x, int y);

private:
	std::array<Value, SIZE * SIZE> m_board{}; //!< Board values, row major.
};

//! Returns the Board::Value enum value of input player.
inline constexpr Board::Value toBoardValue(Player player) {
	return player == Player::Second ? Board::Value::O : Board::Value::X;
}

//! Wire symbol of a cell: 'X', 'O' or ' ' for empty.
inline constexpr char toSymbol(Board::Value value) {
	switch (value) {
	case Board::Value::X:
		return 'X';
	case Board::Value::O:
		return 'O';
	case Board::Value::Empty:
		break;
	}
	return ' ';
}

} // namespace tictac
