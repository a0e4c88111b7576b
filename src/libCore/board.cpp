#include "core/board.hpp"

#include <cassert>

namespace tictac {

Board::Board() {
	m_board.fill(Value::Empty);
}

std::size_t Board::size() const {
	return SIZE;
}

void Board::setAt(const Coord c, Value value) {
	assert(value != Board::Value::Empty);
	assert(c.x < SIZE && c.y < SIZE); // GameSession checks bounds before placing.

	m_board[c.x * SIZE + c.y] = value;
}

Board::Value Board::getAt(const Coord c) const {
	assert(c.x < SIZE && c.y < SIZE);

	return m_board[c.x * SIZE + c.y];
}

bool Board::isFree(const Coord c) const {
	return getAt(c) == Value::Empty;
}

bool Board::isOnBoard(const int x, const int y) {
	return x >= 0 && y >= 0 && x < static_cast<int>(SIZE) && y < static_cast<int>(SIZE);
}

} // namespace tictac
