#include "core/gameSession.hpp"

#include <stdexcept>
#include <utility>

namespace tictac {

static constexpr unsigned MAX_MOVES = Board::SIZE * Board::SIZE;

static std::size_t seatIndex(Player player) {
	return player == Player::First ? 0u : 1u;
}

GameSession::GameSession(std::string gameId, std::string firstPlayer, std::string secondPlayer)
    : m_gameId(std::move(gameId)), m_players{std::move(firstPlayer), std::move(secondPlayer)} {
}

const std::string& GameSession::gameId() const {
	return m_gameId;
}

const std::string& GameSession::firstPlayer() const {
	return m_players[0];
}

const std::string& GameSession::secondPlayer() const {
	return m_players[1];
}

bool GameSession::isPlayer(const std::string& username) const {
	return username == m_players[0] || username == m_players[1];
}

const std::string& GameSession::currentPlayer() const {
	return m_players[seatIndex(m_current)];
}

const std::string& GameSession::opponentOf(const std::string& username) const {
	return username == m_players[0] ? m_players[1] : m_players[0];
}

MoveResult GameSession::applyMove(const std::string& player, const int x, const int y) {
	if (isTerminal()) {
		return MoveResult::GameOver;
	}
	if (player != currentPlayer()) {
		return MoveResult::NotYourTurn;
	}
	if (!Board::isOnBoard(x, y)) {
		return MoveResult::OutOfBounds;
	}

	const Coord c{static_cast<Id>(x), static_cast<Id>(y)};
	if (!m_board.isFree(c)) {
		return MoveResult::Occupied;
	}

	const auto value = toBoardValue(m_current);
	m_board.setAt(c, value);
	++m_moveCount;

	if (completesLine(c, value)) {
		m_status = m_current == Player::First ? GameStatus::FirstWin : GameStatus::SecondWin;
	} else if (m_moveCount == MAX_MOVES) {
		m_status = GameStatus::Draw;
	} else {
		m_current = opponent(m_current);
	}
	return MoveResult::Accepted;
}

bool GameSession::isTerminal() const {
	return m_status != GameStatus::InProgress;
}

GameStatus GameSession::status() const {
	return m_status;
}

std::optional<std::string> GameSession::winner() const {
	switch (m_status) {
	case GameStatus::FirstWin:
		return m_players[0];
	case GameStatus::SecondWin:
		return m_players[1];
	case GameStatus::InProgress:
	case GameStatus::Draw:
		break;
	}
	return std::nullopt;
}

Outcome GameSession::resultFor(const std::string& player) const {
	if (!isTerminal()) {
		throw std::logic_error("GameSession: result requested while game in progress");
	}
	if (!isPlayer(player)) {
		throw std::logic_error("GameSession: result requested for non player");
	}

	if (m_status == GameStatus::Draw) {
		return Outcome::Draw;
	}
	const auto winnerSeat = m_status == GameStatus::FirstWin ? Player::First : Player::Second;
	return seatOf(player) == winnerSeat ? Outcome::Win : Outcome::Loss;
}

const Board& GameSession::board() const {
	return m_board;
}

unsigned GameSession::moveCount() const {
	return m_moveCount;
}

bool GameSession::completesLine(const Coord c, const Board::Value value) const {
	bool row = true;
	bool column = true;
	for (Id i = 0; i != Board::SIZE; ++i) {
		row    = row && m_board.getAt({c.x, i}) == value;
		column = column && m_board.getAt({i, c.y}) == value;
	}
	if (row || column) {
		return true;
	}

	// Diagonals only pass through cells with x == y or x + y == 2.
	if (c.x == c.y) {
		bool diagonal = true;
		for (Id i = 0; i != Board::SIZE; ++i) {
			diagonal = diagonal && m_board.getAt({i, i}) == value;
		}
		if (diagonal) {
			return true;
		}
	}
	if (c.x + c.y == Board::SIZE - 1) {
		bool antiDiagonal = true;
		for (Id i = 0; i != Board::SIZE; ++i) {
			antiDiagonal = antiDiagonal && m_board.getAt({i, static_cast<Id>(Board::SIZE - 1 - i)}) == value;
		}
		if (antiDiagonal) {
			return true;
		}
	}
	return false;
}

Player GameSession::seatOf(const std::string& username) const {
	return username == m_players[0] ? Player::First : Player::Second;
}

} // namespace tictac
