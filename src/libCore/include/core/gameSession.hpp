#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace tictac {

enum class GameStatus { InProgress, FirstWin, SecondWin, Draw };

//! Outcome of a single applyMove call.
enum class MoveResult {
	Accepted,    //!< Mark placed. Game may have become terminal.
	GameOver,    //!< Game already terminal.
	NotYourTurn, //!< Player unknown or not on turn.
	OutOfBounds, //!< Coordinates outside of the grid.
	Occupied     //!< Target cell already marked.
};

//! One match between two accounts.
//! The first player marks 'X' and opens, the second marks 'O'.
//! \note Not thread safe. The owner serialises access per game.
class GameSession {
public:
	GameSession(std::string gameId, std::string firstPlayer, std::string secondPlayer);

	const std::string& gameId() const;
	const std::string& firstPlayer() const;
	const std::string& secondPlayer() const;

	bool isPlayer(const std::string& username) const;
	const std::string& currentPlayer() const;                         //!< Player on turn. Stays the winner once terminal.
	const std::string& opponentOf(const std::string& username) const; //!< \note username must be a player of this game.

	//! Try to place the mark of player at (x,y). Only mutation of the session.
	MoveResult applyMove(const std::string& player, int x, int y);

	bool isTerminal() const;
	GameStatus status() const;
	std::optional<std::string> winner() const; //!< Empty while running or on draw.

	//! WIN/LOSS/DRAW from the perspective of player.
	//! \throws std::logic_error while the game is still in progress or player is not part of the game.
	Outcome resultFor(const std::string& player) const;

	const Board& board() const;
	unsigned moveCount() const;

private:
	bool completesLine(Coord c, Board::Value value) const; //!< Lines through the just played cell only.
	Player seatOf(const std::string& username) const;

private:
	std::string m_gameId;
	std::string m_players[2]; //!< Index 0 first, 1 second.

	Board m_board;
	Player m_current{Player::First};
	GameStatus m_status{GameStatus::InProgress};
	unsigned m_moveCount{0};
};

} // namespace tictac
