#pragma once

#include "core/gameSession.hpp"
#include "gameNet/nwEvents.hpp"
#include "lobby/accountRegistry.hpp"
#include "lobby/pendingTable.hpp"
#include "lobby/presenceRegistry.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace tictac::lobby {

class ClientSession;

//! Coordinator shared by all client sessions. Owns presence, pending challenges and rematches,
//! last opponents and the live games. Requests come in from sessions, answers and notifications
//! go out through the sessions of the affected players.
//! \note All operations may be called concurrently from any session.
//!       Lock order: game -> games table -> clients. The games table lock is never held while locking a game.
class ServerHub {
public:
	ServerHub(IAccountStore& store, std::size_t leaderboardLimit = 10u);

	ServerHub(const ServerHub&)            = delete;
	ServerHub& operator=(const ServerHub&) = delete;

	// Requests from sessions. Errors are reported to the acting session only.
	void registerAccount(ClientSession& actor, const std::string& username, const std::string& secret);
	void login(ClientSession& actor, const std::string& username, const std::string& secret);
	void removeSession(ClientSession& session); //!< Implicit logout. Ends a running game without stats.
	void listPlayers(ClientSession& actor);
	void challenge(ClientSession& actor, const std::string& opponent);
	void respondToChallenge(ClientSession& actor, const std::string& challenger, gameNet::Response response);
	void move(ClientSession& actor, const std::string& gameId, int x, int y);
	void rematch(ClientSession& actor, const std::optional<std::string>& opponent); //!< Empty: last opponent.
	void respondToRematch(ClientSession& actor, const std::string& requester, gameNet::Response response);
	void sendLeaderboard(ClientSession& actor);

	//! Send every logged in session the online list without its own name.
	void broadcastPresence();

	AccountRegistry& accounts();
	const PresenceRegistry& presence() const;

	std::optional<std::string> gameOf(const std::string& username) const; //!< Id of the running game of username.
	std::optional<std::string> lastOpponentOf(const std::string& username) const;
	std::size_t gameCount() const;

private:
	struct LiveGame {
		explicit LiveGame(GameSession game) : session{std::move(game)} {}

		std::mutex mutex;
		GameSession session;
		bool started{false}; //!< START_GAME went out to both players. Set under mutex.
		bool closed{false};  //!< Finished or abandoned. Set under mutex.
	};

	bool sendTo(const std::string& username, const gameNet::ServerEvent& event);
	bool isConnected(const std::string& username) const; //!< Has a logged in session that is not torn down.
	bool isPlaying(const std::string& username) const;

	//! Common part of challenge and rematch requests.
	void invite(ClientSession& actor, const std::string& target, PendingTable& pending, const gameNet::ServerEvent& notice);

	//! Register a game with first opening. Fails if either player already has a game.
	std::shared_ptr<LiveGame> createGame(const std::string& first, const std::string& second);

	//! Common part of challenge and rematch answers. The pending entry is already consumed.
	//! On accept the sender opens the new game.
	void answerInvite(ClientSession& actor, const std::string& sender, gameNet::Response response, const gameNet::ServerEvent& answer);
	//! Report a failed accept to both sides. The pending entry is gone, so the sender would otherwise wait forever.
	void failAccept(ClientSession& actor, const std::string& sender, const std::string& reason);
	void finishGame(LiveGame& game); //!< Caller holds game.mutex.
	void abandonGameOf(const std::string& username);
	void unregisterGame(const GameSession& game);

	static gameNet::BoardGrid snapshot(const Board& board);

private:
	AccountRegistry m_accounts;
	PresenceRegistry m_presence;
	const std::size_t m_leaderboardLimit;

	PendingTable m_challenges;
	PendingTable m_rematches;

	std::unordered_map<std::string, std::shared_ptr<ClientSession>> m_clients; //!< Logged in sessions by username.
	mutable std::mutex m_clientsMutex;

	std::unordered_map<std::string, std::shared_ptr<LiveGame>> m_games; //!< Live games by id.
	std::unordered_map<std::string, std::string> m_gameByPlayer;       //!< Username -> game id.
	mutable std::mutex m_gamesMutex;

	std::unordered_map<std::string, std::string> m_lastOpponents;
	mutable std::mutex m_lastOpponentsMutex;
};

} // namespace tictac::lobby
