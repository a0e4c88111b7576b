#pragma once

#include "core/types.hpp"
#include "gameNet/message.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tictac::gameNet {

// Message "type" values. Several names are shared between both directions.
namespace type {
inline constexpr std::string_view Register              = "REGISTER";
inline constexpr std::string_view Login                 = "LOGIN";
inline constexpr std::string_view ListPlayers           = "LIST_PLAYERS";
inline constexpr std::string_view Challenge             = "CHALLENGE";
inline constexpr std::string_view ChallengeResponse     = "CHALLENGE_RESPONSE";
inline constexpr std::string_view Move                  = "MOVE";
inline constexpr std::string_view Logout                = "LOGOUT";
inline constexpr std::string_view RematchRequest        = "REMATCH_REQUEST";
inline constexpr std::string_view RematchResponse       = "REMATCH_RESPONSE";
inline constexpr std::string_view Leaderboard           = "LEADERBOARD";
inline constexpr std::string_view Success               = "SUCCESS";
inline constexpr std::string_view Error                 = "ERROR";
inline constexpr std::string_view LoginSuccess          = "LOGIN_SUCCESS";
inline constexpr std::string_view PlayersList           = "PLAYERS_LIST";
inline constexpr std::string_view StartGame             = "START_GAME";
inline constexpr std::string_view Update                = "UPDATE";
inline constexpr std::string_view Result                = "RESULT";
inline constexpr std::string_view OpponentDisconnected  = "OPPONENT_DISCONNECTED";
} // namespace type

// Field names.
namespace field {
inline constexpr std::string_view Type          = "type";
inline constexpr std::string_view Username      = "username";
inline constexpr std::string_view Password      = "password";
inline constexpr std::string_view Opponent      = "opponent";
inline constexpr std::string_view Challenger    = "challenger";
inline constexpr std::string_view Requester     = "requester";
inline constexpr std::string_view Response      = "response";
inline constexpr std::string_view GameId        = "gameId";
inline constexpr std::string_view Data          = "data";
inline constexpr std::string_view X             = "x";
inline constexpr std::string_view Y             = "y";
inline constexpr std::string_view Text          = "message";
inline constexpr std::string_view Wins          = "wins";
inline constexpr std::string_view Losses        = "losses";
inline constexpr std::string_view Draws         = "draws";
inline constexpr std::string_view Players       = "players";
inline constexpr std::string_view Player1       = "player1";
inline constexpr std::string_view Player2       = "player2";
inline constexpr std::string_view CurrentPlayer = "currentPlayer";
inline constexpr std::string_view Board         = "board";
inline constexpr std::string_view Result        = "result";
} // namespace field

enum class Response { Accept, Reject };

//! Board snapshot as sent on the wire. 'X', 'O' or ' ' per cell, indexed [x][y].
using BoardGrid = std::array<std::array<char, 3>, 3>;

struct LeaderboardEntry {
	unsigned rank;
	std::string username;
	unsigned wins;
	unsigned losses;
	unsigned draws;
};

// Client Network Events (client -> server)
struct ClientRegister {
	std::string username;
	std::string password;
};
struct ClientLogin {
	std::string username;
	std::string password;
};
struct ClientListPlayers {};
struct ClientChallenge {
	std::string opponent;
};
struct ClientChallengeResponse {
	std::string challenger;
	Response response;
};
struct ClientMove {
	std::string gameId;
	int x;
	int y;
};
struct ClientLogout {};
struct ClientRematchRequest {
	std::optional<std::string> opponent; //!< Empty: server uses the last opponent.
};
struct ClientRematchResponse {
	std::string opponent; //!< The requester being answered.
	Response response;
};
struct ClientLeaderboard {};

// Server Events (server -> client)
struct ServerSuccess {
	std::string message;
};
struct ServerError {
	std::string message;
};
struct ServerLoginSuccess {
	std::string username;
	unsigned wins;
	unsigned losses;
	unsigned draws;
};
struct ServerPlayersList {
	std::vector<std::string> players; //!< Online players without the recipient.
};
struct ServerChallenge {
	std::string challenger;
};
struct ServerChallengeResponse {
	std::string opponent; //!< The player who answered.
	Response response;
};
struct ServerStartGame {
	std::string gameId;
	std::string player1;
	std::string player2;
	std::string currentPlayer;
};
struct ServerUpdate {
	std::string gameId;
	BoardGrid board;
	std::string currentPlayer;
};
struct ServerResult {
	std::string gameId;
	Outcome result; //!< From the recipient's perspective.
	BoardGrid board;
};
struct ServerOpponentDisconnected {
	std::string gameId;
};
struct ServerRematchRequest {
	std::string requester;
};
struct ServerRematchResponse {
	std::string opponent;
	Response response;
};
struct ServerLeaderboard {
	std::vector<LeaderboardEntry> entries;
};

using ClientEvent = std::variant<ClientRegister, ClientLogin, ClientListPlayers, ClientChallenge, ClientChallengeResponse, ClientMove,
                                 ClientLogout, ClientRematchRequest, ClientRematchResponse, ClientLeaderboard>;
using ServerEvent = std::variant<ServerSuccess, ServerError, ServerLoginSuccess, ServerPlayersList, ServerChallenge, ServerChallengeResponse,
                                 ServerStartGame, ServerUpdate, ServerResult, ServerOpponentDisconnected, ServerRematchRequest,
                                 ServerRematchResponse, ServerLeaderboard>;

// Serialize typed events to wire lines. Empty if a value cannot be encoded.
std::string toMessage(const ClientEvent& event);
std::string toMessage(const ServerEvent& event);

//! Parse a server line into a typed event. Returns empty on invalid input.
std::optional<ServerEvent> fromServerMessage(const std::string& message);

// Enum <-> wire text helpers.
std::string_view toString(Response response);
std::optional<Response> responseFromString(std::string_view text);
std::string_view toString(Outcome outcome);
std::optional<Outcome> outcomeFromString(std::string_view text);

} // namespace tictac::gameNet
