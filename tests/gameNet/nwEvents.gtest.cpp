#include "gameNet/nwEvents.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace tictac::gtest {

TEST(GameNetMessages, ClientToMessage) {
	using nlohmann::json;

	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ClientLogin{"alice", "pw"})), json({{"type", "LOGIN"}, {"username", "alice"}, {"password", "pw"}}));
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ClientListPlayers{})), json({{"type", "LIST_PLAYERS"}}));
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ClientMove{.gameId = "g1", .x = 2, .y = 0})),
	          json({{"type", "MOVE"}, {"gameId", "g1"}, {"data", {{"x", "2"}, {"y", "0"}}}}));
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ClientChallengeResponse{.challenger = "alice", .response = gameNet::Response::Accept})),
	          json({{"type", "CHALLENGE_RESPONSE"}, {"challenger", "alice"}, {"response", "ACCEPT"}}));
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ClientRematchRequest{})), json({{"type", "REMATCH_REQUEST"}}));
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ClientRematchRequest{"bob"})), json({{"type", "REMATCH_REQUEST"}, {"opponent", "bob"}}));

	// Quotes travel escaped on one line.
	const auto quoted = gameNet::toMessage(gameNet::ClientRegister{"a\"b", "two\nlines"});
	EXPECT_EQ(quoted.find('\n'), std::string::npos);
	EXPECT_EQ(json::parse(quoted), json({{"type", "REGISTER"}, {"username", "a\"b"}, {"password", "two\nlines"}}));
}

TEST(GameNetMessages, ServerToMessage) {
	using nlohmann::json;

	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ServerError{"Not your turn"})), json({{"type", "ERROR"}, {"message", "Not your turn"}}));
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ServerPlayersList{{"bob", "carol"}})), json({{"type", "PLAYERS_LIST"}, {"players", "bob,carol"}}));
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ServerPlayersList{})), json({{"type", "PLAYERS_LIST"}, {"players", ""}}));
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ServerLeaderboard{{
	                  {.rank = 1u, .username = "bob", .wins = 5u, .losses = 3u, .draws = 0u},
	                  {.rank = 2u, .username = "alice", .wins = 5u, .losses = 5u, .draws = 1u},
	          }})),
	          json({{"type", "LEADERBOARD"}, {"data", "1,bob,5,3,0|2,alice,5,5,1"}}));

	gameNet::BoardGrid board{{{'X', ' ', ' '}, {' ', 'O', ' '}, {' ', ' ', ' '}}};
	EXPECT_EQ(json::parse(gameNet::toMessage(gameNet::ServerUpdate{.gameId = "g1", .board = board, .currentPlayer = "alice"})),
	          json({{"type", "UPDATE"},
	                {"gameId", "g1"},
	                {"currentPlayer", "alice"},
	                {"board",
	                 {{"0,0", "X"}, {"0,1", " "}, {"0,2", " "}, {"1,0", " "}, {"1,1", "O"}, {"1,2", " "}, {"2,0", " "}, {"2,1", " "}, {"2,2", " "}}}}));
}

TEST(GameNetMessages, ServerFromMessageValid) {
	const auto login = gameNet::fromServerMessage(R"({"type":"LOGIN_SUCCESS","username":"bob","wins":"3","losses":"1","draws":"0"})");
	ASSERT_TRUE(login.has_value());
	ASSERT_TRUE(std::holds_alternative<gameNet::ServerLoginSuccess>(*login));
	const auto& loginEvent = std::get<gameNet::ServerLoginSuccess>(*login);
	EXPECT_EQ(loginEvent.username, "bob");
	EXPECT_EQ(loginEvent.wins, 3u);
	EXPECT_EQ(loginEvent.losses, 1u);
	EXPECT_EQ(loginEvent.draws, 0u);

	const auto players = gameNet::fromServerMessage(R"({"type":"PLAYERS_LIST","players":""})");
	ASSERT_TRUE(players.has_value());
	ASSERT_TRUE(std::holds_alternative<gameNet::ServerPlayersList>(*players));
	EXPECT_TRUE(std::get<gameNet::ServerPlayersList>(*players).players.empty());

	const auto challenge = gameNet::fromServerMessage(R"({"type":"CHALLENGE","challenger":"alice"})");
	ASSERT_TRUE(challenge.has_value());
	ASSERT_TRUE(std::holds_alternative<gameNet::ServerChallenge>(*challenge));
	EXPECT_EQ(std::get<gameNet::ServerChallenge>(*challenge).challenger, "alice");

	const auto answer = gameNet::fromServerMessage(R"({"type":"REMATCH_RESPONSE","opponent":"bob","response":"REJECT"})");
	ASSERT_TRUE(answer.has_value());
	ASSERT_TRUE(std::holds_alternative<gameNet::ServerRematchResponse>(*answer));
	EXPECT_EQ(std::get<gameNet::ServerRematchResponse>(*answer).response, gameNet::Response::Reject);

	const auto leaderboard = gameNet::fromServerMessage(R"({"type":"LEADERBOARD","data":"1,bob,5,3,0|2,alice,5,5,1"})");
	ASSERT_TRUE(leaderboard.has_value());
	ASSERT_TRUE(std::holds_alternative<gameNet::ServerLeaderboard>(*leaderboard));
	const auto& entries = std::get<gameNet::ServerLeaderboard>(*leaderboard).entries;
	ASSERT_EQ(entries.size(), 2u);
	EXPECT_EQ(entries[1].rank, 2u);
	EXPECT_EQ(entries[1].username, "alice");
	EXPECT_EQ(entries[1].losses, 5u);

	const auto empty = gameNet::fromServerMessage(R"({"type":"LEADERBOARD","data":""})");
	ASSERT_TRUE(empty.has_value());
	EXPECT_TRUE(std::get<gameNet::ServerLeaderboard>(*empty).entries.empty());
}

TEST(GameNetMessages, ServerEventRoundTrip) {
	gameNet::BoardGrid board{{{'X', 'X', 'X'}, {'O', 'O', ' '}, {' ', ' ', ' '}}};

	const auto result = gameNet::fromServerMessage(gameNet::toMessage(gameNet::ServerResult{.gameId = "g7", .result = Outcome::Loss, .board = board}));
	ASSERT_TRUE(result.has_value());
	ASSERT_TRUE(std::holds_alternative<gameNet::ServerResult>(*result));
	const auto& resultEvent = std::get<gameNet::ServerResult>(*result);
	EXPECT_EQ(resultEvent.gameId, "g7");
	EXPECT_EQ(resultEvent.result, Outcome::Loss);
	EXPECT_EQ(resultEvent.board, board);

	const auto start = gameNet::fromServerMessage(gameNet::toMessage(gameNet::ServerStartGame{
	        .gameId = "g8", .player1 = "alice", .player2 = "bob", .currentPlayer = "alice"}));
	ASSERT_TRUE(start.has_value());
	ASSERT_TRUE(std::holds_alternative<gameNet::ServerStartGame>(*start));
	EXPECT_EQ(std::get<gameNet::ServerStartGame>(*start).player2, "bob");

	const auto gone = gameNet::fromServerMessage(gameNet::toMessage(gameNet::ServerOpponentDisconnected{"g8"}));
	ASSERT_TRUE(gone.has_value());
	ASSERT_TRUE(std::holds_alternative<gameNet::ServerOpponentDisconnected>(*gone));
	EXPECT_EQ(std::get<gameNet::ServerOpponentDisconnected>(*gone).gameId, "g8");
}

TEST(GameNetMessages, ServerFromMessageInvalid) {
	EXPECT_FALSE(gameNet::fromServerMessage("").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage("not-json").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"type":"LOGIN_SUCCESS","username":"bob","wins":3,"losses":1,"draws":0})").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"message":"no type"})").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"type":"UNKNOWN"})").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"type":"ERROR"})").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"type":"LOGIN_SUCCESS","username":"bob","wins":"x","losses":"1","draws":"0"})").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"type":"RESULT","gameId":"g","result":"MAYBE","board":{}})").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"type":"UPDATE","gameId":"g","currentPlayer":"a","board":{"0,0":"X"}})").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"type":"LEADERBOARD","data":"1,bob,5"})").has_value());
	EXPECT_FALSE(gameNet::fromServerMessage(R"({"type":"CHALLENGE_RESPONSE","opponent":"bob","response":"MAYBE"})").has_value());
}

TEST(GameNetMessages, EnumText) {
	EXPECT_EQ(gameNet::toString(gameNet::Response::Accept), "ACCEPT");
	EXPECT_EQ(gameNet::responseFromString("REJECT"), gameNet::Response::Reject);
	EXPECT_FALSE(gameNet::responseFromString("accept").has_value());
	EXPECT_EQ(gameNet::toString(Outcome::Draw), "DRAW");
	EXPECT_EQ(gameNet::outcomeFromString("WIN"), Outcome::Win);
	EXPECT_FALSE(gameNet::outcomeFromString("TIE").has_value());
}

} // namespace tictac::gtest
