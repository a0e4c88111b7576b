#include "lobby/serverHub.hpp"
#include "mockClient.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace tictac::gtest {

using namespace gameNet;

//! Message of the last ERROR a client received. Empty if none.
static std::string lastError(const MockClient& client) {
	const auto error = client.last<ServerError>();
	return error ? error->message : std::string{};
}

class ServerHubTest : public ::testing::Test {
protected:
	//! Challenge accepted by second. Returns the game id.
	std::string startGame(MockClient& first, MockClient& second) {
		first.send(ClientChallenge{second.session().username()});
		second.send(ClientChallengeResponse{.challenger = first.session().username(), .response = Response::Accept});

		const auto start = second.last<ServerStartGame>();
		EXPECT_TRUE(start.has_value());
		return start ? start->gameId : std::string{};
	}

	static void move(MockClient& client, const std::string& gameId, int x, int y) {
		client.send(ClientMove{.gameId = gameId, .x = x, .y = y});
	}

	MemoryAccountStore m_store;
	lobby::ServerHub m_hub{m_store};
};

TEST_F(ServerHubTest, RegisterAndLogin) {
	MockClient alice{m_hub};

	alice.send(ClientRegister{"alice", "pw"});
	ASSERT_TRUE(alice.last<ServerSuccess>().has_value());
	EXPECT_EQ(alice.last<ServerSuccess>()->message, "Registration successful");

	alice.send(ClientRegister{"alice", "pw"});
	EXPECT_EQ(lastError(alice), "Username already exists");
	EXPECT_EQ(m_store.saved().size(), 1u);

	alice.send(ClientLogin{"alice", "wrong"});
	EXPECT_EQ(lastError(alice), "Incorrect credentials");
	EXPECT_FALSE(alice.session().isAuthenticated());

	alice.send(ClientLogin{"alice", "pw"});
	const auto success = alice.last<ServerLoginSuccess>();
	ASSERT_TRUE(success.has_value());
	EXPECT_EQ(success->username, "alice");
	EXPECT_EQ(success->wins, 0u);
	EXPECT_EQ(alice.session().username(), "alice");
	EXPECT_TRUE(m_hub.presence().isOnline("alice"));

	alice.send(ClientLogin{"alice", "pw"});
	EXPECT_EQ(lastError(alice), "Already logged in");

	MockClient second{m_hub};
	second.send(ClientLogin{"alice", "pw"});
	EXPECT_EQ(lastError(second), "User already logged in");
	EXPECT_FALSE(second.session().isAuthenticated());
}

TEST_F(ServerHubTest, InputErrors) {
	MockClient client{m_hub};

	client.sendLine("");
	EXPECT_EQ(lastError(client), "Invalid message format");
	client.clear();
	client.sendLine("   ");
	EXPECT_EQ(lastError(client), "Invalid message format");

	client.sendLine("hello");
	EXPECT_EQ(lastError(client), "Invalid message format");
	client.sendLine(R"({"username":"alice"})");
	EXPECT_EQ(lastError(client), "Invalid message format");
	client.sendLine(R"({"type":"DANCE"})");
	EXPECT_EQ(lastError(client), "Unknown message type");
	client.sendLine(R"({"type":"REGISTER","username":"alice"})");
	EXPECT_EQ(lastError(client), "Username and password required");
	client.sendLine(R"({"type":"LOGIN","password":"pw"})");
	EXPECT_EQ(lastError(client), "Username and password required");

	client.send(ClientRegister{"a,b", "pw"});
	EXPECT_EQ(lastError(client), "Invalid username");
	client.send(ClientRegister{"has space", "pw"});
	EXPECT_EQ(lastError(client), "Invalid username");
	client.send(ClientRegister{"", "pw"});
	EXPECT_EQ(lastError(client), "Invalid username");
	client.send(ClientRegister{"alice", "p,w"});
	EXPECT_EQ(lastError(client), "Invalid password");
	EXPECT_EQ(m_store.saveCount(), 0u);

	// Everything else needs a login.
	for (const auto* line: {R"({"type":"LIST_PLAYERS"})", R"({"type":"CHALLENGE","opponent":"bob"})", R"({"type":"LEADERBOARD"})",
	                        R"({"type":"MOVE","gameId":"g","data":{"x":"0","y":"0"}})", R"({"type":"REMATCH_REQUEST"})"}) {
		client.clear();
		client.sendLine(line);
		EXPECT_EQ(lastError(client), "Not authenticated") << line;
	}
}

TEST_F(ServerHubTest, PresenceBroadcast) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	EXPECT_TRUE(alice.last<ServerPlayersList>()->players.empty());

	bob.registerAndLogin("bob");
	EXPECT_EQ(alice.last<ServerPlayersList>()->players, std::vector<std::string>{"bob"});
	EXPECT_EQ(bob.last<ServerPlayersList>()->players, std::vector<std::string>{"alice"});

	alice.clear();
	alice.send(ClientListPlayers{});
	EXPECT_EQ(alice.count<ServerPlayersList>(), 1u);
	EXPECT_EQ(alice.last<ServerPlayersList>()->players, std::vector<std::string>{"bob"});

	alice.clear();
	bob.disconnect();
	ASSERT_EQ(alice.count<ServerPlayersList>(), 1u);
	EXPECT_TRUE(alice.last<ServerPlayersList>()->players.empty());
	EXPECT_FALSE(m_hub.presence().isOnline("bob"));
}

TEST_F(ServerHubTest, FullGame) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");

	alice.send(ClientChallenge{"bob"});
	ASSERT_TRUE(bob.last<ServerChallenge>().has_value());
	EXPECT_EQ(bob.last<ServerChallenge>()->challenger, "alice");

	bob.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Accept});
	const auto answer = alice.last<ServerChallengeResponse>();
	ASSERT_TRUE(answer.has_value());
	EXPECT_EQ(answer->opponent, "bob");
	EXPECT_EQ(answer->response, Response::Accept);

	for (const auto* client: {&alice, &bob}) {
		const auto start = client->last<ServerStartGame>();
		ASSERT_TRUE(start.has_value());
		EXPECT_EQ(start->player1, "alice");
		EXPECT_EQ(start->player2, "bob");
		EXPECT_EQ(start->currentPlayer, "alice");
	}
	const auto gameId = alice.last<ServerStartGame>()->gameId;
	EXPECT_EQ(gameId.size(), 32u);
	EXPECT_EQ(m_hub.gameOf("alice"), gameId);
	EXPECT_EQ(m_hub.gameOf("bob"), gameId);

	move(alice, gameId, 0, 0);
	move(bob, gameId, 1, 1);
	move(alice, gameId, 0, 1);
	move(bob, gameId, 1, 0);

	const auto update = bob.last<ServerUpdate>();
	ASSERT_TRUE(update.has_value());
	EXPECT_EQ(update->currentPlayer, "alice");
	EXPECT_EQ(update->board[0][0], 'X');
	EXPECT_EQ(update->board[1][1], 'O');
	EXPECT_EQ(update->board[2][2], ' ');

	move(alice, gameId, 0, 2);

	EXPECT_EQ(alice.count<ServerUpdate>(), 5u);
	EXPECT_EQ(bob.count<ServerUpdate>(), 5u);

	const auto aliceResult = alice.last<ServerResult>();
	const auto bobResult   = bob.last<ServerResult>();
	ASSERT_TRUE(aliceResult.has_value());
	ASSERT_TRUE(bobResult.has_value());
	EXPECT_EQ(aliceResult->gameId, gameId);
	EXPECT_EQ(aliceResult->result, Outcome::Win);
	EXPECT_EQ(bobResult->result, Outcome::Loss);
	EXPECT_EQ(bobResult->board[0][2], 'X');

	// RESULT follows the final UPDATE.
	EXPECT_TRUE(std::holds_alternative<ServerResult>(alice.events().back()));

	EXPECT_EQ(m_hub.accounts().get("alice")->wins, 1u);
	EXPECT_EQ(m_hub.accounts().get("bob")->losses, 1u);
	EXPECT_EQ(m_hub.gameCount(), 0u);
	EXPECT_FALSE(m_hub.gameOf("alice").has_value());
	EXPECT_EQ(m_hub.lastOpponentOf("alice"), "bob");
	EXPECT_EQ(m_hub.lastOpponentOf("bob"), "alice");

	const auto persisted = m_store.saved();
	ASSERT_EQ(persisted.size(), 2u);
	EXPECT_EQ(persisted[0].wins, 1u);
	EXPECT_EQ(persisted[1].losses, 1u);

	move(bob, gameId, 2, 2);
	EXPECT_EQ(lastError(bob), "Game not found");
}

TEST_F(ServerHubTest, DrawGame) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");
	const auto gameId = startGame(alice, bob);

	move(alice, gameId, 0, 0);
	move(bob, gameId, 0, 1);
	move(alice, gameId, 0, 2);
	move(bob, gameId, 1, 1);
	move(alice, gameId, 1, 0);
	move(bob, gameId, 1, 2);
	move(alice, gameId, 2, 1);
	move(bob, gameId, 2, 0);
	move(alice, gameId, 2, 2);

	EXPECT_EQ(alice.last<ServerResult>()->result, Outcome::Draw);
	EXPECT_EQ(bob.last<ServerResult>()->result, Outcome::Draw);
	EXPECT_EQ(m_hub.accounts().get("alice")->draws, 1u);
	EXPECT_EQ(m_hub.accounts().get("bob")->draws, 1u);
}

TEST_F(ServerHubTest, MoveErrors) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	MockClient carol{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");
	carol.registerAndLogin("carol");
	const auto gameId = startGame(alice, bob);

	move(bob, gameId, 0, 0);
	EXPECT_EQ(lastError(bob), "Not your turn");
	move(carol, gameId, 0, 0);
	EXPECT_EQ(lastError(carol), "Not a player in this game");
	move(alice, "nope", 0, 0);
	EXPECT_EQ(lastError(alice), "Game not found");
	move(alice, gameId, 3, 0);
	EXPECT_EQ(lastError(alice), "Invalid move, try again");
	move(alice, gameId, 0, 0);
	move(bob, gameId, 0, 0);
	EXPECT_EQ(lastError(bob), "Invalid move, try again");

	alice.sendLine(R"({"type":"MOVE","gameId":")" + gameId + R"("})");
	EXPECT_EQ(lastError(alice), "Invalid move format");
	alice.sendLine(R"({"type":"MOVE","data":{"x":"1","y":"1"}})");
	EXPECT_EQ(lastError(alice), "Invalid move format");
	alice.sendLine(R"({"type":"MOVE","gameId":")" + gameId + R"(","data":{"x":"1"}})");
	EXPECT_EQ(lastError(alice), "Move coordinates required");
	alice.sendLine(R"({"type":"MOVE","gameId":")" + gameId + R"(","data":{"x":"one","y":"1"}})");
	EXPECT_EQ(lastError(alice), "Invalid move coordinates");

	// Only the accepted move produced updates. Errors stay with the actor.
	EXPECT_EQ(alice.count<ServerUpdate>(), 1u);
	EXPECT_EQ(bob.count<ServerUpdate>(), 1u);
	EXPECT_EQ(carol.count<ServerUpdate>(), 0u);
	EXPECT_EQ(carol.count<ServerError>(), 1u);
}

TEST_F(ServerHubTest, ChallengeErrors) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	MockClient carol{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");
	carol.registerAndLogin("carol");

	alice.sendLine(R"({"type":"CHALLENGE"})");
	EXPECT_EQ(lastError(alice), "Opponent username required");
	alice.send(ClientChallenge{"dave"});
	EXPECT_EQ(lastError(alice), "User not available");
	alice.send(ClientChallenge{"alice"});
	EXPECT_EQ(lastError(alice), "Cannot challenge yourself");

	bob.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Accept});
	EXPECT_EQ(lastError(bob), "No pending challenge");
	bob.sendLine(R"({"type":"CHALLENGE_RESPONSE","challenger":"alice","response":"MAYBE"})");
	EXPECT_EQ(lastError(bob), "Invalid challenge response");
	bob.sendLine(R"({"type":"CHALLENGE_RESPONSE","response":"ACCEPT"})");
	EXPECT_EQ(lastError(bob), "Invalid challenge response");

	startGame(alice, bob);
	carol.send(ClientChallenge{"alice"});
	EXPECT_EQ(lastError(carol), "Player is already in a game");
	alice.send(ClientChallenge{"carol"});
	EXPECT_EQ(lastError(alice), "Player is already in a game");
	EXPECT_EQ(m_hub.gameCount(), 1u);
}

TEST_F(ServerHubTest, ChallengeRejected) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");

	alice.send(ClientChallenge{"bob"});
	bob.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Reject});

	const auto answer = alice.last<ServerChallengeResponse>();
	ASSERT_TRUE(answer.has_value());
	EXPECT_EQ(answer->response, Response::Reject);
	EXPECT_EQ(alice.count<ServerStartGame>(), 0u);
	EXPECT_EQ(m_hub.gameCount(), 0u);

	// Consumed.
	bob.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Accept});
	EXPECT_EQ(lastError(bob), "No pending challenge");
}

TEST_F(ServerHubTest, NewChallengeReplacesOld) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	MockClient carol{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");
	carol.registerAndLogin("carol");

	alice.send(ClientChallenge{"bob"});
	alice.send(ClientChallenge{"carol"});

	bob.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Accept});
	EXPECT_EQ(lastError(bob), "No pending challenge");
	carol.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Accept});
	EXPECT_EQ(carol.last<ServerStartGame>()->player2, "carol");
}

TEST_F(ServerHubTest, DisconnectMidGame) {
	MockClient bob{m_hub};
	auto alice = std::make_unique<MockClient>(m_hub);
	alice->registerAndLogin("alice");
	bob.registerAndLogin("bob");
	const auto gameId = startGame(*alice, bob);
	move(*alice, gameId, 0, 0);
	const auto saves = m_store.saveCount();

	alice->disconnect();

	const auto notice = bob.last<ServerOpponentDisconnected>();
	ASSERT_TRUE(notice.has_value());
	EXPECT_EQ(notice->gameId, gameId);
	EXPECT_EQ(bob.count<ServerResult>(), 0u);
	EXPECT_EQ(m_store.saveCount(), saves);
	EXPECT_EQ(m_hub.accounts().get("alice")->totalGames(), 0u);
	EXPECT_EQ(m_hub.accounts().get("bob")->totalGames(), 0u);
	EXPECT_EQ(m_hub.gameCount(), 0u);
	EXPECT_FALSE(m_hub.gameOf("bob").has_value());

	move(bob, gameId, 1, 1);
	EXPECT_EQ(lastError(bob), "Game not found");

	// alice can come back and play again.
	alice = std::make_unique<MockClient>(m_hub);
	alice->send(ClientLogin{"alice", "pw"});
	ASSERT_TRUE(alice->last<ServerLoginSuccess>().has_value());
	EXPECT_FALSE(startGame(bob, *alice).empty());
}

TEST_F(ServerHubTest, DisconnectDropsInvitations) {
	MockClient bob{m_hub};
	MockClient carol{m_hub};
	auto alice = std::make_unique<MockClient>(m_hub);
	alice->registerAndLogin("alice");
	bob.registerAndLogin("bob");
	carol.registerAndLogin("carol");

	alice->send(ClientChallenge{"bob"});
	carol.send(ClientChallenge{"alice"});
	alice.reset();

	bob.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Accept});
	EXPECT_EQ(lastError(bob), "No pending challenge");
	EXPECT_EQ(m_hub.gameCount(), 0u);
}

TEST_F(ServerHubTest, LateTeardownKeepsNewerGame) {
	MockClient bob{m_hub};
	bob.registerAndLogin("bob");
	auto old = std::make_unique<MockClient>(m_hub);
	old->registerAndLogin("alice");
	old->disconnect();

	MockClient alice{m_hub};
	alice.send(ClientLogin{"alice", "pw"});
	ASSERT_TRUE(alice.last<ServerLoginSuccess>().has_value());
	const auto gameId = startGame(bob, alice);
	bob.clear();

	// The transport reports the old session once more.
	m_hub.removeSession(old->session());

	EXPECT_EQ(bob.count<ServerOpponentDisconnected>(), 0u);
	EXPECT_EQ(m_hub.gameOf("alice"), gameId);
	EXPECT_TRUE(m_hub.presence().isOnline("alice"));

	move(bob, gameId, 0, 0);
	EXPECT_EQ(alice.last<ServerUpdate>()->currentPlayer, "alice");
}

TEST_F(ServerHubTest, LateTeardownKeepsNewerInvitations) {
	MockClient carol{m_hub};
	carol.registerAndLogin("carol");
	auto old = std::make_unique<MockClient>(m_hub);
	old->registerAndLogin("alice");
	old->disconnect();

	MockClient alice{m_hub};
	alice.send(ClientLogin{"alice", "pw"});
	carol.send(ClientChallenge{"alice"});
	ASSERT_TRUE(alice.last<ServerChallenge>().has_value());

	m_hub.removeSession(old->session());

	alice.send(ClientChallengeResponse{.challenger = "carol", .response = Response::Accept});
	ASSERT_TRUE(carol.last<ServerStartGame>().has_value());
	EXPECT_EQ(m_hub.gameOf("alice"), carol.last<ServerStartGame>()->gameId);
}

TEST_F(ServerHubTest, TeardownRacesNewLogin) {
	MockClient bob{m_hub};
	bob.registerAndLogin("bob");
	{
		MockClient registrar{m_hub};
		registrar.send(ClientRegister{"alice", "pw"});
	}

	for (unsigned round = 0; round != 50u; ++round) {
		auto old = std::make_unique<MockClient>(m_hub);
		old->send(ClientLogin{"alice", "pw"});
		ASSERT_TRUE(old->last<ServerLoginSuccess>().has_value());
		bob.clear();

		std::thread teardown{[&old] { old->disconnect(); }};

		// A new login of the same account goes through as soon as the old session let go of it.
		auto fresh = std::make_unique<MockClient>(m_hub);
		do {
			fresh->clear();
			fresh->send(ClientLogin{"alice", "pw"});
		} while (!fresh->last<ServerLoginSuccess>().has_value());

		bob.send(ClientChallenge{"alice"});
		fresh->send(ClientChallengeResponse{.challenger = "bob", .response = Response::Accept});
		teardown.join();

		const auto start = fresh->last<ServerStartGame>();
		ASSERT_TRUE(start.has_value()) << "round " << round;
		EXPECT_EQ(bob.count<ServerOpponentDisconnected>(), 0u) << "round " << round;
		EXPECT_EQ(m_hub.gameOf("alice"), start->gameId) << "round " << round;
		EXPECT_TRUE(m_hub.presence().isOnline("alice"));

		fresh.reset();
		EXPECT_EQ(m_hub.gameCount(), 0u);
	}
}

TEST_F(ServerHubTest, AcceptFailureReachesSender) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	MockClient carol{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");
	carol.registerAndLogin("carol");

	alice.send(ClientChallenge{"bob"});
	carol.send(ClientChallenge{"alice"});
	alice.send(ClientChallengeResponse{.challenger = "carol", .response = Response::Accept});
	ASSERT_TRUE(m_hub.gameOf("alice").has_value());

	bob.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Accept});
	EXPECT_EQ(lastError(bob), "Player is already in a game");
	EXPECT_EQ(lastError(alice), "Game with bob could not start: Player is already in a game");
	EXPECT_EQ(m_hub.gameCount(), 1u);
}

TEST_F(ServerHubTest, SenderLeavesWhileAccepting) {
	MockClient bob{m_hub};
	bob.registerAndLogin("bob");
	{
		MockClient registrar{m_hub};
		registrar.send(ClientRegister{"alice", "pw"});
	}

	for (unsigned round = 0; round != 100u; ++round) {
		auto alice = std::make_unique<MockClient>(m_hub);
		alice->send(ClientLogin{"alice", "pw"});
		ASSERT_TRUE(alice->last<ServerLoginSuccess>().has_value());
		alice->send(ClientChallenge{"bob"});
		bob.clear();

		std::thread teardown{[&alice] { alice->disconnect(); }};
		bob.send(ClientChallengeResponse{.challenger = "alice", .response = Response::Accept});
		teardown.join();

		// bob only hears about the end of games he was told about.
		EXPECT_EQ(bob.count<ServerOpponentDisconnected>(), bob.count<ServerStartGame>()) << "round " << round;
		if (const auto notice = bob.last<ServerOpponentDisconnected>()) {
			const auto start = bob.last<ServerStartGame>();
			ASSERT_TRUE(start.has_value()) << "round " << round;
			EXPECT_EQ(notice->gameId, start->gameId);
		}
		EXPECT_EQ(m_hub.gameCount(), 0u) << "round " << round;
		EXPECT_FALSE(m_hub.gameOf("bob").has_value());
	}
}

TEST_F(ServerHubTest, Logout) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");
	bob.clear();

	alice.send(ClientLogout{});
	EXPECT_TRUE(alice.closed());
	EXPECT_FALSE(m_hub.presence().isOnline("alice"));
	EXPECT_TRUE(bob.last<ServerPlayersList>()->players.empty());

	// Nothing is handled after logout.
	alice.clear();
	alice.send(ClientListPlayers{});
	EXPECT_TRUE(alice.lines().empty());

	MockClient again{m_hub};
	again.send(ClientLogin{"alice", "pw"});
	EXPECT_TRUE(again.last<ServerLoginSuccess>().has_value());
}

TEST_F(ServerHubTest, Rematch) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");

	bob.send(ClientRematchRequest{});
	EXPECT_EQ(lastError(bob), "No previous opponent found");

	const auto first = startGame(alice, bob);
	move(alice, first, 0, 0);
	move(bob, first, 1, 0);
	move(alice, first, 0, 1);
	move(bob, first, 1, 1);
	move(alice, first, 0, 2);
	ASSERT_EQ(alice.last<ServerResult>()->result, Outcome::Win);

	alice.send(ClientRematchResponse{.opponent = "bob", .response = Response::Accept});
	EXPECT_EQ(lastError(alice), "No pending rematch");
	bob.send(ClientRematchRequest{"bob"});
	EXPECT_EQ(lastError(bob), "Cannot rematch yourself");

	bob.send(ClientRematchRequest{});
	const auto request = alice.last<ServerRematchRequest>();
	ASSERT_TRUE(request.has_value());
	EXPECT_EQ(request->requester, "bob");

	alice.sendLine(R"({"type":"REMATCH_RESPONSE","opponent":"bob"})");
	EXPECT_EQ(lastError(alice), "Invalid rematch response");

	alice.send(ClientRematchResponse{.opponent = "bob", .response = Response::Accept});
	const auto answer = bob.last<ServerRematchResponse>();
	ASSERT_TRUE(answer.has_value());
	EXPECT_EQ(answer->opponent, "alice");
	EXPECT_EQ(answer->response, Response::Accept);

	const auto start = alice.last<ServerStartGame>();
	ASSERT_TRUE(start.has_value());
	EXPECT_NE(start->gameId, first);
	EXPECT_EQ(start->player1, "bob");
	EXPECT_EQ(start->currentPlayer, "bob");
	EXPECT_EQ(m_hub.gameOf("alice"), start->gameId);
}

TEST_F(ServerHubTest, RematchRejected) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");

	alice.send(ClientRematchRequest{"bob"});
	bob.send(ClientRematchResponse{.opponent = "alice", .response = Response::Reject});

	EXPECT_EQ(alice.last<ServerRematchResponse>()->response, Response::Reject);
	EXPECT_EQ(m_hub.gameCount(), 0u);

	alice.send(ClientRematchRequest{"dave"});
	EXPECT_EQ(lastError(alice), "User not available");
}

TEST_F(ServerHubTest, Leaderboard) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");

	const auto gameId = startGame(alice, bob);
	move(alice, gameId, 0, 0);
	move(bob, gameId, 1, 0);
	move(alice, gameId, 0, 1);
	move(bob, gameId, 1, 1);
	move(alice, gameId, 0, 2);

	bob.send(ClientLeaderboard{});
	const auto board = bob.last<ServerLeaderboard>();
	ASSERT_TRUE(board.has_value());
	ASSERT_EQ(board->entries.size(), 2u);
	EXPECT_EQ(board->entries[0].rank, 1u);
	EXPECT_EQ(board->entries[0].username, "alice");
	EXPECT_EQ(board->entries[0].wins, 1u);
	EXPECT_EQ(board->entries[1].rank, 2u);
	EXPECT_EQ(board->entries[1].username, "bob");
	EXPECT_EQ(board->entries[1].losses, 1u);
}

TEST(ServerHub, LeaderboardLimit) {
	MemoryAccountStore store{{
	        {.username = "a", .secret = "pw", .wins = 1u},
	        {.username = "b", .secret = "pw", .wins = 3u},
	        {.username = "c", .secret = "pw", .wins = 2u},
	}};
	lobby::ServerHub hub{store, 2u};
	MockClient client{hub};
	client.send(ClientLogin{"a", "pw"});
	client.send(ClientLeaderboard{});

	const auto board = client.last<ServerLeaderboard>();
	ASSERT_TRUE(board.has_value());
	ASSERT_EQ(board->entries.size(), 2u);
	EXPECT_EQ(board->entries[0].username, "b");
	EXPECT_EQ(board->entries[1].username, "c");
}

TEST_F(ServerHubTest, ConcurrentLogin) {
	{
		MockClient registrar{m_hub};
		registrar.send(ClientRegister{"alice", "pw"});
	}

	std::vector<std::unique_ptr<MockClient>> clients;
	for (unsigned i = 0; i != 8u; ++i) {
		clients.push_back(std::make_unique<MockClient>(m_hub));
	}

	std::vector<std::thread> threads;
	for (auto& client: clients) {
		threads.emplace_back([&client] { client->send(ClientLogin{"alice", "pw"}); });
	}
	for (auto& thread: threads) {
		thread.join();
	}

	unsigned successes = 0;
	unsigned rejected  = 0;
	for (const auto& client: clients) {
		successes += client->last<ServerLoginSuccess>().has_value() ? 1u : 0u;
		rejected += lastError(*client) == "User already logged in" ? 1u : 0u;
	}
	EXPECT_EQ(successes, 1u);
	EXPECT_EQ(rejected, 7u);
	EXPECT_EQ(m_hub.presence().listOnline().size(), 1u);
}

TEST_F(ServerHubTest, ConcurrentMovesOnOneTurn) {
	MockClient alice{m_hub};
	MockClient bob{m_hub};
	alice.registerAndLogin("alice");
	bob.registerAndLogin("bob");
	const auto gameId = startGame(alice, bob);

	// Several requests for the same turn race through the hub. Exactly one is placed.
	std::atomic<bool> go{false};
	std::vector<std::thread> threads;
	for (int cell = 0; cell != 6; ++cell) {
		threads.emplace_back([&, cell] {
			while (!go) {
				std::this_thread::yield();
			}
			m_hub.move(alice.session(), gameId, cell / 3, cell % 3);
		});
	}
	go = true;
	for (auto& thread: threads) {
		thread.join();
	}

	EXPECT_EQ(bob.count<ServerUpdate>(), 1u);
	EXPECT_EQ(alice.count<ServerError>(), 5u);
	EXPECT_EQ(bob.last<ServerUpdate>()->currentPlayer, "bob");
}

} // namespace tictac::gtest
