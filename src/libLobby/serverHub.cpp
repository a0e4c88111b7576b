#include "lobby/serverHub.hpp"

#include "Logging.hpp"
#include "lobby/clientSession.hpp"
#include "sessionKey.hpp"

#include <format>
#include <utility>
#include <vector>

namespace tictac::lobby {

using namespace gameNet;

ServerHub::ServerHub(IAccountStore& store, std::size_t leaderboardLimit) : m_accounts{store}, m_leaderboardLimit{leaderboardLimit} {
}

AccountRegistry& ServerHub::accounts() {
	return m_accounts;
}

const PresenceRegistry& ServerHub::presence() const {
	return m_presence;
}

void ServerHub::registerAccount(ClientSession& actor, const std::string& username, const std::string& secret) {
	if (!m_accounts.registerAccount(username, secret)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[ServerHub] Registration of existing account '{}' rejected.", username));
		actor.sendError("Username already exists");
		return;
	}
	actor.send(ServerSuccess{"Registration successful"});
}

void ServerHub::login(ClientSession& actor, const std::string& username, const std::string& secret) {
	if (!m_accounts.authenticate(username, secret)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[ServerHub] Failed login for '{}' on session {}.", username, actor.id()));
		actor.sendError("Incorrect credentials");
		return;
	}
	if (!m_presence.markOnline(username, actor.id())) {
		actor.sendError("User already logged in");
		return;
	}

	actor.bindUsername(username);
	{
		std::lock_guard lock{m_clientsMutex};
		m_clients[username] = actor.shared_from_this();
	}

	const auto account = m_accounts.get(username);
	actor.send(ServerLoginSuccess{
	        .username = username,
	        .wins     = account ? account->wins : 0u,
	        .losses   = account ? account->losses : 0u,
	        .draws    = account ? account->draws : 0u,
	});
	Logger().Log(Logging::LogLevel::Info, std::format("[ServerHub] '{}' logged in on session {}.", username, actor.id()));

	broadcastPresence();
}

void ServerHub::removeSession(ClientSession& session) {
	const auto username = session.username();
	if (username.empty()) {
		return;
	}

	// Presence is released last. Until then no other session can log in as username,
	// so the cleanup below only ever touches state of this session.
	bool current = false;
	{
		std::lock_guard lock{m_clientsMutex};
		const auto it = m_clients.find(username);
		if (it != m_clients.end() && it->second.get() == &session) {
			m_clients.erase(it);
			current = true;
		}
	}

	if (current) {
		const auto dropped = m_challenges.removeInvolving(username) + m_rematches.removeInvolving(username);
		if (dropped) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[ServerHub] Dropped {} pending invitations of '{}'.", dropped, username));
		}
		abandonGameOf(username);
	}

	if (!m_presence.markOffline(username, session.id())) {
		return;
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[ServerHub] '{}' went offline.", username));

	broadcastPresence();
}

void ServerHub::broadcastPresence() {
	std::vector<std::pair<std::string, std::shared_ptr<ClientSession>>> recipients;
	{
		std::lock_guard lock{m_clientsMutex};
		recipients.assign(m_clients.begin(), m_clients.end());
	}

	const auto online = m_presence.listOnline();
	for (const auto& [username, session]: recipients) {
		ServerPlayersList list;
		for (const auto& name: online) {
			if (name != username) {
				list.players.push_back(name);
			}
		}
		session->send(list);
	}
}

void ServerHub::listPlayers(ClientSession& actor) {
	const auto self = actor.username();

	ServerPlayersList list;
	for (const auto& name: m_presence.listOnline()) {
		if (name != self) {
			list.players.push_back(name);
		}
	}
	actor.send(list);
}

void ServerHub::challenge(ClientSession& actor, const std::string& opponent) {
	const auto challenger = actor.username();

	if (!m_presence.isOnline(opponent)) {
		actor.sendError("User not available");
		return;
	}
	if (opponent == challenger) {
		actor.sendError("Cannot challenge yourself");
		return;
	}
	if (isPlaying(challenger) || isPlaying(opponent)) {
		actor.sendError("Player is already in a game");
		return;
	}

	invite(actor, opponent, m_challenges, ServerChallenge{challenger});
}

void ServerHub::respondToChallenge(ClientSession& actor, const std::string& challenger, Response response) {
	const auto responder = actor.username();
	if (!m_challenges.consume(challenger, responder)) {
		actor.sendError("No pending challenge");
		return;
	}

	answerInvite(actor, challenger, response, ServerChallengeResponse{.opponent = responder, .response = response});
}

void ServerHub::rematch(ClientSession& actor, const std::optional<std::string>& opponent) {
	const auto requester = actor.username();

	const auto target = opponent ? opponent : lastOpponentOf(requester);
	if (!target) {
		actor.sendError("No previous opponent found");
		return;
	}
	if (*target == requester) {
		actor.sendError("Cannot rematch yourself");
		return;
	}
	if (!m_presence.isOnline(*target)) {
		actor.sendError("User not available");
		return;
	}
	if (isPlaying(requester) || isPlaying(*target)) {
		actor.sendError("Player is already in a game");
		return;
	}

	invite(actor, *target, m_rematches, ServerRematchRequest{requester});
}

void ServerHub::respondToRematch(ClientSession& actor, const std::string& requester, Response response) {
	const auto responder = actor.username();
	if (!m_rematches.consume(requester, responder)) {
		actor.sendError("No pending rematch");
		return;
	}

	answerInvite(actor, requester, response, ServerRematchResponse{.opponent = responder, .response = response});
}

void ServerHub::invite(ClientSession& actor, const std::string& target, PendingTable& pending, const ServerEvent& notice) {
	const auto sender = actor.username();

	pending.put(sender, target);
	if (!sendTo(target, notice)) {
		// Target logged out after the presence check.
		pending.consume(sender, target);
		actor.sendError("User not available");
		return;
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[ServerHub] '{}' invited '{}'.", sender, target));
}

void ServerHub::answerInvite(ClientSession& actor, const std::string& sender, Response response, const ServerEvent& answer) {
	const auto responder = actor.username();

	if (response == Response::Reject) {
		sendTo(sender, answer);
		Logger().Log(Logging::LogLevel::Info, std::format("[ServerHub] '{}' declined '{}'.", responder, sender));
		return;
	}

	// A sender that is still online but already torn down has no client left.
	if (!isConnected(sender)) {
		actor.sendError("User not available");
		return;
	}
	const auto game = createGame(sender, responder);
	if (!game) {
		failAccept(actor, sender, "Player is already in a game");
		return;
	}

	// Hold the game so no update can overtake the start notice.
	std::lock_guard lock{game->mutex};
	if (!game->closed && !isConnected(sender)) {
		// Sender left between the check above and createGame. Its cleanup found no game to abandon.
		game->closed = true;
		unregisterGame(game->session);
	}
	if (game->closed) {
		failAccept(actor, sender, "User not available");
		return;
	}

	const auto& session = game->session;
	sendTo(sender, answer);

	const ServerStartGame start{
	        .gameId        = session.gameId(),
	        .player1       = session.firstPlayer(),
	        .player2       = session.secondPlayer(),
	        .currentPlayer = session.currentPlayer(),
	};
	sendTo(session.firstPlayer(), start);
	sendTo(session.secondPlayer(), start);
	game->started = true;

	Logger().Log(Logging::LogLevel::Info, std::format("[ServerHub] Game {} started: '{}' vs '{}'.", session.gameId(), sender, responder));
}

void ServerHub::failAccept(ClientSession& actor, const std::string& sender, const std::string& reason) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[ServerHub] '{}' could not accept '{}': {}", actor.username(), sender, reason));
	actor.sendError(reason);
	sendTo(sender, ServerError{std::format("Game with {} could not start: {}", actor.username(), reason)});
}

std::shared_ptr<ServerHub::LiveGame> ServerHub::createGame(const std::string& first, const std::string& second) {
	std::lock_guard lock{m_gamesMutex};
	if (m_gameByPlayer.contains(first) || m_gameByPlayer.contains(second)) {
		return nullptr;
	}

	std::string gameId;
	do {
		gameId = CreateSessionKey();
	} while (m_games.contains(gameId));

	auto game = std::make_shared<LiveGame>(GameSession{gameId, first, second});
	m_games.emplace(gameId, game);
	m_gameByPlayer[first]  = gameId;
	m_gameByPlayer[second] = gameId;
	return game;
}

void ServerHub::move(ClientSession& actor, const std::string& gameId, int x, int y) {
	const auto player = actor.username();

	std::shared_ptr<LiveGame> game;
	{
		std::lock_guard lock{m_gamesMutex};
		const auto it = m_games.find(gameId);
		if (it != m_games.end()) {
			game = it->second;
		}
	}
	if (!game) {
		actor.sendError("Game not found");
		return;
	}

	// Turn check and placement form one step per game.
	std::lock_guard lock{game->mutex};
	auto& session = game->session;
	if (game->closed) {
		actor.sendError("Game not found");
		return;
	}
	if (!session.isPlayer(player)) {
		actor.sendError("Not a player in this game");
		return;
	}
	if (session.currentPlayer() != player) {
		actor.sendError("Not your turn");
		return;
	}

	const auto result = session.applyMove(player, x, y);
	if (result != MoveResult::Accepted) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[ServerHub] Rejected move ({},{}) by '{}' in game {}.", x, y, player, gameId));
		actor.sendError("Invalid move, try again");
		return;
	}

	const ServerUpdate update{
	        .gameId        = gameId,
	        .board         = snapshot(session.board()),
	        .currentPlayer = session.currentPlayer(),
	};
	sendTo(session.firstPlayer(), update);
	sendTo(session.secondPlayer(), update);

	if (session.isTerminal()) {
		finishGame(*game);
	}
}

void ServerHub::finishGame(LiveGame& game) {
	game.closed = true;
	unregisterGame(game.session);

	const auto& session = game.session;
	const auto board    = snapshot(session.board());
	for (const auto& player: {session.firstPlayer(), session.secondPlayer()}) {
		const auto outcome = session.resultFor(player);
		m_accounts.updateOutcome(player, outcome);
		{
			std::lock_guard lock{m_lastOpponentsMutex};
			m_lastOpponents[player] = session.opponentOf(player);
		}
		sendTo(player, ServerResult{.gameId = session.gameId(), .result = outcome, .board = board});
	}

	const auto winner = session.winner();
	Logger().Log(Logging::LogLevel::Info,
	             std::format("[ServerHub] Game {} finished after {} moves. Winner: {}.", session.gameId(), session.moveCount(), winner ? *winner : "none"));
}

void ServerHub::abandonGameOf(const std::string& username) {
	std::shared_ptr<LiveGame> game;
	{
		std::lock_guard lock{m_gamesMutex};
		const auto idIt = m_gameByPlayer.find(username);
		if (idIt == m_gameByPlayer.end()) {
			return;
		}
		const auto gameIt = m_games.find(idIt->second);
		if (gameIt != m_games.end()) {
			game = gameIt->second;
		}
	}
	if (!game) {
		return;
	}

	std::lock_guard lock{game->mutex};
	if (game->closed) {
		return;
	}
	game->closed = true;
	unregisterGame(game->session);

	// The opponent only knows games whose start notice went out.
	if (game->started) {
		sendTo(game->session.opponentOf(username), ServerOpponentDisconnected{game->session.gameId()});
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[ServerHub] Game {} abandoned by '{}'.", game->session.gameId(), username));
}

void ServerHub::unregisterGame(const GameSession& game) {
	std::lock_guard lock{m_gamesMutex};
	m_games.erase(game.gameId());
	for (const auto& player: {game.firstPlayer(), game.secondPlayer()}) {
		const auto it = m_gameByPlayer.find(player);
		if (it != m_gameByPlayer.end() && it->second == game.gameId()) {
			m_gameByPlayer.erase(it);
		}
	}
}

void ServerHub::sendLeaderboard(ClientSession& actor) {
	ServerLeaderboard board;
	unsigned rank = 1;
	for (const auto& account: m_accounts.leaderboard(m_leaderboardLimit)) {
		board.entries.push_back(LeaderboardEntry{
		        .rank     = rank++,
		        .username = account.username,
		        .wins     = account.wins,
		        .losses   = account.losses,
		        .draws    = account.draws,
		});
	}
	actor.send(board);
}

bool ServerHub::sendTo(const std::string& username, const ServerEvent& event) {
	std::shared_ptr<ClientSession> session;
	{
		std::lock_guard lock{m_clientsMutex};
		const auto it = m_clients.find(username);
		if (it == m_clients.end()) {
			return false;
		}
		session = it->second;
	}
	return session->send(event);
}

bool ServerHub::isConnected(const std::string& username) const {
	std::lock_guard lock{m_clientsMutex};
	return m_clients.contains(username);
}

bool ServerHub::isPlaying(const std::string& username) const {
	std::lock_guard lock{m_gamesMutex};
	return m_gameByPlayer.contains(username);
}

std::optional<std::string> ServerHub::gameOf(const std::string& username) const {
	std::lock_guard lock{m_gamesMutex};

	const auto it = m_gameByPlayer.find(username);
	if (it == m_gameByPlayer.end()) {
		return {};
	}
	return it->second;
}

std::optional<std::string> ServerHub::lastOpponentOf(const std::string& username) const {
	std::lock_guard lock{m_lastOpponentsMutex};

	const auto it = m_lastOpponents.find(username);
	if (it == m_lastOpponents.end()) {
		return {};
	}
	return it->second;
}

std::size_t ServerHub::gameCount() const {
	std::lock_guard lock{m_gamesMutex};
	return m_games.size();
}

BoardGrid ServerHub::snapshot(const Board& board) {
	BoardGrid grid{};
	for (Id x = 0; x != Board::SIZE; ++x) {
		for (Id y = 0; y != Board::SIZE; ++y) {
			grid[x][y] = toSymbol(board.getAt({x, y}));
		}
	}
	return grid;
}

} // namespace tictac::lobby
