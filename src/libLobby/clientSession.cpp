#include "lobby/clientSession.hpp"

#include "Logging.hpp"
#include "lobby/serverHub.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

namespace tictac::lobby {

using namespace gameNet;

static std::optional<std::string> stringField(const gameNet::Message& message, std::string_view name) {
	return getString(message, std::string{name});
}

static std::optional<int> parseCoordinate(const std::string& text) {
	int value{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

static bool isControl(char c) {
	const auto u = static_cast<unsigned char>(c);
	return u < 0x20u || u == 0x7fu;
}

//! Usernames travel in comma and pipe joined lists and in the account file.
static bool isValidUsername(const std::string& username) {
	if (username.empty()) {
		return false;
	}
	return std::none_of(username.begin(), username.end(), [](char c) {
		return isControl(c) || c == ' ' || c == '"' || c == ',' || c == '|' || c == ':';
	});
}

static bool isValidPassword(const std::string& password) {
	return std::none_of(password.begin(), password.end(), [](char c) { return isControl(c) || c == ','; });
}

ClientSession::ClientSession(SessionId id, ServerHub& hub, Callbacks callbacks)
    : m_id{std::move(id)}, m_hub{hub}, m_callbacks{std::move(callbacks)} {
}

const SessionId& ClientSession::id() const {
	return m_id;
}

std::string ClientSession::username() const {
	std::lock_guard lock{m_usernameMutex};
	return m_username;
}

bool ClientSession::isAuthenticated() const {
	std::lock_guard lock{m_usernameMutex};
	return !m_username.empty();
}

void ClientSession::bindUsername(const std::string& username) {
	std::lock_guard lock{m_usernameMutex};
	m_username = username;
}

bool ClientSession::send(const ServerEvent& event) {
	if (m_closed || !m_callbacks.send) {
		return false;
	}

	return m_callbacks.send(toMessage(event));
}

void ClientSession::sendError(const std::string& text) {
	send(ServerError{text});
}

void ClientSession::onMessage(const std::string& line) {
	if (m_closed) {
		return;
	}

	Logger().Log(Logging::LogLevel::Debug, std::format("[ClientSession] {} <- {}", m_id, line));

	const auto message = decode(line);
	if (!message || !getString(*message, std::string{field::Type})) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[ClientSession] Undecodable line from session {}.", m_id));
		sendError("Invalid message format");
		return;
	}

	try {
		dispatch(*message);
	} catch (const std::exception& ex) {
		Logger().Log(Logging::LogLevel::Error, std::format("[ClientSession] Handling request of session {} failed: {}", m_id, ex.what()));
		sendError("Internal server error");
	}
}

void ClientSession::onDisconnect() {
	if (m_closed.exchange(true)) {
		return;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[ClientSession] Session {} closed.", m_id));
	m_hub.removeSession(*this);
}

void ClientSession::dispatch(const gameNet::Message& message) {
	const auto messageType = *stringField(message, field::Type);

	// Available without login.
	if (messageType == type::Register) {
		return handleRegister(message);
	}
	if (messageType == type::Login) {
		return handleLogin(message);
	}
	if (messageType == type::Logout) {
		return handleLogout();
	}

	const bool known = messageType == type::ListPlayers || messageType == type::Challenge || messageType == type::ChallengeResponse ||
	                   messageType == type::Move || messageType == type::RematchRequest || messageType == type::RematchResponse ||
	                   messageType == type::Leaderboard;
	if (!known) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[ClientSession] Unknown message type '{}' from session {}.", messageType, m_id));
		sendError("Unknown message type");
		return;
	}
	if (!isAuthenticated()) {
		sendError("Not authenticated");
		return;
	}

	if (messageType == type::ListPlayers) {
		handleListPlayers();
	} else if (messageType == type::Challenge) {
		handleChallenge(message);
	} else if (messageType == type::ChallengeResponse) {
		handleChallengeResponse(message);
	} else if (messageType == type::Move) {
		handleMove(message);
	} else if (messageType == type::RematchRequest) {
		handleRematchRequest(message);
	} else if (messageType == type::RematchResponse) {
		handleRematchResponse(message);
	} else {
		handleLeaderboard();
	}
}

void ClientSession::handleRegister(const gameNet::Message& message) {
	const auto username = stringField(message, field::Username);
	const auto password = stringField(message, field::Password);
	if (!username || !password) {
		sendError("Username and password required");
		return;
	}
	if (!isValidUsername(*username)) {
		sendError("Invalid username");
		return;
	}
	if (!isValidPassword(*password)) {
		sendError("Invalid password");
		return;
	}

	m_hub.registerAccount(*this, *username, *password);
}

void ClientSession::handleLogin(const gameNet::Message& message) {
	const auto username = stringField(message, field::Username);
	const auto password = stringField(message, field::Password);
	if (!username || !password) {
		sendError("Username and password required");
		return;
	}
	if (isAuthenticated()) {
		sendError("Already logged in");
		return;
	}

	m_hub.login(*this, *username, *password);
}

void ClientSession::handleListPlayers() {
	m_hub.listPlayers(*this);
}

void ClientSession::handleChallenge(const gameNet::Message& message) {
	const auto opponent = stringField(message, field::Opponent);
	if (!opponent) {
		sendError("Opponent username required");
		return;
	}

	m_hub.challenge(*this, *opponent);
}

void ClientSession::handleChallengeResponse(const gameNet::Message& message) {
	const auto challenger = stringField(message, field::Challenger);
	const auto response   = stringField(message, field::Response);
	const auto answer     = response ? responseFromString(*response) : std::nullopt;
	if (!challenger || !answer) {
		sendError("Invalid challenge response");
		return;
	}

	m_hub.respondToChallenge(*this, *challenger, *answer);
}

void ClientSession::handleMove(const gameNet::Message& message) {
	const auto gameId = stringField(message, field::GameId);
	const auto data   = getMap(message, std::string{field::Data});
	if (!gameId || !data) {
		sendError("Invalid move format");
		return;
	}

	const auto xIt = data->find(std::string{field::X});
	const auto yIt = data->find(std::string{field::Y});
	if (xIt == data->end() || yIt == data->end()) {
		sendError("Move coordinates required");
		return;
	}

	const auto x = parseCoordinate(xIt->second);
	const auto y = parseCoordinate(yIt->second);
	if (!x || !y) {
		sendError("Invalid move coordinates");
		return;
	}

	m_hub.move(*this, *gameId, *x, *y);
}

void ClientSession::handleLogout() {
	Logger().Log(Logging::LogLevel::Info, std::format("[ClientSession] Logout requested by session {}.", m_id));

	// Clean up right away so the account is free before the transport reports the close.
	onDisconnect();
	if (m_callbacks.close) {
		m_callbacks.close();
	}
}

void ClientSession::handleRematchRequest(const gameNet::Message& message) {
	m_hub.rematch(*this, stringField(message, field::Opponent));
}

void ClientSession::handleRematchResponse(const gameNet::Message& message) {
	const auto opponent = stringField(message, field::Opponent);
	const auto response = stringField(message, field::Response);
	const auto answer   = response ? responseFromString(*response) : std::nullopt;
	if (!opponent || !answer) {
		sendError("Invalid rematch response");
		return;
	}

	m_hub.respondToRematch(*this, *opponent, *answer);
}

void ClientSession::handleLeaderboard() {
	m_hub.sendLeaderboard(*this);
}

} // namespace tictac::lobby
