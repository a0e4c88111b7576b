#include "lobby/gameServer.hpp"

#include "Logging.hpp"
#include "lobby/clientSession.hpp"
#include "sessionKey.hpp"

#include <format>
#include <utility>

namespace tictac::lobby {

GameServer::GameServer(ServerConfig config)
    : m_config{std::move(config)}, m_store{m_config.accountsFile}, m_hub{m_store, m_config.leaderboardLimit},
      m_network{m_config.port, m_config.ioThreads} {
	network::TcpServer::Callbacks callbacks;
	callbacks.onConnect    = [this](network::ConnectionId connectionId) { onClientConnected(connectionId); };
	callbacks.onMessage    = [this](network::ConnectionId connectionId, const network::Message& payload) { onClientMessage(connectionId, payload); };
	callbacks.onDisconnect = [this](network::ConnectionId connectionId) { onClientDisconnected(connectionId); };
	m_network.connect(callbacks);
}

GameServer::~GameServer() {
	stop();
}

bool GameServer::start() {
	if (m_isRunning.exchange(true)) {
		return true;
	}

	if (!m_network.start()) {
		m_isRunning = false;
		Logger().Log(Logging::LogLevel::Error, std::format("[GameServer] Could not start on port {}.", m_config.port));
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Listening on port {}. Accounts in '{}'.", m_network.port(), m_config.accountsFile.string()));
	return true;
}

void GameServer::stop() {
	if (!m_isRunning.exchange(false)) {
		return;
	}

	// Disconnect callbacks run for every open connection before this returns.
	m_network.stop();
	Logger().Log(Logging::LogLevel::Info, "[GameServer] Stopped.");
}

std::uint16_t GameServer::port() const {
	return m_network.port();
}

ServerHub& GameServer::hub() {
	return m_hub;
}

void GameServer::onClientConnected(network::ConnectionId connectionId) {
	ClientSession::Callbacks callbacks{
	        .send  = [this, connectionId](const std::string& line) { return m_network.send(connectionId, line); },
	        .close = [this, connectionId] { m_network.reject(connectionId); },
	};
	auto session = std::make_shared<ClientSession>(CreateSessionKey(), m_hub, std::move(callbacks));

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Connection {} opened session {}.", connectionId, session->id()));

	std::lock_guard lock{m_sessionsMutex};
	m_sessions.emplace(connectionId, std::move(session));
}

void GameServer::onClientMessage(network::ConnectionId connectionId, const network::Message& payload) {
	const auto session = findSession(connectionId);
	if (!session) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameServer] Message from unknown connection {}.", connectionId));
		return;
	}
	session->onMessage(payload);
}

void GameServer::onClientDisconnected(network::ConnectionId connectionId) {
	std::shared_ptr<ClientSession> session;
	{
		std::lock_guard lock{m_sessionsMutex};
		const auto it = m_sessions.find(connectionId);
		if (it == m_sessions.end()) {
			return;
		}
		session = std::move(it->second);
		m_sessions.erase(it);
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Connection {} closed.", connectionId));
	session->onDisconnect();
}

std::shared_ptr<ClientSession> GameServer::findSession(network::ConnectionId connectionId) const {
	std::lock_guard lock{m_sessionsMutex};

	const auto it = m_sessions.find(connectionId);
	if (it == m_sessions.end()) {
		return nullptr;
	}
	return it->second;
}

} // namespace tictac::lobby
