#pragma once

#include "lobby/accountStore.hpp"
#include "lobby/config.hpp"
#include "lobby/serverHub.hpp"
#include "network/protocol.hpp"
#include "network/tcpServer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace tictac::lobby {

class ClientSession;

//! Lobby server on two layers.
//! - Network layer    : TcpServer, identifies a client through its connectionId.
//! - Application layer: ServerHub, identifies a client through its ClientSession and username.
class GameServer {
public:
	explicit GameServer(ServerConfig config = {});
	~GameServer();

	GameServer(const GameServer&)            = delete;
	GameServer& operator=(const GameServer&) = delete;

	bool start(); //!< Boot the network listener. False if the port could not be bound.
	void stop();  //!< Close all connections and stop the listener.

	std::uint16_t port() const; //!< Bound port. Useful when configured with port 0.
	ServerHub& hub();

private:
	// Network callbacks (run on libNetwork threads).
	void onClientConnected(network::ConnectionId connectionId);
	void onClientMessage(network::ConnectionId connectionId, const network::Message& payload);
	void onClientDisconnected(network::ConnectionId connectionId);

	std::shared_ptr<ClientSession> findSession(network::ConnectionId connectionId) const;

private:
	ServerConfig m_config;
	std::atomic<bool> m_isRunning{false};

	FileAccountStore m_store;
	ServerHub m_hub;

	std::unordered_map<network::ConnectionId, std::shared_ptr<ClientSession>> m_sessions;
	mutable std::mutex m_sessionsMutex;

	network::TcpServer m_network; //!< Last member: stopped before the sessions and the hub go away.
};

} // namespace tictac::lobby
