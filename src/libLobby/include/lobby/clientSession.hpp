#pragma once

#include "gameNet/message.hpp"
#include "gameNet/nwEvents.hpp"
#include "lobby/presenceRegistry.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tictac::lobby {

class ServerHub;

//! Application side of one client connection. Decodes inbound lines, holds the authentication state
//! and forwards requests to the ServerHub. The hub answers through send().
//! \note The transport delivers onMessage and onDisconnect for one session sequentially.
//!       send() may be called from any thread.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
	struct Callbacks {
		std::function<bool(const std::string&)> send; //!< Queue one encoded line on the transport.
		std::function<void()> close;                  //!< Close the transport. onDisconnect follows.
	};

	ClientSession(SessionId id, ServerHub& hub, Callbacks callbacks);

	const SessionId& id() const;
	std::string username() const; //!< Empty until login succeeded.
	bool isAuthenticated() const;

	void onMessage(const std::string& line); //!< Handle one inbound line.
	void onDisconnect();                     //!< Run cleanup in the hub. Only the first call has an effect.

	bool send(const gameNet::ServerEvent& event);
	void sendError(const std::string& text);

private:
	friend class ServerHub;
	void bindUsername(const std::string& username); //!< Called by the hub once the login is accepted.

private:
	void dispatch(const gameNet::Message& message);

	void handleRegister(const gameNet::Message& message);
	void handleLogin(const gameNet::Message& message);
	void handleListPlayers();
	void handleChallenge(const gameNet::Message& message);
	void handleChallengeResponse(const gameNet::Message& message);
	void handleMove(const gameNet::Message& message);
	void handleLogout();
	void handleRematchRequest(const gameNet::Message& message);
	void handleRematchResponse(const gameNet::Message& message);
	void handleLeaderboard();

private:
	const SessionId m_id;
	ServerHub& m_hub;
	Callbacks m_callbacks;

	std::string m_username;
	mutable std::mutex m_usernameMutex;

	std::atomic<bool> m_closed{false};
};

} // namespace tictac::lobby
