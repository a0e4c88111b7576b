#pragma once

#include "network/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace tictac {
namespace network {

//! Connection manager that runs an async accept loop and serves all connections on a pool of IO threads.
//! \note    Each connection is serialised on its own strand, so callbacks for one connection never overlap
//!          while callbacks for different connections run concurrently.
//! \example Usage: set callbacks via connect(), then start() once. Call stop() to shut down.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(const ConnectionId&)> onConnect;
		std::function<void(const ConnectionId&, const Message&)> onMessage;
		std::function<void(const ConnectionId&)> onDisconnect; //!< Exactly once per accepted connection.
	};

	//! Port 0 binds an ephemeral port, see port().
	explicit TcpServer(std::uint16_t port = DEFAULT_PORT, std::size_t ioThreads = 2u);
	~TcpServer();

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;
	TcpServer(TcpServer&&)                 = delete;
	TcpServer& operator=(TcpServer&&)      = delete;

	void connect(Callbacks callbacks); //!< Connect callback functions to get event signalling. Call before start.
	bool start();                      //!< Start accepting clients. Returns false if the port could not be bound.
	void stop();                       //!< Disconnect clients and stop the server. Safe to call multiple times.

	std::uint16_t port() const; //!< Locally bound port or 0 if binding failed.

	bool send(ConnectionId connectionId, const Message& msg); //!< Queue a line for the client. Returns false if not found.
	void reject(ConnectionId connectionId);                   //!< Force close the connection. onDisconnect still fires.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace network
} // namespace tictac
