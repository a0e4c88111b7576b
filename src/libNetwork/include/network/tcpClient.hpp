#pragma once

#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tictac {
namespace network {

//! Minimal synchronous line client.
//! \note    This is intentionally blocking I/O to keep the client logic simple.
//!          On any network failure, send/read return false/empty and the client is considered disconnected.
//! \example Usage: connect() once, then send()/read() from a single thread.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	//! Connect to host:port. Returns false on failure or if already connected.
	bool connect(std::string host, std::uint16_t port = DEFAULT_PORT);
	bool isConnected() const;
	void disconnect();

	bool send(const Message& message); //!< Send one line. Returns false on failure.

	//! Read the next full line. Empty on timeout or failure. A timeout keeps the connection usable.
	std::optional<Message> read(std::chrono::milliseconds timeout = std::chrono::seconds(5));

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace network
} // namespace tictac
