#pragma once

#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace tictac::network {

//! Transportation primitive. Handles line framed read/write from a single client connection.
//! \note Internals are async and run on the server IO threads, serialised by m_strand.
//!       We use shared_from_this() so any in-flight async op keeps the Connection alive.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&)> onConnect;
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);

	void start();                  //!< Start connection: triggers onConnect and begins the async read loop.
	void stop();                   //!< Stop connection: closes the socket on the strand. Triggers onDisconnect once.
	void send(const Message& msg); //!< Send a line to the client. Safe to call from any thread.

	ConnectionId connectionId() const; //!< Get the identifier of this connection.

private:
	void startRead();    //!< Prime async read and dispatch lines.
	void startWrite();   //!< Prime async write of the queue front.
	void doDisconnect(); //!< Internal cleanup. Runs on the strand.

private:
	std::atomic<bool> m_running{false};           //!< Connection started and not yet torn down.
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< Serialises all handlers of this connection.
	asio::streambuf m_readBuffer;                 //!< Bounded by MAX_LINE_BYTES.

	ConnectionId m_connectionId; //!< Unique identifier for this connection.
	Callbacks m_callbacks;       //!< Used to signal to the parent.

	std::deque<Message> m_writeQueue; //!< Lines including delimiter. Front is being written.
};

} // namespace tictac::network
