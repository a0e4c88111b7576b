#include "network/tcpServer.hpp"

#include "Logging.hpp"
#include "connection.hpp"

#include <asio.hpp>
#include <asio/ip/tcp.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tictac::network {

class TcpServer::Implementation {
public:
	Implementation(std::uint16_t port, std::size_t ioThreads);

	bool start();
	void connect(Callbacks callbacks);
	void stop();

	std::uint16_t port() const;

	bool send(ConnectionId connectionId, const Message& msg);
	void reject(ConnectionId connectionId);

private:
	void doAccept();                                                                                   //!< Start async accept loop.
	std::shared_ptr<Connection> createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId); //!< Create and add new connection to map.

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	bool m_acceptorReady{false};

	const std::size_t m_threadCount;     //!< Size of the IO thread pool.
	std::vector<std::thread> m_ioThreads; //!< Threads running m_ioContext.
	std::atomic<bool> m_running{false};   //!< TCP Server running.

	Callbacks m_callbacks; //!< Callback functions to signal events.

	std::atomic<ConnectionId> m_nextConnectionId{1u};
	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Active connections.
	std::mutex m_connectionsMutex;                                               //!< Handle concurrency.
};


TcpServer::Implementation::Implementation(std::uint16_t port, std::size_t ioThreads)
    : m_acceptor(m_ioContext), m_threadCount(std::max<std::size_t>(ioThreads, 1u)) {
	// Do a manual open/bind/listen so we can stay in error_code land and avoid throws.
	asio::error_code ec;
	m_acceptor.open(asio::ip::tcp::v4(), ec);
	if (!ec) {
		m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	}
	if (!ec) {
		m_acceptor.bind(asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port), ec);
	}
	if (!ec) {
		m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	}
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpServer] Could not listen on port {}: {}", port, ec.message()));
		return;
	}
	m_acceptorReady = true;
}

bool TcpServer::Implementation::start() {
	// If acceptor init failed during construction, don't start a dead server.
	if (!m_acceptorReady) {
		return false;
	}
	if (m_running.exchange(true)) {
		return true;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	for (std::size_t i = 0; i != m_threadCount; ++i) {
		m_ioThreads.emplace_back([this]() { m_ioContext.run(); });
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {} with {} IO threads.", port(), m_threadCount));
	return true;
}

void TcpServer::Implementation::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	// Closing every socket lets the pending reads complete, which fires the disconnect callbacks.
	std::vector<std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		for (const auto& [id, conn]: m_connections) {
			connections.push_back(conn);
		}
	}
	for (auto& conn: connections) {
		conn->stop();
	}

	// Run dry instead of stopping the context so queued disconnect handlers still execute.
	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	for (auto& thread: m_ioThreads) {
		if (thread.joinable()) {
			thread.join();
		}
	}
	m_ioThreads.clear();

	Logger().Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

std::uint16_t TcpServer::Implementation::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? 0u : endpoint.port();
}

bool TcpServer::Implementation::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	if (m_connections.contains(connectionId)) {
		m_connections.at(connectionId)->send(msg);
		return true;
	}

	return false;
}

void TcpServer::Implementation::reject(ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	if (m_connections.contains(connectionId)) {
		m_connections.at(connectionId)->stop(); // Erased by the onDisconnect callback.
	}
}

void TcpServer::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}

		if (ec) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		} else {
			// start() only posts to the connection strand, so holding the lock here is fine.
			// Checking m_running under the lock guarantees stop() sees every started connection.
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			if (m_running) {
				if (const auto connection = createConnection(std::move(socket), m_nextConnectionId++)) {
					connection->start();
				}
			}
		}

		if (m_running) {
			doAccept();
		}
	});
}

std::shared_ptr<Connection> TcpServer::Implementation::createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId) {
	if (m_connections.contains(connectionId)) {
		return nullptr;
	}

	Connection::Callbacks callbacks;
	callbacks.onConnect = [this](Connection& connection) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[TcpServer] Connection '{}' opened.", connection.connectionId()));
		if (m_callbacks.onConnect) {
			m_callbacks.onConnect(connection.connectionId());
		}
	};
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(connection.connectionId(), message);
		}
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto index = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(index);
		}
		Logger().Log(Logging::LogLevel::Debug, std::format("[TcpServer] Connection '{}' closed.", index));
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(index);
		}
	};

	auto connection = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
	m_connections.emplace(connectionId, connection);
	return connection;
}


TcpServer::TcpServer(std::uint16_t port, std::size_t ioThreads) : m_pimpl(std::make_unique<Implementation>(port, ioThreads)) {
}

TcpServer::~TcpServer() {
	stop();
}

bool TcpServer::start() {
	return m_pimpl->start();
}

void TcpServer::connect(Callbacks callbacks) {
	m_pimpl->connect(std::move(callbacks));
}

void TcpServer::stop() {
	m_pimpl->stop();
}

std::uint16_t TcpServer::port() const {
	return m_pimpl->port();
}

bool TcpServer::send(ConnectionId connectionId, const Message& msg) {
	return m_pimpl->send(connectionId, msg);
}

void TcpServer::reject(ConnectionId connectionId) {
	m_pimpl->reject(connectionId);
}

} // namespace tictac::network
