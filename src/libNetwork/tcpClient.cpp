#include "network/tcpClient.hpp"

#include <asio.hpp>
#include <asio/connect.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <utility>

namespace tictac {
namespace network {

class TcpClient::Implementation {
public:
	Implementation();

public:
	bool connect(std::string host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);
	std::optional<Message> read(std::chrono::milliseconds timeout);

private:
	Message takeLine(std::size_t bytes); //!< Extract one line of bytes length (delimiter included) from the buffer.

	asio::io_context m_ioContext{};
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;
	asio::streambuf m_readBuffer;

	bool m_isConnected{false};
};

TcpClient::Implementation::Implementation() : m_resolver(m_ioContext), m_socket(m_ioContext), m_readBuffer(MAX_LINE_BYTES) {
}

bool TcpClient::Implementation::connect(std::string host, std::uint16_t port) {
	if (m_isConnected) {
		return false;
	}

	// Use error_code overloads to avoid exceptions.
	asio::error_code ec;
	const auto endpoints = m_resolver.resolve(host, std::to_string(port), ec);
	if (ec) {
		return false;
	}
	asio::connect(m_socket, endpoints, ec);
	if (ec) {
		return false;
	}

	m_isConnected = true;
	return true;
}

void TcpClient::Implementation::disconnect() {
	asio::error_code ec;
	m_socket.cancel(ec);
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_isConnected = false;
}

bool TcpClient::Implementation::isConnected() const {
	return m_isConnected;
}

bool TcpClient::Implementation::send(const Message& message) {
	if (!m_isConnected) {
		return false;
	}

	const auto line = message + LINE_DELIMITER;
	asio::error_code ec;
	asio::write(m_socket, asio::buffer(line), ec);
	if (ec) {
		m_isConnected = false;
		return false;
	}
	return true;
}

std::optional<Message> TcpClient::Implementation::read(std::chrono::milliseconds timeout) {
	if (!m_isConnected) {
		return std::nullopt;
	}

	bool completed = false;
	asio::error_code readEc;
	std::size_t readBytes = 0;
	asio::async_read_until(m_socket, m_readBuffer, LINE_DELIMITER, [&](asio::error_code ec, std::size_t bytes) {
		completed = true;
		readEc    = ec;
		readBytes = bytes;
	});

	m_ioContext.restart();
	m_ioContext.run_for(timeout);

	if (!completed) {
		// Timed out. Cancel and drain the aborted handler so the next read starts clean.
		asio::error_code ec;
		m_socket.cancel(ec);
		m_ioContext.restart();
		m_ioContext.run();
		if (!completed || readEc) {
			return std::nullopt;
		}
	}

	if (readEc) {
		m_isConnected = false;
		return std::nullopt;
	}
	return takeLine(readBytes);
}

Message TcpClient::Implementation::takeLine(std::size_t bytes) {
	const auto data = m_readBuffer.data();
	Message line(asio::buffers_begin(data), asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(bytes - 1));
	m_readBuffer.consume(bytes);
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
	return line;
}


TcpClient::TcpClient() : m_pimpl(std::make_unique<Implementation>()) {
}

TcpClient::~TcpClient() {
	disconnect();
}

bool TcpClient::connect(std::string host, std::uint16_t port) {
	return m_pimpl->connect(std::move(host), port);
}

void TcpClient::disconnect() {
	m_pimpl->disconnect();
}

bool TcpClient::isConnected() const {
	return m_pimpl->isConnected();
}

bool TcpClient::send(const Message& message) {
	return m_pimpl->send(message);
}

std::optional<Message> TcpClient::read(std::chrono::milliseconds timeout) {
	return m_pimpl->read(timeout);
}

} // namespace network
} // namespace tictac
