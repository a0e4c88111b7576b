#include "connection.hpp"

#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <string>
#include <utility>

namespace tictac::network {

Connection::Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks)
    : m_socket(std::move(socket)), m_strand(m_socket.get_executor()), m_readBuffer(MAX_LINE_BYTES), m_connectionId(connectionId),
      m_callbacks(std::move(callbacks)) {
}

void Connection::start() {
	if (m_running.exchange(true)) {
		return;
	}

	// onConnect runs on the strand so it is ordered before the first onMessage.
	asio::post(m_strand, [self = shared_from_this()] {
		if (self->m_callbacks.onConnect) {
			self->m_callbacks.onConnect(*self);
		}
		self->startRead();
	});
}

void Connection::stop() {
	asio::post(m_strand, [self = shared_from_this()] { self->doDisconnect(); });
}

void Connection::send(const Message& msg) {
	if (!m_running.load()) {
		return;
	}

	asio::post(m_strand, [self = shared_from_this(), line = msg + LINE_DELIMITER]() mutable {
		const bool idle = self->m_writeQueue.empty();
		self->m_writeQueue.push_back(std::move(line));
		if (idle) {
			self->startWrite();
		}
	});
}

ConnectionId Connection::connectionId() const {
	return m_connectionId;
}

void Connection::startWrite() {
	if (!m_running || m_writeQueue.empty()) {
		return;
	}

	asio::async_write(m_socket, asio::buffer(m_writeQueue.front()),
	                  asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                  if (ec || !self->m_running) {
			                  self->doDisconnect();
			                  return;
		                  }

		                  self->m_writeQueue.pop_front();
		                  if (!self->m_writeQueue.empty()) {
			                  self->startWrite();
		                  }
	                  }));
}

void Connection::startRead() {
	// A full buffer without delimiter completes with asio::error::not_found and ends the connection.
	asio::async_read_until(m_socket, m_readBuffer, LINE_DELIMITER,
	                       asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t bytes) {
		                       if (ec || !self->m_running) {
			                       self->doDisconnect();
			                       return;
		                       }

		                       const auto data = self->m_readBuffer.data();
		                       Message line(asio::buffers_begin(data), asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(bytes - 1));
		                       self->m_readBuffer.consume(bytes);
		                       if (!line.empty() && line.back() == '\r') {
			                       line.pop_back();
		                       }

		                       if (self->m_callbacks.onMessage) {
			                       self->m_callbacks.onMessage(*self, line);
		                       }
		                       self->startRead();
	                       }));
}

void Connection::doDisconnect() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_writeQueue.clear();

	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(*this);
	}
}

} // namespace tictac::network
