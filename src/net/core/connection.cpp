#include "connection.hpp"
#include "Logging.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <format>
#include <utility>

namespace wiz::network::core {

Connection::Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks)
    : m_socket(std::move(socket)), m_strand(asio::make_strand(m_socket.get_executor())), m_connectionId(connectionId),
      m_callbacks(std::move(callbacks)) {
}

void Connection::start() {
	if (m_running.exchange(true)) {
		return;
	}

	asio::post(m_strand, [self = shared_from_this()] {
		if (self->m_callbacks.onConnect) {
			self->m_callbacks.onConnect(*self);
		}
		self->startRead();
	});
}

void Connection::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::post(m_strand, [self = shared_from_this()] {
		asio::error_code ec;
		self->m_socket.shutdown(asio::socket_base::shutdown_both, ec);
		self->m_socket.close(ec);
	});
}

void Connection::close() {
	m_running = false;
	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
}

void Connection::send(const Message& msg) {
	if (!m_running || msg.size() > MAX_PAYLOAD_BYTES) {
		return;
	}

	asio::post(m_strand, [self = shared_from_this(), msg] {
		const bool idle = self->m_writeQueue.empty();
		self->m_writeQueue.push_back(msg);
		if (idle) {
			self->startWrite();
		}
	});
}

ConnectionId Connection::connectionId() const {
	return m_connectionId;
}

void Connection::startRead() {
	asio::async_read(m_socket, asio::buffer(&m_readHeader, sizeof(BasicMessageHeader)),
	                 asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                 if (ec || !self->m_running) {
			                 self->doDisconnect();
			                 return;
		                 }

		                 const auto payloadSize = from_network_u32(self->m_readHeader.payload_size);
		                 if (payloadSize > MAX_PAYLOAD_BYTES) {
			                 Logger().Log(Logging::LogLevel::Warning,
			                              std::format("[Connection] {} announced {} bytes. Dropping connection.", self->m_connectionId, payloadSize));
			                 self->doDisconnect();
			                 return;
		                 }
		                 self->readPayload(payloadSize);
	                 }));
}

void Connection::readPayload(const std::uint32_t payloadSize) {
	if (payloadSize == 0) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(*this, Message{});
		}
		startRead();
		return;
	}

	m_readPayload.assign(payloadSize, '\0');
	asio::async_read(m_socket, asio::buffer(m_readPayload.data(), m_readPayload.size()),
	                 asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                 if (ec || !self->m_running) {
			                 self->doDisconnect();
			                 return;
		                 }

		                 if (self->m_callbacks.onMessage) {
			                 self->m_callbacks.onMessage(*self, self->m_readPayload);
		                 }
		                 self->startRead();
	                 }));
}

void Connection::startWrite() {
	if (!m_running || m_writeQueue.empty()) {
		return;
	}

	m_writeHeader.payload_size = to_network_u32(static_cast<std::uint32_t>(m_writeQueue.front().size()));

	std::array<asio::const_buffer, 2> buffers = {asio::buffer(&m_writeHeader, sizeof(BasicMessageHeader)),
	                                             asio::buffer(m_writeQueue.front().data(), m_writeQueue.front().size())};

	asio::async_write(m_socket, buffers, asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                  if (ec || !self->m_running) {
			                  self->doDisconnect();
			                  return;
		                  }

		                  self->m_writeQueue.pop_front();
		                  self->startWrite();
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

} // namespace wiz::network::core
