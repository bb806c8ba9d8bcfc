#include "network/core/tcpServer.hpp"
#include "Logging.hpp"
#include "connection.hpp"

#include <asio.hpp>

#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace wiz::network::core {

class TcpServer::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	void connect(Callbacks callbacks);
	bool start();
	void stop();

	bool isListening() const;
	std::uint16_t port() const;

	bool send(ConnectionId connectionId, const Message& msg);
	void reject(ConnectionId connectionId);

private:
	void doAccept();                             //!< Async accept loop.
	void addConnection(asio::ip::tcp::socket socket); //!< Register and start a new connection.

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	bool m_acceptorReady{false};
	std::uint16_t m_port{0};

	std::thread m_ioThread;
	std::atomic<bool> m_running{false};

	Callbacks m_callbacks;

	ConnectionId m_nextConnectionId{1u};
	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections;
	std::mutex m_connectionsMutex;
};


TcpServer::Implementation::Implementation(std::uint16_t port) : m_acceptor(m_ioContext) {
	// Manual open/bind/listen keeps us in error_code land.
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

	m_port          = m_acceptor.local_endpoint(ec).port();
	m_acceptorReady = !ec;
}

void TcpServer::Implementation::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

bool TcpServer::Implementation::start() {
	if (!m_acceptorReady) {
		return false;
	}
	if (m_running.exchange(true)) {
		return true;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {}.", m_port));
	return true;
}

void TcpServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, connection]: connections) {
		connection->stop();
	}

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
	// Posted shutdowns may not have run before the context stopped.
	for (auto& [id, connection]: connections) {
		connection->close();
	}
	Logger().Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

bool TcpServer::Implementation::isListening() const {
	return m_acceptorReady && m_running;
}

std::uint16_t TcpServer::Implementation::port() const {
	return m_port;
}

bool TcpServer::Implementation::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it == m_connections.end()) {
		return false;
	}
	it->second->send(msg);
	return true;
}

void TcpServer::Implementation::reject(ConnectionId connectionId) {
	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		const auto it = m_connections.find(connectionId);
		if (it == m_connections.end()) {
			return;
		}
		connection = it->second;
		m_connections.erase(it);
	}
	connection->stop();
}

void TcpServer::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			addConnection(std::move(socket));
		} else {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		}
		doAccept();
	});
}

void TcpServer::Implementation::addConnection(asio::ip::tcp::socket socket) {
	Connection::Callbacks callbacks;
	callbacks.onConnect = [this](Connection& connection) {
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
		const auto connectionId = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(connectionId);
		}
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(connectionId);
		}
	};

	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		const auto connectionId = m_nextConnectionId++;
		connection              = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
		m_connections.emplace(connectionId, connection);
	}
	connection->start();
}


TcpServer::TcpServer(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::connect(Callbacks callbacks) {
	m_pimpl->connect(std::move(callbacks));
}

bool TcpServer::start() {
	return m_pimpl->start();
}

void TcpServer::stop() {
	m_pimpl->stop();
}

bool TcpServer::isListening() const {
	return m_pimpl->isListening();
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

} // namespace wiz::network::core
