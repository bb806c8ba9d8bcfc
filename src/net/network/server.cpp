#include "network/server.hpp"

#include "Logging.hpp"
#include "network/core/tcpServer.hpp"
#include "network/nwEvents.hpp"
#include "roomManager.hpp"
#include "safeQueue.hpp"
#include "serverEvents.hpp"

#include <atomic>
#include <format>
#include <thread>

namespace wiz::network {

class Server::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	bool start();
	void stop();

	std::uint16_t port() const;

private:
	void serverLoop();                                //!< Relay thread: drain queue and act.
	void processEvent(const ServerQueueEvent& event); //!< Reads event type and distributes.

	void send(core::ConnectionId connectionId, const ServerEvent& event);
	void broadcast(const Room& room, const ServerEvent& event);

private:
	// Network callbacks (run on the IO thread) only enqueue events.
	void onClientConnected(core::ConnectionId connectionId);
	void onClientMessage(core::ConnectionId connectionId, const core::Message& payload);
	void onClientDisconnected(core::ConnectionId connectionId);

private:
	void processClientConnect(const ServerQueueEvent& event);
	void processClientMessage(const ServerQueueEvent& event);
	void processClientDisconnect(const ServerQueueEvent& event);
	void processShutdown(const ServerQueueEvent& event);

	void handleClientEvent(core::ConnectionId connectionId, const ClientJoinRoom& event);
	void handleClientEvent(core::ConnectionId connectionId, const ClientState& event);

private:
	std::atomic<bool> m_isRunning{false};
	std::thread m_serverThread;

	RoomManager m_rooms;
	core::TcpServer m_network;
	SafeQueue<ServerQueueEvent> m_eventQueue; //!< Event queue between IO thread and relay thread.
};

Server::Implementation::Implementation(std::uint16_t port) : m_network{port} {
	core::TcpServer::Callbacks callbacks;
	callbacks.onConnect    = [this](core::ConnectionId connectionId) { onClientConnected(connectionId); };
	callbacks.onMessage    = [this](core::ConnectionId connectionId, const core::Message& payload) { onClientMessage(connectionId, payload); };
	callbacks.onDisconnect = [this](core::ConnectionId connectionId) { onClientDisconnected(connectionId); };
	m_network.connect(std::move(callbacks));
}

bool Server::Implementation::start() {
	if (m_isRunning.exchange(true)) {
		return true;
	}
	if (!m_network.start()) {
		m_isRunning = false;
		return false;
	}

	m_serverThread = std::thread([this] { serverLoop(); });
	Logger().Log(Logging::LogLevel::Info, std::format("[Relay] Started on port {}.", m_network.port()));
	return true;
}

void Server::Implementation::stop() {
	if (m_isRunning.exchange(false)) {
		m_eventQueue.Push(ServerQueueEvent{.type = ServerQueueEventType::Shutdown});
	}
	m_network.stop();
	m_eventQueue.Release();

	if (m_serverThread.joinable()) {
		m_serverThread.join();
		Logger().Log(Logging::LogLevel::Info, "[Relay] Stopped.");
	}
}

std::uint16_t Server::Implementation::port() const {
	return m_network.port();
}

void Server::Implementation::send(core::ConnectionId connectionId, const ServerEvent& event) {
	if (!m_network.send(connectionId, toMessage(event))) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Relay] Client {} is gone. Reply dropped.", connectionId));
	}
}

void Server::Implementation::broadcast(const Room& room, const ServerEvent& event) {
	const auto message = toMessage(event);
	m_rooms.forEachMember(room, [&](core::ConnectionId connectionId) {
		if (!m_network.send(connectionId, message)) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[Relay] Member {} is gone. Skipped.", connectionId));
		}
	});
}

void Server::Implementation::onClientConnected(core::ConnectionId connectionId) {
	m_eventQueue.Push(ServerQueueEvent{.type = ServerQueueEventType::ClientConnected, .connectionId = connectionId});
}

void Server::Implementation::onClientMessage(core::ConnectionId connectionId, const core::Message& payload) {
	m_eventQueue.Push(ServerQueueEvent{
	        .type         = ServerQueueEventType::ClientMessage,
	        .connectionId = connectionId,
	        .payload      = payload,
	});
}

void Server::Implementation::onClientDisconnected(core::ConnectionId connectionId) {
	m_eventQueue.Push(ServerQueueEvent{.type = ServerQueueEventType::ClientDisconnected, .connectionId = connectionId});
}

void Server::Implementation::serverLoop() {
	while (m_isRunning) {
		const auto event = m_eventQueue.Pop();
		if (!event) {
			break;
		}
		processEvent(*event);
	}
}

void Server::Implementation::processEvent(const ServerQueueEvent& event) {
	switch (event.type) {
	case ServerQueueEventType::ClientConnected:
		processClientConnect(event);
		break;
	case ServerQueueEventType::ClientDisconnected:
		processClientDisconnect(event);
		break;
	case ServerQueueEventType::ClientMessage:
		processClientMessage(event);
		break;
	case ServerQueueEventType::Shutdown:
		processShutdown(event);
		break;
	}
}

void Server::Implementation::processClientConnect(const ServerQueueEvent& event) {
	Logger().Log(Logging::LogLevel::Info, std::format("[Relay] Client {} connected.", event.connectionId));
}

void Server::Implementation::processClientMessage(const ServerQueueEvent& event) {
	const auto clientEvent = fromClientMessage(event.payload);
	if (!clientEvent) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Relay] Invalid message from client {}.", event.connectionId));
		send(event.connectionId, ServerError{.message = "Invalid message."});
		return;
	}

	std::visit([&](const auto& e) { handleClientEvent(event.connectionId, e); }, *clientEvent);
}

void Server::Implementation::processClientDisconnect(const ServerQueueEvent& event) {
	m_rooms.leave(event.connectionId);
	Logger().Log(Logging::LogLevel::Info, std::format("[Relay] Client {} disconnected. {} room(s) open.", event.connectionId, m_rooms.roomCount()));
}

void Server::Implementation::processShutdown(const ServerQueueEvent&) {
	m_isRunning = false;
}

void Server::Implementation::handleClientEvent(core::ConnectionId connectionId, const ClientJoinRoom& event) {
	if (event.password.size() > MAX_PASSWORD_BYTES) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Relay] Client {} sent a password of {} bytes.", connectionId, event.password.size()));
		send(connectionId, ServerError{.message = std::format("Room password exceeds {} bytes.", MAX_PASSWORD_BYTES)});
		return;
	}

	const auto& room = m_rooms.join(connectionId, event.password);
	Logger().Log(Logging::LogLevel::Info, std::format("[Relay] Client {} joined a room with {} member(s).", connectionId, room.members.size()));
	send(connectionId, ServerRoomJoined{.password = room.password, .state = room.state});
}

void Server::Implementation::handleClientEvent(core::ConnectionId connectionId, const ClientState& event) {
	auto* room = m_rooms.roomOf(connectionId);
	if (!room) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Relay] Client {} published state outside a room.", connectionId));
		send(connectionId, ServerError{.message = "Join a room before publishing state."});
		return;
	}

	room->state = event.state;
	Logger().Log(Logging::LogLevel::Debug, std::format("[Relay] Client {} published state to {} member(s).", connectionId, room->members.size()));
	broadcast(*room, ServerState{.state = room->state});
}


Server::Server() : m_pimpl(std::make_unique<Implementation>(core::DEFAULT_PORT)) {
}

Server::Server(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

Server::~Server() {
	stop();
}

bool Server::start() {
	return m_pimpl->start();
}

void Server::stop() {
	m_pimpl->stop();
}

std::uint16_t Server::port() const {
	return m_pimpl->port();
}

} // namespace wiz::network
