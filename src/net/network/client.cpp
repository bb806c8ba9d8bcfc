#include "network/client.hpp"

#include "Logging.hpp"
#include "network/core/tcpClient.hpp"

#include <atomic>
#include <format>
#include <thread>

namespace wiz::network {

class Client::Implementation {
public:
	Implementation() = default;
	~Implementation();

	bool registerHandler(IClientHandler* handler);

	bool connect(const std::string& host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const ClientEvent& event);

private:
	void startReadLoop(); //!< Starts background read thread for blocking reads.
	void stopReadLoop();
	void readLoop();

private:
	void handleNetworkEvent(const ServerRoomJoined& event);
	void handleNetworkEvent(const ServerState& event);
	void handleNetworkEvent(const ServerError& event);

private:
	core::TcpClient m_client;
	std::atomic<bool> m_running{false}; //!< Read thread running.
	std::thread m_readThread;

	IClientHandler* m_handler{nullptr};
};

Client::Implementation::~Implementation() {
	disconnect();
}

bool Client::Implementation::registerHandler(IClientHandler* handler) {
	if (m_handler) {
		return false;
	}
	m_handler = handler;
	return true;
}

bool Client::Implementation::connect(const std::string& host, std::uint16_t port) {
	if (m_client.isConnected()) {
		return false;
	}

	// A previous session may have ended on its own. Reap its reader first.
	stopReadLoop();
	if (!m_client.connect(host, port)) {
		return false;
	}
	startReadLoop();
	return true;
}

void Client::Implementation::disconnect() {
	m_client.disconnect();
	stopReadLoop();
}

bool Client::Implementation::isConnected() const {
	return m_client.isConnected();
}

bool Client::Implementation::send(const ClientEvent& event) {
	const auto message = toMessage(event);
	if (!m_client.send(message)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Client] Could not send {} bytes.", message.size()));
		return false;
	}
	return true;
}

void Client::Implementation::startReadLoop() {
	if (m_running.exchange(true)) {
		return;
	}
	m_readThread = std::thread([this] { readLoop(); });
}

void Client::Implementation::stopReadLoop() {
	m_running = false;
	if (!m_readThread.joinable()) {
		return;
	}

	if (m_readThread.get_id() != std::this_thread::get_id()) {
		m_readThread.join();
	} else {
		m_readThread.detach();
	}
}

void Client::Implementation::readLoop() {
	while (m_running && m_client.isConnected()) {
		// TcpClient::read blocks. This loop lives on its own thread.
		const auto message = m_client.read();
		if (!message) {
			break;
		}

		const auto event = fromServerMessage(*message);
		if (!event) {
			Logger().Log(Logging::LogLevel::Warning, "[Client] Ignoring invalid message from relay.");
			continue;
		}
		std::visit([&](const auto& e) { handleNetworkEvent(e); }, *event);
	}

	Logger().Log(Logging::LogLevel::Info, "[Client] Disconnected from relay.");
	if (m_handler) {
		m_handler->onDisconnected();
	}
}

void Client::Implementation::handleNetworkEvent(const ServerRoomJoined& event) {
	if (m_handler) {
		m_handler->onRoomJoined(event);
	}
}

void Client::Implementation::handleNetworkEvent(const ServerState& event) {
	if (m_handler) {
		m_handler->onState(event);
	}
}

void Client::Implementation::handleNetworkEvent(const ServerError& event) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[Client] Relay error: {}", event.message));
	if (m_handler) {
		m_handler->onError(event);
	}
}


Client::Client() : m_pimpl(std::make_unique<Implementation>()) {
}

Client::~Client() = default;

bool Client::registerHandler(IClientHandler* handler) {
	return m_pimpl->registerHandler(handler);
}

bool Client::connect(const std::string& host, std::uint16_t port) {
	return m_pimpl->connect(host, port);
}

void Client::disconnect() {
	m_pimpl->disconnect();
}

bool Client::isConnected() const {
	return m_pimpl->isConnected();
}

bool Client::joinRoom(const RoomPassword& password) {
	return m_pimpl->send(ClientJoinRoom{.password = password});
}

bool Client::publish(const Json::Value& state) {
	return m_pimpl->send(ClientState{.state = state});
}

bool Client::send(const ClientEvent& event) {
	return m_pimpl->send(event);
}

} // namespace wiz::network
