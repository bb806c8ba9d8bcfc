#pragma once

#include "network/core/protocol.hpp"
#include "network/nwEvents.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace wiz::network {

//! Callback interface invoked on the client's read thread.
class IClientHandler {
public:
	virtual ~IClientHandler()                                = default;
	virtual void onRoomJoined(const ServerRoomJoined& event) = 0;
	virtual void onState(const ServerState& event)           = 0;
	virtual void onError(const ServerError& event)           = 0;
	virtual void onDisconnected()                            = 0;
};

//! Relay client. Reads on a background thread and forwards typed events to the handler.
class Client {
public:
	Client();
	~Client();

	Client(const Client&)            = delete;
	Client& operator=(const Client&) = delete;
	Client(Client&&)                 = delete;
	Client& operator=(Client&&)      = delete;

	bool registerHandler(IClientHandler* handler); //!< Register a single handler. Returns false if already registered.

	bool connect(const std::string& host, std::uint16_t port = core::DEFAULT_PORT);
	void disconnect();
	bool isConnected() const;

	bool joinRoom(const RoomPassword& password);
	bool publish(const Json::Value& state);
	bool send(const ClientEvent& event);

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace wiz::network
