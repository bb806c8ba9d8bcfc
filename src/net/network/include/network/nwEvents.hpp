#pragma once

#include "network/types.hpp"

#include <json/json.h>

#include <optional>
#include <string>
#include <variant>

namespace wiz::network {

// Client Network Events (client -> server)
struct ClientJoinRoom {
	RoomPassword password;
};

//! Full game snapshot published to the room. The relay never looks inside.
struct ClientState {
	Json::Value state;
};

// Server Events (server -> client)
struct ServerRoomJoined {
	RoomPassword password;
	Json::Value state; //!< Stored room snapshot. Null for a fresh room.
};

struct ServerState {
	Json::Value state;
};

struct ServerError {
	std::string message;
};


using ClientEvent = std::variant<ClientJoinRoom, ClientState>;
using ServerEvent = std::variant<ServerRoomJoined, ServerState, ServerError>;

// Serialize typed events to compact JSON messages.
std::string toMessage(const ClientEvent& event);
std::string toMessage(const ServerEvent& event);

// Parse JSON messages into typed events. Returns empty on invalid input.
std::optional<ClientEvent> fromClientMessage(const std::string& message);
std::optional<ServerEvent> fromServerMessage(const std::string& message);

} // namespace wiz::network
