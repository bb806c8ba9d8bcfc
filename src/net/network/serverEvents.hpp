#pragma once

#include "network/core/protocol.hpp"

namespace wiz::network {

// Events flowing from the IO thread into the relay thread.
enum class ServerQueueEventType { ClientConnected, ClientDisconnected, ClientMessage, Shutdown };

struct ServerQueueEvent {
	ServerQueueEventType type{};
	core::ConnectionId connectionId{};
	core::Message payload{}; //!< Raw frame, e.g. {"type":"joinRoom","password":"abc"}.
};

} // namespace wiz::network
