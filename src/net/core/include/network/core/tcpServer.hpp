#pragma once

#include "network/core/protocol.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace wiz {
namespace network {
namespace core {

//! Accepts clients on a dedicated IO thread and frames their traffic.
//! \note    Callbacks run on the IO thread. Keep them short.
//! \example Usage: set callbacks via connect(), then start() once. Call stop() to shut down.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(ConnectionId)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	explicit TcpServer(std::uint16_t port = DEFAULT_PORT);
	~TcpServer();

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;
	TcpServer(TcpServer&&)                 = delete;
	TcpServer& operator=(TcpServer&&)      = delete;

	void connect(Callbacks callbacks); //!< Set event callbacks. Call before start.
	bool start();                      //!< Start accepting clients. Returns false if the port could not be bound.
	void stop();                       //!< Disconnect clients and stop the server. Safe to call multiple times.

	bool isListening() const;
	std::uint16_t port() const; //!< Bound port. Useful when constructed with port 0.

	bool send(ConnectionId connectionId, const Message& msg); //!< Returns false if the connection is unknown.
	void reject(ConnectionId connectionId);                   //!< Force close a connection.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace core
} // namespace network
} // namespace wiz
