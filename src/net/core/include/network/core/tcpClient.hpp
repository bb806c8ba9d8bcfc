#pragma once

#include "network/core/protocol.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wiz {
namespace network {
namespace core {

//! Minimal synchronous TCP client.
//! \note    Blocking I/O. On any network failure send/read fail and the client counts as disconnected.
//! \example Usage: connect() once, then read() from one thread and send() from another.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	//! Connect to host:port. Returns false on failure or if already connected.
	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	bool isConnected() const;
	void disconnect();

	bool send(const Message& message);   //!< Send a message with a size prefix header. Returns false on failure.
	std::optional<Message> read();       //!< Read a full frame. Empty if disconnected or on error.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace core
} // namespace network
} // namespace wiz
