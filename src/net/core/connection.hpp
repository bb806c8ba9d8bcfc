#pragma once

#include "network/core/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace wiz::network::core {

//! Handles framed reads and writes of a single client socket.
//! \note Runs on the server IO thread. Every async operation holds a shared_from_this() reference.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&)> onConnect;
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);

	void start();                  //!< Signal onConnect and start the read loop.
	void stop();                   //!< Close the socket without signalling onDisconnect.
	void close();                  //!< Close immediately. Only valid once the IO thread has exited.
	void send(const Message& msg); //!< Queue a frame. Safe to call from any thread.

	ConnectionId connectionId() const;

private:
	void startRead();
	void readPayload(std::uint32_t payloadSize);
	void startWrite();
	void doDisconnect(); //!< Close and signal onDisconnect once.

private:
	std::atomic<bool> m_running{false};
	asio::ip::tcp::socket m_socket;
	asio::strand<asio::any_io_executor> m_strand;

	ConnectionId m_connectionId;
	Callbacks m_callbacks;

	BasicMessageHeader m_readHeader{};
	Message m_readPayload;

	std::deque<Message> m_writeQueue;
	BasicMessageHeader m_writeHeader{};
};

} // namespace wiz::network::core
