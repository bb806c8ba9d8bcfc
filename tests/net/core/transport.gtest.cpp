#include "network/core/tcpClient.hpp"
#include "network/core/tcpServer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace wiz::gtest {

using network::core::ConnectionId;
using network::core::Message;

//! Records server side traffic and lets the test wait for it.
class ServerEvents {
public:
	void connected(ConnectionId id) {
		std::lock_guard<std::mutex> lock(m_mutex);
		m_connected.push_back(id);
		m_cv.notify_all();
	}

	void message(ConnectionId id, const Message& message) {
		std::lock_guard<std::mutex> lock(m_mutex);
		m_messages.emplace_back(id, message);
		m_cv.notify_all();
	}

	void disconnected(ConnectionId id) {
		std::lock_guard<std::mutex> lock(m_mutex);
		m_disconnected.push_back(id);
		m_cv.notify_all();
	}

	bool waitFor(std::chrono::milliseconds timeout, std::size_t connected, std::size_t messages, std::size_t disconnected) {
		std::unique_lock<std::mutex> lock(m_mutex);
		return m_cv.wait_for(lock, timeout, [&] {
			return m_connected.size() >= connected && m_messages.size() >= messages && m_disconnected.size() >= disconnected;
		});
	}

	std::vector<std::pair<ConnectionId, Message>> messages() {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_messages;
	}

private:
	std::mutex m_mutex;
	std::condition_variable m_cv;
	std::vector<ConnectionId> m_connected;
	std::vector<std::pair<ConnectionId, Message>> m_messages;
	std::vector<ConnectionId> m_disconnected;
};

TEST(Transport, FramedEcho) {
	constexpr std::uint16_t kPort = 12351;

	network::core::TcpServer server{kPort};
	ServerEvents events;

	network::core::TcpServer::Callbacks callbacks;
	callbacks.onConnect = [&](ConnectionId id) { events.connected(id); };
	callbacks.onMessage = [&](ConnectionId id, const Message& message) {
		events.message(id, message);
		server.send(id, "echo:" + message);
	};
	callbacks.onDisconnect = [&](ConnectionId id) { events.disconnected(id); };
	server.connect(std::move(callbacks));

	ASSERT_TRUE(server.start());
	EXPECT_TRUE(server.isListening());
	EXPECT_EQ(server.port(), kPort);

	network::core::TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", kPort));
	EXPECT_FALSE(client.connect("127.0.0.1", kPort));
	ASSERT_TRUE(events.waitFor(std::chrono::milliseconds(500), 1, 0, 0));

	ASSERT_TRUE(client.send("hello"));
	ASSERT_TRUE(client.send(""));

	const auto first = client.read();
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(*first, "echo:hello");
	const auto second = client.read();
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(*second, "echo:");

	ASSERT_TRUE(events.waitFor(std::chrono::milliseconds(500), 1, 2, 0));
	EXPECT_EQ(events.messages()[0].second, "hello");

	client.disconnect();
	EXPECT_FALSE(client.isConnected());
	EXPECT_TRUE(events.waitFor(std::chrono::milliseconds(500), 1, 2, 1));

	server.stop();
}

TEST(Transport, LargeFrame) {
	constexpr std::uint16_t kPort = 12352;

	network::core::TcpServer server{kPort};
	ServerEvents events;

	network::core::TcpServer::Callbacks callbacks;
	callbacks.onMessage = [&](ConnectionId id, const Message& message) { events.message(id, message); };
	server.connect(std::move(callbacks));
	ASSERT_TRUE(server.start());

	network::core::TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", kPort));

	const std::string snapshot(network::core::MAX_PAYLOAD_BYTES, 'x');
	ASSERT_TRUE(client.send(snapshot));
	EXPECT_FALSE(client.send(snapshot + "x"));

	ASSERT_TRUE(events.waitFor(std::chrono::milliseconds(1000), 0, 1, 0));
	EXPECT_EQ(events.messages()[0].second.size(), snapshot.size());

	client.disconnect();
	server.stop();
}

TEST(Transport, ConnectFailure) {
	network::core::TcpClient client;
	EXPECT_FALSE(client.connect("127.0.0.1", 12359));
	EXPECT_FALSE(client.isConnected());
	EXPECT_FALSE(client.send("lost"));
	EXPECT_FALSE(client.read().has_value());
}

} // namespace wiz::gtest
