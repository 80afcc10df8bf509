#include "hoshi/network/tcpClient.hpp"
#include "hoshi/network/tcpServer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>

namespace hoshi::gtest {

using namespace std::chrono_literals;
using network::ConnectionId;

namespace {

//! Server answering every frame with "echo: <frame>".
struct EchoServer {
	EchoServer() : server(0u) {
		server.connect(network::TcpServer::Callbacks{
		        .onConnect =
		                [this](ConnectionId id) {
			                std::lock_guard<std::mutex> lock(mutex);
			                connected.insert(id);
		                },
		        .onMessage = [this](ConnectionId id, const network::Message& message) { server.send(id, "echo: " + message); },
		        .onDisconnect =
		                [this](ConnectionId id) {
			                {
				                std::lock_guard<std::mutex> lock(mutex);
				                disconnected.insert(id);
			                }
			                changed.notify_all();
		                },
		});
		server.start();
	}

	bool waitForDisconnects(std::size_t count) {
		std::unique_lock<std::mutex> lock(mutex);
		return changed.wait_for(lock, 5s, [&] { return disconnected.size() >= count; });
	}

	std::set<ConnectionId> connected;
	std::set<ConnectionId> disconnected;
	std::mutex mutex;
	std::condition_variable changed;
	network::TcpServer server; //!< Stopped before the members its callbacks use.
};

} // namespace

TEST(Networking, EchoRoundTrip) {
	EchoServer echo;
	ASSERT_NE(echo.server.port(), 0u);

	network::TcpClient client1;
	network::TcpClient client2;
	ASSERT_TRUE(client1.connect("127.0.0.1", echo.server.port()));
	ASSERT_TRUE(client2.connect("127.0.0.1", echo.server.port()));

	ASSERT_TRUE(client1.send(R"({"type":"heartbeat"})"));
	ASSERT_TRUE(client2.send("second"));
	ASSERT_TRUE(client1.send(""));

	EXPECT_EQ(client1.read(), network::Message(R"(echo: {"type":"heartbeat"})"));
	EXPECT_EQ(client1.read(), network::Message("echo: "));
	EXPECT_EQ(client2.read(), network::Message("echo: second"));

	client1.disconnect();
	client2.disconnect();
	EXPECT_TRUE(echo.waitForDisconnects(2u));
	EXPECT_FALSE(client1.isConnected());
}

TEST(Networking, LargeFrame) {
	EchoServer echo;
	network::TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", echo.server.port()));

	const network::Message big(100'000u, 'x');
	ASSERT_TRUE(client.send(big));
	const auto reply = client.read();
	ASSERT_TRUE(reply.has_value());
	EXPECT_EQ(reply->size(), big.size() + 6u);

	// Oversized frames are refused before sending.
	EXPECT_FALSE(client.send(network::Message(network::MAX_PAYLOAD_BYTES + 1u, 'x')));
}

TEST(Networking, RejectClosesClient) {
	EchoServer echo;
	network::TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", echo.server.port()));
	ASSERT_TRUE(client.send("hello"));
	ASSERT_TRUE(client.read().has_value());

	ConnectionId id{};
	{
		std::lock_guard<std::mutex> lock(echo.mutex);
		ASSERT_EQ(echo.connected.size(), 1u);
		id = *echo.connected.begin();
	}

	echo.server.reject(id);
	EXPECT_TRUE(echo.waitForDisconnects(1u));
	EXPECT_FALSE(client.read().has_value());
	EXPECT_FALSE(echo.server.send(id, "gone"));
}

TEST(Networking, ConnectFails) {
	network::TcpClient client;
	EXPECT_FALSE(client.send("nobody listens"));
	EXPECT_FALSE(client.read().has_value());

	network::TcpServer server(0u);
	server.start();
	const auto port = server.port();
	server.stop();
	EXPECT_FALSE(client.connect("127.0.0.1", port));
}

} // namespace hoshi::gtest
