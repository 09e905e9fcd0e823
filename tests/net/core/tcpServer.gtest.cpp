#include "network/core/tcpClient.hpp"
#include "network/core/tcpServer.hpp"

#include <asio.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace gomoku::gtest {

using network::core::ConnectionId;
using network::core::Message;
using network::core::SendResult;
using network::core::TcpClient;
using network::core::TcpServer;

//! Echoes every frame back to its sender and records connection events.
class EchoServer {
public:
	EchoServer() : m_server{"127.0.0.1", 0u, 2u} {
		TcpServer::Callbacks callbacks;
		callbacks.onConnect = [this](const ConnectionId&, const std::string& peer) {
			std::lock_guard<std::mutex> lock(m_mutex);
			m_lastPeer = peer;
			++m_connected;
			m_cv.notify_all();
		};
		callbacks.onMessage = [this](const ConnectionId& id, const Message& msg) {
			if (msg == "close") {
				return false;
			}
			if (msg == "oversize") {
				const auto result = m_server.send(id, Message(network::core::MAX_PAYLOAD_BYTES + 1u, 'x'));
				std::lock_guard<std::mutex> lock(m_mutex);
				m_lastResult = result;
				return true;
			}
			return m_server.send(id, msg) == SendResult::Queued;
		};
		callbacks.onDisconnect = [this](const ConnectionId&) {
			std::lock_guard<std::mutex> lock(m_mutex);
			++m_disconnected;
			m_cv.notify_all();
		};
		m_server.connect(callbacks);
	}

	TcpServer& server() {
		return m_server;
	}

	bool waitForDisconnects(std::size_t count) {
		std::unique_lock<std::mutex> lock(m_mutex);
		return m_cv.wait_for(lock, std::chrono::seconds(2), [&] { return m_disconnected >= count; });
	}

	bool waitForConnects(std::size_t count) {
		std::unique_lock<std::mutex> lock(m_mutex);
		return m_cv.wait_for(lock, std::chrono::seconds(2), [&] { return m_connected >= count; });
	}

	std::optional<SendResult> lastResult() {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_lastResult;
	}

	std::string lastPeer() {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_lastPeer;
	}

private:
	std::mutex m_mutex;
	std::condition_variable m_cv;
	std::size_t m_connected{0};
	std::size_t m_disconnected{0};
	std::string m_lastPeer;
	std::optional<SendResult> m_lastResult;

	TcpServer m_server;
};

TEST(TcpServer, EchoesFrames) {
	EchoServer echo;
	ASSERT_TRUE(echo.server().start());
	ASSERT_NE(echo.server().port(), 0u);

	TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", echo.server().port()));

	for (const Message msg: {Message{"hello"}, Message{}, Message(network::core::MAX_PAYLOAD_BYTES, 'x')}) {
		ASSERT_TRUE(client.send(msg));
		const auto reply = client.read();
		ASSERT_TRUE(reply);
		EXPECT_EQ(*reply, msg);
	}

	ASSERT_TRUE(echo.waitForConnects(1u));
	EXPECT_EQ(echo.lastPeer().rfind("127.0.0.1:", 0), 0u);

	client.disconnect();
	EXPECT_TRUE(echo.waitForDisconnects(1u));
	echo.server().stop();
}

TEST(TcpServer, ClientRefusesOversizedFrame) {
	TcpClient client;
	EXPECT_FALSE(client.send("not connected"));

	EchoServer echo;
	ASSERT_TRUE(echo.server().start());
	ASSERT_TRUE(client.connect("127.0.0.1", echo.server().port()));
	EXPECT_FALSE(client.send(Message(network::core::MAX_PAYLOAD_BYTES + 1u, 'x')));
	EXPECT_TRUE(client.isConnected());
	echo.server().stop();
}

TEST(TcpServer, OversizedReplyIsDroppedAndConnectionStays) {
	EchoServer echo;
	ASSERT_TRUE(echo.server().start());

	TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", echo.server().port()));
	ASSERT_TRUE(client.send("oversize"));

	// Frames on one connection are handled in order, so the echo arrives after the dropped reply.
	ASSERT_TRUE(client.send("after"));
	EXPECT_EQ(client.read(), Message{"after"});
	EXPECT_EQ(echo.lastResult(), SendResult::TooLarge);
	EXPECT_TRUE(client.isConnected());

	echo.server().stop();
}

TEST(TcpServer, SendToUnknownConnectionReportsClosed) {
	EchoServer echo;
	ASSERT_TRUE(echo.server().start());
	EXPECT_EQ(echo.server().send(4242u, "nobody"), SendResult::Closed);
	echo.server().stop();
}

TEST(TcpServer, OversizedHeaderClosesConnection) {
	EchoServer echo;
	ASSERT_TRUE(echo.server().start());

	asio::io_context context;
	asio::ip::tcp::socket socket(context);
	asio::error_code ec;
	socket.connect({asio::ip::make_address("127.0.0.1"), echo.server().port()}, ec);
	ASSERT_FALSE(ec);

	const auto header = network::core::to_network_u32(network::core::MAX_PAYLOAD_BYTES + 1u);
	asio::write(socket, asio::buffer(&header, sizeof(header)), ec);
	ASSERT_FALSE(ec);

	EXPECT_TRUE(echo.waitForDisconnects(1u));

	char byte{};
	asio::read(socket, asio::buffer(&byte, 1u), ec);
	EXPECT_TRUE(ec);
	echo.server().stop();
}

TEST(TcpServer, HandlerClosesOnlyItsConnection) {
	EchoServer echo;
	ASSERT_TRUE(echo.server().start());

	TcpClient closing;
	TcpClient staying;
	ASSERT_TRUE(closing.connect("127.0.0.1", echo.server().port()));
	ASSERT_TRUE(staying.connect("127.0.0.1", echo.server().port()));

	ASSERT_TRUE(closing.send("close"));
	EXPECT_FALSE(closing.read());
	EXPECT_TRUE(echo.waitForDisconnects(1u));

	ASSERT_TRUE(staying.send("still here"));
	EXPECT_EQ(staying.read(), Message{"still here"});
	echo.server().stop();
}

TEST(TcpServer, StartFailsOnBadAddress) {
	TcpServer server{"not an address", 0u};
	EXPECT_FALSE(server.start());
	server.stop();
}

TEST(TcpServer, StopIsIdempotent) {
	EchoServer echo;
	ASSERT_TRUE(echo.server().start());
	echo.server().stop();
	echo.server().stop();
}

} // namespace gomoku::gtest
