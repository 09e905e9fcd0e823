#include "network/core/tcpClient.hpp"
#include "network/gameServer.hpp"
#include "network/messages.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

namespace gomoku::gtest {

using network::core::TcpClient;

static bool send(TcpClient& client, const Command& command) {
	return client.send(network::toMessage(command));
}

static std::optional<Response> receive(TcpClient& client) {
	const auto message = client.read();
	if (!message) {
		return std::nullopt;
	}
	return network::fromServerMessage(*message);
}

static bool waitForPeerCount(const network::GameServer& server, std::size_t count) {
	for (int i = 0; i < 100; ++i) {
		if (server.peerCount() == count) {
			return true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
	}
	return false;
}

class GameServerTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_TRUE(m_server.start());
		ASSERT_TRUE(m_alice.connect("127.0.0.1", m_server.port()));
		ASSERT_TRUE(m_bob.connect("127.0.0.1", m_server.port()));

		ASSERT_TRUE(send(m_alice, ConnectCommand{"alice"}));
		const auto okAlice = receive(m_alice);
		ASSERT_TRUE(okAlice);
		ASSERT_TRUE(std::holds_alternative<OkResponse>(*okAlice));

		ASSERT_TRUE(send(m_bob, ConnectCommand{"bob"}));
		const auto okBob = receive(m_bob);
		ASSERT_TRUE(okBob);
		ASSERT_TRUE(std::holds_alternative<OkResponse>(*okBob));
	}

	void TearDown() override {
		m_alice.disconnect();
		m_bob.disconnect();
		m_server.stop();
	}

	network::GameServer m_server{network::ServerConfig{.host = "127.0.0.1", .port = 0u, .ioThreads = 2u}};
	TcpClient m_alice;
	TcpClient m_bob;
};

TEST_F(GameServerTest, ThirdPlayerIsRejected) {
	TcpClient carol;
	ASSERT_TRUE(carol.connect("127.0.0.1", m_server.port()));
	ASSERT_TRUE(send(carol, ConnectCommand{"carol"}));

	const auto fail = receive(carol);
	ASSERT_TRUE(fail);
	ASSERT_TRUE(std::holds_alternative<FailResponse>(*fail));
	EXPECT_EQ(std::get<FailResponse>(*fail).message, "Game already has two players");
	EXPECT_EQ(std::get<FailResponse>(*fail).peer.rfind("127.0.0.1:", 0), 0u);
}

TEST_F(GameServerTest, OpeningMoveIsBroadcast) {
	ASSERT_TRUE(send(m_bob, MoveCommand{112u, "bob"}));

	const Response expected = MoveResponse{112u, Color::First, std::nullopt};
	EXPECT_EQ(receive(m_alice), expected);
	EXPECT_EQ(receive(m_bob), expected);
}

TEST_F(GameServerTest, OutOfTurnOnlyReachesOffender) {
	ASSERT_TRUE(send(m_alice, MoveCommand{0u, "alice"}));
	ASSERT_TRUE(receive(m_alice));
	ASSERT_TRUE(receive(m_bob));

	ASSERT_TRUE(send(m_alice, MoveCommand{1u, "alice"}));
	const auto fail = receive(m_alice);
	ASSERT_TRUE(fail);
	ASSERT_TRUE(std::holds_alternative<FailResponse>(*fail));
	EXPECT_EQ(std::get<FailResponse>(*fail).message, "It's not your move");

	// The next frame bob sees is his own move, not alice's failure.
	ASSERT_TRUE(send(m_bob, MoveCommand{15u, "bob"}));
	const Response expected = MoveResponse{15u, Color::Second, std::nullopt};
	EXPECT_EQ(receive(m_bob), expected);
	EXPECT_EQ(receive(m_alice), expected);
}

TEST_F(GameServerTest, WinIsAnnouncedAndResetRestarts) {
	for (CellIndex i = 0; i < 4u; ++i) {
		ASSERT_TRUE(send(m_alice, MoveCommand{i, "alice"}));
		ASSERT_TRUE(receive(m_alice));
		ASSERT_TRUE(receive(m_bob));
		ASSERT_TRUE(send(m_bob, MoveCommand{15u + i, "bob"}));
		ASSERT_TRUE(receive(m_alice));
		ASSERT_TRUE(receive(m_bob));
	}

	ASSERT_TRUE(send(m_alice, MoveCommand{4u, "alice"}));
	const Response win = MoveResponse{4u, Color::First, std::string{"alice"}};
	EXPECT_EQ(receive(m_alice), win);
	EXPECT_EQ(receive(m_bob), win);

	ASSERT_TRUE(send(m_bob, ResetCommand{}));
	EXPECT_EQ(receive(m_alice), Response{ResetResponse{}});
	EXPECT_EQ(receive(m_bob), Response{ResetResponse{}});
}

TEST_F(GameServerTest, GarbageClosesOnlyThatConnection) {
	TcpClient mallory;
	ASSERT_TRUE(mallory.connect("127.0.0.1", m_server.port()));
	ASSERT_TRUE(waitForPeerCount(m_server, 3u));

	ASSERT_TRUE(mallory.send("\xC1\xC1\xC1"));
	EXPECT_FALSE(mallory.read());
	EXPECT_TRUE(waitForPeerCount(m_server, 2u));

	ASSERT_TRUE(send(m_alice, MoveCommand{20u, "alice"}));
	EXPECT_TRUE(receive(m_alice));
	EXPECT_TRUE(receive(m_bob));
}

TEST_F(GameServerTest, DisconnectBeforeGameFreesSeat) {
	m_alice.disconnect();
	ASSERT_TRUE(waitForPeerCount(m_server, 1u));

	TcpClient carol;
	ASSERT_TRUE(carol.connect("127.0.0.1", m_server.port()));
	ASSERT_TRUE(send(carol, ConnectCommand{"carol"}));
	const auto ok = receive(carol);
	ASSERT_TRUE(ok);
	EXPECT_TRUE(std::holds_alternative<OkResponse>(*ok));
}

TEST_F(GameServerTest, LongNameIsRejectedAndPeersStayConnected) {
	TcpClient carol;
	ASSERT_TRUE(carol.connect("127.0.0.1", m_server.port()));
	ASSERT_TRUE(send(carol, ConnectCommand{std::string(4070u, 'c')}));

	const auto fail = receive(carol);
	ASSERT_TRUE(fail);
	ASSERT_TRUE(std::holds_alternative<FailResponse>(*fail));
	EXPECT_EQ(std::get<FailResponse>(*fail).message, "Name is too long");
	EXPECT_EQ(m_server.peerCount(), 3u);

	// Broadcasts still reach everybody.
	ASSERT_TRUE(send(m_alice, MoveCommand{0u, "alice"}));
	const Response expected = MoveResponse{0u, Color::First, std::nullopt};
	EXPECT_EQ(receive(m_alice), expected);
	EXPECT_EQ(receive(m_bob), expected);
	EXPECT_EQ(receive(carol), expected);
}

TEST_F(GameServerTest, SeatLeftDuringGameIsFreedByReset) {
	ASSERT_TRUE(send(m_alice, MoveCommand{0u, "alice"}));
	ASSERT_TRUE(receive(m_alice));
	ASSERT_TRUE(receive(m_bob));

	m_alice.disconnect();
	ASSERT_TRUE(waitForPeerCount(m_server, 1u));

	TcpClient carol;
	ASSERT_TRUE(carol.connect("127.0.0.1", m_server.port()));
	ASSERT_TRUE(send(carol, ConnectCommand{"carol"}));
	const auto full = receive(carol);
	ASSERT_TRUE(full);
	ASSERT_TRUE(std::holds_alternative<FailResponse>(*full));
	EXPECT_EQ(std::get<FailResponse>(*full).message, "Game already has two players");

	ASSERT_TRUE(send(m_bob, ResetCommand{}));
	EXPECT_EQ(receive(m_bob), Response{ResetResponse{}});
	EXPECT_EQ(receive(carol), Response{ResetResponse{}});

	ASSERT_TRUE(send(carol, ConnectCommand{"carol"}));
	const auto ok = receive(carol);
	ASSERT_TRUE(ok);
	EXPECT_TRUE(std::holds_alternative<OkResponse>(*ok));
}

} // namespace gomoku::gtest
