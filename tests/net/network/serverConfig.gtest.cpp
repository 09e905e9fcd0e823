#include "network/serverConfig.hpp"

#include <gtest/gtest.h>

namespace gomoku::gtest {

TEST(ServerConfig, BlankKeepsDefaults) {
	for (const auto input: {"", "   ", "\t\n"}) {
		const auto config = network::parseServerConfig(input);
		ASSERT_TRUE(config);
		EXPECT_EQ(config->host, "0.0.0.0");
		EXPECT_EQ(config->port, 3333u);
		EXPECT_EQ(config->ioThreads, 2u);
	}
}

TEST(ServerConfig, HostAndPort) {
	const auto config = network::parseServerConfig(" 127.0.0.1:4000 ");
	ASSERT_TRUE(config);
	EXPECT_EQ(config->host, "127.0.0.1");
	EXPECT_EQ(config->port, 4000u);
}

TEST(ServerConfig, BracketedIpv6) {
	const auto config = network::parseServerConfig("[::1]:5000");
	ASSERT_TRUE(config);
	EXPECT_EQ(config->host, "::1");
	EXPECT_EQ(config->port, 5000u);
}

TEST(ServerConfig, RejectsMalformed) {
	EXPECT_FALSE(network::parseServerConfig("localhost"));
	EXPECT_FALSE(network::parseServerConfig(":3333"));
	EXPECT_FALSE(network::parseServerConfig("127.0.0.1:"));
	EXPECT_FALSE(network::parseServerConfig("127.0.0.1:port"));
	EXPECT_FALSE(network::parseServerConfig("127.0.0.1:70000"));
	EXPECT_FALSE(network::parseServerConfig("127.0.0.1:-1"));
	EXPECT_FALSE(network::parseServerConfig("[::1:5000"));
	EXPECT_FALSE(network::parseServerConfig("[]:5000"));
}

} // namespace gomoku::gtest
