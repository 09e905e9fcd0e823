#pragma once

#include "network/serverConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace gomoku::network {

//! Hosts the single shared game.
//! - Network layer    : TcpServer accepts connections and frames messages, identified by connection id.
//! - Application layer: one Coordinator per connection applies commands to the game, identified by peer address.
class GameServer {
public:
	explicit GameServer(ServerConfig config = {});
	~GameServer();

	GameServer(const GameServer&)            = delete;
	GameServer& operator=(const GameServer&) = delete;
	GameServer(GameServer&&)                 = delete;
	GameServer& operator=(GameServer&&)      = delete;

	bool start(); //!< Boot the network listener. Returns false if the address could not be bound.
	void stop();  //!< Close all connections and stop the listener. Safe to call multiple times.

	std::uint16_t port() const;    //!< Bound port.
	std::size_t peerCount() const; //!< Peers currently registered for delivery.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide transport and game internals.
};

} // namespace gomoku::network
