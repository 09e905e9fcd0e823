#pragma once

#include "core/sharedGame.hpp"
#include "core/types.hpp"
#include "network/connectionRegistry.hpp"
#include "network/core/protocol.hpp"

namespace gomoku::network {

//! Bridges one connection to the shared game and the connection registry.
//! Decodes inbound frames, applies them to the game under its lock and routes the response:
//! Move/Reset results to every peer, Ok/Fail only to this peer.
class Coordinator {
public:
	Coordinator(PeerAddress peer, SharedGame& game, ConnectionRegistry& registry);

	Coordinator(const Coordinator&)            = delete;
	Coordinator& operator=(const Coordinator&) = delete;

	//! Handle one inbound frame. Returns false on an undecodable payload; the connection has to be closed then.
	bool onMessage(const core::Message& payload);

	//! Connection closed. Removes the peer from the registry and frees its seat if no game is running.
	void onDisconnect();

	const PeerAddress& peer() const;

private:
	void dispatch(const Response& response); //!< Route the encoded response. Called with the game lock held.

private:
	PeerAddress m_peer;
	SharedGame& m_game;
	ConnectionRegistry& m_registry;
};

} // namespace gomoku::network
