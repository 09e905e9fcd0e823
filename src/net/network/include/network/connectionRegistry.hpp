#pragma once

#include "core/types.hpp"
#include "network/core/protocol.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace gomoku::network {

//! Outbound delivery path of one peer.
class IOutboundChannel {
public:
	virtual ~IOutboundChannel() = default;

	//! Queue payload for the peer. Must not block. Returns false only if the peer is gone.
	virtual bool deliver(const core::Message& payload) = 0;
};

//! Direct message addressed to a peer the registry does not know.
//! \note Responses are only addressed to peers that sent a command, so this indicates a connection lifecycle bug.
class UnknownPeerError : public std::logic_error {
public:
	explicit UnknownPeerError(const PeerAddress& peer);

	const PeerAddress& peer() const;

private:
	PeerAddress m_peer;
};

//! Maps each connected peer to its outbound channel. Thread safe.
//! Peers whose channel refuses a delivery are pruned.
class ConnectionRegistry {
public:
	void registerPeer(const PeerAddress& peer, std::shared_ptr<IOutboundChannel> channel); //!< Add or replace the channel of peer.
	bool unregisterPeer(const PeerAddress& peer);                                          //!< Returns false if peer was not registered.

	//! Deliver payload to every registered peer except exclude. Returns the number of successful deliveries.
	std::size_t broadcast(const core::Message& payload, const std::optional<PeerAddress>& exclude = std::nullopt);

	//! Deliver payload to peer only. Returns false if the delivery failed and the peer got pruned.
	//! \throws UnknownPeerError if peer is not registered.
	bool directMessage(const core::Message& payload, const PeerAddress& peer);

	bool contains(const PeerAddress& peer) const;
	std::size_t size() const;
	void clear();

private:
	mutable std::mutex m_mutex;
	std::unordered_map<PeerAddress, std::shared_ptr<IOutboundChannel>> m_peers;
};

} // namespace gomoku::network
