#include "network/connectionRegistry.hpp"

#include "Logging.hpp"

#include <format>
#include <vector>

namespace gomoku::network {

UnknownPeerError::UnknownPeerError(const PeerAddress& peer) : std::logic_error(std::format("No connection registered for peer '{}'.", peer)), m_peer(peer) {
}

const PeerAddress& UnknownPeerError::peer() const {
	return m_peer;
}

void ConnectionRegistry::registerPeer(const PeerAddress& peer, std::shared_ptr<IOutboundChannel> channel) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto [it, inserted] = m_peers.insert_or_assign(peer, std::move(channel));
	if (!inserted) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Registry] Peer '{}' registered twice. Replaced channel.", peer));
	}
}

bool ConnectionRegistry::unregisterPeer(const PeerAddress& peer) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_peers.erase(peer) > 0u;
}

std::size_t ConnectionRegistry::broadcast(const core::Message& payload, const std::optional<PeerAddress>& exclude) {
	std::lock_guard<std::mutex> lock(m_mutex);

	std::size_t delivered = 0;
	std::vector<PeerAddress> gone;
	for (const auto& [peer, channel]: m_peers) {
		if (exclude && peer == *exclude) {
			continue;
		}
		if (channel->deliver(payload)) {
			++delivered;
		} else {
			gone.push_back(peer);
		}
	}

	for (const auto& peer: gone) {
		m_peers.erase(peer);
		Logger().Log(Logging::LogLevel::Info, std::format("[Registry] Pruned peer '{}' after failed delivery.", peer));
	}
	return delivered;
}

bool ConnectionRegistry::directMessage(const core::Message& payload, const PeerAddress& peer) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_peers.find(peer);
	if (it == m_peers.end()) {
		throw UnknownPeerError(peer);
	}

	if (!it->second->deliver(payload)) {
		m_peers.erase(it);
		Logger().Log(Logging::LogLevel::Info, std::format("[Registry] Pruned peer '{}' after failed delivery.", peer));
		return false;
	}
	return true;
}

bool ConnectionRegistry::contains(const PeerAddress& peer) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_peers.contains(peer);
}

std::size_t ConnectionRegistry::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_peers.size();
}

void ConnectionRegistry::clear() {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_peers.clear();
}

} // namespace gomoku::network
