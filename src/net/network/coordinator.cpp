#include "network/coordinator.hpp"

#include "Logging.hpp"
#include "network/messages.hpp"

#include <format>
#include <utility>

namespace gomoku::network {

//! Peer an Ok/Fail response is addressed to. nullptr for broadcast responses.
static const PeerAddress* addressee(const Response& response) {
	if (const auto* ok = std::get_if<OkResponse>(&response)) {
		return &ok->peer;
	}
	if (const auto* fail = std::get_if<FailResponse>(&response)) {
		return &fail->peer;
	}
	return nullptr;
}

Coordinator::Coordinator(PeerAddress peer, SharedGame& game, ConnectionRegistry& registry) : m_peer(std::move(peer)), m_game(game), m_registry(registry) {
}

bool Coordinator::onMessage(const core::Message& payload) {
	const auto command = fromClientMessage(payload);
	if (!command) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Coordinator] DecodeError: undecodable payload ({} bytes) from '{}'. Closing connection.", payload.size(), m_peer));
		return false;
	}

	// Dispatch inside the exclusive section so every peer sees results in the order the game applied them.
	m_game.withLock([&](Game& game) {
		const auto response = game.handle(*command, m_peer);
		dispatch(response);
	});
	return true;
}

void Coordinator::onDisconnect() {
	m_game.withLock([&](Game& game) { game.disconnect(m_peer); });
	m_registry.unregisterPeer(m_peer);

	Logger().Log(Logging::LogLevel::Info, std::format("[Coordinator] Peer '{}' left.", m_peer));
}

const PeerAddress& Coordinator::peer() const {
	return m_peer;
}

void Coordinator::dispatch(const Response& response) {
	const auto message = toMessage(response);

	if (isBroadcast(response)) {
		if (const auto* move = std::get_if<MoveResponse>(&response)) {
			Logger().Log(Logging::LogLevel::Info, std::format("[Coordinator] '{}' placed color {} at {}.", m_peer, static_cast<unsigned>(move->color), move->cell));
			if (move->winner) {
				Logger().Log(Logging::LogLevel::Info, std::format("[Coordinator] '{}' won the game.", *move->winner));
			}
		} else {
			Logger().Log(Logging::LogLevel::Info, std::format("[Coordinator] Game reset by '{}'.", m_peer));
		}
		m_registry.broadcast(message);
		return;
	}

	const auto* target = addressee(response);
	if (const auto* fail = std::get_if<FailResponse>(&response)) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Coordinator] Rejected command from '{}': {}", m_peer, fail->message));
	}

	try {
		if (!m_registry.directMessage(message, *target)) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Coordinator] Could not deliver response to '{}'.", *target));
		}
	} catch (const UnknownPeerError& ex) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Coordinator] Response lost: {}", ex.what()));
	}
}

} // namespace gomoku::network
