#include "network/gameServer.hpp"

#include "Logging.hpp"
#include "core/sharedGame.hpp"
#include "network/connectionRegistry.hpp"
#include "network/coordinator.hpp"
#include "network/core/tcpServer.hpp"

#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace gomoku::network {

//! Outbound channel writing into the queue of one transport connection.
class ConnectionChannel final : public IOutboundChannel {
public:
	ConnectionChannel(core::TcpServer& network, core::ConnectionId connectionId) : m_network(network), m_connectionId(connectionId) {
	}

	bool deliver(const core::Message& payload) override {
		// An oversized frame is dropped and logged by the transport. The peer stays registered.
		return m_network.send(m_connectionId, payload) != core::SendResult::Closed;
	}

private:
	core::TcpServer& m_network;
	core::ConnectionId m_connectionId;
};


class GameServer::Implementation {
public:
	explicit Implementation(const ServerConfig& config);

	bool start();
	void stop();

	std::uint16_t port() const;
	std::size_t peerCount() const;

private:
	// Network callbacks. Run on the connection strand of the IO threads.
	void onClientConnected(core::ConnectionId connectionId, const PeerAddress& peer);
	bool onClientMessage(core::ConnectionId connectionId, const core::Message& payload);
	void onClientDisconnected(core::ConnectionId connectionId);

	std::shared_ptr<Coordinator> findCoordinator(core::ConnectionId connectionId) const;

private:
	std::atomic<bool> m_isRunning{false};

	SharedGame m_game;
	ConnectionRegistry m_registry;

	std::unordered_map<core::ConnectionId, std::shared_ptr<Coordinator>> m_coordinators; //!< One per open connection.
	mutable std::mutex m_coordinatorsMutex;                                              //!< Guards m_coordinators.

	core::TcpServer m_network; //!< Declared last: stopped first, while the state its callbacks touch is alive.
};

GameServer::Implementation::Implementation(const ServerConfig& config) : m_network{config.host, config.port, config.ioThreads} {
	core::TcpServer::Callbacks callbacks;
	callbacks.onConnect    = [this](core::ConnectionId connectionId, const std::string& peer) { onClientConnected(connectionId, peer); };
	callbacks.onMessage    = [this](core::ConnectionId connectionId, const core::Message& payload) { return onClientMessage(connectionId, payload); };
	callbacks.onDisconnect = [this](core::ConnectionId connectionId) { onClientDisconnected(connectionId); };
	m_network.connect(callbacks);
}

bool GameServer::Implementation::start() {
	if (m_isRunning.exchange(true)) {
		return true;
	}

	if (!m_network.start()) {
		m_isRunning = false;
		Logger().Log(Logging::LogLevel::Error, "[GameServer] Could not start network listener.");
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Server listening on port {}.", m_network.port()));
	return true;
}

void GameServer::Implementation::stop() {
	if (!m_isRunning.exchange(false)) {
		return;
	}

	// Joins the IO threads; no callback runs after this.
	m_network.stop();

	{
		std::lock_guard<std::mutex> lock(m_coordinatorsMutex);
		m_coordinators.clear();
	}
	m_registry.clear();

	Logger().Log(Logging::LogLevel::Info, "[GameServer] Server stopped.");
}

std::uint16_t GameServer::Implementation::port() const {
	return m_network.port();
}

std::size_t GameServer::Implementation::peerCount() const {
	return m_registry.size();
}

void GameServer::Implementation::onClientConnected(core::ConnectionId connectionId, const PeerAddress& peer) {
	m_registry.registerPeer(peer, std::make_shared<ConnectionChannel>(m_network, connectionId));

	{
		std::lock_guard<std::mutex> lock(m_coordinatorsMutex);
		m_coordinators.insert_or_assign(connectionId, std::make_shared<Coordinator>(peer, m_game, m_registry));
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Client '{}' connected.", peer));
}

bool GameServer::Implementation::onClientMessage(core::ConnectionId connectionId, const core::Message& payload) {
	const auto coordinator = findCoordinator(connectionId);
	if (!coordinator) {
		Logger().Log(Logging::LogLevel::Error, std::format("[GameServer] Message from connection '{}' without coordinator.", connectionId));
		return false;
	}
	return coordinator->onMessage(payload);
}

void GameServer::Implementation::onClientDisconnected(core::ConnectionId connectionId) {
	std::shared_ptr<Coordinator> coordinator;
	{
		std::lock_guard<std::mutex> lock(m_coordinatorsMutex);
		const auto it = m_coordinators.find(connectionId);
		if (it == m_coordinators.end()) {
			// Should never happen
			Logger().Log(Logging::LogLevel::Error, std::format("[GameServer] Connection '{}' closed without coordinator.", connectionId));
			return;
		}
		coordinator = std::move(it->second);
		m_coordinators.erase(it);
	}

	coordinator->onDisconnect();
}

std::shared_ptr<Coordinator> GameServer::Implementation::findCoordinator(core::ConnectionId connectionId) const {
	std::lock_guard<std::mutex> lock(m_coordinatorsMutex);
	const auto it = m_coordinators.find(connectionId);
	return it == m_coordinators.end() ? nullptr : it->second;
}


GameServer::GameServer(ServerConfig config) : m_pimpl(std::make_unique<Implementation>(config)) {
}

GameServer::~GameServer() {
	stop();
}

bool GameServer::start() {
	return m_pimpl->start();
}

void GameServer::stop() {
	m_pimpl->stop();
}

std::uint16_t GameServer::port() const {
	return m_pimpl->port();
}

std::size_t GameServer::peerCount() const {
	return m_pimpl->peerCount();
}

} // namespace gomoku::network
