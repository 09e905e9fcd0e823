#include "network/core/tcpServer.hpp"

#include "Logging.hpp"
#include "connection.hpp"

#include <asio.hpp>
#include <asio/ip/tcp.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gomoku::network::core {

class TcpServer::Implementation {
public:
	Implementation(const std::string& host, std::uint16_t port, std::size_t ioThreads);

	void connect(Callbacks callbacks);
	bool start();
	void stop();

	SendResult send(ConnectionId connectionId, const Message& msg);
	std::uint16_t port() const;

private:
	void doAccept();                                                                //!< Start async accept loop.
	bool createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId); //!< Create and add new connection to map.

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	bool m_acceptorReady{false};

	const std::size_t m_ioThreadCount;    //!< Threads running the IO context.
	std::vector<std::thread> m_ioThreads; //!< Pool running m_ioContext.
	std::atomic<bool> m_running{false};   //!< TCP Server running.

	Callbacks m_callbacks; //!< Callback functions to signal events.

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Active connections.
	std::mutex m_connectionsMutex;                                               //!< Handle concurrency.
	ConnectionId m_nextConnectionId{1u};                                         //!< Guarded by m_connectionsMutex.
};


TcpServer::Implementation::Implementation(const std::string& host, std::uint16_t port, std::size_t ioThreads)
    : m_acceptor(m_ioContext), m_ioThreadCount(std::max<std::size_t>(ioThreads, 1u)) {
	// Do a manual open/bind/listen so we can stay in error_code land and avoid throws.
	asio::error_code ec;
	const auto address = asio::ip::make_address(host, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Invalid listen address '{}': {}", host, ec.message()));
		return;
	}

	const asio::ip::tcp::endpoint endpoint{address, port};
	m_acceptor.open(endpoint.protocol(), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Could not open acceptor: {}", ec.message()));
		return;
	}
	m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	if (ec) {
		return;
	}
	m_acceptor.bind(endpoint, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Could not bind {}:{}: {}", host, port, ec.message()));
		return;
	}
	m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Network] Could not listen on {}:{}: {}", host, port, ec.message()));
		return;
	}
	m_acceptorReady = true;
}

void TcpServer::Implementation::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

bool TcpServer::Implementation::start() {
	// If acceptor init failed during construction, don't start a dead server.
	if (!m_acceptorReady) {
		return false;
	}
	if (m_running.exchange(true)) {
		return true;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	for (std::size_t i = 0; i < m_ioThreadCount; ++i) {
		m_ioThreads.emplace_back([this]() { m_ioContext.run(); });
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Network] Accepting connections on port {} with {} IO threads.", port(), m_ioThreadCount));
	return true;
}

void TcpServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, conn]: connections) {
		conn->stop();
	}

	// Pending handlers finish once the sockets are closed; then run() returns on every IO thread.
	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	for (auto& thread: m_ioThreads) {
		if (thread.joinable()) {
			thread.join();
		}
	}
	m_ioThreads.clear();

	Logger().Log(Logging::LogLevel::Info, "[Network] Server stopped.");
}

SendResult TcpServer::Implementation::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it == m_connections.end()) {
		return SendResult::Closed;
	}
	return it->second->send(msg);
}

std::uint16_t TcpServer::Implementation::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? 0u : endpoint.port();
}

void TcpServer::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}

		if (ec) {
			Logger().Log(Logging::LogLevel::Error, "[Network] Accept failed - " + ec.message());
		} else {
			std::shared_ptr<Connection> connection;
			{
				std::lock_guard<std::mutex> lock(m_connectionsMutex);
				const auto connectionId = m_nextConnectionId++;
				if (createConnection(std::move(socket), connectionId)) {
					connection = m_connections.at(connectionId);
				}
			}
			if (connection) {
				connection->start();
			}
		}

		if (m_running) {
			doAccept();
		}
	});
}

bool TcpServer::Implementation::createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId) {
	if (m_connections.contains(connectionId)) {
		return false;
	}

	Connection::Callbacks callbacks;
	callbacks.onConnect = [this](Connection& connection) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Network] Connection {} from '{}'.", connection.connectionId(), connection.peerAddress()));
		if (m_callbacks.onConnect) {
			m_callbacks.onConnect(connection.connectionId(), connection.peerAddress());
		}
	};
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			return m_callbacks.onMessage(connection.connectionId(), message);
		}
		return true;
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto index = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(index);
		}
		Logger().Log(Logging::LogLevel::Info, std::format("[Network] Connection {} closed.", index));
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(index);
		}
	};

	auto connection           = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
	const auto [it, inserted] = m_connections.try_emplace(connectionId, std::move(connection));
	return inserted;
}


TcpServer::TcpServer(std::string host, std::uint16_t port, std::size_t ioThreads) : m_pimpl(std::make_unique<Implementation>(host, port, ioThreads)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::connect(Callbacks callbacks) {
	m_pimpl->connect(std::move(callbacks));
}

bool TcpServer::start() {
	return m_pimpl->start();
}

void TcpServer::stop() {
	m_pimpl->stop();
}

SendResult TcpServer::send(ConnectionId connectionId, const Message& msg) {
	return m_pimpl->send(connectionId, msg);
}

std::uint16_t TcpServer::port() const {
	return m_pimpl->port();
}

} // namespace gomoku::network::core
