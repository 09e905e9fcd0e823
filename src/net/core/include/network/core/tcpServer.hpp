#pragma once

#include "network/core/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace gomoku {
namespace network {
namespace core {

//! Connection manager that runs an async accept loop on a pool of IO threads.
//! \note    Each connection is bound to its own strand, so reads and queued writes of one connection never run concurrently,
//!          while different connections progress in parallel.
//! \example Usage: set callbacks via connect(), then start() once. Call stop() to shut down.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(const ConnectionId&, const std::string&)> onConnect; //!< Connection id and remote address "ip:port".
		std::function<bool(const ConnectionId&, const Message&)> onMessage;    //!< Return false to close the connection.
		std::function<void(const ConnectionId&)> onDisconnect;                 //!< Not raised for connections closed by stop().
	};

	explicit TcpServer(std::string host = std::string{DEFAULT_HOST}, std::uint16_t port = DEFAULT_PORT, std::size_t ioThreads = 1u);
	~TcpServer();

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;
	TcpServer(TcpServer&&)                 = delete;
	TcpServer& operator=(TcpServer&&)      = delete;

	void connect(Callbacks callbacks); //!< Connect callback functions to get event signalling. Call before start.
	bool start();                      //!< Start accepting clients. Returns false if the address could not be bound.
	void stop();                       //!< Disconnect clients and stop the server. Safe to call multiple times.

	SendResult send(ConnectionId connectionId, const Message& msg); //!< Queue message for the client. Oversized frames are dropped, the connection stays.

	std::uint16_t port() const; //!< Bound port. Useful when constructed with port 0.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace core
} // namespace network
} // namespace gomoku
