#pragma once

#include "network/core/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace gomoku::network::core {

//! Transportation primitive. Handles read/write from a single client connection.
//! \note Internals are async and run on the server IO threads, serialized by the connection strand.
//!       The read loop is always primed while queued writes drain, so inbound and outbound traffic never block each other.
//!       Every async op holds shared_from_this(), which keeps the Connection alive while in flight.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&)> onConnect;
		std::function<bool(Connection&, const Message&)> onMessage; //!< Return false to close the connection.
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);
	~Connection();

	void start();                  //!< Start connection: triggers onConnect, then begins the async read loop.
	void stop();                   //!< Stop connection: closes the socket and cancels IO. Does not raise onDisconnect.
	SendResult send(const Message& msg); //!< Queue message for the client. Safe to call from any thread. Never blocks.

	ConnectionId connectionId() const;      //!< Get the identifier of this connection.
	const std::string& peerAddress() const; //!< Remote endpoint as "ip:port".

private:
	void startRead();    //!< Prime async read and dispatch messages.
	void startWrite();   //!< Prime async write for queued messages.
	void doDisconnect(); //!< Internal cleanup. Raises onDisconnect once.

private:
	std::atomic<bool> m_running{false};           //!< Connection running.
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< Serializes handlers of this connection.

	ConnectionId m_connectionId; //!< Unique identifier of the connection.
	std::string m_peerAddress;   //!< Remote endpoint, fixed at accept time.
	Callbacks m_callbacks;       //!< Used to signal to the parent.

	std::deque<Message> m_writeQueue; //!< Outbound frames. Only touched on the strand.
	bool m_writeInProgress{false};
};

} // namespace gomoku::network::core
