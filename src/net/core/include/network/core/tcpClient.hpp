#pragma once

#include "network/core/protocol.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace gomoku {
namespace network {
namespace core {

//! Minimal synchronous TCP client speaking the size prefixed framing.
//! \note    Blocking I/O. On any network failure send/read fail and the client is considered disconnected.
//! \example Usage: connect() once, then send()/read() from a single thread.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	//! Connect to host:port. Returns false on failure or if already connected.
	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	bool isConnected() const;
	void disconnect();

	bool send(const Message& message); //!< Send one frame. Returns false on failure.
	std::optional<Message> read();     //!< Block until a full frame arrived. Returns nothing if disconnected or on error.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace core
} // namespace network
} // namespace gomoku
