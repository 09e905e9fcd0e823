#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>

namespace gomoku {
namespace network {
namespace core {

using ConnectionId = std::uint32_t; //!< Identifies a connection on network layer.
using Message      = std::string;   //!< One complete frame payload.

inline constexpr std::string_view DEFAULT_HOST = "0.0.0.0";
inline constexpr std::uint16_t DEFAULT_PORT    = 3333;

//! Maximum payload we are willing to read. Larger frames close the connection.
inline constexpr std::uint32_t MAX_PAYLOAD_BYTES = 4 * 1024;

//! Outcome of queueing a frame for a connection.
enum class SendResult {
	Queued,  //!< Frame queued for writing.
	Closed,  //!< Connection is gone.
	TooLarge //!< Payload exceeds MAX_PAYLOAD_BYTES. Frame dropped, connection stays open.
};

//! Every frame is prefixed with the payload size in network byte order.
struct BasicMessageHeader {
	std::uint32_t payload_size{};
};

constexpr std::uint32_t byteswap_u32(std::uint32_t value) {
	return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) | ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

constexpr std::uint32_t to_network_u32(std::uint32_t value) {
	if constexpr (std::endian::native == std::endian::big) {
		return value;
	}
	return byteswap_u32(value);
}

constexpr std::uint32_t from_network_u32(std::uint32_t value) {
	return to_network_u32(value);
}

} // namespace core
} // namespace network
} // namespace gomoku
