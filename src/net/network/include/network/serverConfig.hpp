#pragma once

#include "network/core/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gomoku::network {

struct ServerConfig {
	std::string host{core::DEFAULT_HOST};   //!< Listen address.
	std::uint16_t port{core::DEFAULT_PORT}; //!< Listen port. 0 picks a free port.
	std::size_t ioThreads{2u};              //!< Threads serving connection IO.
};

//! Parse a listen address "host:port" or "[v6-host]:port".
//! Blank input keeps the defaults. Returns empty for malformed input.
std::optional<ServerConfig> parseServerConfig(std::string_view address);

} // namespace gomoku::network
