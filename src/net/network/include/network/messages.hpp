#pragma once

#include "core/gameMessage.hpp"
#include "network/core/protocol.hpp"

#include <optional>

namespace gomoku::network {

// Serialize typed commands/responses to MessagePack encoded frame payloads.
core::Message toMessage(const Command& command);
core::Message toMessage(const Response& response);

// Parse frame payloads into typed commands/responses. Returns empty on undecodable input.
std::optional<Command> fromClientMessage(const core::Message& message);
std::optional<Response> fromServerMessage(const core::Message& message);

} // namespace gomoku::network
