#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace gomoku {

// Commands (client -> server)
struct ConnectCommand {
	std::string name;

	bool operator==(const ConnectCommand&) const = default;
};
struct MoveCommand {
	CellIndex cell;
	std::string name;

	bool operator==(const MoveCommand&) const = default;
};
struct ResetCommand {
	bool operator==(const ResetCommand&) const = default;
};

// Responses (server -> client)
struct OkResponse {
	PeerAddress peer; //!< Peer that sent the acknowledged command.

	bool operator==(const OkResponse&) const = default;
};
struct FailResponse {
	std::string message; //!< Reason of the rejection.
	PeerAddress peer;    //!< Peer that sent the rejected command.

	bool operator==(const FailResponse&) const = default;
};
struct MoveResponse {
	CellIndex cell;                    //!< Cell the stone was placed on.
	Color color;                       //!< Color of the placed stone.
	std::optional<std::string> winner; //!< Name of the winner once decided.

	bool operator==(const MoveResponse&) const = default;
};
struct ResetResponse {
	bool operator==(const ResetResponse&) const = default;
};

using Command  = std::variant<ConnectCommand, MoveCommand, ResetCommand>;
using Response = std::variant<OkResponse, FailResponse, MoveResponse, ResetResponse>;

//! Move and Reset results go to every peer. Ok and Fail only go to the peer named in the response.
inline bool isBroadcast(const Response& response) {
	return std::holds_alternative<MoveResponse>(response) || std::holds_alternative<ResetResponse>(response);
}

} // namespace gomoku
