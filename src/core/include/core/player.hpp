#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace gomoku {

//! Participant of the game.
struct Player {
	PeerAddress address;        //!< Connection the player joined from.
	std::string name;           //!< Display name. Identifies the player in move commands.
	std::optional<Color> color; //!< Unset until the first opening move.
	bool connected{true};       //!< Cleared when the peer leaves during a game. The seat is freed on the next reset.

	bool operator==(const Player&) const = default;
};

} // namespace gomoku
