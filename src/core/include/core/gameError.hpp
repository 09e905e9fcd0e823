#pragma once

#include <cstdint>
#include <string_view>

namespace gomoku {

//! Recoverable command rejections. Reported to the offending peer only; the game stays unchanged.
enum class GameError : std::uint8_t {
	NotEnoughPlayers, //!< Move before two players joined.
	OutOfTurn,        //!< Move by the player not on turn.
	UnknownPlayer,    //!< Move with a name not in the roster.
	InvalidCell,      //!< Cell index outside of the board.
	CellOccupied,     //!< Cell already holds a stone.
	GameOver,         //!< Move after a winner was decided. Needs a reset.
	NameTaken,        //!< Connect with a name already in the roster.
	GameFull,         //!< Connect while two players are already registered.
	NameTooLong,      //!< Connect with a name longer than MAX_NAME_BYTES.
};

//! Human readable message sent in the Fail response.
constexpr std::string_view toMessage(GameError error) {
	switch (error) {
	case GameError::NotEnoughPlayers:
		return "Wait for a second player to connect";
	case GameError::OutOfTurn:
		return "It's not your move";
	case GameError::UnknownPlayer:
		return "Unknown player name";
	case GameError::InvalidCell:
		return "Cell is outside of the board";
	case GameError::CellOccupied:
		return "Cell is already occupied";
	case GameError::GameOver:
		return "Game is over, reset to play again";
	case GameError::NameTaken:
		return "Name is already taken";
	case GameError::GameFull:
		return "Game already has two players";
	case GameError::NameTooLong:
		return "Name is too long";
	}
	return "Unknown error";
}

} // namespace gomoku
