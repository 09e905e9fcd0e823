#pragma once

#include "core/board.hpp"
#include "core/gameError.hpp"
#include "core/gameMessage.hpp"
#include "core/player.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gomoku {

//! Phases of the game. Derived from roster, active player and winner.
enum class GameState {
	Lobby,   //!< Fewer than two players registered.
	Opening, //!< Two players, nobody moved yet. Either player may open.
	InPlay,  //!< Turns alternate between the two players.
	Won      //!< A winner is decided. Moves are rejected until a reset.
};

//! Authoritative five-in-a-row game state machine.
//! \note Not thread safe. Share it between connections through SharedGame.
class Game {
public:
	Game();

	//! Apply a command sent by peer and return the response.
	//! \note A rejected command leaves the game unchanged.
	Response handle(const Command& command, const PeerAddress& peer);

	//! Peer connection closed. Frees the seat of the player that joined from peer right away if no game is running,
	//! otherwise on the next reset.
	void disconnect(const PeerAddress& peer);

	GameState state() const;
	const Board& board() const;
	const std::vector<Player>& players() const;
	std::optional<std::size_t> activePlayer() const; //!< Roster index of the player on turn.
	const std::optional<std::string>& winner() const;

private:
	Response handleCommand(const ConnectCommand& command, const PeerAddress& peer);
	Response handleCommand(const MoveCommand& command, const PeerAddress& peer);
	Response handleCommand(const ResetCommand& command, const PeerAddress& peer);

	//! Returns the reason a move can not be played or nothing if it is legal.
	std::optional<GameError> checkMove(const MoveCommand& command, std::optional<std::size_t> mover) const;
	std::optional<std::size_t> findPlayer(const std::string& name) const; //!< Roster index of the first player with name.

	void reset(); //!< Clears turn, winner and board. Drops players that left during the game.

private:
	std::vector<Player> m_players;             //!< Roster. At most MAX_PLAYERS entries.
	std::optional<std::size_t> m_activePlayer; //!< Unset until the opening move.
	std::optional<std::string> m_winner;       //!< Name of the winner.
	Board m_board;
};

} // namespace gomoku
