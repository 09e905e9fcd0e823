#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace gomoku {

using CellIndex   = std::size_t; //!< Flat index into the board, row major.
using PeerAddress = std::string; //!< Remote endpoint of a connection as "ip:port".

inline constexpr std::size_t BOARD_COLUMNS  = 15u;  //!< Row width W.
inline constexpr std::size_t BOARD_CELLS    = 255u; //!< Total cells. Rows are derived as BOARD_CELLS / BOARD_COLUMNS.
inline constexpr std::size_t WIN_LENGTH     = 5u;   //!< Stones in a line needed to win.
inline constexpr std::size_t MAX_PLAYERS    = 2u;
inline constexpr std::size_t MAX_NAME_BYTES = 64u;  //!< Longest accepted player name.

//! Color identity of a player. Values are part of the wire format.
enum class Color : std::uint8_t { First = 1, Second = 2 };

//! Returns the opponent color of input color.
inline constexpr Color opponent(Color color) {
	return color == Color::First ? Color::Second : Color::First;
}

} // namespace gomoku
