#pragma once

#include "core/types.hpp"

#include <vector>

namespace gomoku {

//! Fixed size grid stored as a flat row major sequence.
//! \note The cell count never changes after construction. Out of range access throws std::out_of_range.
class Board {
public:
	//! Possible occupancy values of cells on the board.
	enum class Value : std::uint8_t { Empty = 0, First = static_cast<int>(Color::First), Second = static_cast<int>(Color::Second) };

public:
	explicit Board(std::size_t cells = BOARD_CELLS, std::size_t columns = BOARD_COLUMNS);

	std::size_t size() const;    //!< Number of cells.
	std::size_t columns() const; //!< Row width.
	std::size_t rows() const;    //!< Number of rows (size / columns).

	void set(CellIndex index, Value value); //!< Set the value of a cell. index \in [0, size-1]
	Value get(CellIndex index) const;       //!< Get the value of a cell. index \in [0, size-1]
	bool isFree(CellIndex index) const;     //!< Returns whether a cell is empty.
	bool contains(CellIndex index) const;   //!< Returns whether the index is on the board.

	void clear(); //!< Set all cells to empty.

private:
	std::size_t m_columns;        //!< Row width.
	std::vector<Value> m_cells{}; //!< Cell values.
};

//! Returns the Board::Value enum value of input color.
inline constexpr Board::Value toBoardValue(Color color) {
	return color == Color::Second ? Board::Value::Second : Board::Value::First;
}

} // namespace gomoku
