#pragma once

#include "core/board.hpp"

#include <cstddef>

namespace gomoku {

//! Returns true if value owns WIN_LENGTH or more adjacent cells inside a single row.
bool hasHorizontalRun(const Board& board, Board::Value value);

//! Returns true if value owns WIN_LENGTH or more cells chained by stride.
//! \note Stride must be columns - 1, columns or columns + 1. Every step has to land in the next row on the
//!       neighbouring column (or same column for a vertical stride); a step wrapping across the board edge ends the run.
bool hasStrideRun(const Board& board, Board::Value value, std::size_t stride);

//! Full win check: horizontal, vertical and both diagonals.
bool hasFiveInRow(const Board& board, Board::Value value);

} // namespace gomoku
