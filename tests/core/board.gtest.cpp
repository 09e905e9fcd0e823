#include "core/board.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace gomoku::gtest {

TEST(Board, Geometry) {
	const Board board;
	EXPECT_EQ(board.size(), BOARD_CELLS);
	EXPECT_EQ(board.columns(), 15u);
	EXPECT_EQ(board.rows(), 17u);

	for (CellIndex i = 0; i < board.size(); ++i) {
		EXPECT_TRUE(board.isFree(i));
	}
}

TEST(Board, SetGetClear) {
	Board board;
	board.set(0u, Board::Value::First);
	board.set(254u, Board::Value::Second);

	EXPECT_EQ(board.get(0u), Board::Value::First);
	EXPECT_EQ(board.get(254u), Board::Value::Second);
	EXPECT_FALSE(board.isFree(0u));
	EXPECT_TRUE(board.isFree(1u));

	board.clear();
	EXPECT_TRUE(board.isFree(0u));
	EXPECT_TRUE(board.isFree(254u));
	EXPECT_EQ(board.size(), BOARD_CELLS);
}

TEST(Board, OutOfRangeFailsFast) {
	Board board;
	EXPECT_FALSE(board.contains(BOARD_CELLS));
	EXPECT_THROW(board.set(BOARD_CELLS, Board::Value::First), std::out_of_range);
	EXPECT_THROW(static_cast<void>(board.get(1000u)), std::out_of_range);
}

TEST(Board, RejectsRaggedGeometry) {
	EXPECT_THROW(Board(100u, 15u), std::invalid_argument);
	EXPECT_THROW(Board(100u, 0u), std::invalid_argument);
}

TEST(Board, ToBoardValue) {
	EXPECT_EQ(toBoardValue(Color::First), Board::Value::First);
	EXPECT_EQ(toBoardValue(Color::Second), Board::Value::Second);
	EXPECT_EQ(opponent(Color::First), Color::Second);
}

} // namespace gomoku::gtest
