#include "core/winChecker.hpp"

#include <array>
#include <format>
#include <stdexcept>

namespace gomoku {

bool hasHorizontalRun(const Board& board, const Board::Value value) {
	const auto columns = board.columns();

	for (std::size_t row = 0; row < board.rows(); ++row) {
		std::size_t run = 0;
		for (std::size_t col = 0; col < columns; ++col) {
			if (board.get(row * columns + col) != value) {
				run = 0;
				continue;
			}
			if (++run >= WIN_LENGTH) {
				return true;
			}
		}
	}
	return false;
}

bool hasStrideRun(const Board& board, const Board::Value value, const std::size_t stride) {
	const auto columns = board.columns();
	if (stride + 1 < columns || stride > columns + 1) {
		throw std::invalid_argument(std::format("hasStrideRun: stride {} is not a line direction for row width {}.", stride, columns));
	}

	// Column offset expected for one step: -1, 0 or +1.
	const auto columnStep = static_cast<long long>(stride) - static_cast<long long>(columns);

	for (CellIndex start = 0; start < board.size(); ++start) {
		if (board.get(start) != value) {
			continue;
		}

		std::size_t run   = 1;
		CellIndex current = start;
		while (current + stride < board.size()) {
			const auto next           = current + stride;
			const auto expectedColumn = static_cast<long long>(current % columns) + columnStep;
			if (expectedColumn != static_cast<long long>(next % columns) || board.get(next) != value) {
				break;
			}

			if (++run >= WIN_LENGTH) {
				return true;
			}
			current = next;
		}
	}
	return false;
}

bool hasFiveInRow(const Board& board, const Board::Value value) {
	if (hasHorizontalRun(board, value)) {
		return true;
	}

	const auto columns = board.columns();
	const std::array<std::size_t, 3> strides{columns - 1, columns, columns + 1};
	for (const auto stride: strides) {
		if (hasStrideRun(board, value, stride)) {
			return true;
		}
	}
	return false;
}

} // namespace gomoku
