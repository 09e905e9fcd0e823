#include "core/board.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace gomoku {

Board::Board(const std::size_t cells, const std::size_t columns) : m_columns(columns), m_cells(cells, Value::Empty) {
	if (columns == 0u || cells % columns != 0u) {
		throw std::invalid_argument(std::format("Board: {} cells cannot be split into rows of {}.", cells, columns));
	}
}

std::size_t Board::size() const {
	return m_cells.size();
}

std::size_t Board::columns() const {
	return m_columns;
}

std::size_t Board::rows() const {
	return m_cells.size() / m_columns;
}

void Board::set(const CellIndex index, const Value value) {
	m_cells.at(index) = value;
}

Board::Value Board::get(const CellIndex index) const {
	return m_cells.at(index);
}

bool Board::isFree(const CellIndex index) const {
	return get(index) == Value::Empty;
}

bool Board::contains(const CellIndex index) const {
	return index < m_cells.size();
}

void Board::clear() {
	std::ranges::fill(m_cells, Value::Empty);
}

} // namespace gomoku
