#include "hoshi/core/board.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace hoshi {

Board::Board(const std::size_t size) : m_size(size), m_board(size * size, Value::Empty) {
	if (size < MIN_BOARD_SIZE || size > MAX_BOARD_SIZE) {
		throw std::invalid_argument(std::format("Unsupported board size {}.", size));
	}
}

std::size_t Board::size() const {
	return m_size;
}

bool Board::inBounds(const Coord c) const {
	return c.x < m_size && c.y < m_size;
}

void Board::setAt(const Coord c, Value value) {
	if (!inBounds(c)) {
		throw std::out_of_range(std::format("Coordinate ({}, {}) outside of {}x{} board.", c.x, c.y, m_size, m_size));
	}

	m_board[c.y * m_size + c.x] = value;
}

Board::Value Board::getAt(const Coord c) const {
	if (!inBounds(c)) {
		throw std::out_of_range(std::format("Coordinate ({}, {}) outside of {}x{} board.", c.x, c.y, m_size, m_size));
	}

	return m_board[c.y * m_size + c.x];
}

void Board::remAt(const Coord c) {
	setAt(c, Value::Empty);
}

bool Board::isFree(const Coord c) const {
	return getAt(c) == Value::Empty;
}

std::size_t Board::count(const Value value) const {
	return static_cast<std::size_t>(std::count(m_board.begin(), m_board.end(), value));
}

} // namespace hoshi
