#pragma once

#include "hoshi/core/types.hpp"

#include <cstddef>
#include <vector>

namespace hoshi {

//! Square go board. Stores only the occupation of each intersection, rules live in the BoardEngine.
class Board {
public:
	//! Possible ownership values of fields on the board.
	enum class Value { Empty = 0, Black = static_cast<int>(Player::Black), White = static_cast<int>(Player::White) };

public:
	//! \throws std::invalid_argument if size is outside [MIN_BOARD_SIZE, MAX_BOARD_SIZE].
	explicit Board(std::size_t size);

	std::size_t size() const;

	bool inBounds(Coord c) const;     //!< Coordinate lies on the board.
	void setAt(Coord c, Value value); //!< Set at given coordinate (x,y) \in [0, size-1]
	Value getAt(Coord c) const;       //!< Get value at given coordinate (x,y) \in [0, size-1]
	void remAt(Coord c);              //!< Clear the given coordinate.
	bool isFree(Coord c) const;       //!< Returns whether a certain board coordinate is free or occupied.

	std::size_t count(Value value) const; //!< Number of intersections holding value.

	bool operator==(const Board&) const = default;

private:
	std::size_t m_size;           //!< Board size
	std::vector<Value> m_board{}; //!< Board values.
};

//! Returns the Board::Value enum value of input player.
inline constexpr Board::Value toBoardValue(Player player) {
	return player == Player::White ? Board::Value::White : Board::Value::Black;
}

//! Returns the player owning a non-empty board value.
inline constexpr Player toPlayer(Board::Value value) {
	return value == Board::Value::White ? Player::White : Player::Black;
}

} // namespace hoshi
