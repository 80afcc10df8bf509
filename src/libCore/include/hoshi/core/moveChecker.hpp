#pragma once

#include "hoshi/core/board.hpp"
#include "hoshi/core/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace hoshi {

//! Reasons for the board to reject a placement.
enum class MoveError { OutOfBounds, Occupied, Ko, Suicide };

std::string_view toString(MoveError error);

//! Outcome of BoardEngine::place.
struct MoveResult {
	std::optional<MoveError> error; //!< Set when the move was rejected. Board is unchanged then.
	std::vector<Coord> captures;    //!< Stones removed by the move.
	std::optional<Coord> koPosition; //!< Point banned for the opponent's immediate recapture.

	bool accepted() const {
		return !error.has_value();
	}
};

//! Returns the liberties of the group connected to startCoord if player placed a stone there.
std::size_t computeGroupLiberties(const Board& board, Coord startCoord, Player player);

//! Returns the connected group of the stone at c. Empty when c holds no stone.
std::vector<Coord> groupAt(const Board& board, Coord c);

//! Returns the number of distinct empty intersections adjacent to the group.
std::size_t countLiberties(const Board& board, const std::vector<Coord>& group);

//! Returns the distinct empty intersections adjacent to the group.
std::vector<Coord> libertiesOf(const Board& board, const std::vector<Coord>& group);

//! Check whether a move would be suicidal.
bool isSuicide(const Board& board, Player player, Coord c);

//! Legality check for bounds, occupancy and suicide. Ko is tracked by the BoardEngine.
bool isValidMove(const Board& board, Player player, Coord c);

//! Board together with the ko state. Applies placements with captures atomically.
class BoardEngine {
public:
	explicit BoardEngine(std::size_t size);
	explicit BoardEngine(Board board, std::optional<Coord> koPosition = std::nullopt);

	//! Place a stone of player at c.
	//! On rejection nothing changes. On success captures are removed and the ko point is updated.
	MoveResult place(Coord c, Player player);

	//! A pass lifts any ko ban.
	void pass();

	const Board& board() const;
	std::optional<Coord> koPosition() const;

private:
	Board m_board;
	std::optional<Coord> m_koPosition;
};

} // namespace hoshi
