#pragma once

#include "hoshi/core/scoring.hpp"
#include "hoshi/core/types.hpp"

#include <cstddef>
#include <vector>

namespace hoshi {

inline constexpr unsigned MIN_HANDICAP = 2u;
inline constexpr unsigned MAX_HANDICAP = 9u;

//! Whether handicap stones can be placed on a board of the given size.
bool supportsHandicap(std::size_t boardSize);

//! Star points for the handicap stones, in placement order.
//! Returns an empty list if handicap is outside [MIN_HANDICAP, MAX_HANDICAP] or the board size has no handicap points.
std::vector<Coord> handicapPositions(std::size_t boardSize, unsigned handicap);

//! Komi for a game. Handicap games use 0.5 regardless of the ruleset.
double adjustedKomi(Ruleset ruleset, unsigned handicap);

//! White moves first once black's handicap stones are on the board.
inline constexpr Player firstToMove(unsigned handicap) {
	return handicap > 0u ? Player::White : Player::Black;
}

} // namespace hoshi
