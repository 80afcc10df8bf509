#include "hoshi/core/handicap.hpp"

#include <algorithm>

namespace hoshi {

//! Corners first, then center, then the side star points.
static std::vector<Coord> starPoints(const std::size_t boardSize) {
	Id edge = 0u;
	switch (boardSize) {
	case 9u:
		edge = 2u;
		break;
	case 13u:
	case 15u:
	case 19u:
	case 21u:
		edge = 3u;
		break;
	default:
		return {};
	}

	const auto far    = static_cast<Id>(boardSize - 1u - edge);
	const auto center = static_cast<Id>(boardSize / 2u);
	return {
	        {edge, edge}, {far, far}, {far, edge}, {edge, far}, {center, center}, {center, edge}, {center, far}, {edge, center}, {far, center},
	};
}

bool supportsHandicap(const std::size_t boardSize) {
	return !starPoints(boardSize).empty();
}

std::vector<Coord> handicapPositions(const std::size_t boardSize, const unsigned handicap) {
	if (handicap < MIN_HANDICAP || handicap > MAX_HANDICAP) {
		return {};
	}

	auto points = starPoints(boardSize);
	points.resize(std::min<std::size_t>(handicap, points.size()));
	return points;
}

double adjustedKomi(const Ruleset ruleset, const unsigned handicap) {
	if (handicap > 0u) {
		return 0.5;
	}
	return defaultKomi(ruleset);
}

} // namespace hoshi
