#pragma once

#include "hoshi/core/scoring.hpp"
#include "hoshi/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hoshi {

//! Convert sgf code to core game coordinate.
std::optional<Coord> fromSGF(const std::string& s);

//! Convert core game coordinate to sgf code.
std::string toSGF(Coord c);

//! Root properties of an exported game.
struct SgfGameInfo {
	std::size_t boardSize{19u};
	double komi{6.5};
	Ruleset ruleset{Ruleset::Japanese};
	std::vector<Coord> handicapStones;
	std::string blackName;
	std::string whiteName;
	std::string result; //!< Empty while the game is running.
};

struct SgfMove {
	Player player;
	std::optional<Coord> coord; //!< Empty for a pass.
};

//! Plain SGF transcript. Passes are written as empty moves.
std::string toSgfTranscript(const SgfGameInfo& info, const std::vector<SgfMove>& moves);

} // namespace hoshi
