#pragma once

#include "hoshi/core/board.hpp"
#include "hoshi/core/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hoshi {

enum class Ruleset { Chinese, Japanese, Korean, AGA, Ing };

std::string_view toString(Ruleset ruleset);
std::optional<Ruleset> rulesetFromString(std::string_view name);

//! Komi of the ruleset for even games.
double defaultKomi(Ruleset ruleset);

//! Ownership of the empty (or dead) intersections.
struct Territory {
	std::vector<Coord> black;
	std::vector<Coord> white;
	std::vector<Coord> neutral; //!< Dame or regions bordering no live stone.
};

//! Per-color breakdown of a score.
struct ColorScore {
	unsigned territory{0u};
	unsigned stones{0u};   //!< Live stones on the board.
	unsigned captures{0u}; //!< Prisoners plus dead opponent stones.
	double komi{0.0};
	double total{0.0};
};

struct ScoreResult {
	Territory territory;
	ColorScore black;
	ColorScore white;
	std::optional<Player> winner; //!< Empty on a draw.
	double margin{0.0};

	//! "B+<margin>", "W+<margin>" or "Draw".
	std::string resultCode() const;
};

//! Flood fills every empty or dead intersection. A region belongs to a color if it borders only live stones of that color.
Territory computeTerritory(const Board& board, const std::set<Coord>& deadStones);

//! Scores the final position under the given ruleset.
//! \param captured Stones captured during play, excluding the dead stones.
ScoreResult score(const Board& board, const std::set<Coord>& deadStones, Captures captured, Ruleset ruleset, double komi);

//! Heuristic for groups that are very likely dead: no liberties, or one or two liberties where one is a false eye.
bool isGroupLikelyDead(const Board& board, const std::vector<Coord>& group);

//! Flip the dead status of the whole group at c.
//! If more than half of the group is already dead, the group is revived, otherwise the group is marked dead.
//! \param autoExtend When marking dead, additionally mark every same-colored group the heuristic judges likely dead.
//! \returns The new dead stone set. Unchanged when c holds no stone.
std::set<Coord> toggleDeadStone(const Board& board, const std::set<Coord>& deadStones, Coord c, bool autoExtend = false);

//! Formats a score margin with at most one decimal ("6.5", "3").
std::string formatMargin(double margin);

} // namespace hoshi
