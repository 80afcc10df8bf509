#include "hoshi/core/scoring.hpp"

#include "hoshi/core/moveChecker.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <utility>

namespace hoshi {

static constexpr std::array<int, 4> kDiagX{1, 1, -1, -1};
static constexpr std::array<int, 4> kDiagY{1, -1, 1, -1};

std::string_view toString(const Ruleset ruleset) {
	switch (ruleset) {
	case Ruleset::Chinese:
		return "chinese";
	case Ruleset::Japanese:
		return "japanese";
	case Ruleset::Korean:
		return "korean";
	case Ruleset::AGA:
		return "aga";
	case Ruleset::Ing:
		return "ing";
	}
	return "japanese";
}

std::optional<Ruleset> rulesetFromString(const std::string_view name) {
	for (const auto ruleset: {Ruleset::Chinese, Ruleset::Japanese, Ruleset::Korean, Ruleset::AGA, Ruleset::Ing}) {
		if (toString(ruleset) == name) {
			return ruleset;
		}
	}
	return std::nullopt;
}

double defaultKomi(const Ruleset ruleset) {
	switch (ruleset) {
	case Ruleset::Chinese:
	case Ruleset::AGA:
		return 7.5;
	case Ruleset::Japanese:
	case Ruleset::Korean:
		return 6.5;
	case Ruleset::Ing:
		return 8.0;
	}
	return 6.5;
}

std::string formatMargin(const double margin) {
	const auto rounded = std::round(margin * 10.0) / 10.0;
	if (rounded == std::floor(rounded)) {
		return std::format("{}", static_cast<long long>(rounded));
	}
	return std::format("{:.1f}", rounded);
}

std::string ScoreResult::resultCode() const {
	if (!winner) {
		return "Draw";
	}
	return std::format("{}+{}", toLetter(*winner), formatMargin(margin));
}

Territory computeTerritory(const Board& board, const std::set<Coord>& deadStones) {
	const auto boardSize = board.size();

	auto isOpen = [&](Coord c) { return board.isFree(c) || deadStones.contains(c); };

	std::vector<std::vector<bool>> visited(boardSize, std::vector<bool>(boardSize, false));
	Territory territory;

	for (Id y = 0; y < boardSize; ++y) {
		for (Id x = 0; x < boardSize; ++x) {
			const Coord start{x, y};
			if (visited[x][y] || !isOpen(start))
				continue;

			std::vector<Coord> region;
			std::vector<Coord> stack{start};
			visited[x][y]     = true;
			bool bordersBlack = false;
			bool bordersWhite = false;

			while (!stack.empty()) {
				const auto c = stack.back();
				stack.pop_back();
				region.push_back(c);

				for (const auto& [dx, dy]: {std::pair{1, 0}, std::pair{-1, 0}, std::pair{0, 1}, std::pair{0, -1}}) {
					const int nx = static_cast<int>(c.x) + dx;
					const int ny = static_cast<int>(c.y) + dy;
					if (nx < 0 || ny < 0 || nx >= static_cast<int>(boardSize) || ny >= static_cast<int>(boardSize))
						continue;

					const Coord neighbour{static_cast<Id>(nx), static_cast<Id>(ny)};
					if (isOpen(neighbour)) {
						if (!visited[neighbour.x][neighbour.y]) {
							visited[neighbour.x][neighbour.y] = true;
							stack.push_back(neighbour);
						}
					} else if (board.getAt(neighbour) == Board::Value::Black) {
						bordersBlack = true;
					} else {
						bordersWhite = true;
					}
				}
			}

			auto& owner = bordersBlack == bordersWhite ? territory.neutral : (bordersBlack ? territory.black : territory.white);
			owner.insert(owner.end(), region.begin(), region.end());
		}
	}

	return territory;
}

ScoreResult score(const Board& board, const std::set<Coord>& deadStones, const Captures captured, const Ruleset ruleset, const double komi) {
	ScoreResult result;
	result.territory = computeTerritory(board, deadStones);

	unsigned deadBlack = 0u;
	unsigned deadWhite = 0u;
	for (const auto c: deadStones) {
		if (!board.inBounds(c))
			continue;
		const auto value = board.getAt(c);
		if (value == Board::Value::Black) {
			++deadBlack;
		} else if (value == Board::Value::White) {
			++deadWhite;
		}
	}

	auto& black     = result.black;
	auto& white     = result.white;
	black.territory = static_cast<unsigned>(result.territory.black.size());
	white.territory = static_cast<unsigned>(result.territory.white.size());
	black.stones    = static_cast<unsigned>(board.count(Board::Value::Black)) - deadBlack;
	white.stones    = static_cast<unsigned>(board.count(Board::Value::White)) - deadWhite;
	black.captures  = captured.black + deadWhite;
	white.captures  = captured.white + deadBlack;
	white.komi      = komi;

	switch (ruleset) {
	case Ruleset::Chinese:
	case Ruleset::Korean:
		// Area scoring. Captures do not count.
		black.total = black.territory + black.stones;
		white.total = white.territory + white.stones + komi;
		break;
	case Ruleset::Japanese:
		black.total = black.territory + black.captures;
		white.total = white.territory + white.captures + komi;
		break;
	case Ruleset::AGA:
	case Ruleset::Ing:
		black.total = black.territory + black.stones + black.captures;
		white.total = white.territory + white.stones + white.captures + komi;
		break;
	}

	if (black.total > white.total) {
		result.winner = Player::Black;
	} else if (white.total > black.total) {
		result.winner = Player::White;
	}
	result.margin = std::abs(black.total - white.total);

	return result;
}

//! Empty point whose diagonals hold at least two opponent stones of owner.
static bool isFalseEye(const Board& board, const Coord c, const Player owner) {
	const auto enemy     = toBoardValue(opponent(owner));
	const auto boardSize = static_cast<int>(board.size());

	unsigned enemyDiagonals = 0u;
	for (std::size_t i = 0; i < kDiagX.size(); ++i) {
		const int nx = static_cast<int>(c.x) + kDiagX[i];
		const int ny = static_cast<int>(c.y) + kDiagY[i];
		if (nx < 0 || ny < 0 || nx >= boardSize || ny >= boardSize)
			continue;
		if (board.getAt({static_cast<Id>(nx), static_cast<Id>(ny)}) == enemy) {
			++enemyDiagonals;
		}
	}
	return enemyDiagonals >= 2u;
}

bool isGroupLikelyDead(const Board& board, const std::vector<Coord>& group) {
	if (group.empty())
		return false;

	const auto owner     = toPlayer(board.getAt(group.front()));
	const auto liberties = libertiesOf(board, group);

	switch (liberties.size()) {
	case 0u:
		return true;
	case 1u:
	case 2u:
		return std::any_of(liberties.begin(), liberties.end(), [&](const Coord c) { return isFalseEye(board, c, owner); });
	default:
		return false;
	}
}

std::set<Coord> toggleDeadStone(const Board& board, const std::set<Coord>& deadStones, const Coord c, const bool autoExtend) {
	const auto group = groupAt(board, c);
	if (group.empty()) {
		return deadStones;
	}

	const auto deadCount = std::count_if(group.begin(), group.end(), [&](const Coord stone) { return deadStones.contains(stone); });

	auto result = deadStones;
	if (static_cast<std::size_t>(deadCount) * 2u > group.size()) {
		for (const auto stone: group) {
			result.erase(stone);
		}
		return result;
	}

	result.insert(group.begin(), group.end());
	if (!autoExtend) {
		return result;
	}

	const auto color     = board.getAt(c);
	const auto boardSize = board.size();
	for (Id y = 0; y < boardSize; ++y) {
		for (Id x = 0; x < boardSize; ++x) {
			const Coord other{x, y};
			if (board.getAt(other) != color || result.contains(other))
				continue;

			const auto otherGroup = groupAt(board, other);
			if (isGroupLikelyDead(board, otherGroup)) {
				result.insert(otherGroup.begin(), otherGroup.end());
			}
		}
	}
	return result;
}

} // namespace hoshi
