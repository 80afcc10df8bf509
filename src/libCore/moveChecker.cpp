#include "hoshi/core/moveChecker.hpp"

#include <array>
#include <set>
#include <utility>

namespace hoshi {

static constexpr std::array<int, 4> kDx{1, -1, 0, 0};
static constexpr std::array<int, 4> kDy{0, 0, 1, -1};

//! Calls fn for every orthogonal neighbour of c that lies on the board.
template <typename Fn>
static void forEachNeighbour(const Board& board, const Coord c, Fn&& fn) {
	const auto boardSize = static_cast<int>(board.size());
	for (std::size_t i = 0; i < kDx.size(); ++i) {
		const int nx = static_cast<int>(c.x) + kDx[i];
		const int ny = static_cast<int>(c.y) + kDy[i];
		if (nx < 0 || ny < 0 || nx >= boardSize || ny >= boardSize)
			continue;

		fn(Coord{static_cast<Id>(nx), static_cast<Id>(ny)});
	}
}

//! Flood fill the group of player starting at startCoord.
//! \param [out] group          Stones of the group.
//! \param [in]  pretendStone   Treated as a stone of player.
//! \param [in]  blockedLiberty Treated as occupied when counting liberties.
//! \returns Number of distinct liberties of the group.
static std::size_t groupAnalysis(const Board& board, const Coord startCoord, const Player player, std::vector<Coord>& group,
                                 const std::optional<Coord> pretendStone, const std::optional<Coord> blockedLiberty) {
	const auto boardSize = board.size();

	auto isPlayerStone = [&](Coord c) {
		if (pretendStone && *pretendStone == c)
			return true;
		return board.getAt(c) == toBoardValue(player);
	};

	std::vector<std::vector<bool>> visited(boardSize, std::vector<bool>(boardSize, false));
	std::vector<std::vector<bool>> libertyVisited(boardSize, std::vector<bool>(boardSize, false));

	std::vector<Coord> stack;
	if (isPlayerStone(startCoord)) {
		stack.push_back(startCoord);
		group.push_back(startCoord);
		visited[startCoord.x][startCoord.y] = true;
	} else {
		return 0;
	}

	std::size_t liberties = 0;
	while (!stack.empty()) {
		const auto c = stack.back();
		stack.pop_back();

		forEachNeighbour(board, c, [&](const Coord neighbour) {
			if (isPlayerStone(neighbour)) {
				if (!visited[neighbour.x][neighbour.y]) {
					visited[neighbour.x][neighbour.y] = true;
					stack.push_back(neighbour);
					group.push_back(neighbour);
				}
				return;
			}

			if (board.getAt(neighbour) == Board::Value::Empty && (!blockedLiberty || *blockedLiberty != neighbour) &&
			    !libertyVisited[neighbour.x][neighbour.y]) {
				libertyVisited[neighbour.x][neighbour.y] = true;
				++liberties;
			}
		});
	}

	return liberties;
}

//! Opponent groups adjacent to c that lose their last liberty when player occupies c.
static std::vector<Coord> capturedBy(const Board& board, const Coord c, const Player player) {
	const auto boardSize = board.size();
	const auto enemy     = opponent(player);

	std::vector<std::vector<bool>> visited(boardSize, std::vector<bool>(boardSize, false));
	std::vector<Coord> captured;
	std::vector<Coord> group;

	forEachNeighbour(board, c, [&](const Coord neighbour) {
		if (board.getAt(neighbour) != toBoardValue(enemy) || visited[neighbour.x][neighbour.y])
			return;

		group.clear();
		const auto liberties = groupAnalysis(board, neighbour, enemy, group, std::nullopt, c);
		for (const auto stone: group) {
			visited[stone.x][stone.y] = true;
		}
		if (liberties == 0) {
			captured.insert(captured.end(), group.begin(), group.end());
		}
	});

	return captured;
}

std::string_view toString(const MoveError error) {
	switch (error) {
	case MoveError::OutOfBounds:
		return "out of bounds";
	case MoveError::Occupied:
		return "position occupied";
	case MoveError::Ko:
		return "ko";
	case MoveError::Suicide:
		return "suicide";
	}
	return "unknown";
}

std::size_t computeGroupLiberties(const Board& board, Coord startCoord, Player player) {
	if (!board.inBounds(startCoord))
		return 0;
	std::vector<Coord> group;
	return groupAnalysis(board, startCoord, player, group, startCoord, std::nullopt);
}

std::vector<Coord> groupAt(const Board& board, const Coord c) {
	std::vector<Coord> group;
	if (!board.inBounds(c) || board.isFree(c))
		return group;

	groupAnalysis(board, c, toPlayer(board.getAt(c)), group, std::nullopt, std::nullopt);
	return group;
}

std::vector<Coord> libertiesOf(const Board& board, const std::vector<Coord>& group) {
	std::set<Coord> liberties;
	for (const auto stone: group) {
		forEachNeighbour(board, stone, [&](const Coord neighbour) {
			if (board.isFree(neighbour)) {
				liberties.insert(neighbour);
			}
		});
	}
	return {liberties.begin(), liberties.end()};
}

std::size_t countLiberties(const Board& board, const std::vector<Coord>& group) {
	return libertiesOf(board, group).size();
}

bool isSuicide(const Board& board, Player player, Coord c) {
	// Direct liberties after placing the stone (ignores captures).
	if (computeGroupLiberties(board, c, player) > 0) {
		return false;
	}

	// Capturing neighbours can save the move.
	return capturedBy(board, c, player).empty();
}

bool isValidMove(const Board& board, Player player, Coord c) {
	if (!board.inBounds(c) || !board.isFree(c))
		return false;

	return !isSuicide(board, player, c);
}

BoardEngine::BoardEngine(const std::size_t size) : m_board(size) {
}

BoardEngine::BoardEngine(Board board, std::optional<Coord> koPosition) : m_board(std::move(board)), m_koPosition(koPosition) {
}

MoveResult BoardEngine::place(const Coord c, const Player player) {
	MoveResult result;
	if (!m_board.inBounds(c)) {
		result.error = MoveError::OutOfBounds;
		return result;
	}
	if (!m_board.isFree(c)) {
		result.error = MoveError::Occupied;
		return result;
	}
	if (m_koPosition && *m_koPosition == c) {
		result.error = MoveError::Ko;
		return result;
	}

	auto captures = capturedBy(m_board, c, player);
	if (captures.empty() && computeGroupLiberties(m_board, c, player) == 0) {
		result.error = MoveError::Suicide;
		return result;
	}

	m_board.setAt(c, toBoardValue(player));
	for (const auto stone: captures) {
		m_board.remAt(stone);
	}

	// Single stone taking a single stone and left in atari on that point.
	m_koPosition.reset();
	if (captures.size() == 1u) {
		const auto placedGroup = groupAt(m_board, c);
		const auto liberties   = libertiesOf(m_board, placedGroup);
		if (placedGroup.size() == 1u && liberties.size() == 1u && liberties.front() == captures.front()) {
			m_koPosition = captures.front();
		}
	}

	result.captures   = std::move(captures);
	result.koPosition = m_koPosition;
	return result;
}

void BoardEngine::pass() {
	m_koPosition.reset();
}

const Board& BoardEngine::board() const {
	return m_board;
}

std::optional<Coord> BoardEngine::koPosition() const {
	return m_koPosition;
}

} // namespace hoshi
