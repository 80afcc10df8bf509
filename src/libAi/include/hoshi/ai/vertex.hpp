#pragma once

#include "hoshi/core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace hoshi::ai {

//! Largest board the vertex notation can address (columns A-T without I).
inline constexpr std::size_t MAX_VERTEX_BOARD_SIZE = 19u;

//! Move as reported by the engine.
struct EngineMove {
	enum class Kind { Place, Pass, Resign };

	Kind kind{Kind::Pass};
	Coord coord{}; //!< Only valid for Kind::Place.
};

//! Vertex for a board coordinate, e.g. "D4". Column letters skip 'I', rows count from the edge opposite to y = 0.
//! \returns Empty if the coordinate cannot be written on this board.
std::optional<std::string> toVertex(Coord c, std::size_t boardSize);

//! Vertex for a move. A missing coordinate is written as "pass".
std::optional<std::string> toVertex(std::optional<Coord> c, std::size_t boardSize);

//! Parse an engine move ("Q16", "pass", "resign"). Case insensitive.
std::optional<EngineMove> fromVertex(std::string_view vertex, std::size_t boardSize);

//! GTP color argument.
inline constexpr std::string_view toColor(Player player) {
	return player == Player::White ? "W" : "B";
}

} // namespace hoshi::ai
