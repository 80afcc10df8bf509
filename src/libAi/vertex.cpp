#include "hoshi/ai/vertex.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace hoshi::ai {

static constexpr std::string_view kColumns = "ABCDEFGHJKLMNOPQRST";

static std::string toLower(std::string_view value) {
	std::string lower(value);
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lower;
}

std::optional<std::string> toVertex(const Coord c, const std::size_t boardSize) {
	if (boardSize > MAX_VERTEX_BOARD_SIZE || c.x >= boardSize || c.y >= boardSize) {
		return std::nullopt;
	}
	return std::format("{}{}", kColumns[c.x], boardSize - c.y);
}

std::optional<std::string> toVertex(const std::optional<Coord> c, const std::size_t boardSize) {
	if (!c) {
		return std::string{"pass"};
	}
	return toVertex(*c, boardSize);
}

std::optional<EngineMove> fromVertex(std::string_view vertex, const std::size_t boardSize) {
	const auto lower = toLower(vertex);
	if (lower == "pass") {
		return EngineMove{.kind = EngineMove::Kind::Pass};
	}
	if (lower == "resign") {
		return EngineMove{.kind = EngineMove::Kind::Resign};
	}
	if (lower.size() < 2u || boardSize > MAX_VERTEX_BOARD_SIZE) {
		return std::nullopt;
	}

	const auto column = kColumns.find(static_cast<char>(std::toupper(static_cast<unsigned char>(lower.front()))));
	if (column == std::string_view::npos || column >= boardSize) {
		return std::nullopt;
	}

	std::size_t row = 0u;
	const auto* first    = lower.data() + 1;
	const auto* last     = lower.data() + lower.size();
	const auto [ptr, ec] = std::from_chars(first, last, row);
	if (ec != std::errc{} || ptr != last || row < 1u || row > boardSize) {
		return std::nullopt;
	}

	return EngineMove{
	        .kind  = EngineMove::Kind::Place,
	        .coord = Coord{static_cast<Id>(column), static_cast<Id>(boardSize - row)},
	};
}

} // namespace hoshi::ai
