#include "hoshi/core/sgfHandler.hpp"

#include <format>
#include <sstream>

namespace hoshi {

//! Escape the characters SGF reserves inside property values.
static std::string escape(const std::string& value) {
	std::string escaped;
	escaped.reserve(value.size());
	for (const char c: value) {
		if (c == ']' || c == '\\') {
			escaped.push_back('\\');
		}
		escaped.push_back(c);
	}
	return escaped;
}

std::optional<Coord> fromSGF(const std::string& s) {
	if (s.size() != 2u || s[0u] < 'a' || s[0u] > 'z' || s[1u] < 'a' || s[1u] > 'z') {
		return std::nullopt;
	}
	return Coord{static_cast<Id>(s[0u] - 'a'), static_cast<Id>(s[1u] - 'a')};
}

std::string toSGF(const Coord c) {
	return {char('a' + c.x), char('a' + c.y)};
}

std::string toSgfTranscript(const SgfGameInfo& info, const std::vector<SgfMove>& moves) {
	std::ostringstream sgf;
	sgf << std::format("(;FF[4]GM[1]CA[UTF-8]SZ[{}]KM[{}]RU[{}]", info.boardSize, formatMargin(info.komi), toString(info.ruleset));

	if (!info.handicapStones.empty()) {
		sgf << std::format("HA[{}]AB", info.handicapStones.size());
		for (const auto c: info.handicapStones) {
			sgf << '[' << toSGF(c) << ']';
		}
	}
	if (!info.blackName.empty()) {
		sgf << "PB[" << escape(info.blackName) << ']';
	}
	if (!info.whiteName.empty()) {
		sgf << "PW[" << escape(info.whiteName) << ']';
	}
	if (!info.result.empty()) {
		sgf << "RE[" << escape(info.result) << ']';
	}

	for (const auto& move: moves) {
		sgf << ';' << toLetter(move.player) << '[';
		if (move.coord) {
			sgf << toSGF(*move.coord);
		}
		sgf << ']';
	}

	sgf << ')';
	return sgf.str();
}

} // namespace hoshi
