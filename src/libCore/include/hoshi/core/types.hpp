#pragma once

#include <compare>
#include <cstddef>
#include <string_view>

namespace hoshi {

using Id = unsigned; //!< Board ID used by the core library.

inline constexpr std::size_t MIN_BOARD_SIZE = 5u;
inline constexpr std::size_t MAX_BOARD_SIZE = 21u;

//! Coordinate pair for the board.
//! \note Origin (0,0) is the top left corner of the board.
struct Coord {
	Id x, y;

	auto operator<=>(const Coord&) const = default;
};

enum class Player { Black = 1, White = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::White ? Player::Black : Player::White;
}

//! Single letter used in result codes and transcripts.
inline constexpr char toLetter(Player player) {
	return player == Player::White ? 'W' : 'B';
}

inline constexpr std::string_view toString(Player player) {
	return player == Player::White ? "white" : "black";
}

//! Stones captured by each player.
struct Captures {
	unsigned black{0u}; //!< Stones captured by black.
	unsigned white{0u}; //!< Stones captured by white.

	unsigned& of(Player player) {
		return player == Player::Black ? black : white;
	}
	unsigned of(Player player) const {
		return player == Player::Black ? black : white;
	}

	bool operator==(const Captures&) const = default;
};

} // namespace hoshi
