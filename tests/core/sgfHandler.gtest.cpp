#include "hoshi/core/sgfHandler.hpp"

#include <gtest/gtest.h>

namespace hoshi::gtest {

TEST(SgfHandler, Coordinates) {
	EXPECT_EQ(toSGF({0u, 0u}), "aa");
	EXPECT_EQ(toSGF({3u, 15u}), "dp");
	EXPECT_EQ(fromSGF("dp"), (Coord{3u, 15u}));
	EXPECT_FALSE(fromSGF("").has_value());
	EXPECT_FALSE(fromSGF("A1").has_value());
}

TEST(SgfHandler, Transcript) {
	const SgfGameInfo info{
	        .boardSize = 9u,
	        .komi      = 6.5,
	        .ruleset   = Ruleset::Japanese,
	        .blackName = "Alice",
	        .whiteName = "Bob",
	        .result    = "B+R",
	};
	const std::vector<SgfMove> moves{
	        {Player::Black, Coord{2u, 2u}},
	        {Player::White, std::nullopt},
	};

	EXPECT_EQ(toSgfTranscript(info, moves), "(;FF[4]GM[1]CA[UTF-8]SZ[9]KM[6.5]RU[japanese]PB[Alice]PW[Bob]RE[B+R];B[cc];W[])");
}

TEST(SgfHandler, TranscriptHandicap) {
	const SgfGameInfo info{
	        .boardSize      = 19u,
	        .komi           = 0.5,
	        .ruleset        = Ruleset::Chinese,
	        .handicapStones = {{3u, 3u}, {15u, 15u}},
	        .whiteName      = "B]ob",
	};

	EXPECT_EQ(toSgfTranscript(info, {}), "(;FF[4]GM[1]CA[UTF-8]SZ[19]KM[0.5]RU[chinese]HA[2]AB[dd][pp]PW[B\\]ob])");
}

} // namespace hoshi::gtest
