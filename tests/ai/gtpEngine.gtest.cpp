#include "mockEngineChannel.hpp"

#include "hoshi/ai/gtpEngine.hpp"

#include <gtest/gtest.h>

#include <asio.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hoshi::gtest {

using ai::EngineMove;
using ai::GtpEngine;

namespace {

//! Engine whose channels are created from the responder. Keeps every created channel for inspection.
struct EngineFixture {
	explicit EngineFixture(MockEngineChannel::Responder responder, GtpEngine::Settings settings = {}) {
		engine = std::make_shared<GtpEngine>(
		        io,
		        [this, responder]() {
			        auto channel = std::make_shared<MockEngineChannel>(responder);
			        if (!channels.empty()) {
				        channel->crashOn.reset();
			        } else {
				        channel->crashOn = firstCrashOn;
			        }
			        channels.push_back(channel);
			        return channel;
		        },
		        settings);
	}

	asio::io_context io;
	std::optional<std::string> firstCrashOn; //!< Applied to the first channel only.
	std::vector<std::shared_ptr<MockEngineChannel>> channels;
	std::shared_ptr<GtpEngine> engine;
};

} // namespace

TEST(GtpEngine, StartAndShutdown) {
	EngineFixture fixture(scriptedEngine(std::make_shared<std::vector<std::string>>()));
	EXPECT_FALSE(fixture.engine->isRunning());

	ASSERT_TRUE(fixture.engine->start());
	EXPECT_TRUE(fixture.engine->isRunning());

	fixture.engine->shutdown();
	EXPECT_FALSE(fixture.engine->isRunning());

	// Commands after shutdown fail right away.
	std::optional<GtpEngine::Reply> reply;
	fixture.engine->command("name", {}, [&](const GtpEngine::Reply& r) { reply = r; });
	ASSERT_TRUE(reply.has_value());
	EXPECT_EQ(reply->failure, GtpEngine::Failure::ChannelLost);
}

TEST(GtpEngine, SetupSendsGame) {
	EngineFixture fixture(scriptedEngine(std::make_shared<std::vector<std::string>>()));
	ASSERT_TRUE(fixture.engine->start());

	std::optional<GtpEngine::Reply> reply;
	fixture.engine->setup(
	        GtpEngine::GameSetup{
	                .boardSize      = 9u,
	                .komi           = 0.5,
	                .handicapStones = {{2u, 2u}},
	                .moves          = {{Player::White, Coord{4u, 4u}}, {Player::Black, std::nullopt}},
	        },
	        [&](const GtpEngine::Reply& r) { reply = r; });

	ASSERT_TRUE(reply.has_value());
	EXPECT_TRUE(reply->ok());

	const std::vector<std::string> expected{"1 boardsize 9", "2 clear_board", "3 komi 0.5", "4 play B C7", "5 play W E5", "6 play B pass"};
	EXPECT_EQ(fixture.channels.front()->written(), expected);
}

TEST(GtpEngine, MultiLineResponse) {
	EngineFixture fixture([](const std::string& id, const std::string&) { return std::vector<std::string>{"=" + id + " first", "second", ""}; });
	ASSERT_TRUE(fixture.engine->start());

	std::optional<GtpEngine::Reply> reply;
	fixture.engine->command("list_commands", {}, [&](const GtpEngine::Reply& r) { reply = r; });

	ASSERT_TRUE(reply.has_value());
	EXPECT_TRUE(reply->ok());
	EXPECT_EQ(reply->text, "first\nsecond");
}

TEST(GtpEngine, RejectedCommand) {
	EngineFixture fixture([](const std::string& id, const std::string&) { return MockEngineChannel::failure(id, "illegal move"); });
	ASSERT_TRUE(fixture.engine->start());

	std::optional<GtpEngine::Reply> reply;
	fixture.engine->play(Player::Black, Coord{0u, 0u}, [&](const GtpEngine::Reply& r) { reply = r; });

	ASSERT_TRUE(reply.has_value());
	EXPECT_EQ(reply->failure, GtpEngine::Failure::Rejected);
	EXPECT_EQ(reply->text, "illegal move");
}

TEST(GtpEngine, GenmoveUpdatesMirror) {
	auto moves = std::make_shared<std::vector<std::string>>(std::vector<std::string>{"D4"});
	EngineFixture fixture(scriptedEngine(moves));
	ASSERT_TRUE(fixture.engine->start());
	fixture.engine->setup(GtpEngine::GameSetup{.boardSize = 9u});

	std::optional<GtpEngine::MoveReply> reply;
	fixture.engine->genmove(Player::Black, [&](const GtpEngine::MoveReply& r) { reply = r; });

	ASSERT_TRUE(reply.has_value());
	ASSERT_TRUE(reply->move.has_value());
	EXPECT_EQ(reply->move->kind, EngineMove::Kind::Place);
	EXPECT_EQ(reply->move->coord, (Coord{3u, 5u}));

	const auto mirror = fixture.engine->mirror();
	ASSERT_EQ(mirror.moves.size(), 1u);
	EXPECT_EQ(mirror.moves.front().player, Player::Black);
	EXPECT_EQ(mirror.moves.front().coord, (Coord{3u, 5u}));
}

TEST(GtpEngine, GenmoveUnreadable) {
	auto moves = std::make_shared<std::vector<std::string>>(std::vector<std::string>{"Z99"});
	EngineFixture fixture(scriptedEngine(moves));
	ASSERT_TRUE(fixture.engine->start());

	std::optional<GtpEngine::MoveReply> reply;
	fixture.engine->genmove(Player::White, [&](const GtpEngine::MoveReply& r) { reply = r; });

	ASSERT_TRUE(reply.has_value());
	EXPECT_FALSE(reply->move.has_value());
	EXPECT_FALSE(reply->error.empty());
	EXPECT_TRUE(fixture.engine->mirror().moves.empty());
}

TEST(GtpEngine, RestartReplaysAfterCrash) {
	auto moves = std::make_shared<std::vector<std::string>>(std::vector<std::string>{"E5"});
	EngineFixture fixture(scriptedEngine(moves));
	fixture.firstCrashOn = "genmove";
	ASSERT_TRUE(fixture.engine->start());

	fixture.engine->setup(GtpEngine::GameSetup{.boardSize = 9u, .komi = 6.5});
	fixture.engine->play(Player::Black, Coord{2u, 2u});

	std::optional<GtpEngine::MoveReply> reply;
	fixture.engine->genmove(Player::White, [&](const GtpEngine::MoveReply& r) { reply = r; });

	ASSERT_EQ(fixture.channels.size(), 2u);
	ASSERT_TRUE(reply.has_value());
	ASSERT_TRUE(reply->move.has_value());
	EXPECT_EQ(reply->move->coord, (Coord{4u, 4u}));

	// Replacement engine got the game replayed before the request was repeated.
	const auto& written = fixture.channels.back()->written();
	ASSERT_EQ(written.size(), 5u);
	EXPECT_NE(written[0].find("boardsize 9"), std::string::npos);
	EXPECT_NE(written[3].find("play B C7"), std::string::npos);
	EXPECT_NE(written[4].find("genmove W"), std::string::npos);
}

TEST(GtpEngine, LateMoveAfterSetupIsNotMirrored) {
	auto genmoveId = std::make_shared<std::string>();
	EngineFixture fixture([genmoveId](const std::string& id, const std::string& command) {
		if (command.starts_with("genmove")) {
			*genmoveId = id;
			return std::vector<std::string>{};
		}
		return MockEngineChannel::success(id);
	});
	ASSERT_TRUE(fixture.engine->start());
	fixture.engine->setup(GtpEngine::GameSetup{.boardSize = 9u, .moves = {{Player::Black, Coord{2u, 2u}}}});

	std::optional<GtpEngine::MoveReply> late;
	fixture.engine->genmove(Player::White, [&](const GtpEngine::MoveReply& r) { late = r; });
	ASSERT_FALSE(genmoveId->empty());

	// Game was taken back while the engine was thinking.
	fixture.engine->setup(GtpEngine::GameSetup{.boardSize = 9u});
	fixture.channels.front()->deliver(MockEngineChannel::success(*genmoveId, "E5"));

	ASSERT_TRUE(late.has_value());
	ASSERT_TRUE(late->move.has_value());
	EXPECT_TRUE(fixture.engine->mirror().moves.empty());

	// A restarted engine gets the game as it was set up, without the late move.
	fixture.channels.front()->crashOn = "genmove";
	fixture.engine->genmove(Player::Black, [](const GtpEngine::MoveReply&) {});
	ASSERT_EQ(fixture.channels.size(), 2u);

	const std::vector<std::string> expected{"boardsize 9", "clear_board", "komi 6.5", "genmove B"};
	std::vector<std::string> replayed;
	for (const auto& line: fixture.channels.back()->written()) {
		replayed.push_back(line.substr(line.find(' ') + 1u));
	}
	EXPECT_EQ(replayed, expected);
}

TEST(GtpEngine, GivesUpAfterRetries) {
	GtpEngine::Settings settings{.commandTimeout = std::chrono::seconds(10), .maxRetries = 2u};
	EngineFixture fixture(
	        [](const std::string& id, const std::string& command) {
		        if (command.starts_with("genmove")) {
			        return std::vector<std::string>{};
		        }
		        return MockEngineChannel::success(id);
	        },
	        settings);
	ASSERT_TRUE(fixture.engine->start());

	std::optional<GtpEngine::MoveReply> reply;
	fixture.engine->genmove(Player::Black, [&](const GtpEngine::MoveReply& r) { reply = r; });
	ASSERT_FALSE(reply.has_value());

	// Every silent engine dies before answering.
	for (std::size_t i = 0; i <= settings.maxRetries; ++i) {
		ASSERT_EQ(fixture.channels.size(), i + 1u);
		fixture.channels.back()->crash("engine crashed");
	}

	ASSERT_TRUE(reply.has_value());
	EXPECT_FALSE(reply->move.has_value());
	EXPECT_EQ(reply->error, "AI unresponsive");
	EXPECT_EQ(fixture.channels.size(), settings.maxRetries + 1u);
}

TEST(GtpEngine, CommandTimeout) {
	EngineFixture fixture([](const std::string&, const std::string&) { return std::vector<std::string>{}; },
	                      GtpEngine::Settings{.commandTimeout = std::chrono::milliseconds(20), .maxRetries = 0u});
	ASSERT_TRUE(fixture.engine->start());

	std::optional<GtpEngine::MoveReply> reply;
	fixture.engine->genmove(Player::Black, [&](const GtpEngine::MoveReply& r) { reply = r; });

	fixture.io.run_for(std::chrono::seconds(2));

	ASSERT_TRUE(reply.has_value());
	EXPECT_FALSE(reply->move.has_value());
	EXPECT_EQ(reply->error, "AI unresponsive");
}

TEST(GtpEngine, NoRestartAfterShutdown) {
	EngineFixture fixture([](const std::string&, const std::string&) { return std::vector<std::string>{}; });
	ASSERT_TRUE(fixture.engine->start());

	std::optional<GtpEngine::MoveReply> reply;
	fixture.engine->genmove(Player::Black, [&](const GtpEngine::MoveReply& r) { reply = r; });
	fixture.engine->shutdown();

	ASSERT_TRUE(reply.has_value());
	EXPECT_FALSE(reply->move.has_value());
	EXPECT_EQ(fixture.channels.size(), 1u);
}

} // namespace hoshi::gtest
