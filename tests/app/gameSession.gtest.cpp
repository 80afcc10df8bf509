#include "sessionHelpers.hpp"

#include "hoshi/app/gameSession.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace hoshi::gtest {

using namespace std::chrono_literals;
using app::ErrorCode;
using app::SessionStatus;

namespace {

//! Human game with alice (black) and bob (white) seated.
std::shared_ptr<GameSession> startedGame(SessionFixture& fixture, app::GameConfig config = humanGame()) {
	auto session = fixture.create(std::move(config));
	EXPECT_TRUE(session->join("alice", "Alice").ok());
	EXPECT_TRUE(session->join("bob", "Bob").ok());
	return session;
}

} // namespace

// ------------------------------------------------------------------
// Participants

TEST(GameSession, JoinSeatsPlayers) {
	SessionFixture fixture;
	auto session = fixture.create(humanGame());
	EXPECT_EQ(session->status(), SessionStatus::Waiting);

	ASSERT_TRUE(session->join("alice", "Alice").ok());
	EXPECT_EQ(session->colorOf("alice"), Player::Black);
	EXPECT_EQ(session->status(), SessionStatus::Waiting);

	ASSERT_TRUE(session->join("bob", "Bob").ok());
	EXPECT_EQ(session->colorOf("bob"), Player::White);
	EXPECT_EQ(session->status(), SessionStatus::Playing);

	const auto state = fixture.sink.last<app::GameState>();
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->snapshot.status, SessionStatus::Playing);
	EXPECT_EQ(state->snapshot.players.size(), 2u);
	EXPECT_EQ(state->snapshot.currentTurn, Player::Black);
}

TEST(GameSession, CreatorColorPreference) {
	SessionFixture fixture;
	auto config            = humanGame();
	config.colorPreference = app::ColorPreference::White;

	auto session = fixture.create(config);
	session->join("alice", "Alice");
	session->join("bob", "Bob");
	EXPECT_EQ(session->colorOf("alice"), Player::White);
	EXPECT_EQ(session->colorOf("bob"), Player::Black);
}

TEST(GameSession, SpectatorsWhenSeatsAreTaken) {
	SessionFixture fixture;
	auto session = startedGame(fixture);

	ASSERT_TRUE(session->join("carol", "Carol").ok());
	EXPECT_FALSE(session->colorOf("carol").has_value());
	EXPECT_EQ(session->snapshot().spectators, 1u);

	// Spectators receive the state directly.
	const auto entries = fixture.sink.entries();
	ASSERT_FALSE(entries.empty());
	EXPECT_EQ(entries.back().recipient, PlayerId{"carol"});

	EXPECT_EQ(session->applyMove("carol", {2u, 2u}).code, ErrorCode::NotAPlayer);

	ASSERT_TRUE(session->leave("carol").ok());
	EXPECT_EQ(session->snapshot().spectators, 0u);
}

TEST(GameSession, Reconnect) {
	SessionFixture fixture;
	auto session = startedGame(fixture);

	session->setConnected("bob", false);
	EXPECT_FALSE(session->seat(Player::White)->connected);

	fixture.sink.clear();
	ASSERT_TRUE(session->join("bob", "Bob").ok());
	EXPECT_TRUE(session->seat(Player::White)->connected);
	EXPECT_EQ(session->colorOf("bob"), Player::White);

	const auto entries = fixture.sink.entries();
	ASSERT_EQ(entries.size(), 1u);
	EXPECT_EQ(entries.front().recipient, PlayerId{"bob"});
	EXPECT_TRUE(std::holds_alternative<app::GameState>(entries.front().event));
}

TEST(GameSession, Abandoned) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	EXPECT_FALSE(session->isAbandoned(fixture.clock.now + 1h, 60s));

	session->setConnected("alice", false);
	session->setConnected("bob", false);
	EXPECT_FALSE(session->isAbandoned(fixture.clock.now + 59s, 60s));
	EXPECT_TRUE(session->isAbandoned(fixture.clock.now + 60s, 60s));

	// A spectator keeps the game alive.
	session->join("carol", "Carol", true);
	EXPECT_FALSE(session->isAbandoned(fixture.clock.now + 1h, 60s));
}

// ------------------------------------------------------------------
// Playing

TEST(GameSession, MoveBeforeStart) {
	SessionFixture fixture;
	auto session = fixture.create(humanGame());
	session->join("alice", "Alice");
	EXPECT_EQ(session->applyMove("alice", {2u, 2u}).code, ErrorCode::InvalidState);
}

TEST(GameSession, TurnOrder) {
	SessionFixture fixture;
	auto session = startedGame(fixture);

	EXPECT_EQ(session->applyMove("bob", {2u, 2u}).code, ErrorCode::NotYourTurn);
	ASSERT_TRUE(session->applyMove("alice", {2u, 2u}).ok());
	EXPECT_EQ(session->applyMove("alice", {3u, 3u}).code, ErrorCode::NotYourTurn);

	const auto occupied = session->applyMove("bob", {2u, 2u});
	EXPECT_EQ(occupied.code, ErrorCode::IllegalMove);
	EXPECT_EQ(occupied.message, "position occupied");

	// Rejected moves change nothing.
	EXPECT_EQ(session->history().size(), 1u);
	EXPECT_EQ(session->snapshot().currentTurn, Player::White);
}

TEST(GameSession, MoveMadeWithCaptures) {
	SessionFixture fixture;
	auto session = startedGame(fixture);

	ASSERT_TRUE(session->applyMove("alice", {1u, 0u}).ok());
	ASSERT_TRUE(session->applyMove("bob", {0u, 0u}).ok());
	ASSERT_TRUE(session->applyMove("alice", {0u, 1u}).ok());

	const auto move = fixture.sink.last<app::MoveMade>();
	ASSERT_TRUE(move.has_value());
	EXPECT_EQ(move->moveNumber, 3u);
	EXPECT_EQ(move->color, Player::Black);
	EXPECT_EQ(move->coord, (Coord{0u, 1u}));
	ASSERT_EQ(move->captures.size(), 1u);
	EXPECT_EQ(move->captures.front(), (Coord{0u, 0u}));
	EXPECT_EQ(move->nextTurn, Player::White);
	EXPECT_EQ(move->totalCaptures.black, 1u);

	const auto snapshot = session->snapshot();
	EXPECT_TRUE(snapshot.board.isFree({0u, 0u}));
	EXPECT_EQ(snapshot.captures.black, 1u);
}

TEST(GameSession, Resign) {
	SessionFixture fixture;
	auto session = startedGame(fixture);

	ASSERT_TRUE(session->resign("alice").ok());
	EXPECT_EQ(session->status(), SessionStatus::Finished);

	const auto finished = fixture.sink.last<app::GameFinished>();
	ASSERT_TRUE(finished.has_value());
	EXPECT_EQ(finished->result, "W+R");
	EXPECT_EQ(finished->winner, Player::White);
	EXPECT_EQ(finished->reason, app::FinishReason::Resignation);

	EXPECT_EQ(session->applyMove("bob", {2u, 2u}).code, ErrorCode::InvalidState);
	EXPECT_EQ(session->resign("bob").code, ErrorCode::InvalidState);
}

TEST(GameSession, HandicapGame) {
	SessionFixture fixture;
	auto config     = humanGame();
	config.handicap = 2u;
	auto session    = startedGame(fixture, config);

	const auto snapshot = session->snapshot();
	EXPECT_EQ(snapshot.board.getAt({2u, 2u}), Board::Value::Black);
	EXPECT_EQ(snapshot.board.getAt({6u, 6u}), Board::Value::Black);
	EXPECT_EQ(snapshot.currentTurn, Player::White);
	EXPECT_DOUBLE_EQ(session->config().effectiveKomi(), 0.5);

	EXPECT_EQ(session->applyMove("alice", {4u, 4u}).code, ErrorCode::NotYourTurn);
	EXPECT_TRUE(session->applyMove("bob", {4u, 4u}).ok());
}

TEST(GameSession, InvalidConfig) {
	SessionFixture fixture;
	EXPECT_THROW(fixture.create(humanGame(4u)), std::invalid_argument);

	auto config     = humanGame();
	config.handicap = 1u;
	EXPECT_THROW(fixture.create(config), std::invalid_argument);
}

TEST(GameSession, ExportSgf) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->applyMove("alice", {2u, 2u});
	session->applyPass("bob");

	const auto sgf = session->exportSgf();
	EXPECT_NE(sgf.find("SZ[9]"), std::string::npos);
	EXPECT_NE(sgf.find("PB[Alice]PW[Bob]"), std::string::npos);
	EXPECT_NE(sgf.find(";B[cc];W[])"), std::string::npos);
}

// ------------------------------------------------------------------
// Scoring

TEST(GameSession, TwoPassesStartScoring) {
	SessionFixture fixture;
	auto session = startedGame(fixture);

	ASSERT_TRUE(session->applyMove("alice", {4u, 4u}).ok());
	ASSERT_TRUE(session->applyPass("bob").ok());
	EXPECT_EQ(session->status(), SessionStatus::Playing);
	ASSERT_TRUE(session->applyPass("alice").ok());
	EXPECT_EQ(session->status(), SessionStatus::Scoring);

	const auto started = fixture.sink.last<app::ScoringPhaseStarted>();
	ASSERT_TRUE(started.has_value());
	EXPECT_EQ(started->reason, app::ScoringReason::Passes);

	// Pass is reported as a move without position.
	const auto pass = fixture.sink.last<app::MoveMade>();
	ASSERT_TRUE(pass.has_value());
	EXPECT_FALSE(pass->coord.has_value());

	EXPECT_EQ(session->applyMove("bob", {0u, 0u}).code, ErrorCode::InvalidState);
}

TEST(GameSession, PassesMustBeConsecutive) {
	SessionFixture fixture;
	auto session = startedGame(fixture);

	session->applyPass("alice");
	session->applyMove("bob", {4u, 4u});
	session->applyPass("alice");
	EXPECT_EQ(session->status(), SessionStatus::Playing);
}

TEST(GameSession, ConfirmScore) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->applyMove("alice", {4u, 4u});
	session->applyPass("bob");
	session->applyPass("alice");

	ASSERT_TRUE(session->confirmScore("alice", true).ok());
	EXPECT_EQ(session->status(), SessionStatus::Scoring);

	const auto update = fixture.sink.last<app::ScoreConfirmationUpdate>();
	ASSERT_TRUE(update.has_value());
	EXPECT_TRUE(update->black);
	EXPECT_FALSE(update->white);

	ASSERT_TRUE(session->confirmScore("bob", true).ok());
	EXPECT_EQ(session->status(), SessionStatus::Finished);

	// One black stone owns the whole board.
	const auto finished = fixture.sink.last<app::GameFinished>();
	ASSERT_TRUE(finished.has_value());
	EXPECT_EQ(finished->reason, app::FinishReason::Score);
	EXPECT_EQ(finished->result, "B+73.5");
	ASSERT_TRUE(finished->score.has_value());
	EXPECT_EQ(finished->score->black.territory, 80u);
}

TEST(GameSession, ToggleDeadStoneResetsConfirmation) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->applyMove("alice", {4u, 4u});
	session->applyPass("bob");

	EXPECT_EQ(session->toggleDeadStone("alice", {4u, 4u}).code, ErrorCode::InvalidState);
	session->applyPass("alice");

	session->confirmScore("alice", true);
	EXPECT_EQ(session->toggleDeadStone("bob", {0u, 0u}).code, ErrorCode::InvalidArgument);
	ASSERT_TRUE(session->toggleDeadStone("bob", {4u, 4u}).ok());

	const auto dead = fixture.sink.last<app::DeadStonesUpdated>();
	ASSERT_TRUE(dead.has_value());
	ASSERT_EQ(dead->deadStones.size(), 1u);
	EXPECT_EQ(dead->estimate.resultCode(), "W+7.5");
	EXPECT_FALSE(session->snapshot().blackConfirmed);

	session->confirmScore("alice", true);
	session->confirmScore("bob", true);
	EXPECT_EQ(fixture.sink.last<app::GameFinished>()->result, "W+7.5");
}

TEST(GameSession, CancelScoring) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->applyPass("alice");
	session->applyPass("bob");
	ASSERT_EQ(session->status(), SessionStatus::Scoring);

	ASSERT_TRUE(session->cancelScoring("alice").ok());
	EXPECT_EQ(session->status(), SessionStatus::Playing);
	EXPECT_EQ(fixture.sink.events<app::ScoringCanceled>().size(), 1u);

	// Passes start counting again.
	session->applyPass("alice");
	EXPECT_EQ(session->status(), SessionStatus::Playing);
	EXPECT_EQ(session->cancelScoring("alice").code, ErrorCode::InvalidState);
}

// ------------------------------------------------------------------
// Clock

TEST(GameSession, MoveChargesClock) {
	SessionFixture fixture;
	auto config        = humanGame();
	config.timeControl = Clock::ByoYomi{.mainTime = 60s, .period = 30s, .periods = 1u};
	auto session       = startedGame(fixture, config);

	fixture.clock.advance(75s);
	ASSERT_TRUE(session->applyMove("alice", {2u, 2u}).ok());

	const auto time = fixture.sink.last<app::TimeUpdate>();
	ASSERT_TRUE(time.has_value());
	EXPECT_EQ(time->color, Player::Black);
	EXPECT_TRUE(time->clock.isInByoYomi());
	EXPECT_EQ(time->clock.periodRemaining, 30s);
	EXPECT_EQ(time->clock.periodsLeft, 1u);

	const auto reset = fixture.sink.last<app::ByoYomiReset>();
	ASSERT_TRUE(reset.has_value());
	EXPECT_EQ(reset->color, Player::Black);

	EXPECT_EQ(session->history().back().timeSpent, 75s);

	fixture.clock.advance(10s);
	ASSERT_TRUE(session->applyMove("bob", {6u, 6u}).ok());

	// Exceeding the last period loses on time. The move is not played.
	fixture.clock.advance(31s);
	const auto late = session->applyMove("alice", {4u, 4u});
	EXPECT_EQ(late.code, app::ErrorCode::TimedOut);
	EXPECT_EQ(session->status(), SessionStatus::Finished);
	EXPECT_TRUE(session->snapshot().board.isFree({4u, 4u}));

	const auto timeout = fixture.sink.last<app::PlayerTimeout>();
	ASSERT_TRUE(timeout.has_value());
	EXPECT_EQ(timeout->color, Player::Black);
	EXPECT_EQ(timeout->result, "W+T");
	EXPECT_EQ(fixture.sink.last<app::GameFinished>()->reason, app::FinishReason::Timeout);
}

TEST(GameSession, TickProjectsClock) {
	SessionFixture fixture;
	auto config        = humanGame();
	config.timeControl = Clock::ByoYomi{.mainTime = 60s, .period = 0s, .periods = 0u};
	auto session       = startedGame(fixture, config);

	fixture.clock.advance(10s);
	session->tick();

	const auto time = fixture.sink.last<app::TimeUpdate>();
	ASSERT_TRUE(time.has_value());
	EXPECT_EQ(time->color, Player::Black);
	EXPECT_EQ(time->clock.mainRemaining, 50s);

	// Ticking does not charge the player.
	EXPECT_EQ(session->snapshot().players.front().clock.mainRemaining, 60s);
}

TEST(GameSession, TickTimeout) {
	SessionFixture fixture;
	auto config        = humanGame();
	config.timeControl = Clock::Blitz{.timePerMove = 5s};
	auto session       = startedGame(fixture, config);

	fixture.clock.advance(4s);
	session->tick();
	EXPECT_EQ(session->status(), SessionStatus::Playing);

	fixture.clock.advance(2s);
	session->tick();
	EXPECT_EQ(session->status(), SessionStatus::Finished);
	EXPECT_EQ(fixture.sink.last<app::GameFinished>()->result, "W+T");
}

TEST(GameSession, PassAfterTimeoutIsRefused) {
	SessionFixture fixture;
	auto config        = humanGame();
	config.timeControl = Clock::Blitz{.timePerMove = 5s};
	auto session       = startedGame(fixture, config);

	fixture.clock.advance(6s);
	EXPECT_EQ(session->applyPass("alice").code, app::ErrorCode::TimedOut);
	EXPECT_EQ(session->status(), SessionStatus::Finished);
	EXPECT_TRUE(session->history().empty());
	EXPECT_EQ(fixture.sink.last<app::GameFinished>()->result, "W+T");
}

TEST(GameSession, UnlimitedClockIsSilent) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	fixture.clock.advance(10h);
	session->tick();
	session->applyMove("alice", {2u, 2u});
	EXPECT_TRUE(fixture.sink.events<app::TimeUpdate>().empty());
}

// ------------------------------------------------------------------
// Undo

TEST(GameSession, UndoAccepted) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->applyMove("alice", {2u, 2u});
	session->applyMove("bob", {6u, 6u});

	ASSERT_TRUE(session->requestUndo("alice", 1u).ok());
	const auto requested = fixture.sink.last<app::UndoRequested>();
	ASSERT_TRUE(requested.has_value());
	EXPECT_EQ(requested->requestedBy, "alice");

	EXPECT_EQ(session->requestUndo("bob", 0u).code, ErrorCode::AlreadyRequested);
	EXPECT_EQ(session->respondUndo("alice", true).code, ErrorCode::InvalidState);

	ASSERT_TRUE(session->respondUndo("bob", true).ok());
	const auto resolved = fixture.sink.last<app::UndoResolved>();
	ASSERT_TRUE(resolved.has_value());
	EXPECT_TRUE(resolved->accepted);

	const auto snapshot = session->snapshot();
	EXPECT_EQ(snapshot.history.size(), 1u);
	EXPECT_EQ(snapshot.currentTurn, Player::White);
	EXPECT_TRUE(snapshot.board.isFree({6u, 6u}));
	EXPECT_FALSE(snapshot.board.isFree({2u, 2u}));
}

TEST(GameSession, UndoRestoresCaptures) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->applyMove("alice", {1u, 0u});
	session->applyMove("bob", {0u, 0u});
	session->applyMove("alice", {0u, 1u});
	ASSERT_EQ(session->snapshot().captures.black, 1u);

	session->requestUndo("bob", 2u);
	session->respondUndo("alice", true);

	const auto snapshot = session->snapshot();
	EXPECT_EQ(snapshot.captures.black, 0u);
	EXPECT_EQ(snapshot.board.getAt({0u, 0u}), Board::Value::White);
	EXPECT_EQ(snapshot.currentTurn, Player::Black);
}

TEST(GameSession, UndoDeclined) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->applyMove("alice", {2u, 2u});

	EXPECT_EQ(session->requestUndo("alice", 1u).code, ErrorCode::InvalidArgument);
	ASSERT_TRUE(session->requestUndo("alice", 0u).ok());
	ASSERT_TRUE(session->respondUndo("bob", false).ok());

	EXPECT_FALSE(fixture.sink.last<app::UndoResolved>()->accepted);
	EXPECT_EQ(session->history().size(), 1u);
	EXPECT_EQ(session->respondUndo("bob", true).code, ErrorCode::NoPendingRequest);
}

TEST(GameSession, UndoAfterPassKeepsPassCount) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->applyPass("alice");
	session->applyMove("bob", {2u, 2u});

	session->requestUndo("alice", 1u);
	session->respondUndo("bob", true);

	// Kept history ends with a pass, so one more pass ends the game.
	session->applyPass("bob");
	EXPECT_EQ(session->status(), SessionStatus::Scoring);
}

// ------------------------------------------------------------------
// Play again

TEST(GameSession, PlayAgain) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	EXPECT_EQ(session->requestPlayAgain("alice").code, ErrorCode::InvalidState);

	session->resign("bob");
	ASSERT_TRUE(session->requestPlayAgain("alice").ok());
	EXPECT_EQ(session->requestPlayAgain("alice").code, ErrorCode::AlreadyRequested);
	EXPECT_FALSE(session->takePlayAgainAgreement());
	EXPECT_EQ(fixture.sink.last<app::PlayAgainRequested>()->requestedBy, "alice");

	ASSERT_TRUE(session->respondPlayAgain("bob", true).ok());
	EXPECT_TRUE(session->takePlayAgainAgreement());
	EXPECT_FALSE(session->takePlayAgainAgreement());
}

TEST(GameSession, PlayAgainBothRequest) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->resign("bob");

	session->requestPlayAgain("alice");
	session->requestPlayAgain("bob");
	EXPECT_TRUE(session->takePlayAgainAgreement());
}

TEST(GameSession, PlayAgainDeclined) {
	SessionFixture fixture;
	auto session = startedGame(fixture);
	session->resign("bob");

	EXPECT_EQ(session->respondPlayAgain("bob", true).code, ErrorCode::NoPendingRequest);
	session->requestPlayAgain("alice");
	ASSERT_TRUE(session->respondPlayAgain("bob", false).ok());
	EXPECT_FALSE(session->takePlayAgainAgreement());
	EXPECT_FALSE(session->snapshot().playAgainRequest.has_value());
}

// ------------------------------------------------------------------
// AI games

TEST(GameSession, AiRequiresEngine) {
	RecordingSink sink;
	ManualClock clock;
	EXPECT_THROW(GameSession(1u, "ABCDEF", aiGame(), GameSession::Dependencies{.sink = sink, .now = clock.source(), .engineFactory = {}}),
	             std::runtime_error);
}

TEST(GameSession, AiAnswersMove) {
	SessionFixture fixture;
	fixture.moves->push_back("E5");
	auto session = fixture.create(aiGame());

	const auto ai = session->seat(Player::White);
	ASSERT_TRUE(ai.has_value());
	EXPECT_TRUE(ai->isAi);
	EXPECT_EQ(ai->id, GameSession::AI_PLAYER_ID);

	ASSERT_TRUE(session->join("alice", "Alice").ok());
	EXPECT_EQ(session->status(), SessionStatus::Playing);
	EXPECT_EQ(session->join(GameSession::AI_PLAYER_ID, "Impostor").code, ErrorCode::InvalidArgument);

	ASSERT_TRUE(session->applyMove("alice", {2u, 2u}).ok());

	const auto history = session->history();
	ASSERT_EQ(history.size(), 2u);
	EXPECT_EQ(history.back().color, Player::White);
	EXPECT_EQ(history.back().coord, (Coord{4u, 4u}));
	EXPECT_EQ(session->snapshot().currentTurn, Player::Black);

	const auto input = fixture.engineInput();
	EXPECT_NE(std::find_if(input.begin(), input.end(), [](const std::string& l) { return l.ends_with("play B C7"); }), input.end());
	EXPECT_NE(std::find_if(input.begin(), input.end(), [](const std::string& l) { return l.ends_with("genmove W"); }), input.end());
}

TEST(GameSession, AiOpensAsBlack) {
	SessionFixture fixture;
	fixture.moves->push_back("E5");
	auto session = fixture.create(aiGame(app::ColorPreference::White));
	ASSERT_TRUE(session->seat(Player::Black)->isAi);

	session->join("alice", "Alice");
	ASSERT_EQ(session->history().size(), 1u);
	EXPECT_EQ(session->history().front().color, Player::Black);
	EXPECT_EQ(session->snapshot().currentTurn, Player::White);
}

TEST(GameSession, AiIllegalMoveBecomesPass) {
	SessionFixture fixture;
	fixture.moves->push_back("C7");
	auto session = fixture.create(aiGame());
	session->join("alice", "Alice");
	session->applyMove("alice", {2u, 2u});

	const auto history = session->history();
	ASSERT_EQ(history.size(), 2u);
	EXPECT_FALSE(history.back().coord.has_value());

	// Engine was reset to the real game.
	const auto input = fixture.engineInput();
	EXPECT_EQ(std::count_if(input.begin(), input.end(), [](const std::string& l) { return l.ends_with("clear_board"); }), 2);
}

TEST(GameSession, AiResigns) {
	SessionFixture fixture;
	fixture.moves->push_back("resign");
	auto session = fixture.create(aiGame());
	session->join("alice", "Alice");
	session->applyMove("alice", {2u, 2u});

	EXPECT_EQ(session->status(), SessionStatus::Finished);
	EXPECT_EQ(fixture.sink.last<app::GameFinished>()->result, "B+R");
}

TEST(GameSession, AiUnresponsiveStartsScoring) {
	SessionFixture fixture;
	fixture.engineCrashOn             = "genmove";
	fixture.engineSettings.maxRetries = 1u;
	auto session                      = fixture.create(aiGame());
	session->join("alice", "Alice");
	session->applyMove("alice", {2u, 2u});

	EXPECT_EQ(fixture.channels.size(), 2u);
	EXPECT_EQ(session->status(), SessionStatus::Scoring);

	const auto error = fixture.sink.last<app::ErrorEvent>();
	ASSERT_TRUE(error.has_value());
	EXPECT_EQ(error->code, ErrorCode::AiUnavailable);
	EXPECT_EQ(fixture.sink.last<app::ScoringPhaseStarted>()->reason, app::ScoringReason::AiUnresponsive);
}

TEST(GameSession, AiConfirmsScore) {
	SessionFixture fixture;
	auto session = fixture.create(aiGame());
	session->join("alice", "Alice");

	// Engine passes once the script is used up.
	session->applyPass("alice");
	ASSERT_EQ(session->status(), SessionStatus::Scoring);

	ASSERT_TRUE(session->confirmScore("alice", true).ok());
	EXPECT_EQ(session->status(), SessionStatus::Finished);
	EXPECT_EQ(fixture.sink.last<app::GameFinished>()->result, "W+6.5");
}

TEST(GameSession, AiSingleUndo) {
	SessionFixture fixture;
	fixture.moves->push_back("E5");
	fixture.moves->push_back("G3");
	auto session = fixture.create(aiGame());
	session->join("alice", "Alice");
	session->applyMove("alice", {2u, 2u});
	ASSERT_EQ(session->history().size(), 2u);

	ASSERT_TRUE(session->requestUndo("alice", 0u).ok());
	EXPECT_TRUE(session->history().empty());
	EXPECT_TRUE(fixture.sink.last<app::UndoResolved>()->accepted);
	EXPECT_EQ(session->snapshot().currentTurn, Player::Black);

	session->applyMove("alice", {2u, 2u});
	ASSERT_EQ(session->history().size(), 2u);
	EXPECT_EQ(session->requestUndo("alice", 0u).code, ErrorCode::InvalidState);
}

TEST(GameSession, AiPlayAgainIsImmediate) {
	SessionFixture fixture;
	auto session = fixture.create(aiGame());
	session->join("alice", "Alice");
	session->resign("alice");

	ASSERT_TRUE(session->requestPlayAgain("alice").ok());
	EXPECT_TRUE(session->takePlayAgainAgreement());
}

} // namespace hoshi::gtest
