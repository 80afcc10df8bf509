#pragma once

#include "hoshi/app/config.hpp"
#include "hoshi/app/errors.hpp"
#include "hoshi/app/types.hpp"
#include "hoshi/clock/clock.hpp"
#include "hoshi/core/board.hpp"
#include "hoshi/core/scoring.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hoshi::app {

// Session state as sent in 'gameState'.
struct SeatView {
	PlayerId id;
	std::string name;
	Player color;
	bool isAi{false};
	bool connected{false};
	Clock::PlayerClock clock;
};

struct MoveView {
	Player color;
	std::optional<Coord> coord; //!< Empty for a pass.
	std::vector<Coord> captures;
	Clock::Duration timeSpent{};
};

struct UndoRequestView {
	PlayerId requestedBy;
	std::size_t moveIndex;
};

struct SessionSnapshot {
	SessionId id;
	std::string code;
	SessionStatus status;
	GameConfig config;
	Board board;
	Player currentTurn;
	std::vector<MoveView> history;
	Captures captures;
	std::optional<Coord> koPosition;
	std::vector<SeatView> players;
	std::size_t spectators{0u};
	Clock::Duration turnElapsed{}; //!< Time the player to move has spent so far.
	std::vector<Coord> deadStones;
	bool blackConfirmed{false};
	bool whiteConfirmed{false};
	std::optional<UndoRequestView> undoRequest;
	std::optional<PlayerId> playAgainRequest;
	std::string result; //!< Result code once finished.
	std::optional<ScoreResult> score;
};

// Server Events (server -> client)
struct GameCreated {
	SessionId sessionId;
	std::string code; //!< Short code to share with the opponent.
	PlayerId playerId;
};

struct GameState {
	SessionSnapshot snapshot;
};

struct MoveMade {
	std::size_t moveNumber;      //!< 1 based index in the history.
	Player color;                //!< Player who moved.
	std::optional<Coord> coord;  //!< Empty for a pass.
	std::vector<Coord> captures; //!< Stones removed by the move.
	std::optional<Coord> koPosition;
	Player nextTurn;
	Captures totalCaptures;
};

struct TimeUpdate {
	Player color;
	Clock::PlayerClock clock;
};

struct ByoYomiReset {
	Player color;
	Clock::Duration periodRemaining;
	unsigned periodsLeft;
};

struct PlayerTimeout {
	Player color;       //!< Player who ran out of time.
	std::string result; //!< "B+T" or "W+T".
};

enum class ScoringReason { Passes, AiUnresponsive };

struct ScoringPhaseStarted {
	ScoringReason reason;
};

struct DeadStonesUpdated {
	std::vector<Coord> deadStones;
	ScoreResult estimate; //!< Score with the current dead stones.
};

struct ScoreConfirmationUpdate {
	Player color;
	bool confirmed;
	bool black; //!< Confirmation state after the update.
	bool white;
};

struct ScoringCanceled {};

struct UndoRequested {
	PlayerId requestedBy;
	std::size_t moveIndex;
};

struct UndoResolved {
	bool accepted;
	std::size_t moveIndex;
};

struct PlayAgainRequested {
	PlayerId requestedBy;
};

struct NewGame {
	SessionId previous;
	SessionId sessionId;
	std::string code;
};

enum class FinishReason { Resignation, Timeout, Score };

struct GameFinished {
	std::string result;
	std::optional<Player> winner; //!< Empty on a draw.
	FinishReason reason;
	std::optional<ScoreResult> score; //!< Set when the game was counted.
};

struct ErrorEvent {
	ErrorCode code;
	std::string message;
};

using ServerEvent = std::variant<GameCreated, GameState, MoveMade, TimeUpdate, ByoYomiReset, PlayerTimeout, ScoringPhaseStarted, DeadStonesUpdated,
                                 ScoreConfirmationUpdate, ScoringCanceled, UndoRequested, UndoResolved, PlayAgainRequested, NewGame, GameFinished, ErrorEvent>;

//! Message type name of the event, e.g. "moveMade".
std::string_view eventName(const ServerEvent& event);

// Serialize typed events to JSON messages.
std::string toMessage(const ServerEvent& event);
std::string toMessage(SessionId sessionId, const ServerEvent& event); //!< Adds the "gameId" of the session.

} // namespace hoshi::app
