#pragma once

#include "hoshi/ai/gtpEngine.hpp"
#include "hoshi/app/config.hpp"
#include "hoshi/app/errors.hpp"
#include "hoshi/app/eventSink.hpp"
#include "hoshi/app/events.hpp"
#include "hoshi/app/types.hpp"
#include "hoshi/clock/clock.hpp"
#include "hoshi/core/moveChecker.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hoshi::app {

//! Authoritative state of a single game.
//! Every operation serializes on the session mutex. Events are emitted through the sink while the mutex is held.
//! Engine requests are dispatched after the mutex is released. Their results are dropped if the session moved on meanwhile.
//! \note Must be owned by a std::shared_ptr.
class GameSession : public std::enable_shared_from_this<GameSession> {
public:
	using Duration      = Clock::Duration;
	using TimePoint     = Clock::TimePoint;
	using TimeSource    = std::function<TimePoint()>;
	using EngineFactory = std::function<std::shared_ptr<ai::GtpEngine>(const GameConfig&)>; //!< Returns a started engine or throws.

	struct Dependencies {
		IEventSink& sink;
		TimeSource now;
		EngineFactory engineFactory; //!< Only used for AI games.
	};

	struct Seat {
		PlayerId id;
		std::string name;
		bool isAi{false};
		bool connected{true};
	};

	//! Entry of the move history.
	struct MoveRecord {
		Player color;
		std::optional<Coord> coord; //!< Empty for a pass.
		TimePoint timestamp;
		Duration timeSpent;
		std::vector<Coord> captures;
		Clock::PlayerClock clock; //!< Mover's clock after the move was charged.
	};

	inline static const PlayerId AI_PLAYER_ID{"ai"};

public:
	//! \throws std::invalid_argument on an invalid config, std::runtime_error if the AI engine cannot be started.
	GameSession(SessionId id, std::string code, GameConfig config, Dependencies dependencies);
	~GameSession();

	GameSession(const GameSession&)            = delete;
	GameSession& operator=(const GameSession&) = delete;

	SessionId id() const;
	const std::string& code() const;
	const GameConfig& config() const;

	SessionStatus status() const;
	std::optional<Player> colorOf(const PlayerId& playerId) const; //!< Seat color of a player. Empty for spectators.
	std::optional<Seat> seat(Player color) const;
	bool isAiGame() const;

	// Participants
	ActionResult join(const PlayerId& playerId, const std::string& name, bool asSpectator = false);
	ActionResult leave(const PlayerId& playerId);                   //!< Spectators are removed, players keep their seat.
	void setConnected(const PlayerId& playerId, bool connected);    //!< Presence of a seated player.
	bool isAbandoned(TimePoint now, Duration gracePeriod) const;    //!< No connected participant for at least gracePeriod.

	// Playing
	ActionResult applyMove(const PlayerId& playerId, Coord coord);
	ActionResult applyPass(const PlayerId& playerId);
	ActionResult resign(const PlayerId& playerId);

	// Scoring
	ActionResult toggleDeadStone(const PlayerId& playerId, Coord coord);
	ActionResult confirmScore(const PlayerId& playerId, bool confirmed);
	ActionResult cancelScoring(const PlayerId& playerId);

	// Undo
	//! \param moveIndex Number of history entries to keep.
	ActionResult requestUndo(const PlayerId& playerId, std::size_t moveIndex);
	ActionResult respondUndo(const PlayerId& playerId, bool accepted);

	// Play again
	ActionResult requestPlayAgain(const PlayerId& playerId);
	ActionResult respondPlayAgain(const PlayerId& playerId, bool accepted);
	bool takePlayAgainAgreement(); //!< True exactly once after both sides agreed to a new game.

	//! Advance the clock of the player to move. Called by the ticker.
	void tick();

	SessionSnapshot snapshot() const;
	std::vector<MoveRecord> history() const;
	std::string exportSgf() const;

private:
	//! Run fn under the session lock and dispatch the deferred engine requests afterwards.
	template <typename Fn>
	auto mutate(Fn&& fn);
	void defer(std::function<void()> task);

	std::optional<Player> colorOfLocked(const PlayerId& playerId) const;
	std::optional<Seat>& seatRef(Player color);
	const std::optional<Seat>& seatRef(Player color) const;
	bool isAiTurn() const;
	Duration elapsed(TimePoint now) const;

	void emit(const ServerEvent& event);
	void emitClock(Player color, Clock::Transition transition);
	void emitState();
	SessionSnapshot snapshotLocked() const;

	void startGame();
	ActionResult playMove(Player color, Coord coord);
	bool chargeMove(Player color, Duration spent, Clock::Transition& transition); //!< False if the player ran out of time. The game is over then.
	void commitPlacement(Player color, Coord coord, BoardEngine board, const MoveResult& result, TimePoint now, Duration spent, Clock::Transition transition);
	void commitPass(Player color, TimePoint now, Duration spent, Clock::Transition transition);

	void enterScoring(ScoringReason reason);
	void finish(std::string result, std::optional<Player> winner, FinishReason reason, std::optional<ScoreResult> score = std::nullopt);
	void finishOnTimeout(Player color);
	ScoreResult currentScore() const;

	void performUndo(std::size_t moveIndex);

	// Engine interaction. Requests are deferred until the lock is released.
	ai::GtpEngine::GameSetup engineSetup() const;
	void requestAiMove();
	void syncEngine();
	void tellEngine(Player color, std::optional<Coord> coord);
	void onAiMove(std::uint64_t generation, const ai::GtpEngine::MoveReply& reply);

private:
	const SessionId m_id;
	const std::string m_code;
	const GameConfig m_config;
	IEventSink& m_sink;
	TimeSource m_now;

	SessionStatus m_status{SessionStatus::Waiting};
	Player m_creatorColor;
	std::optional<Seat> m_black;
	std::optional<Seat> m_white;
	std::vector<PlayerId> m_spectators;
	TimePoint m_lastPresence; //!< Last time a participant was connected.

	std::vector<Coord> m_handicapStones;
	BoardEngine m_board;
	Player m_turn;
	Captures m_captures;
	std::vector<MoveRecord> m_history;
	unsigned m_consecutivePasses{0u};
	Clock m_clock;
	TimePoint m_lastMoveTime; //!< Baseline of the running clock.

	std::set<Coord> m_deadStones;
	bool m_blackConfirmed{false};
	bool m_whiteConfirmed{false};

	std::optional<UndoRequestView> m_undoRequest;
	bool m_aiUndoUsed{false};
	std::optional<PlayerId> m_playAgainRequest;
	bool m_playAgainAgreed{false};

	std::string m_result;
	std::optional<ScoreResult> m_score;

	std::shared_ptr<ai::GtpEngine> m_engine;
	std::uint64_t m_generation{0u}; //!< Invalidates outstanding engine moves.

	std::vector<std::function<void()>> m_deferred;
	mutable std::mutex m_mutex;
};

} // namespace hoshi::app
