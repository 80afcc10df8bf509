#include "hoshi/app/gameSession.hpp"

#include "Logging.hpp"
#include "hoshi/core/handicap.hpp"
#include "hoshi/core/sgfHandler.hpp"

#include <algorithm>
#include <format>
#include <random>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace hoshi::app {

namespace {

GameConfig validated(GameConfig config) {
	config.validate();
	return config;
}

Player resolveColor(ColorPreference preference) {
	switch (preference) {
	case ColorPreference::Black:
		return Player::Black;
	case ColorPreference::White:
		return Player::White;
	case ColorPreference::Random:
		break;
	}
	std::mt19937 rng(std::random_device{}());
	return std::bernoulli_distribution(0.5)(rng) ? Player::Black : Player::White;
}

//! Empty board with the handicap stones of black.
BoardEngine initialBoard(std::size_t boardSize, const std::vector<Coord>& handicapStones) {
	Board board(boardSize);
	for (const auto stone: handicapStones) {
		board.setAt(stone, Board::Value::Black);
	}
	return BoardEngine(std::move(board));
}

void logEngineFailure(SessionId id, std::string_view what, const ai::GtpEngine::Reply& reply) {
	if (!reply.ok()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameSession] Game {}: Engine {} failed: {}", id, what, reply.text));
	}
}

} // namespace

GameSession::GameSession(SessionId id, std::string code, GameConfig config, Dependencies dependencies)
    : m_id(id), m_code(std::move(code)), m_config(validated(std::move(config))), m_sink(dependencies.sink), m_now(std::move(dependencies.now)),
      m_creatorColor(resolveColor(m_config.colorPreference)), m_lastPresence(m_now()),
      m_handicapStones(handicapPositions(m_config.boardSize, m_config.handicap)), m_board(initialBoard(m_config.boardSize, m_handicapStones)),
      m_turn(firstToMove(m_config.handicap)), m_clock(m_config.timeControl), m_lastMoveTime(m_lastPresence) {
	if (m_config.gameType != GameType::Ai) {
		return;
	}

	if (!dependencies.engineFactory) {
		throw std::runtime_error("No AI engine available.");
	}
	m_engine = dependencies.engineFactory(m_config);
	if (!m_engine) {
		throw std::runtime_error("AI engine could not be started.");
	}

	seatRef(opponent(m_creatorColor)) = Seat{
	        .id        = AI_PLAYER_ID,
	        .name      = std::format("AI ({})", ai::toString(m_config.aiLevel)),
	        .isAi      = true,
	        .connected = true,
	};
	m_engine->setup(engineSetup(), [id = m_id](const ai::GtpEngine::Reply& reply) { logEngineFailure(id, "setup", reply); });

	Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: AI plays {}.", m_id, toString(opponent(m_creatorColor))));
}

GameSession::~GameSession() {
	if (m_engine) {
		m_engine->shutdown();
	}
}

template <typename Fn>
auto GameSession::mutate(Fn&& fn) {
	std::vector<std::function<void()>> deferred;
	std::unique_lock<std::mutex> lock(m_mutex);

	if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
		fn();
		deferred.swap(m_deferred);
		lock.unlock();
		for (auto& task: deferred) {
			task();
		}
	} else {
		auto result = fn();
		deferred.swap(m_deferred);
		lock.unlock();
		for (auto& task: deferred) {
			task();
		}
		return result;
	}
}

void GameSession::defer(std::function<void()> task) {
	m_deferred.push_back(std::move(task));
}

SessionId GameSession::id() const {
	return m_id;
}
const std::string& GameSession::code() const {
	return m_code;
}
const GameConfig& GameSession::config() const {
	return m_config;
}

SessionStatus GameSession::status() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_status;
}

std::optional<Player> GameSession::colorOf(const PlayerId& playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return colorOfLocked(playerId);
}

std::optional<GameSession::Seat> GameSession::seat(Player color) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return seatRef(color);
}

bool GameSession::isAiGame() const {
	return m_config.gameType == GameType::Ai;
}

std::optional<Player> GameSession::colorOfLocked(const PlayerId& playerId) const {
	if (m_black && m_black->id == playerId) {
		return Player::Black;
	}
	if (m_white && m_white->id == playerId) {
		return Player::White;
	}
	return std::nullopt;
}

std::optional<GameSession::Seat>& GameSession::seatRef(Player color) {
	return color == Player::Black ? m_black : m_white;
}
const std::optional<GameSession::Seat>& GameSession::seatRef(Player color) const {
	return color == Player::Black ? m_black : m_white;
}

bool GameSession::isAiTurn() const {
	const auto& seat = seatRef(m_turn);
	return seat && seat->isAi;
}

GameSession::Duration GameSession::elapsed(TimePoint now) const {
	return now > m_lastMoveTime ? std::chrono::duration_cast<Duration>(now - m_lastMoveTime) : Duration::zero();
}

// ------------------------------------------------------------------
// Participants

ActionResult GameSession::join(const PlayerId& playerId, const std::string& name, bool asSpectator) {
	return mutate([&] {
		if (playerId.empty() || (isAiGame() && playerId == AI_PLAYER_ID)) {
			return ActionResult::failure(ErrorCode::InvalidArgument, "Invalid player id.");
		}

		const auto now = m_now();
		if (const auto color = colorOfLocked(playerId)) {
			seatRef(*color)->connected = true;
			m_lastPresence             = now;
			Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Player '{}' reconnected as {}.", m_id, playerId, toString(*color)));
			m_sink.sendTo(m_id, playerId, GameState{snapshotLocked()});
			return ActionResult::success();
		}

		if (asSpectator || (m_black && m_white)) {
			if (std::find(m_spectators.begin(), m_spectators.end(), playerId) == m_spectators.end()) {
				m_spectators.push_back(playerId);
			}
			m_lastPresence = now;
			Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: '{}' is watching.", m_id, playerId));
			m_sink.sendTo(m_id, playerId, GameState{snapshotLocked()});
			return ActionResult::success();
		}

		const auto color = seatRef(m_creatorColor) ? opponent(m_creatorColor) : m_creatorColor;
		seatRef(color)   = Seat{.id = playerId, .name = name, .isAi = false, .connected = true};
		m_lastPresence   = now;
		Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Player '{}' seated as {}.", m_id, playerId, toString(color)));

		if (m_black && m_white) {
			startGame();
		} else {
			emitState();
		}
		return ActionResult::success();
	});
}

ActionResult GameSession::leave(const PlayerId& playerId) {
	return mutate([&] {
		const auto spectator = std::find(m_spectators.begin(), m_spectators.end(), playerId);
		if (spectator != m_spectators.end()) {
			m_spectators.erase(spectator);
			m_lastPresence = m_now();
			return ActionResult::success();
		}

		const auto color = colorOfLocked(playerId);
		if (!color) {
			return ActionResult::failure(ErrorCode::NotFound, "Not part of this game.");
		}
		seatRef(*color)->connected = false;
		m_lastPresence             = m_now();
		Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Player '{}' left.", m_id, playerId));
		emitState();
		return ActionResult::success();
	});
}

void GameSession::setConnected(const PlayerId& playerId, bool connected) {
	mutate([&] {
		if (const auto color = colorOfLocked(playerId)) {
			seatRef(*color)->connected = connected;
			m_lastPresence             = m_now();
			return;
		}
		if (!connected) {
			std::erase(m_spectators, playerId);
			m_lastPresence = m_now();
		}
	});
}

bool GameSession::isAbandoned(TimePoint now, Duration gracePeriod) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	const auto present = [](const std::optional<Seat>& seat) { return seat && !seat->isAi && seat->connected; };
	if (present(m_black) || present(m_white) || !m_spectators.empty()) {
		return false;
	}
	return now - m_lastPresence >= gracePeriod;
}

// ------------------------------------------------------------------
// Playing

void GameSession::startGame() {
	m_status       = SessionStatus::Playing;
	m_lastMoveTime = m_now();
	Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Started.", m_id));
	emitState();
	requestAiMove();
}

ActionResult GameSession::applyMove(const PlayerId& playerId, Coord coord) {
	return mutate([&] {
		const auto color = colorOfLocked(playerId);
		if (!color) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can move.");
		}
		if (m_status != SessionStatus::Playing) {
			return ActionResult::failure(ErrorCode::InvalidState, "Game is not in progress.");
		}
		if (*color != m_turn) {
			return ActionResult::failure(ErrorCode::NotYourTurn, "Not your turn.");
		}
		return playMove(*color, coord);
	});
}

ActionResult GameSession::applyPass(const PlayerId& playerId) {
	return mutate([&] {
		const auto color = colorOfLocked(playerId);
		if (!color) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can pass.");
		}
		if (m_status != SessionStatus::Playing) {
			return ActionResult::failure(ErrorCode::InvalidState, "Game is not in progress.");
		}
		if (*color != m_turn) {
			return ActionResult::failure(ErrorCode::NotYourTurn, "Not your turn.");
		}

		Clock::Transition transition{};
		const auto now   = m_now();
		const auto spent = elapsed(now);
		if (!chargeMove(*color, spent, transition)) {
			return ActionResult::failure(ErrorCode::TimedOut, "Out of time.");
		}
		commitPass(*color, now, spent, transition);
		return ActionResult::success();
	});
}

ActionResult GameSession::resign(const PlayerId& playerId) {
	return mutate([&] {
		const auto color = colorOfLocked(playerId);
		if (!color) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can resign.");
		}
		if (m_status != SessionStatus::Playing && m_status != SessionStatus::Scoring) {
			return ActionResult::failure(ErrorCode::InvalidState, "Game is not in progress.");
		}

		const auto winner = opponent(*color);
		Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: {} resigned.", m_id, toString(*color)));
		finish(std::format("{}+R", toLetter(winner)), winner, FinishReason::Resignation);
		return ActionResult::success();
	});
}

ActionResult GameSession::playMove(Player color, Coord coord) {
	auto board        = m_board;
	const auto result = board.place(coord, color);
	if (!result.accepted()) {
		Logger().Log(Logging::LogLevel::Warning,
		             std::format("[GameSession] Game {}: Rejected {} move at ({}, {}): {}.", m_id, toString(color), coord.x, coord.y, toString(*result.error)));
		return ActionResult::failure(ErrorCode::IllegalMove, std::string{toString(*result.error)});
	}

	Clock::Transition transition{};
	const auto now   = m_now();
	const auto spent = elapsed(now);
	if (!chargeMove(color, spent, transition)) {
		return ActionResult::failure(ErrorCode::TimedOut, "Out of time.");
	}
	commitPlacement(color, coord, std::move(board), result, now, spent, transition);
	return ActionResult::success();
}

bool GameSession::chargeMove(Player color, Duration spent, Clock::Transition& transition) {
	transition = m_clock.charge(color, spent);
	if (transition == Clock::Transition::Timeout) {
		finishOnTimeout(color);
		return false;
	}
	return true;
}

void GameSession::commitPlacement(Player color, Coord coord, BoardEngine board, const MoveResult& result, TimePoint now, Duration spent,
                                  Clock::Transition transition) {
	m_board = std::move(board);
	m_captures.of(color) += static_cast<unsigned>(result.captures.size());
	m_history.push_back(MoveRecord{
	        .color     = color,
	        .coord     = coord,
	        .timestamp = now,
	        .timeSpent = spent,
	        .captures  = result.captures,
	        .clock     = m_clock.state(color),
	});
	m_consecutivePasses = 0u;
	m_turn              = opponent(color);
	m_lastMoveTime      = now;

	emit(MoveMade{
	        .moveNumber    = m_history.size(),
	        .color         = color,
	        .coord         = coord,
	        .captures      = result.captures,
	        .koPosition    = result.koPosition,
	        .nextTurn      = m_turn,
	        .totalCaptures = m_captures,
	});
	emitClock(color, transition);

	if (!seatRef(color)->isAi) {
		tellEngine(color, coord);
	}
	requestAiMove();
}

void GameSession::commitPass(Player color, TimePoint now, Duration spent, Clock::Transition transition) {
	m_board.pass();
	m_history.push_back(MoveRecord{
	        .color     = color,
	        .coord     = std::nullopt,
	        .timestamp = now,
	        .timeSpent = spent,
	        .captures  = {},
	        .clock     = m_clock.state(color),
	});
	++m_consecutivePasses;
	m_turn         = opponent(color);
	m_lastMoveTime = now;

	emit(MoveMade{
	        .moveNumber    = m_history.size(),
	        .color         = color,
	        .coord         = std::nullopt,
	        .captures      = {},
	        .koPosition    = std::nullopt,
	        .nextTurn      = m_turn,
	        .totalCaptures = m_captures,
	});
	emitClock(color, transition);

	if (!seatRef(color)->isAi) {
		tellEngine(color, std::nullopt);
	}
	if (m_consecutivePasses >= 2u) {
		enterScoring(ScoringReason::Passes);
		return;
	}
	requestAiMove();
}

// ------------------------------------------------------------------
// Scoring

void GameSession::enterScoring(ScoringReason reason) {
	m_status = SessionStatus::Scoring;
	++m_generation;
	m_deadStones.clear();
	m_blackConfirmed = false;
	m_whiteConfirmed = false;
	m_undoRequest.reset();

	Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Scoring phase started.", m_id));
	emit(ScoringPhaseStarted{.reason = reason});
	emitState();

	if (m_engine && reason == ScoringReason::Passes) {
		defer([engine = m_engine, id = m_id] {
			engine->finalScore([id](const ai::GtpEngine::Reply& reply) {
				if (reply.ok()) {
					Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Engine estimates '{}'.", id, reply.text));
				} else {
					logEngineFailure(id, "final_score", reply);
				}
			});
		});
	}
}

ScoreResult GameSession::currentScore() const {
	return score(m_board.board(), m_deadStones, m_captures, m_config.ruleset, m_config.effectiveKomi());
}

ActionResult GameSession::toggleDeadStone(const PlayerId& playerId, Coord coord) {
	return mutate([&] {
		if (!colorOfLocked(playerId)) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can mark dead stones.");
		}
		if (m_status != SessionStatus::Scoring) {
			return ActionResult::failure(ErrorCode::InvalidState, "Game is not in scoring mode.");
		}
		const auto& board = m_board.board();
		if (!board.inBounds(coord) || board.isFree(coord)) {
			return ActionResult::failure(ErrorCode::InvalidArgument, "No stone at position.");
		}

		m_deadStones     = hoshi::toggleDeadStone(board, m_deadStones, coord, m_config.autoExtendDeadGroups);
		m_blackConfirmed = false;
		m_whiteConfirmed = false;

		emit(DeadStonesUpdated{
		        .deadStones = std::vector<Coord>(m_deadStones.begin(), m_deadStones.end()),
		        .estimate   = currentScore(),
		});
		return ActionResult::success();
	});
}

ActionResult GameSession::confirmScore(const PlayerId& playerId, bool confirmed) {
	return mutate([&] {
		const auto color = colorOfLocked(playerId);
		if (!color) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can confirm the score.");
		}
		if (m_status != SessionStatus::Scoring) {
			return ActionResult::failure(ErrorCode::InvalidState, "Game is not in scoring mode.");
		}

		(*color == Player::Black ? m_blackConfirmed : m_whiteConfirmed) = confirmed;
		const auto other = opponent(*color);
		if (confirmed && seatRef(other) && seatRef(other)->isAi) {
			(other == Player::Black ? m_blackConfirmed : m_whiteConfirmed) = true;
		}

		emit(ScoreConfirmationUpdate{.color = *color, .confirmed = confirmed, .black = m_blackConfirmed, .white = m_whiteConfirmed});

		if (m_blackConfirmed && m_whiteConfirmed) {
			auto result = currentScore();
			finish(result.resultCode(), result.winner, FinishReason::Score, std::move(result));
		}
		return ActionResult::success();
	});
}

ActionResult GameSession::cancelScoring(const PlayerId& playerId) {
	return mutate([&] {
		if (!colorOfLocked(playerId)) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can cancel scoring.");
		}
		if (m_status != SessionStatus::Scoring) {
			return ActionResult::failure(ErrorCode::InvalidState, "Game is not in scoring mode.");
		}

		m_status = SessionStatus::Playing;
		++m_generation;
		m_deadStones.clear();
		m_blackConfirmed    = false;
		m_whiteConfirmed    = false;
		m_consecutivePasses = 0u;
		m_lastMoveTime      = m_now();

		Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Scoring canceled.", m_id));
		emit(ScoringCanceled{});
		emitState();
		requestAiMove();
		return ActionResult::success();
	});
}

void GameSession::finish(std::string result, std::optional<Player> winner, FinishReason reason, std::optional<ScoreResult> score) {
	m_status = SessionStatus::Finished;
	m_result = std::move(result);
	m_score  = std::move(score);
	++m_generation;
	m_undoRequest.reset();

	Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Finished with '{}'.", m_id, m_result));
	emit(GameFinished{.result = m_result, .winner = winner, .reason = reason, .score = m_score});
	emitState();
}

void GameSession::finishOnTimeout(Player color) {
	const auto winner = opponent(color);
	const auto result = std::format("{}+T", toLetter(winner));

	Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: {} ran out of time.", m_id, toString(color)));
	emit(PlayerTimeout{.color = color, .result = result});
	finish(result, winner, FinishReason::Timeout);
}

// ------------------------------------------------------------------
// Undo

ActionResult GameSession::requestUndo(const PlayerId& playerId, std::size_t moveIndex) {
	return mutate([&] {
		if (!colorOfLocked(playerId)) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can request an undo.");
		}
		if (m_status != SessionStatus::Playing) {
			return ActionResult::failure(ErrorCode::InvalidState, "Game is not in progress.");
		}
		if (moveIndex >= m_history.size()) {
			return ActionResult::failure(ErrorCode::InvalidArgument, "Nothing to undo.");
		}

		if (isAiGame()) {
			if (m_aiUndoUsed) {
				return ActionResult::failure(ErrorCode::InvalidState, "The undo of this game is used up.");
			}
			m_aiUndoUsed = true;
			performUndo(moveIndex);
			emit(UndoResolved{.accepted = true, .moveIndex = moveIndex});
			emitState();
			syncEngine();
			requestAiMove();
			return ActionResult::success();
		}

		if (m_undoRequest) {
			return ActionResult::failure(ErrorCode::AlreadyRequested, "An undo request is pending.");
		}
		m_undoRequest = UndoRequestView{.requestedBy = playerId, .moveIndex = moveIndex};
		emit(UndoRequested{.requestedBy = playerId, .moveIndex = moveIndex});
		return ActionResult::success();
	});
}

ActionResult GameSession::respondUndo(const PlayerId& playerId, bool accepted) {
	return mutate([&] {
		if (!colorOfLocked(playerId)) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can answer an undo request.");
		}
		if (!m_undoRequest) {
			return ActionResult::failure(ErrorCode::NoPendingRequest, "No undo request pending.");
		}
		if (m_undoRequest->requestedBy == playerId) {
			return ActionResult::failure(ErrorCode::InvalidState, "Cannot answer your own undo request.");
		}

		const auto request = *std::exchange(m_undoRequest, std::nullopt);
		const bool applied = accepted && m_status == SessionStatus::Playing && request.moveIndex < m_history.size();
		if (applied) {
			performUndo(request.moveIndex);
		}

		emit(UndoResolved{.accepted = applied, .moveIndex = request.moveIndex});
		if (applied) {
			emitState();
		}
		return ActionResult::success();
	});
}

void GameSession::performUndo(std::size_t moveIndex) {
	++m_generation;

	auto board = initialBoard(m_config.boardSize, m_handicapStones);
	Captures captures;
	std::vector<MoveRecord> kept;
	kept.reserve(moveIndex);

	for (std::size_t i = 0u; i < moveIndex && i < m_history.size(); ++i) {
		auto record = m_history[i];
		if (record.coord) {
			const auto result = board.place(*record.coord, record.color);
			if (!result.accepted()) {
				Logger().Log(Logging::LogLevel::Warning, std::format("[GameSession] Game {}: Skipping move {} during undo: {}.", m_id, i + 1u, toString(*result.error)));
				continue;
			}
			record.captures = result.captures;
			captures.of(record.color) += static_cast<unsigned>(result.captures.size());
		} else {
			board.pass();
		}
		kept.push_back(std::move(record));
	}

	m_board             = std::move(board);
	m_captures          = captures;
	m_history           = std::move(kept);
	m_turn              = m_history.empty() ? firstToMove(m_config.handicap) : opponent(m_history.back().color);
	m_consecutivePasses = (!m_history.empty() && !m_history.back().coord) ? 1u : 0u;
	m_lastMoveTime      = m_now();
	m_undoRequest.reset();

	Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: Undone to move {}.", m_id, m_history.size()));
}

// ------------------------------------------------------------------
// Play again

ActionResult GameSession::requestPlayAgain(const PlayerId& playerId) {
	return mutate([&] {
		if (!colorOfLocked(playerId)) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can ask for a new game.");
		}
		if (m_status != SessionStatus::Finished) {
			return ActionResult::failure(ErrorCode::InvalidState, "Game is not finished.");
		}

		if (isAiGame()) {
			m_playAgainAgreed = true;
			return ActionResult::success();
		}
		if (m_playAgainRequest) {
			if (*m_playAgainRequest == playerId) {
				return ActionResult::failure(ErrorCode::AlreadyRequested, "New game already requested.");
			}
			// Both asked.
			m_playAgainRequest.reset();
			m_playAgainAgreed = true;
			return ActionResult::success();
		}

		m_playAgainRequest = playerId;
		emit(PlayAgainRequested{.requestedBy = playerId});
		return ActionResult::success();
	});
}

ActionResult GameSession::respondPlayAgain(const PlayerId& playerId, bool accepted) {
	return mutate([&] {
		if (!colorOfLocked(playerId)) {
			return ActionResult::failure(ErrorCode::NotAPlayer, "Only players can answer.");
		}
		if (!m_playAgainRequest) {
			return ActionResult::failure(ErrorCode::NoPendingRequest, "No new game requested.");
		}
		if (*m_playAgainRequest == playerId) {
			return ActionResult::failure(ErrorCode::InvalidState, "Cannot answer your own request.");
		}

		m_playAgainRequest.reset();
		if (accepted) {
			m_playAgainAgreed = true;
		} else {
			emitState();
		}
		return ActionResult::success();
	});
}

bool GameSession::takePlayAgainAgreement() {
	std::lock_guard<std::mutex> lock(m_mutex);
	return std::exchange(m_playAgainAgreed, false);
}

// ------------------------------------------------------------------
// Clock

void GameSession::tick() {
	mutate([&] {
		if (m_status != SessionStatus::Playing || m_clock.isUnlimited()) {
			return;
		}

		const auto now    = m_now();
		const auto color  = m_turn;
		const auto result = m_clock.tick(color, elapsed(now));
		if (result.committed) {
			m_lastMoveTime = now;
		}
		if (result.transition == Clock::Transition::Timeout) {
			finishOnTimeout(color);
			return;
		}

		emit(TimeUpdate{.color = color, .clock = result.projection});
		if (result.transition == Clock::Transition::EnteredByoYomi || result.transition == Clock::Transition::PeriodReset) {
			emit(ByoYomiReset{.color = color, .periodRemaining = result.projection.periodRemaining, .periodsLeft = result.projection.periodsLeft});
		}
	});
}

// ------------------------------------------------------------------
// Events and queries

void GameSession::emit(const ServerEvent& event) {
	m_sink.broadcast(m_id, event);
}

void GameSession::emitClock(Player color, Clock::Transition transition) {
	if (m_clock.isUnlimited()) {
		return;
	}

	const auto state = m_clock.state(color);
	emit(TimeUpdate{.color = color, .clock = state});
	if (transition == Clock::Transition::EnteredByoYomi || transition == Clock::Transition::PeriodReset) {
		emit(ByoYomiReset{.color = color, .periodRemaining = state.periodRemaining, .periodsLeft = state.periodsLeft});
	}
}

void GameSession::emitState() {
	emit(GameState{snapshotLocked()});
}

SessionSnapshot GameSession::snapshot() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return snapshotLocked();
}

SessionSnapshot GameSession::snapshotLocked() const {
	std::vector<MoveView> history;
	history.reserve(m_history.size());
	for (const auto& record: m_history) {
		history.push_back(MoveView{.color = record.color, .coord = record.coord, .captures = record.captures, .timeSpent = record.timeSpent});
	}

	std::vector<SeatView> players;
	for (const auto color: {Player::Black, Player::White}) {
		if (const auto& seat = seatRef(color)) {
			players.push_back(SeatView{
			        .id        = seat->id,
			        .name      = seat->name,
			        .color     = color,
			        .isAi      = seat->isAi,
			        .connected = seat->connected,
			        .clock     = m_clock.state(color),
			});
		}
	}

	return SessionSnapshot{
	        .id               = m_id,
	        .code             = m_code,
	        .status           = m_status,
	        .config           = m_config,
	        .board            = m_board.board(),
	        .currentTurn      = m_turn,
	        .history          = std::move(history),
	        .captures         = m_captures,
	        .koPosition       = m_board.koPosition(),
	        .players          = std::move(players),
	        .spectators       = m_spectators.size(),
	        .turnElapsed      = m_status == SessionStatus::Playing ? elapsed(m_now()) : Duration::zero(),
	        .deadStones       = std::vector<Coord>(m_deadStones.begin(), m_deadStones.end()),
	        .blackConfirmed   = m_blackConfirmed,
	        .whiteConfirmed   = m_whiteConfirmed,
	        .undoRequest      = m_undoRequest,
	        .playAgainRequest = m_playAgainRequest,
	        .result           = m_result,
	        .score            = m_score,
	};
}

std::vector<GameSession::MoveRecord> GameSession::history() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_history;
}

std::string GameSession::exportSgf() const {
	std::lock_guard<std::mutex> lock(m_mutex);

	SgfGameInfo info{
	        .boardSize      = m_config.boardSize,
	        .komi           = m_config.effectiveKomi(),
	        .ruleset        = m_config.ruleset,
	        .handicapStones = m_handicapStones,
	        .blackName      = m_black ? m_black->name : std::string{},
	        .whiteName      = m_white ? m_white->name : std::string{},
	        .result         = m_result,
	};

	std::vector<SgfMove> moves;
	moves.reserve(m_history.size());
	for (const auto& record: m_history) {
		moves.push_back(SgfMove{.player = record.color, .coord = record.coord});
	}
	return toSgfTranscript(info, moves);
}

// ------------------------------------------------------------------
// Engine

ai::GtpEngine::GameSetup GameSession::engineSetup() const {
	ai::GtpEngine::GameSetup setup{
	        .boardSize      = m_config.boardSize,
	        .komi           = m_config.effectiveKomi(),
	        .handicapStones = m_handicapStones,
	        .moves          = {},
	};
	for (const auto& record: m_history) {
		setup.moves.push_back(ai::GtpEngine::PlayedMove{.player = record.color, .coord = record.coord});
	}
	return setup;
}

void GameSession::requestAiMove() {
	if (!m_engine || m_status != SessionStatus::Playing || !isAiTurn()) {
		return;
	}

	defer([engine = m_engine, weak = weak_from_this(), generation = m_generation, color = m_turn] {
		engine->genmove(color, [weak, generation](const ai::GtpEngine::MoveReply& reply) {
			if (auto self = weak.lock()) {
				self->onAiMove(generation, reply);
			}
		});
	});
}

void GameSession::syncEngine() {
	if (!m_engine) {
		return;
	}
	defer([engine = m_engine, setup = engineSetup(), id = m_id] {
		engine->setup(setup, [id](const ai::GtpEngine::Reply& reply) { logEngineFailure(id, "resync", reply); });
	});
}

void GameSession::tellEngine(Player color, std::optional<Coord> coord) {
	if (!m_engine) {
		return;
	}
	defer([engine = m_engine, color, coord, id = m_id] {
		engine->play(color, coord, [id](const ai::GtpEngine::Reply& reply) { logEngineFailure(id, "play", reply); });
	});
}

void GameSession::onAiMove(std::uint64_t generation, const ai::GtpEngine::MoveReply& reply) {
	mutate([&] {
		if (generation != m_generation || m_status != SessionStatus::Playing || !isAiTurn()) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[GameSession] Game {}: Discarding outdated engine move.", m_id));
			return;
		}

		const auto color = m_turn;
		if (!reply.move) {
			Logger().Log(Logging::LogLevel::Error, std::format("[GameSession] Game {}: No engine move: {}", m_id, reply.error));
			emit(ErrorEvent{.code = ErrorCode::AiUnavailable, .message = "AI unresponsive"});
			enterScoring(ScoringReason::AiUnresponsive);
			return;
		}
		Logger().Log(Logging::LogLevel::Debug, std::format("[GameSession] Game {}: Engine thought for {} ms.", m_id, reply.thinkingTime.count()));

		Clock::Transition transition{};
		const auto now   = m_now();
		const auto spent = elapsed(now);
		if (!chargeMove(color, spent, transition)) {
			return;
		}

		switch (reply.move->kind) {
		case ai::EngineMove::Kind::Resign:
			Logger().Log(Logging::LogLevel::Info, std::format("[GameSession] Game {}: AI resigned.", m_id));
			finish(std::format("{}+R", toLetter(opponent(color))), opponent(color), FinishReason::Resignation);
			return;
		case ai::EngineMove::Kind::Pass:
			commitPass(color, now, spent, transition);
			return;
		case ai::EngineMove::Kind::Place:
			break;
		}

		const auto coord  = reply.move->coord;
		auto board        = m_board;
		const auto result = board.place(coord, color);
		if (!result.accepted()) {
			Logger().Log(Logging::LogLevel::Warning,
			             std::format("[GameSession] Game {}: Engine move ({}, {}) rejected: {}. Playing a pass.", m_id, coord.x, coord.y, toString(*result.error)));
			commitPass(color, now, spent, transition);
			syncEngine();
			return;
		}
		commitPlacement(color, coord, std::move(board), result, now, spent, transition);
	});
}

} // namespace hoshi::app
