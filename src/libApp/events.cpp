#include "hoshi/app/events.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace hoshi::app {

using nlohmann::json;

namespace {

double seconds(Clock::Duration duration) {
	return std::chrono::duration<double>(duration).count();
}

json coordJson(Coord c) {
	return json{{"x", c.x}, {"y", c.y}};
}

json coordJson(const std::optional<Coord>& c) {
	return c ? coordJson(*c) : json(nullptr);
}

json coordsJson(const std::vector<Coord>& coords) {
	auto result = json::array();
	for (const auto c: coords) {
		result.push_back(coordJson(c));
	}
	return result;
}

json clockJson(const Clock::PlayerClock& clock) {
	return json{
	        {"phase", toString(clock.phase)},
	        {"mainTimeRemaining", seconds(clock.mainRemaining)},
	        {"isInByoYomi", clock.isInByoYomi()},
	        {"byoYomiTimeLeft", seconds(clock.periodRemaining)},
	        {"byoYomiPeriodsLeft", clock.periodsLeft},
	};
}

json colorScoreJson(const ColorScore& score) {
	return json{
	        {"territory", score.territory}, {"stones", score.stones}, {"captures", score.captures}, {"komi", score.komi}, {"total", score.total},
	};
}

json scoreJson(const ScoreResult& score) {
	return json{
	        {"territory",
	         {
	                 {"black", coordsJson(score.territory.black)},
	                 {"white", coordsJson(score.territory.white)},
	                 {"neutral", coordsJson(score.territory.neutral)},
	         }},
	        {"black", colorScoreJson(score.black)},
	        {"white", colorScoreJson(score.white)},
	        {"winner", score.winner ? json(toString(*score.winner)) : json(nullptr)},
	        {"margin", score.margin},
	        {"result", score.resultCode()},
	};
}

json stonesJson(const Board& board) {
	auto stones = json::array();
	for (Id y = 0u; y < board.size(); ++y) {
		for (Id x = 0u; x < board.size(); ++x) {
			const auto value = board.getAt({x, y});
			if (value != Board::Value::Empty) {
				stones.push_back(json{{"x", x}, {"y", y}, {"color", toString(toPlayer(value))}});
			}
		}
	}
	return stones;
}

json snapshotJson(const SessionSnapshot& s) {
	auto players = json::array();
	for (const auto& seat: s.players) {
		players.push_back(json{
		        {"id", seat.id},
		        {"name", seat.name},
		        {"color", toString(seat.color)},
		        {"isAI", seat.isAi},
		        {"connected", seat.connected},
		        {"clock", clockJson(seat.clock)},
		});
	}

	auto history = json::array();
	for (const auto& move: s.history) {
		history.push_back(json{
		        {"color", toString(move.color)},
		        {"position", coordJson(move.coord)},
		        {"pass", !move.coord.has_value()},
		        {"captures", coordsJson(move.captures)},
		        {"timeSpent", seconds(move.timeSpent)},
		});
	}

	return json{
	        {"id", s.id},
	        {"code", s.code},
	        {"status", toString(s.status)},
	        {"config", toJson(s.config)},
	        {"boardSize", s.board.size()},
	        {"stones", stonesJson(s.board)},
	        {"currentTurn", toString(s.currentTurn)},
	        {"history", std::move(history)},
	        {"capturedStones", {{"black", s.captures.black}, {"white", s.captures.white}}},
	        {"koPosition", coordJson(s.koPosition)},
	        {"players", std::move(players)},
	        {"spectators", s.spectators},
	        {"turnElapsed", seconds(s.turnElapsed)},
	        {"deadStones", coordsJson(s.deadStones)},
	        {"scoreConfirmation", {{"black", s.blackConfirmed}, {"white", s.whiteConfirmed}}},
	        {"undoRequest", s.undoRequest ? json{{"requestedBy", s.undoRequest->requestedBy}, {"moveIndex", s.undoRequest->moveIndex}} : json(nullptr)},
	        {"playAgainRequest", s.playAgainRequest ? json(*s.playAgainRequest) : json(nullptr)},
	        {"result", s.result},
	        {"score", s.score ? scoreJson(*s.score) : json(nullptr)},
	};
}

std::string_view toString(ScoringReason reason) {
	return reason == ScoringReason::AiUnresponsive ? "aiUnresponsive" : "passes";
}

std::string_view toString(FinishReason reason) {
	switch (reason) {
	case FinishReason::Resignation:
		return "resignation";
	case FinishReason::Timeout:
		return "timeout";
	case FinishReason::Score:
		return "score";
	}
	return "score";
}

json toJson(const GameCreated& e) {
	return json{{"sessionId", e.sessionId}, {"code", e.code}, {"playerId", e.playerId}};
}
json toJson(const GameState& e) {
	return json{{"state", snapshotJson(e.snapshot)}};
}
json toJson(const MoveMade& e) {
	return json{
	        {"moveNumber", e.moveNumber},
	        {"color", toString(e.color)},
	        {"position", coordJson(e.coord)},
	        {"pass", !e.coord.has_value()},
	        {"captures", coordsJson(e.captures)},
	        {"koPosition", coordJson(e.koPosition)},
	        {"nextTurn", toString(e.nextTurn)},
	        {"capturedStones", {{"black", e.totalCaptures.black}, {"white", e.totalCaptures.white}}},
	};
}
json toJson(const TimeUpdate& e) {
	auto result     = clockJson(e.clock);
	result["color"] = toString(e.color);
	return result;
}
json toJson(const ByoYomiReset& e) {
	return json{{"color", toString(e.color)}, {"byoYomiTimeLeft", seconds(e.periodRemaining)}, {"byoYomiPeriodsLeft", e.periodsLeft}};
}
json toJson(const PlayerTimeout& e) {
	return json{{"color", toString(e.color)}, {"winner", toString(opponent(e.color))}, {"result", e.result}};
}
json toJson(const ScoringPhaseStarted& e) {
	return json{{"reason", toString(e.reason)}};
}
json toJson(const DeadStonesUpdated& e) {
	return json{{"deadStones", coordsJson(e.deadStones)}, {"estimate", scoreJson(e.estimate)}};
}
json toJson(const ScoreConfirmationUpdate& e) {
	return json{{"color", toString(e.color)}, {"confirmed", e.confirmed}, {"scoreConfirmation", {{"black", e.black}, {"white", e.white}}}};
}
json toJson(const ScoringCanceled&) {
	return json::object();
}
json toJson(const UndoRequested& e) {
	return json{{"requestedBy", e.requestedBy}, {"moveIndex", e.moveIndex}};
}
json toJson(const UndoResolved& e) {
	return json{{"accepted", e.accepted}, {"moveIndex", e.moveIndex}};
}
json toJson(const PlayAgainRequested& e) {
	return json{{"requestedBy", e.requestedBy}};
}
json toJson(const NewGame& e) {
	return json{{"previousGameId", e.previous}, {"newGameId", e.sessionId}, {"code", e.code}};
}
json toJson(const GameFinished& e) {
	return json{
	        {"result", e.result},
	        {"winner", e.winner ? json(toString(*e.winner)) : json(nullptr)},
	        {"reason", toString(e.reason)},
	        {"score", e.score ? scoreJson(*e.score) : json(nullptr)},
	};
}
json toJson(const ErrorEvent& e) {
	return json{{"code", toString(e.code)}, {"message", e.message}};
}

template <typename T>
constexpr std::string_view typeName() {
	if constexpr (std::is_same_v<T, GameCreated>) {
		return "gameCreated";
	} else if constexpr (std::is_same_v<T, GameState>) {
		return "gameState";
	} else if constexpr (std::is_same_v<T, MoveMade>) {
		return "moveMade";
	} else if constexpr (std::is_same_v<T, TimeUpdate>) {
		return "timeUpdate";
	} else if constexpr (std::is_same_v<T, ByoYomiReset>) {
		return "byoYomiReset";
	} else if constexpr (std::is_same_v<T, PlayerTimeout>) {
		return "playerTimeout";
	} else if constexpr (std::is_same_v<T, ScoringPhaseStarted>) {
		return "scoringPhaseStarted";
	} else if constexpr (std::is_same_v<T, DeadStonesUpdated>) {
		return "deadStonesUpdated";
	} else if constexpr (std::is_same_v<T, ScoreConfirmationUpdate>) {
		return "scoreConfirmationUpdate";
	} else if constexpr (std::is_same_v<T, ScoringCanceled>) {
		return "scoringCanceled";
	} else if constexpr (std::is_same_v<T, UndoRequested>) {
		return "undoRequested";
	} else if constexpr (std::is_same_v<T, UndoResolved>) {
		return "undoResolved";
	} else if constexpr (std::is_same_v<T, PlayAgainRequested>) {
		return "playAgainRequested";
	} else if constexpr (std::is_same_v<T, NewGame>) {
		return "newGame";
	} else if constexpr (std::is_same_v<T, GameFinished>) {
		return "gameFinished";
	} else {
		static_assert(std::is_same_v<T, ErrorEvent>);
		return "error";
	}
}

json eventJson(const ServerEvent& event) {
	return std::visit(
	        [](const auto& e) {
		        auto result    = toJson(e);
		        result["type"] = typeName<std::decay_t<decltype(e)>>();
		        return result;
	        },
	        event);
}

} // namespace

std::string_view eventName(const ServerEvent& event) {
	return std::visit([](const auto& e) { return typeName<std::decay_t<decltype(e)>>(); }, event);
}

std::string toMessage(const ServerEvent& event) {
	return eventJson(event).dump();
}

std::string toMessage(const SessionId sessionId, const ServerEvent& event) {
	auto result      = eventJson(event);
	result["gameId"] = sessionId;
	return result.dump();
}

} // namespace hoshi::app
