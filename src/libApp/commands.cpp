#include "hoshi/app/commands.hpp"

#include <cstdint>
#include <limits>

namespace hoshi::app {

using nlohmann::json;

namespace {

json coordJson(Coord c) {
	return json{{"x", c.x}, {"y", c.y}};
}

std::optional<Coord> readCoord(const json& j) {
	const auto it = j.find("position");
	if (it == j.end() || !it->is_object()) {
		return std::nullopt;
	}
	const auto x = it->find("x");
	const auto y = it->find("y");
	if (x == it->end() || y == it->end() || !x->is_number_unsigned() || !y->is_number_unsigned()) {
		return std::nullopt;
	}
	// Larger values would wrap onto the board.
	constexpr auto maxId = std::numeric_limits<Id>::max();
	if (x->get<std::uint64_t>() > maxId || y->get<std::uint64_t>() > maxId) {
		return std::nullopt;
	}
	return Coord{x->get<Id>(), y->get<Id>()};
}

std::optional<bool> readBool(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_boolean()) {
		return std::nullopt;
	}
	return it->get<bool>();
}

std::optional<std::string> readString(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_string()) {
		return std::nullopt;
	}
	return it->get<std::string>();
}

std::optional<std::uint64_t> readUnsigned(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_number_unsigned()) {
		return std::nullopt;
	}
	return it->get<std::uint64_t>();
}

json toJson(const CreateGame& c) {
	return json{{"type", "createGame"}, {"config", c.config}, {"playerId", c.playerId}, {"name", c.name}};
}
json toJson(const JoinGame& c) {
	json result{{"type", "joinGame"}, {"playerId", c.playerId}, {"name", c.name}, {"asSpectator", c.asSpectator}};
	if (c.sessionId) {
		result["gameId"] = *c.sessionId;
	}
	if (!c.code.empty()) {
		result["code"] = c.code;
	}
	return result;
}
json toJson(const MakeMove& c) {
	return json{{"type", "makeMove"}, {"position", coordJson(c.coord)}};
}
json toJson(const PassTurn&) {
	return json{{"type", "passTurn"}};
}
json toJson(const Resign&) {
	return json{{"type", "resign"}};
}
json toJson(const RequestUndo& c) {
	return json{{"type", "requestUndo"}, {"moveIndex", c.moveIndex}};
}
json toJson(const RespondUndo& c) {
	return json{{"type", "respondUndo"}, {"accepted", c.accepted}};
}
json toJson(const ToggleDeadStone& c) {
	return json{{"type", "toggleDeadStone"}, {"position", coordJson(c.coord)}};
}
json toJson(const ConfirmScore& c) {
	return json{{"type", "confirmScore"}, {"confirmed", c.confirmed}};
}
json toJson(const CancelScoring&) {
	return json{{"type", "cancelScoring"}};
}
json toJson(const RequestPlayAgain&) {
	return json{{"type", "requestPlayAgain"}};
}
json toJson(const RespondPlayAgain& c) {
	return json{{"type", "respondPlayAgain"}, {"accepted", c.accepted}};
}
json toJson(const Heartbeat&) {
	return json{{"type", "heartbeat"}};
}
json toJson(const LeaveGame&) {
	return json{{"type", "leaveGame"}};
}
json toJson(const GetGameState&) {
	return json{{"type", "getGameState"}};
}

std::optional<ClientCommand> parseCreateGame(const json& j) {
	const auto playerId = readString(j, "playerId");
	if (!playerId || playerId->empty()) {
		return std::nullopt;
	}

	CreateGame command{.config = json::object(), .playerId = *playerId, .name = readString(j, "name").value_or(*playerId)};
	if (const auto it = j.find("config"); it != j.end()) {
		if (!it->is_object()) {
			return std::nullopt;
		}
		command.config = *it;
	}
	return command;
}

std::optional<ClientCommand> parseJoinGame(const json& j) {
	const auto playerId = readString(j, "playerId");
	if (!playerId || playerId->empty()) {
		return std::nullopt;
	}

	JoinGame command{
	        .sessionId   = readUnsigned(j, "gameId"),
	        .code        = readString(j, "code").value_or(""),
	        .playerId    = *playerId,
	        .name        = readString(j, "name").value_or(*playerId),
	        .asSpectator = readBool(j, "asSpectator").value_or(false),
	};
	if (!command.sessionId && command.code.empty()) {
		return std::nullopt;
	}
	return command;
}

} // namespace

std::string toMessage(const ClientCommand& command) {
	return std::visit([](const auto& c) { return toJson(c).dump(); }, command);
}

std::optional<ClientCommand> fromClientMessage(std::string_view message) {
	const auto j = json::parse(message, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return std::nullopt;
	}

	const auto type = readString(j, "type");
	if (!type) {
		return std::nullopt;
	}

	if (*type == "createGame") {
		return parseCreateGame(j);
	}
	if (*type == "joinGame") {
		return parseJoinGame(j);
	}
	if (*type == "makeMove") {
		if (const auto coord = readCoord(j)) {
			return MakeMove{.coord = *coord};
		}
		return std::nullopt;
	}
	if (*type == "toggleDeadStone") {
		if (const auto coord = readCoord(j)) {
			return ToggleDeadStone{.coord = *coord};
		}
		return std::nullopt;
	}
	if (*type == "requestUndo") {
		if (const auto index = readUnsigned(j, "moveIndex")) {
			return RequestUndo{.moveIndex = static_cast<std::size_t>(*index)};
		}
		return std::nullopt;
	}
	if (*type == "respondUndo") {
		if (const auto accepted = readBool(j, "accepted")) {
			return RespondUndo{.accepted = *accepted};
		}
		return std::nullopt;
	}
	if (*type == "confirmScore") {
		return ConfirmScore{.confirmed = readBool(j, "confirmed").value_or(true)};
	}
	if (*type == "respondPlayAgain") {
		if (const auto accepted = readBool(j, "accepted")) {
			return RespondPlayAgain{.accepted = *accepted};
		}
		return std::nullopt;
	}
	if (*type == "passTurn") {
		return PassTurn{};
	}
	if (*type == "resign") {
		return Resign{};
	}
	if (*type == "cancelScoring") {
		return CancelScoring{};
	}
	if (*type == "requestPlayAgain") {
		return RequestPlayAgain{};
	}
	if (*type == "heartbeat") {
		return Heartbeat{};
	}
	if (*type == "leaveGame") {
		return LeaveGame{};
	}
	if (*type == "getGameState") {
		return GetGameState{};
	}

	// Invalid
	return std::nullopt;
}

} // namespace hoshi::app
