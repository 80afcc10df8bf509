#pragma once

#include "hoshi/app/types.hpp"
#include "hoshi/core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hoshi::app {

// Client Commands (client -> server)
struct CreateGame {
	nlohmann::json config; //!< Game settings. Validated when the session is created.
	PlayerId playerId;
	std::string name;
};
struct JoinGame {
	std::optional<SessionId> sessionId; //!< Either the id or the share code identifies the game.
	std::string code;
	PlayerId playerId;
	std::string name;
	bool asSpectator{false};
};
struct MakeMove {
	Coord coord;
};
struct PassTurn {};
struct Resign {};
struct RequestUndo {
	std::size_t moveIndex; //!< Number of moves to keep.
};
struct RespondUndo {
	bool accepted;
};
struct ToggleDeadStone {
	Coord coord;
};
struct ConfirmScore {
	bool confirmed;
};
struct CancelScoring {};
struct RequestPlayAgain {};
struct RespondPlayAgain {
	bool accepted;
};
struct Heartbeat {};
struct LeaveGame {};
struct GetGameState {};

using ClientCommand = std::variant<CreateGame, JoinGame, MakeMove, PassTurn, Resign, RequestUndo, RespondUndo, ToggleDeadStone, ConfirmScore, CancelScoring,
                                   RequestPlayAgain, RespondPlayAgain, Heartbeat, LeaveGame, GetGameState>;

// Serialize typed commands to JSON messages.
std::string toMessage(const ClientCommand& command);

// Parse JSON messages into typed commands. Returns empty on invalid input.
std::optional<ClientCommand> fromClientMessage(std::string_view message);

} // namespace hoshi::app
