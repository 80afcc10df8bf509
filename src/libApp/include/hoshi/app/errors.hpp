#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace hoshi::app {

enum class ErrorCode {
	None,
	NotFound,         //!< Unknown session or player.
	InvalidState,     //!< Operation not allowed in the current session status.
	NotYourTurn,
	NotAPlayer,       //!< Requester holds no seat in the session.
	IllegalMove,      //!< Rejected by the board rules.
	InvalidArgument,
	AiUnavailable,
	AlreadyRequested, //!< A request of the same kind is still pending.
	NoPendingRequest,
	TimedOut,         //!< Clock ran out before the move. The game is lost on time.
};

std::string_view toString(ErrorCode code);

//! Outcome of a session operation. Rejections never mutate the session, except TimedOut which ends the game.
struct ActionResult {
	ErrorCode code{ErrorCode::None};
	std::string message;

	bool ok() const {
		return code == ErrorCode::None;
	}

	static ActionResult success() {
		return {};
	}
	static ActionResult failure(ErrorCode code, std::string message) {
		return ActionResult{.code = code, .message = std::move(message)};
	}
};

} // namespace hoshi::app
