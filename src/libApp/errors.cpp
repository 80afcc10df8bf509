#include "hoshi/app/errors.hpp"

namespace hoshi::app {

std::string_view toString(ErrorCode code) {
	switch (code) {
	case ErrorCode::None:
		return "none";
	case ErrorCode::NotFound:
		return "notFound";
	case ErrorCode::InvalidState:
		return "invalidState";
	case ErrorCode::NotYourTurn:
		return "notYourTurn";
	case ErrorCode::NotAPlayer:
		return "notAPlayer";
	case ErrorCode::IllegalMove:
		return "illegalMove";
	case ErrorCode::InvalidArgument:
		return "invalidArgument";
	case ErrorCode::AiUnavailable:
		return "aiUnavailable";
	case ErrorCode::AlreadyRequested:
		return "alreadyRequested";
	case ErrorCode::NoPendingRequest:
		return "noPendingRequest";
	case ErrorCode::TimedOut:
		return "timedOut";
	}
	return "unknown";
}

} // namespace hoshi::app
