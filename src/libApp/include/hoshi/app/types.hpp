#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace hoshi::app {

using SessionId = std::uint64_t; //!< Server assigned id of a game session.
using PlayerId  = std::string;   //!< Client chosen id, stable across reconnects.

enum class SessionStatus { Waiting, Playing, Scoring, Finished };

inline constexpr std::string_view toString(SessionStatus status) {
	switch (status) {
	case SessionStatus::Waiting:
		return "waiting";
	case SessionStatus::Playing:
		return "playing";
	case SessionStatus::Scoring:
		return "scoring";
	case SessionStatus::Finished:
		return "finished";
	}
	return "waiting";
}

} // namespace hoshi::app
