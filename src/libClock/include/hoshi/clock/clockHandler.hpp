#pragma once

#include "hoshi/clock/clock.hpp"

#include <algorithm>

namespace hoshi {

//! Interface which all clocks require
class ClockHandler {
public:
	using Duration    = Clock::Duration;
	using Phase       = Clock::Phase;
	using Transition  = Clock::Transition;
	using PlayerClock = Clock::PlayerClock;

	virtual ~ClockHandler() = default;

	virtual Transition charge(Player player, Duration elapsed)                   = 0;
	virtual Clock::TickResult tick(Player player, Duration elapsedSinceBaseline) = 0;
	virtual bool isUnlimited() const                                             = 0;

	PlayerClock state(Player player) const {
		return player == Player::Black ? m_black : m_white;
	}

protected:
	PlayerClock& sideRef(Player player) {
		return player == Player::Black ? m_black : m_white;
	}

	static Duration clampZero(Duration value) {
		return std::max(value, Duration::zero());
	}

	Transition timeout(PlayerClock& side) {
		side.phase           = Phase::Timeout;
		side.mainRemaining   = Duration::zero();
		side.periodRemaining = Duration::zero();
		side.periodsLeft     = 0u;
		return Transition::Timeout;
	}

protected:
	PlayerClock m_black;
	PlayerClock m_white;
};

} // namespace hoshi
