#pragma once

#include "hoshi/clock/clockHandler.hpp"

namespace hoshi {

//! Every move must be played within the same allotment.
class BlitzClock final : public ClockHandler {
public:
	explicit BlitzClock(Duration timePerMove) : m_timePerMove(clampZero(timePerMove)) {
		PlayerClock initial;
		initial.phase           = Phase::PerMove;
		initial.periodRemaining = m_timePerMove;
		m_black                 = initial;
		m_white                 = initial;
	}

	bool isUnlimited() const override {
		return false;
	}

	Transition charge(Player player, Duration elapsed) override {
		auto& side = sideRef(player);
		if (side.phase == Phase::Timeout || elapsed > m_timePerMove) {
			return timeout(side);
		}

		side.periodRemaining = m_timePerMove;
		return Transition::Stay;
	}

	Clock::TickResult tick(Player player, Duration elapsed) override {
		auto& side = sideRef(player);

		Clock::TickResult result;
		if (side.phase == Phase::Timeout) {
			result.transition = Transition::Timeout;
		} else if (elapsed > m_timePerMove) {
			result.transition = timeout(side);
			result.committed  = true;
		} else {
			result.projection = side;
			result.projection.periodRemaining = m_timePerMove - clampZero(elapsed);
			return result;
		}

		result.projection = side;
		return result;
	}

private:
	Duration m_timePerMove;
};

} // namespace hoshi
