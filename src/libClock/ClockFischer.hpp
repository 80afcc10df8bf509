#pragma once

#include "ClockStandard.hpp"

namespace hoshi {

//! Fischer clock is a standard clock that adds an increment after each move played within main time.
class FischerClock final : public StandardClock {
public:
	FischerClock(Duration main, Duration increment, Duration period, unsigned periods)
	    : StandardClock(main, period, periods), m_increment(clampZero(increment)) {
	}

	Transition charge(Player player, Duration elapsed) override {
		const auto transition = StandardClock::charge(player, elapsed);

		auto& side = sideRef(player);
		if (transition == Transition::Stay && side.phase == Phase::MainTime && !isUnlimited()) {
			side.mainRemaining += m_increment;
		}
		return transition;
	}

private:
	Duration m_increment;
};

} // namespace hoshi
