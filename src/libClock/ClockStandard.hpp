#pragma once

#include "hoshi/clock/clockHandler.hpp"

namespace hoshi {

//! Main time followed by japanese byo-yomi.
class StandardClock : public ClockHandler {
public:
	StandardClock(Duration main, Duration period, unsigned periods)
	    : m_main(clampZero(main)), m_period(clampZero(period)), m_periods(m_period > Duration::zero() ? periods : 0u) {
		PlayerClock initial;
		initial.mainRemaining = m_main;
		initial.periodsLeft   = m_periods;
		if (hasOvertime()) {
			initial.periodRemaining = m_period;
			if (m_main == Duration::zero()) {
				initial.phase = Phase::ByoYomi;
			}
		}
		m_black = initial;
		m_white = initial;
	}

	bool isUnlimited() const override {
		return m_main == Duration::zero() && !hasOvertime();
	}

	Transition charge(Player player, Duration elapsed) override {
		auto& side = sideRef(player);
		switch (side.phase) {
		case Phase::Timeout:
			return Transition::Timeout;
		case Phase::ByoYomi:
			return chargeByoYomi(side, clampZero(elapsed));
		default:
			return chargeMain(side, clampZero(elapsed));
		}
	}

	Clock::TickResult tick(Player player, Duration elapsed) override {
		elapsed    = clampZero(elapsed);
		auto& side = sideRef(player);

		Clock::TickResult result;
		switch (side.phase) {
		case Phase::Timeout:
			result.transition = Transition::Timeout;
			break;
		case Phase::ByoYomi:
			if (elapsed <= side.periodRemaining) {
				result.projection = side;
				result.projection.periodRemaining -= elapsed;
				return result;
			}
			result.transition = chargeByoYomi(side, elapsed);
			result.committed  = true;
			break;
		default:
			if (isUnlimited() || elapsed < side.mainRemaining) {
				result.projection = side;
				if (!isUnlimited()) {
					result.projection.mainRemaining -= elapsed;
				}
				return result;
			}
			result.transition = chargeMain(side, elapsed);
			result.committed  = true;
			break;
		}

		result.projection = side;
		return result;
	}

protected:
	bool hasOvertime() const {
		return m_period > Duration::zero() && m_periods > 0u;
	}

private:
	Transition chargeMain(PlayerClock& side, Duration elapsed) {
		if (isUnlimited()) {
			return Transition::Stay;
		}

		const auto before = side.mainRemaining;
		if (elapsed < before) {
			side.mainRemaining = before - elapsed;
			return Transition::Stay;
		}

		side.mainRemaining = Duration::zero();
		if (!hasOvertime()) {
			return timeout(side);
		}

		// Every full period the overage spans is used up.
		const auto consumed = static_cast<unsigned>((elapsed - before) / m_period);
		if (consumed >= m_periods) {
			return timeout(side);
		}

		side.phase           = Phase::ByoYomi;
		side.periodRemaining = m_period;
		side.periodsLeft     = m_periods - consumed;
		return Transition::EnteredByoYomi;
	}

	Transition chargeByoYomi(PlayerClock& side, Duration elapsed) {
		if (elapsed <= side.periodRemaining) {
			side.periodRemaining = m_period;
			return Transition::PeriodReset;
		}

		const auto consumed = static_cast<unsigned>(elapsed / m_period);
		if (consumed >= side.periodsLeft) {
			return timeout(side);
		}

		side.periodsLeft -= consumed;
		side.periodRemaining = m_period;
		return Transition::PeriodReset;
	}

private:
	Duration m_main;
	Duration m_period;
	unsigned m_periods;
};

} // namespace hoshi
