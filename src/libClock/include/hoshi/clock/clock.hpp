#pragma once

#include "hoshi/core/types.hpp"

#include <chrono>
#include <memory>
#include <string_view>
#include <variant>

namespace hoshi {

class ClockHandler;

//! Server side time control of both players.
//! The clock does not read the wall clock itself. Callers pass the time elapsed since the last move was committed.
class Clock {
public:
	using Duration  = std::chrono::milliseconds;
	using TimePoint = std::chrono::steady_clock::time_point;

	enum class Phase {
		MainTime, //!< Consuming main time.
		ByoYomi,  //!< Main time used up. Periods are consumed when a move exceeds the period time.
		PerMove,  //!< Blitz allotment, reset after every move.
		Timeout,  //!< Terminal.
	};

	//! Result of charging time to a player.
	enum class Transition { Stay, EnteredByoYomi, PeriodReset, Timeout };

	// Clock configurations
	//! Main time followed by byo-yomi periods.
	//! periods == 0 is absolute time. mainTime == 0 and periods == 0 is unlimited.
	struct ByoYomi {
		Duration mainTime;
		Duration period;
		unsigned periods;
	};
	//! Main time with an increment added after every move played within main time.
	struct Fischer {
		Duration mainTime;
		Duration increment;
		Duration period{};
		unsigned periods{0u};
	};
	//! Fixed time for every single move.
	struct Blitz {
		Duration timePerMove;
	};
	using Config = std::variant<ByoYomi, Fischer, Blitz>;

	struct PlayerClock {
		Phase phase{Phase::MainTime};
		Duration mainRemaining{};
		Duration periodRemaining{}; //!< Byo-yomi period or blitz allotment left.
		unsigned periodsLeft{0u};

		bool isInByoYomi() const {
			return phase == Phase::ByoYomi;
		}
		bool operator==(const PlayerClock&) const = default;
	};

	struct TickResult {
		PlayerClock projection;                  //!< Live view of the player's clock.
		Transition transition{Transition::Stay}; //!< Boundary crossed by wall-clock time alone.
		bool committed{false};                   //!< Clock state changed. The caller restarts the elapsed baseline.
	};

public:
	explicit Clock(const Config& config);
	~Clock();

	Clock(Clock&&) noexcept;
	Clock& operator=(Clock&&) noexcept;

	//! Charge the time a player spent on a move.
	Transition charge(Player player, Duration elapsed);

	//! Project the clock of the player to move without charging a move.
	//! Commits only when main time, a byo-yomi period or the blitz allotment runs out.
	TickResult tick(Player player, Duration elapsedSinceBaseline);

	PlayerClock state(Player player) const;
	bool isUnlimited() const;
	const Config& config() const;

private:
	Config m_config;
	std::unique_ptr<ClockHandler> m_handler;
};

std::string_view toString(Clock::Phase phase);

} // namespace hoshi
