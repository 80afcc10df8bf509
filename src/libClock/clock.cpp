#include "hoshi/clock/clock.hpp"

#include "ClockBlitz.hpp"
#include "ClockFischer.hpp"
#include "ClockStandard.hpp"

#include <type_traits>

namespace hoshi {

Clock::Clock(const Config& config) : m_config(config) {
	std::visit(
	        [this](const auto& cfg) {
		        using T = std::decay_t<decltype(cfg)>;

		        if constexpr (std::is_same_v<T, ByoYomi>) {
			        m_handler = std::make_unique<StandardClock>(cfg.mainTime, cfg.period, cfg.periods);
		        } else if constexpr (std::is_same_v<T, Fischer>) {
			        m_handler = std::make_unique<FischerClock>(cfg.mainTime, cfg.increment, cfg.period, cfg.periods);
		        } else if constexpr (std::is_same_v<T, Blitz>) {
			        m_handler = std::make_unique<BlitzClock>(cfg.timePerMove);
		        } else {
			        static_assert(!sizeof(T), "Clock configuration not handled.");
		        }
	        },
	        config);
}
Clock::~Clock() = default;

Clock::Clock(Clock&&) noexcept            = default;
Clock& Clock::operator=(Clock&&) noexcept = default;

Clock::Transition Clock::charge(Player player, Duration elapsed) {
	return m_handler->charge(player, elapsed);
}

Clock::TickResult Clock::tick(Player player, Duration elapsedSinceBaseline) {
	return m_handler->tick(player, elapsedSinceBaseline);
}

Clock::PlayerClock Clock::state(Player player) const {
	return m_handler->state(player);
}

bool Clock::isUnlimited() const {
	return m_handler->isUnlimited();
}

const Clock::Config& Clock::config() const {
	return m_config;
}

std::string_view toString(const Clock::Phase phase) {
	switch (phase) {
	case Clock::Phase::MainTime:
		return "mainTime";
	case Clock::Phase::ByoYomi:
		return "byoYomi";
	case Clock::Phase::PerMove:
		return "perMove";
	case Clock::Phase::Timeout:
		return "timeout";
	}
	return "mainTime";
}

} // namespace hoshi
