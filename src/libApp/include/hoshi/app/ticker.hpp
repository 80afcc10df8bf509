#pragma once

#include "hoshi/app/gameSession.hpp"
#include "hoshi/app/sessionRegistry.hpp"

#include <asio.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <thread>

namespace hoshi::app {

//! Periodically advances the clocks of all sessions and evicts abandoned ones.
class Ticker {
public:
	using TickHook = std::function<void(GameSession::TimePoint)>;

	Ticker(SessionRegistry& registry, GameSession::TimeSource now, GameSession::Duration interval, GameSession::Duration gracePeriod);
	~Ticker();

	void setHook(TickHook hook); //!< Called after every tick. Set before start.

	void start(); //!< Run on a dedicated thread.
	void stop();

	void tickOnce(); //!< Single synchronous tick.

private:
	void schedule();

private:
	SessionRegistry& m_registry;
	GameSession::TimeSource m_now;
	GameSession::Duration m_interval;
	GameSession::Duration m_gracePeriod;
	TickHook m_hook;

	asio::io_context m_ioContext;
	asio::steady_timer m_timer;
	std::thread m_thread;
	std::atomic<bool> m_running{false};
};

} // namespace hoshi::app
